/*
 * Copyright (c) 2015-2019, Pelayo Bernedo.
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are
 * met:
 *
 * 1. Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS
 * IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO,
 * THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
 * PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS
 * BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE
 * GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION)
 * HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT
 * LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT
 * OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef LLSD_MISC_HPP
#define LLSD_MISC_HPP

#include <stdint.h>
#include <stddef.h>
#include <string.h>
#include <string>
#include <vector>
#include "soname.hpp"


// Miscellaneous support functions.

namespace llsd {    namespace LLSD_SONAME  {

// Read and write big endian values from unaligned storage. The binary
// format uses network byte order for everything but dates.
inline uint32_t beget32 (const void *vp)
{
	return (uint32_t(((uint8_t*)vp)[0]) << 24) |
	       (uint32_t(((uint8_t*)vp)[1]) << 16) |
	       (uint32_t(((uint8_t*)vp)[2]) << 8) |
	       ((uint8_t*)vp)[3];
}

inline uint64_t beget64 (const void *vp)
{
	return (uint64_t(beget32 (vp)) << 32) | beget32 ((uint8_t*)vp + 4);
}

inline void beput32 (void *dest, uint32_t value)
{
	((uint8_t*)dest)[0] = value >> 24;
	((uint8_t*)dest)[1] = (value >> 16) & 0xFF;
	((uint8_t*)dest)[2] = (value >> 8) & 0xFF;
	((uint8_t*)dest)[3] = value & 0xFF;
}

inline void beput64 (void *dest, uint64_t value)
{
	beput32 (dest, value >> 32);
	beput32 ((uint8_t*)dest + 4, value & 0xFFFFFFFF);
}

inline uint64_t leget64 (const void *vp)
{
	return (uint64_t(((uint8_t*)vp)[7]) << 56) |
	       (uint64_t(((uint8_t*)vp)[6]) << 48) |
	       (uint64_t(((uint8_t*)vp)[5]) << 40) |
	       (uint64_t(((uint8_t*)vp)[4]) << 32) |
	       (uint64_t(((uint8_t*)vp)[3]) << 24) |
	       (uint64_t(((uint8_t*)vp)[2]) << 16) |
	       (uint64_t(((uint8_t*)vp)[1]) << 8) |
	       ((uint8_t*)vp)[0];
}

inline void leput64 (void *dest, uint64_t value)
{
	for (int i = 0; i < 8; ++i) {
		((uint8_t*)dest)[i] = value & 0xFF;
		value >>= 8;
	}
}

// Reinterpret the bits of a double.
inline uint64_t double_bits (double d)
{
	uint64_t u;
	memcpy (&u, &d, sizeof u);
	return u;
}

inline double bits_double (uint64_t u)
{
	double d;
	memcpy (&d, &u, sizeof d);
	return d;
}


// Base 64 encoding with the standard alphabet and padding.

// Encode in Base 64 and append to dest.
EXPORTFN
void base64enc (const uint8_t *bytes, size_t nbytes, std::string &dest);

// Decode the n characters of s and append the bytes to v. White space is
// skipped. Return false if there are characters outside of the alphabet or
// if the padding is wrong.
EXPORTFN
bool base64dec (const char *s, size_t n, std::vector<uint8_t> &v);


// Hexadecimal encoding. Lower case on output, any case on input.
EXPORTFN
void write_hex (std::string &dst, const void *b, size_t nbytes);

// Decode exactly n characters. Return false on odd length or non hex
// characters.
EXPORTFN
bool read_hex (const char *s, size_t n, std::vector<uint8_t> &dst);

inline int hexval (char c)
{
	if ('0' <= c && c <= '9') {
		return c - '0';
	} else if ('a' <= c && c <= 'f') {
		return c - 'a' + 10;
	} else if ('A' <= c && c <= 'F') {
		return c - 'A' + 10;
	} else {
		return -1;
	}
}

extern const char hex_digits[];


// UTF-8 decoding. Return the length of the valid sequence that starts at s
// and store its code point in *cp. Return 0 if the bytes at s are not a
// valid, shortest form sequence of a Unicode scalar value.
EXPORTFN size_t utf8_sequence (const char *s, size_t n, uint32_t *cp);

// True if the whole string is well formed UTF-8.
EXPORTFN bool is_utf8 (const char *s, size_t n);

inline bool is_utf8 (const std::string &s)
{
	return is_utf8 (s.data(), s.size());
}

}}

#endif

