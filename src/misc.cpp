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

#include "misc.hpp"


namespace llsd {    namespace LLSD_SONAME {


const char hex_digits[] = "0123456789abcdef";


// Base 64 encoding.

static const char base64_alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
						"abcdefghijklmnopqrstuvwxyz"
						"0123456789+/";


inline void base64_add_three (const uint32_t beval, std::string *dest)
{
	dest->push_back (base64_alphabet[beval >> 18]);
	dest->push_back (base64_alphabet[(beval >> 12) & 0x3F]);
	dest->push_back (base64_alphabet[(beval >> 6) & 0x3F]);
	dest->push_back (base64_alphabet[beval & 0x3F]);
}


void base64enc (const uint8_t *bytes, size_t nbytes, std::string &dest)
{
	dest.reserve (dest.size() + (nbytes + 2) / 3 * 4);
	while (nbytes >= 3) {
		// Big endian representation of the first 3 bytes.
		uint32_t three_bytes = (uint32_t(bytes[0]) << 16)
				| (uint32_t(bytes[1]) << 8) | bytes[2];

		base64_add_three (three_bytes, &dest);
		bytes += 3;
		nbytes -= 3;
	}

	if (nbytes == 1) {
		dest.push_back (base64_alphabet[bytes[0] >> 2]);
		dest.push_back (base64_alphabet[(bytes[0] & 3) << 4]);
		dest.push_back ('=');
		dest.push_back ('=');
	} else if (nbytes == 2) {
		dest.push_back (base64_alphabet[bytes[0] >> 2]);
		dest.push_back (base64_alphabet[((bytes[0] << 4) | (bytes[1] >> 4)) & 0x3F]);
		dest.push_back (base64_alphabet[((bytes[1] & 0xF) << 2) & 0x3F]);
		dest.push_back ('=');
	}
}


static bool is_blank (char c)
{
	return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}


bool base64dec (const char *s, size_t n, std::vector<uint8_t> &v)
{
	uint32_t val, cumul = 0;
	int pending = 4;
	int padding = 0;

	while (n > 0) {
		char c = *s++;
		--n;
		if (is_blank (c)) {
			continue;
		}
		if (c == '=') {
			++padding;
			continue;
		}
		if (padding > 0) {
			// Data after the padding.
			return false;
		}
		if (c >= 'A' && c <= 'Z') {
			val = c - 'A';
		} else if (c >= 'a' && c <= 'z') {
			val = c - 'a' + 26;
		} else if (c >= '0' && c <= '9') {
			val = c - '0' + 52;
		} else if (c == '+') {
			val = 62;
		} else if (c == '/') {
			val = 63;
		} else {
			return false;
		}
		cumul = (cumul << 6) | val;
		if (--pending == 0) {
			v.push_back (cumul >> 16);
			v.push_back ((cumul >> 8) & 0xFF);
			v.push_back (cumul & 0xFF);
			pending = 4;
			cumul = 0;
		}
	}

	if (pending == 1) {
		// We read 3 base64s. We have 18 bits in cumul.
		if (padding != 0 && padding != 1) return false;
		v.push_back (cumul >> 10);
		v.push_back ((cumul >> 2) & 0xFF);
	} else if (pending == 2) {
		// We have 2 base64s. We have 12 bits in cumul.
		if (padding != 0 && padding != 2) return false;
		v.push_back (cumul >> 4);
	} else if (pending == 3) {
		// A single character cannot encode a byte.
		return false;
	} else if (padding != 0) {
		return false;
	}
	return true;
}



void write_hex (std::string &dst, const void *vb, size_t nbytes)
{
	const uint8_t *b = (const uint8_t*)vb;
	dst.reserve (dst.size() + nbytes * 2);
	for (size_t i = 0; i < nbytes; ++i) {
		dst.push_back (hex_digits[b[i] >> 4]);
		dst.push_back (hex_digits[b[i] & 0xF]);
	}
}


bool read_hex (const char *in, size_t n, std::vector<uint8_t> &dst)
{
	if (n % 2 != 0) return false;
	dst.reserve (dst.size() + n / 2);
	for (size_t i = 0; i < n; i += 2) {
		int hi = hexval (in[i]);
		int lo = hexval (in[i + 1]);
		if (hi < 0 || lo < 0) return false;
		dst.push_back ((hi << 4) | lo);
	}
	return true;
}



size_t utf8_sequence (const char *s, size_t n, uint32_t *cp)
{
	if (n == 0) return 0;

	const uint8_t *u = (const uint8_t*)s;
	uint32_t c = u[0];
	size_t len;
	uint32_t min;

	if (c < 0x80) {
		*cp = c;
		return 1;
	} else if ((c & 0xE0) == 0xC0) {
		len = 2;
		min = 0x80;
		c &= 0x1F;
	} else if ((c & 0xF0) == 0xE0) {
		len = 3;
		min = 0x800;
		c &= 0x0F;
	} else if ((c & 0xF8) == 0xF0) {
		len = 4;
		min = 0x10000;
		c &= 0x07;
	} else {
		return 0;
	}

	if (n < len) return 0;
	for (size_t i = 1; i < len; ++i) {
		if ((u[i] & 0xC0) != 0x80) return 0;
		c = (c << 6) | (u[i] & 0x3F);
	}

	// Overlong forms, surrogates and values above the Unicode range.
	if (c < min || (c >= 0xD800 && c <= 0xDFFF) || c > 0x10FFFF) {
		return 0;
	}
	*cp = c;
	return len;
}


bool is_utf8 (const char *s, size_t n)
{
	uint32_t cp;
	while (n > 0) {
		size_t len = utf8_sequence (s, n, &cp);
		if (len == 0) return false;
		s += len;
		n -= len;
	}
	return true;
}


}}

