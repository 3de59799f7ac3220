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

#ifndef LLSD_PRIMITIVE_HPP
#define LLSD_PRIMITIVE_HPP

// Text forms of the scalar values, shared by the codecs. The decoders take a
// pointer and a length and throw Error with one of the invalid_* codes and
// no offset. The codecs add the position with rethrow_at().

#include "soname.hpp"
#include "value.hpp"
#include <stdint.h>
#include <stddef.h>
#include <string>

namespace llsd {   namespace LLSD_SONAME {

// How binary values are written as text.
enum Binary_encoding { base64, base16 };


// Canonical 8-4-4-4-12 form, lower case.
EXPORTFN std::string format_uuid (const Uuid &u);
EXPORTFN void append_uuid (std::string &dst, const Uuid &u);
// Hex digits may have any case. Throws invalid_uuid.
EXPORTFN Uuid parse_uuid (const char *s, size_t n);
inline Uuid parse_uuid (const std::string &s) { return parse_uuid (s.data(), s.size()); }


// YYYY-MM-DDTHH:MM:SSZ, proleptic Gregorian calendar, UTC. Only the years
// 0000 to 9999 have this form: other dates throw unsupported_value.
EXPORTFN std::string format_date (int64_t seconds);

const int64_t min_text_date = -62167219200LL;    // 0000-01-01T00:00:00Z
const int64_t max_text_date = 253402300799LL;    // 9999-12-31T23:59:59Z

// Accepts YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM). The fraction is
// dropped, rounding toward the earlier second. Throws invalid_date.
EXPORTFN int64_t parse_date (const char *s, size_t n);
inline int64_t parse_date (const std::string &s) { return parse_date (s.data(), s.size()); }


// Shortest decimal text that reads back as the same double. Non finite
// values are written as nan, inf and -inf.
EXPORTFN std::string format_real (double r);

// [sign] digits [. digits] [e [sign] digits]. If allow_special is true the
// words nan, inf, infinity with optional sign are also accepted in any case.
// Throws invalid_real.
EXPORTFN double parse_real (const char *s, size_t n, bool allow_special);

// True if s starts like one of the non finite spellings.
EXPORTFN bool is_special_real (const char *s, size_t n);


EXPORTFN std::string format_integer (int32_t i);
// [sign] digits. Throws invalid_integer if the value does not fit.
EXPORTFN int32_t parse_integer (const char *s, size_t n);


EXPORTFN std::string encode_binary (const Binary &b, Binary_encoding enc);
// Throws invalid_binary.
EXPORTFN Binary decode_binary (const char *s, size_t n, Binary_encoding enc);

}}

#endif

