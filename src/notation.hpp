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

#ifndef LLSD_NOTATION_HPP
#define LLSD_NOTATION_HPP

#include "soname.hpp"
#include "value.hpp"
#include "primitive.hpp"
#include <stddef.h>
#include <string>

namespace llsd {   namespace LLSD_SONAME {

// The notation form comes in two flavours. The byte stream variant writes
// binary values as byte counted spans, b(N)"raw", so its output may contain
// any byte. The string variant never writes byte counted spans: its output
// is valid UTF-8 and may be embedded in XML after the usual escaping. Its
// parser rejects byte counted spans.
enum Notation_variant { bytes_variant, string_variant };

EXPORTFN extern const char notation_header[];

struct Notation_options {
	Notation_variant variant;
	Binary_encoding  binary_encoding;   // For the string variant.
	bool             header;            // Write the header line.
	int              max_depth;         // Maximum nesting when parsing.

	Notation_options()
		: variant(bytes_variant), binary_encoding(base64), header(false), max_depth(256) {}
};

// An optional header line is skipped.
EXPORTFN Value parse_notation (const char *buf, size_t n, const Notation_options &opt=Notation_options());
EXPORTFN Value parse_notation (const std::string &s, const Notation_options &opt=Notation_options());

// Throws Error with unsupported_value for infinite and NaN reals, which the
// notation form cannot express.
EXPORTFN std::string serialize_notation (const Value &v, const Notation_options &opt=Notation_options());

}}

#endif

