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

#ifndef LLSD_SERIALIZE_HPP
#define LLSD_SERIALIZE_HPP

#include "soname.hpp"
#include "value.hpp"
#include <stddef.h>
#include <string>

namespace llsd {   namespace LLSD_SONAME {

enum Format { xml_format, binary_format, notation_format };

struct Zip_options {
	int    level;           // zlib compression level.
	size_t max_expanded;    // unzip() fails beyond this many expanded bytes.

	Zip_options() : level(9), max_expanded(64 * 1024 * 1024) {}
};

// Guess the format from the first line:
//
//   <? LLSD/Binary ?>             binary
//   <? llsd/notation ?>           notation, in any case
//   <? LLSD/XML ?>, <?xml, <llsd  XML
//   anything else                 notation
//
// A UTF-8 byte order mark before the first line is skipped.
EXPORTFN Format detect_format (const char *buf, size_t n);

// Parse with the codec chosen by detect_format().
EXPORTFN Value parse (const char *buf, size_t n);
EXPORTFN Value parse (const std::string &s);

// Serialize with the given codec. The binary and notation forms get their
// header line. Notation uses the byte stream variant.
EXPORTFN std::string serialize (const Value &v, Format f);

// The zlib stream of the binary form, as exchanged by the asset servers.
EXPORTFN std::string zip (const Value &v, const Zip_options &opt=Zip_options());

// Expand and parse. Throws Error with bad_compression if the zlib stream is
// damaged, incomplete, followed by other data or expands beyond the limit.
EXPORTFN Value unzip (const char *buf, size_t n, const Zip_options &opt=Zip_options());
EXPORTFN Value unzip (const std::string &s, const Zip_options &opt=Zip_options());

}}

#endif

