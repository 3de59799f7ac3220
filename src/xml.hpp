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

#ifndef LLSD_XML_HPP
#define LLSD_XML_HPP

#include "soname.hpp"
#include "value.hpp"
#include <stddef.h>
#include <string>

namespace llsd {   namespace LLSD_SONAME {

struct Xml_options {
	int indent;         // Spaces per nesting level. 0 writes everything in one line.
	int max_depth;      // Maximum nesting of arrays and maps when parsing.

	Xml_options() : indent(0), max_depth(256) {}
};

// Parse a document with an <llsd> root holding a single value. The document
// is checked by expat before any value is built, so a document that is not
// well formed throws Error with malformed_xml, whatever its content.
EXPORTFN Value parse_xml (const char *buf, size_t n, const Xml_options &opt=Xml_options());
EXPORTFN Value parse_xml (const std::string &s, const Xml_options &opt=Xml_options());

// Write the XML declaration and the <llsd> document. Binary values are
// always written in base64. Throws Error with unsupported_value if a string,
// key or URI is not valid UTF-8 or holds a character that XML 1.0 does not
// allow.
EXPORTFN std::string serialize_xml (const Value &v, const Xml_options &opt=Xml_options());

}}

#endif

