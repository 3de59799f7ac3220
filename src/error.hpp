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

#ifndef LLSD_ERROR_HPP
#define LLSD_ERROR_HPP

#include "soname.hpp"
#include "format.hpp"
#include <stddef.h>
#include <stdexcept>
#include <sstream>

namespace llsd {   namespace LLSD_SONAME {

// Detailed reason of a failure. Each code belongs to one of the broad kinds
// below.
enum Errc {
	wrong_variant,           // Typed access to the wrong variant.

	malformed_xml,           // The XML is not well formed.
	structural_error,        // The grammar of the format was violated.
	unterminated_structure,  // Unterminated string or unmatched bracket.
	bad_header,              // Missing or incorrect header line.
	truncated_input,         // A field extends beyond the end of the input.
	trailing_data,           // Non blank data after the top level value.
	too_deep,                // Nesting deeper than the configured limit.
	bad_compression,         // zlib stream could not be expanded.

	unknown_type,            // Element or tag letter not in the known set.
	unknown_tag,             // Binary tag byte not in the known set.

	invalid_uuid,
	invalid_date,
	invalid_binary,          // Bad base64 or base16 text.
	invalid_integer,         // Not a number or does not fit in 32 bits.
	invalid_real,
	invalid_boolean,

	unsupported_value,       // The format cannot represent the value.
	unsupported_form         // Byte counted span in the string variant.
};

// Broad classes of failure.
enum Error_kind {
	kind_malformed,          // Grammar violation, bad header, truncation.
	kind_unknown_type,       // Tag or element not in the recognized set.
	kind_type_mismatch,      // Typed accessor used on the wrong variant.
	kind_invalid_primitive,  // Malformed UUID, date, number or encoding.
	kind_unsupported         // The format cannot carry this value or form.
};

EXPORTFN Error_kind kind_of (Errc code);

// Short name of the code, as used in messages.
EXPORTFN const char * errc_name (Errc code);


// All the failures of the library are reported with this exception. The
// offset is the position in the input where the problem was detected, or
// -1 if there is no input position (serializing or accessing a value).
class EXPORTFN Error : public std::runtime_error {
	Errc        ec;
	ptrdiff_t   off;
public:
	Error (Errc code, const std::string &msg, ptrdiff_t offset=-1);

	Errc code() const { return ec; }
	Error_kind kind() const { return kind_of (ec); }
	ptrdiff_t offset() const { return off; }
};


// Throw an Error with the message built by format().
template <class ...Args>
void throw_error (Errc code, ptrdiff_t offset, const char *fmt, const Args &... args)
{
	std::ostringstream os;
	format (os, fmt, args...);
	throw Error (code, os.str(), offset);
}

// Throw again with the position of the failure in the input. Used by the
// codecs when a primitive decoder fails without knowing where it was called.
EXPORTFN void rethrow_at (const Error &e, ptrdiff_t offset);

}}

#endif

