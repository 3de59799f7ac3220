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



#include "error.hpp"


namespace llsd {   namespace LLSD_SONAME {


Error_kind kind_of (Errc code)
{
	switch (code) {
	case wrong_variant:
		return kind_type_mismatch;

	case unknown_type:
	case unknown_tag:
		return kind_unknown_type;

	case invalid_uuid:
	case invalid_date:
	case invalid_binary:
	case invalid_integer:
	case invalid_real:
	case invalid_boolean:
		return kind_invalid_primitive;

	case unsupported_value:
	case unsupported_form:
		return kind_unsupported;

	case malformed_xml:
	case structural_error:
	case unterminated_structure:
	case bad_header:
	case truncated_input:
	case trailing_data:
	case too_deep:
	case bad_compression:
		break;
	}
	return kind_malformed;
}


const char * errc_name (Errc code)
{
	switch (code) {
	case wrong_variant:          return "wrong variant";
	case malformed_xml:          return "malformed XML";
	case structural_error:       return "structural error";
	case unterminated_structure: return "unterminated structure";
	case bad_header:             return "bad header";
	case truncated_input:        return "truncated input";
	case trailing_data:          return "trailing data";
	case too_deep:               return "nesting too deep";
	case bad_compression:        return "bad compression";
	case unknown_type:           return "unknown type";
	case unknown_tag:            return "unknown tag";
	case invalid_uuid:           return "invalid UUID";
	case invalid_date:           return "invalid date";
	case invalid_binary:         return "invalid binary encoding";
	case invalid_integer:        return "invalid integer";
	case invalid_real:           return "invalid real";
	case invalid_boolean:        return "invalid boolean";
	case unsupported_value:      return "unsupported value";
	case unsupported_form:       return "unsupported form";
	}
	return "unknown error";
}


static std::string decorate (Errc code, const std::string &msg, ptrdiff_t offset)
{
	if (offset < 0) {
		return sformat ("%s: %s", errc_name(code), msg);
	}
	return sformat ("%s at offset %d: %s", errc_name(code), offset, msg);
}


Error::Error (Errc code, const std::string &msg, ptrdiff_t offset)
	: std::runtime_error (decorate (code, msg, offset))
	, ec (code)
	, off (offset)
{
}


void rethrow_at (const Error &e, ptrdiff_t offset)
{
	if (e.offset() >= 0) {
		throw e;
	}
	// Strip the code prefix added by the first constructor.
	std::string msg = e.what();
	std::string prefix = std::string(errc_name (e.code())) + ": ";
	if (msg.compare (0, prefix.size(), prefix) == 0) {
		msg.erase (0, prefix.size());
	}
	throw Error (e.code(), msg, offset);
}


}}

