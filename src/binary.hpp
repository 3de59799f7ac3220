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

#ifndef LLSD_BINARY_HPP
#define LLSD_BINARY_HPP

#include "soname.hpp"
#include "value.hpp"
#include <stdint.h>
#include <stddef.h>
#include <string>
#include <memory>

namespace llsd { namespace LLSD_SONAME {

// The binary form is a header line followed by a single tagged value:
//
//   !          undefined
//   1 0        true, false
//   i          int32, big endian
//   r          IEEE double, big endian
//   u          16 bytes
//   s l b      string, uri and binary: uint32 length, big endian, and the bytes
//   d          IEEE double with the seconds since the epoch, little endian
//   [          uint32 count, the values and ]
//   {          uint32 count, for each entry k, uint32 length, the key bytes
//              and the value. Closed by }
//
// See http://wiki.secondlife.com/wiki/LLSD for the published description.

EXPORTFN extern const char binary_header[];
// Length of the header, without the terminating null.
enum { binary_header_size = 18 };

struct Binary_options {
	int max_depth;      // Maximum nesting of arrays and maps.

	Binary_options() : max_depth(256) {}
};


class EXPORTFN Binary_writer {
	struct Data;
	std::unique_ptr<Data> data;  // pimpl idiom.

public:
	// Append the output to *dest.
	Binary_writer (std::string *dest);
	~Binary_writer();

	void write_header();

	// Write one tagged value with all its children. Throws Error with
	// unsupported_value if a length does not fit in 32 bits or a date cannot
	// be stored exactly in a double.
	void write (const Value &v);

	void write_undefined();
	void write_boolean (bool b);
	void write_integer (int32_t i);
	void write_real (double r);
	void write_uuid (const Uuid &u);
	void write_string (const std::string &s);
	void write_date (int64_t seconds);
	void write_uri (const std::string &s);
	void write_binary (const void *p, size_t n);
	void start_array (size_t count);
	void end_array();
	void start_map (size_t count);
	void write_key (const std::string &key);
	void end_map();
};


class EXPORTFN Binary_reader {
	struct Data;
	std::unique_ptr<Data> data;

	Value read_value (int depth);

public:
	// The buffer must outlive the reader.
	Binary_reader (const char *buf, size_t n, const Binary_options &opt=Binary_options());
	~Binary_reader();

	// Throws Error with bad_header if the input does not start with the
	// header line.
	void read_header();

	// Read one value and its children.
	Value read_value();

	// Throws Error with trailing_data if there is input left.
	void expect_end();

	size_t position() const;
};


// Whole document conversions. The parse functions throw Error with the
// offset of the failure in the input.
EXPORTFN Value parse_binary (const char *buf, size_t n, const Binary_options &opt=Binary_options());
EXPORTFN Value parse_binary (const std::string &s, const Binary_options &opt=Binary_options());
EXPORTFN std::string serialize_binary (const Value &v);

// The same without the header line, for callers that frame the value by
// other means.
EXPORTFN Value parse_binary_body (const char *buf, size_t n, const Binary_options &opt=Binary_options());
EXPORTFN std::string serialize_binary_body (const Value &v);

}}

#endif

