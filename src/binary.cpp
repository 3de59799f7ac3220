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

#include "binary.hpp"
#include "misc.hpp"
#include "error.hpp"
#include <math.h>
#include <string.h>
#include <algorithm>


namespace llsd {   namespace LLSD_SONAME {

const char binary_header[] = "<? LLSD/Binary ?>\n";

// Largest magnitude of the seconds of a date that a double holds exactly.
static const int64_t max_exact_date = int64_t(1) << 53;


struct Binary_writer::Data {
	std::string *out;

	Data (std::string *dest) : out(dest) {}

	void put_tag (char tag) { out->push_back (tag); }

	void put32 (uint32_t u) {
		char buf[4];
		beput32 (buf, u);
		out->append (buf, 4);
	}

	void put_count (size_t n, const char *what) {
		if (n > 0xFFFFFFFFu) {
			throw_error (unsupported_value, -1, _("the %s has %d elements, more than the 32 bits count allows."),
			             what, n);
		}
		put32 (n);
	}

	void put_span (const void *p, size_t n, const char *what) {
		put_count (n, what);
		out->append ((const char*)p, n);
	}
};


Binary_writer::Binary_writer (std::string *dest)
	: data (new Data(dest))
{
}

Binary_writer::~Binary_writer() {}

void Binary_writer::write_header()
{
	data->out->append (binary_header, binary_header_size);
}

void Binary_writer::write_undefined()
{
	data->put_tag ('!');
}

void Binary_writer::write_boolean (bool b)
{
	data->put_tag (b ? '1' : '0');
}

void Binary_writer::write_integer (int32_t i)
{
	data->put_tag ('i');
	data->put32 (uint32_t(i));
}

void Binary_writer::write_real (double r)
{
	char buf[8];
	beput64 (buf, double_bits (r));
	data->put_tag ('r');
	data->out->append (buf, 8);
}

void Binary_writer::write_uuid (const Uuid &u)
{
	data->put_tag ('u');
	data->out->append ((const char*)u.bytes, sizeof u.bytes);
}

void Binary_writer::write_string (const std::string &s)
{
	data->put_tag ('s');
	data->put_span (s.data(), s.size(), "string");
}

void Binary_writer::write_date (int64_t seconds)
{
	if (seconds > max_exact_date || seconds < -max_exact_date) {
		throw_error (unsupported_value, -1, _("the date %d cannot be stored exactly in the binary form."),
		             seconds);
	}
	char buf[8];
	leput64 (buf, double_bits (double(seconds)));
	data->put_tag ('d');
	data->out->append (buf, 8);
}

void Binary_writer::write_uri (const std::string &s)
{
	data->put_tag ('l');
	data->put_span (s.data(), s.size(), "URI");
}

void Binary_writer::write_binary (const void *p, size_t n)
{
	data->put_tag ('b');
	data->put_span (p, n, "binary value");
}

void Binary_writer::start_array (size_t count)
{
	data->put_tag ('[');
	data->put_count (count, "array");
}

void Binary_writer::end_array()
{
	data->put_tag (']');
}

void Binary_writer::start_map (size_t count)
{
	data->put_tag ('{');
	data->put_count (count, "map");
}

void Binary_writer::write_key (const std::string &key)
{
	data->put_tag ('k');
	data->put_span (key.data(), key.size(), "key");
}

void Binary_writer::end_map()
{
	data->put_tag ('}');
}


void Binary_writer::write (const Value &v)
{
	switch (v.type()) {
	case Value::undefined:
		write_undefined();
		break;
	case Value::boolean:
		write_boolean (v.as_boolean());
		break;
	case Value::integer:
		write_integer (v.as_integer());
		break;
	case Value::real:
		write_real (v.as_real());
		break;
	case Value::uuid:
		write_uuid (v.as_uuid());
		break;
	case Value::string:
		write_string (v.as_string());
		break;
	case Value::date:
		write_date (v.as_date());
		break;
	case Value::uri:
		write_uri (v.as_uri());
		break;
	case Value::binary:
		write_binary (v.as_binary().data(), v.as_binary().size());
		break;
	case Value::array:
		start_array (v.size());
		for (const auto &child : v.as_array()) {
			write (child);
		}
		end_array();
		break;
	case Value::map:
		start_map (v.size());
		for (const auto &e : v.as_map()) {
			write_key (e.first);
			write (e.second);
		}
		end_map();
		break;
	}
}



struct Binary_reader::Data {
	const char      *beg, *p, *lim;
	Binary_options  opt;

	size_t pos() const { return p - beg; }
	size_t remaining() const { return lim - p; }

	void need (size_t n, const char *what) {
		if (remaining() < n) {
			throw_error (truncated_input, pos(), _("%s needs %d bytes but only %d remain."),
			             what, n, remaining());
		}
	}

	uint32_t get32 (const char *what) {
		need (4, what);
		uint32_t u = beget32 (p);
		p += 4;
		return u;
	}

	// Length prefixed bytes.
	std::string get_span (const char *what) {
		uint32_t len = get32 (what);
		need (len, what);
		std::string s (p, len);
		p += len;
		return s;
	}

	void expect_close (char close, const char *what) {
		need (1, what);
		if (*p != close) {
			throw_error (structural_error, pos(), _("the %s must be closed with '%c', found byte 0x%x."),
			             what, close, unsigned((unsigned char)*p));
		}
		++p;
	}
};


Binary_reader::Binary_reader (const char *buf, size_t n, const Binary_options &opt)
	: data (new Data)
{
	data->beg = data->p = buf;
	data->lim = buf + n;
	data->opt = opt;
}

Binary_reader::~Binary_reader() {}

size_t Binary_reader::position() const
{
	return data->pos();
}

void Binary_reader::read_header()
{
	if (data->remaining() < size_t(binary_header_size) ||
	    memcmp (data->p, binary_header, binary_header_size) != 0) {
		throw_error (bad_header, data->pos(), _("the input does not start with %s."),
		             "<? LLSD/Binary ?>");
	}
	data->p += binary_header_size;
}

void Binary_reader::expect_end()
{
	if (data->p != data->lim) {
		throw_error (trailing_data, data->pos(), _("%d bytes follow the value."),
		             data->remaining());
	}
}

Value Binary_reader::read_value()
{
	return read_value (0);
}

Value Binary_reader::read_value (int depth)
{
	size_t start = data->pos();
	data->need (1, "a value");
	char tag = *data->p++;

	switch (tag) {
	case '!':
		return Value();

	case '1':
		return Value(true);

	case '0':
		return Value(false);

	case 'i':
		return Value(int32_t(data->get32 ("an integer")));

	case 'r': {
		data->need (8, "a real");
		double r = bits_double (beget64 (data->p));
		data->p += 8;
		return Value(r);
	}

	case 'u': {
		data->need (16, "a UUID");
		Uuid u ((const uint8_t*)data->p);
		data->p += 16;
		return Value(u);
	}

	case 's':
		return Value::make_string (data->get_span ("a string"));

	case 'l':
		return Value::make_uri (data->get_span ("a URI"));

	case 'b': {
		uint32_t len = data->get32 ("a binary value");
		data->need (len, "a binary value");
		Value v = Value::make_binary (data->p, len);
		data->p += len;
		return v;
	}

	case 'd': {
		data->need (8, "a date");
		double d = bits_double (leget64 (data->p));
		// 2^63 as a double. The valid range is [-2^63, 2^63).
		const double limit = 9223372036854775808.0;
		if (!isfinite (d) || d < -limit || d >= limit) {
			throw_error (invalid_date, start, _("the date %s is outside of the 64 bits range."), d);
		}
		data->p += 8;
		return Value::make_date (int64_t(floor (d)));
	}

	case '[': {
		if (depth >= data->opt.max_depth) {
			throw_error (too_deep, start, _("more than %d levels of nesting."), data->opt.max_depth);
		}
		uint32_t count = data->get32 ("an array count");
		Array items;
		// Each element takes at least one byte.
		items.reserve (std::min<size_t>(count, data->remaining()));
		for (uint32_t i = 0; i < count; ++i) {
			items.push_back (read_value (depth + 1));
		}
		data->expect_close (']', "array");
		return Value(std::move(items));
	}

	case '{': {
		if (depth >= data->opt.max_depth) {
			throw_error (too_deep, start, _("more than %d levels of nesting."), data->opt.max_depth);
		}
		uint32_t count = data->get32 ("a map count");
		Map m;
		// The smallest entry is k, the length and a one byte value.
		m.reserve (std::min<size_t>(count, data->remaining() / 6));
		for (uint32_t i = 0; i < count; ++i) {
			data->need (1, "a map key");
			if (*data->p != 'k') {
				throw_error (structural_error, data->pos(), _("map keys start with 'k', found byte 0x%x."),
				             unsigned((unsigned char)*data->p));
			}
			++data->p;
			std::string key = data->get_span ("a map key");
			Value v = read_value (depth + 1);
			m.insert (std::move(key), std::move(v));
		}
		data->expect_close ('}', "map");
		return Value(std::move(m));
	}

	default:
		throw_error (unknown_tag, start, _("the byte 0x%x is not a type tag."),
		             unsigned((unsigned char)tag));
	}
	return Value();
}



Value parse_binary (const char *buf, size_t n, const Binary_options &opt)
{
	Binary_reader rd (buf, n, opt);
	rd.read_header();
	Value v = rd.read_value();
	rd.expect_end();
	return v;
}

Value parse_binary (const std::string &s, const Binary_options &opt)
{
	return parse_binary (s.data(), s.size(), opt);
}

Value parse_binary_body (const char *buf, size_t n, const Binary_options &opt)
{
	Binary_reader rd (buf, n, opt);
	Value v = rd.read_value();
	rd.expect_end();
	return v;
}

std::string serialize_binary (const Value &v)
{
	std::string res;
	Binary_writer wr (&res);
	wr.write_header();
	wr.write (v);
	return res;
}

std::string serialize_binary_body (const Value &v)
{
	std::string res;
	Binary_writer wr (&res);
	wr.write (v);
	return res;
}

}}

