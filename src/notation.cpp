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

#include "notation.hpp"
#include "misc.hpp"
#include "error.hpp"
#include <math.h>
#include <ctype.h>
#include <string.h>
#include <stdlib.h>


namespace llsd {   namespace LLSD_SONAME {

const char notation_header[] = "<? llsd/notation ?>\n";

namespace {

class Notation_parser {
	const char       *beg, *p, *lim;
	Notation_options opt;

	ptrdiff_t pos() const { return p - beg; }
	bool at_end() const { return p == lim; }

	void skip_blanks();
	void skip_header();
	void check_depth (int depth, ptrdiff_t start);
	void expect (char c, const char *what);
	void byte_counted_allowed (ptrdiff_t start);

	std::string token (const char *accepted);
	std::string quoted (char quote);
	std::string quoted();
	std::string counted();

	Value boolean (char first);
	Value real();
	Value uuid();
	Value binary();
	Value array (int depth);
	Value map (int depth);
	Value value (int depth);

public:
	Notation_parser (const char *buf, size_t n, const Notation_options &o)
		: beg(buf), p(buf), lim(buf + n), opt(o) {}

	Value document();
};


void Notation_parser::skip_blanks()
{
	while (p != lim && (*p == ' ' || *p == '\t' || *p == '\n' || *p == '\r' ||
	                    *p == '\f' || *p == '\v')) {
		++p;
	}
}

// The header is accepted in any case.
void Notation_parser::skip_header()
{
	static const char header[] = "<? llsd/notation ?>";
	const size_t len = sizeof header - 1;
	if (size_t(lim - p) < len) return;
	for (size_t i = 0; i < len; ++i) {
		if (tolower ((unsigned char)p[i]) != header[i]) return;
	}
	p += len;
}

void Notation_parser::check_depth (int depth, ptrdiff_t start)
{
	if (depth >= opt.max_depth) {
		throw_error (too_deep, start, _("more than %d levels of nesting."), opt.max_depth);
	}
}

void Notation_parser::expect (char c, const char *what)
{
	if (at_end()) {
		throw_error (unterminated_structure, pos(), _("the input ends inside %s."), what);
	}
	if (*p != c) {
		throw_error (structural_error, pos(), _("expected '%c' in %s, found '%c'."), c, what, *p);
	}
	++p;
}

void Notation_parser::byte_counted_allowed (ptrdiff_t start)
{
	if (opt.variant == string_variant) {
		throw_error (unsupported_form, start, _("byte counted values are not allowed in the string variant."));
	}
}


// The longest run of characters in the accepted set.
std::string Notation_parser::token (const char *accepted)
{
	const char *start = p;
	while (p != lim && *p != 0 && strchr (accepted, *p)) ++p;
	return std::string (start, p);
}


// Read up to the closing quote. The opening quote has been consumed.
std::string Notation_parser::quoted (char quote)
{
	ptrdiff_t start = pos() - 1;
	std::string res;
	for (;;) {
		if (at_end()) {
			throw_error (unterminated_structure, start, _("the string has no closing quote."));
		}
		char c = *p++;
		if (c == quote) {
			return res;
		}
		if (c != '\\') {
			res.push_back (c);
			continue;
		}
		if (at_end()) {
			throw_error (unterminated_structure, start, _("the string has no closing quote."));
		}
		c = *p++;
		switch (c) {
		case 'a': res.push_back ('\a'); break;
		case 'b': res.push_back ('\b'); break;
		case 'f': res.push_back ('\f'); break;
		case 'n': res.push_back ('\n'); break;
		case 'r': res.push_back ('\r'); break;
		case 't': res.push_back ('\t'); break;
		case 'v': res.push_back ('\v'); break;
		case 'x': {
			int hi = lim - p >= 2 ? hexval (p[0]) : -1;
			int lo = lim - p >= 2 ? hexval (p[1]) : -1;
			if (hi < 0 || lo < 0) {
				throw_error (structural_error, pos() - 2, _("\\x must be followed by two hex digits."));
			}
			res.push_back (char((hi << 4) | lo));
			p += 2;
			break;
		}
		default:
			// \\, \', \" and anything else stand for themselves.
			res.push_back (c);
		}
	}
}

// A quoted string with either kind of quote.
std::string Notation_parser::quoted()
{
	if (at_end()) {
		throw_error (unterminated_structure, pos(), _("expected a quoted string, found the end of the input."));
	}
	char q = *p;
	if (q != '"' && q != '\'') {
		throw_error (structural_error, pos(), _("expected a quoted string, found '%c'."), q);
	}
	++p;
	return quoted (q);
}

// (N)"raw bytes". The tag letter has been consumed.
std::string Notation_parser::counted()
{
	ptrdiff_t start = pos() - 1;
	expect ('(', "a byte counted value");
	std::string digits = token ("0123456789");
	if (digits.empty() || digits.size() > 10) {
		throw_error (structural_error, start, _("expected the byte count of the value."));
	}
	unsigned long long count = strtoull (digits.c_str(), NULL, 10);
	expect (')', "a byte counted value");
	if (at_end()) {
		throw_error (unterminated_structure, start, _("the byte counted value has no data."));
	}
	char q = *p;
	if (q != '"' && q != '\'') {
		throw_error (structural_error, pos(), _("expected a quote after the byte count, found '%c'."), q);
	}
	++p;
	if ((unsigned long long)(lim - p) < count + 1) {
		throw_error (unterminated_structure, start, _("the input ends before the %d bytes of the value."),
		             count);
	}
	std::string res (p, size_t(count));
	p += count;
	if (*p != q) {
		throw_error (structural_error, pos(), _("the byte counted value must end with the opening quote."));
	}
	++p;
	return res;
}


Value Notation_parser::boolean (char first)
{
	ptrdiff_t start = pos() - 1;
	std::string word (1, first);
	while (p != lim && isalpha ((unsigned char)*p)) {
		word.push_back (*p++);
	}
	for (auto &c : word) {
		c = tolower ((unsigned char)c);
	}
	if (word == "t" || word == "true") {
		return Value(true);
	} else if (word == "f" || word == "false") {
		return Value(false);
	}
	throw_error (invalid_boolean, start, _("'%s' is not a boolean."), word);
	return Value();
}

Value Notation_parser::real()
{
	ptrdiff_t start = pos();
	if (is_special_real (p, lim - p)) {
		throw_error (unsupported_value, start, _("the notation form has no spelling for infinity or NaN."));
	}
	std::string t = token ("+-.0123456789eE");
	try {
		return Value(parse_real (t.data(), t.size(), false));
	} catch (const Error &e) {
		rethrow_at (e, start);
	}
	return Value();
}

Value Notation_parser::uuid()
{
	ptrdiff_t start = pos();
	size_t n = lim - p < 36 ? lim - p : 36;
	const char *s = p;
	p += n;
	try {
		return Value(parse_uuid (s, n));
	} catch (const Error &e) {
		rethrow_at (e, start);
	}
	return Value();
}

// The 'b' has been consumed.
Value Notation_parser::binary()
{
	ptrdiff_t start = pos() - 1;
	Binary_encoding enc;
	if (lim - p >= 2 && p[0] == '6' && p[1] == '4') {
		enc = base64;
		p += 2;
	} else if (lim - p >= 2 && p[0] == '1' && p[1] == '6') {
		enc = base16;
		p += 2;
	} else if (p != lim && *p == '(') {
		byte_counted_allowed (start);
		std::string raw = counted();
		return Value::make_binary (raw.data(), raw.size());
	} else {
		throw_error (structural_error, start, _("binary values are written b64\"...\", b16\"...\" or b(N)\"...\"."));
	}

	std::string text = quoted();
	try {
		return Value::make_binary (decode_binary (text.data(), text.size(), enc));
	} catch (const Error &e) {
		rethrow_at (e, start);
	}
	return Value();
}

Value Notation_parser::array (int depth)
{
	ptrdiff_t start = pos() - 1;
	check_depth (depth, start);
	Array items;
	for (;;) {
		skip_blanks();
		if (at_end()) {
			throw_error (unterminated_structure, start, _("the array has no closing ']'."));
		}
		if (*p == ']') {
			++p;
			break;
		}
		if (*p == ',') {
			++p;
			continue;
		}
		items.push_back (value (depth + 1));
	}
	return Value(std::move(items));
}

Value Notation_parser::map (int depth)
{
	ptrdiff_t start = pos() - 1;
	check_depth (depth, start);
	Map m;
	for (;;) {
		skip_blanks();
		if (at_end()) {
			throw_error (unterminated_structure, start, _("the map has no closing '}'."));
		}
		if (*p == '}') {
			++p;
			break;
		}
		if (*p == ',') {
			++p;
			continue;
		}

		std::string key;
		if (*p == '\'' || *p == '"') {
			key = quoted();
		} else if (*p == 's') {
			byte_counted_allowed (pos());
			++p;
			key = counted();
		} else {
			throw_error (structural_error, pos(), _("expected a quoted map key, found '%c'."), *p);
		}

		skip_blanks();
		expect (':', "a map entry");
		skip_blanks();
		if (at_end()) {
			throw_error (unterminated_structure, start, _("the map has no closing '}'."));
		}
		Value v = value (depth + 1);
		m.insert (std::move(key), std::move(v));
	}
	return Value(std::move(m));
}


Value Notation_parser::value (int depth)
{
	skip_blanks();
	ptrdiff_t start = pos();
	if (at_end()) {
		throw_error (structural_error, start, _("expected a value, found the end of the input."));
	}

	char c = *p++;
	switch (c) {
	case '!':
		return Value();

	case '0':
		return Value(false);

	case '1':
		return Value(true);

	case 't': case 'T': case 'f': case 'F':
		return boolean (c);

	case 'i': {
		std::string t = token ("+-0123456789");
		try {
			return Value(parse_integer (t.data(), t.size()));
		} catch (const Error &e) {
			rethrow_at (e, start);
		}
		break;
	}

	case 'r':
		return real();

	case 'u':
		return uuid();

	case '\'':
	case '"':
		return Value::make_string (quoted (c));

	case 's':
		byte_counted_allowed (start);
		return Value::make_string (counted());

	case 'l':
		return Value::make_uri (quoted());

	case 'd': {
		std::string t = quoted();
		try {
			return Value::make_date (parse_date (t));
		} catch (const Error &e) {
			rethrow_at (e, start);
		}
		break;
	}

	case 'b':
		return binary();

	case '[':
		return array (depth);

	case '{':
		return map (depth);

	case ']':
	case '}':
		throw_error (structural_error, start, _("'%c' does not close anything."), c);
	}

	throw_error (unknown_type, start, _("'%c' does not start a value."), c);
	return Value();
}


Value Notation_parser::document()
{
	skip_blanks();
	skip_header();
	Value v = value (0);
	skip_blanks();
	if (!at_end()) {
		throw_error (trailing_data, pos(), _("%d bytes follow the value."), lim - p);
	}
	return v;
}




class Notation_writer {
	std::string       *out;
	Notation_options  opt;

	void escaped (const std::string &s, char quote);
	void write (const Value &v);

public:
	Notation_writer (std::string *dest, const Notation_options &o) : out(dest), opt(o) {}
	void document (const Value &v);
};


static void put_hex_escape (std::string *out, unsigned char c)
{
	out->append ("\\x");
	out->push_back (hex_digits[c >> 4]);
	out->push_back (hex_digits[c & 0xF]);
}

// Write s between quotes. Control characters, the backslash and the quote
// are escaped. In the string variant the bytes that are not part of a valid
// UTF-8 sequence, and the noncharacters U+FFFE and U+FFFF, are written as
// \xHH.
void Notation_writer::escaped (const std::string &s, char quote)
{
	out->push_back (quote);
	const char *p = s.data();
	size_t n = s.size();
	while (n > 0) {
		unsigned char c = *p;
		size_t len = 1;
		if (c >= 0x80 && opt.variant == bytes_variant) {
			out->push_back (c);
			++p;
			--n;
			continue;
		}
		if (c >= 0x80) {
			uint32_t cp = 0;
			len = utf8_sequence (p, n, &cp);
			if (len == 0 || cp == 0xFFFE || cp == 0xFFFF) {
				size_t bad = len == 0 ? 1 : len;
				for (size_t i = 0; i < bad; ++i) {
					put_hex_escape (out, p[i]);
				}
				len = bad;
			} else {
				out->append (p, len);
			}
			p += len;
			n -= len;
			continue;
		}

		switch (c) {
		case '\a': out->append ("\\a"); break;
		case '\b': out->append ("\\b"); break;
		case '\f': out->append ("\\f"); break;
		case '\n': out->append ("\\n"); break;
		case '\r': out->append ("\\r"); break;
		case '\t': out->append ("\\t"); break;
		case '\v': out->append ("\\v"); break;
		case '\\': out->append ("\\\\"); break;
		default:
			if (c == (unsigned char)quote) {
				out->push_back ('\\');
				out->push_back (c);
			} else if (c < 0x20 || c == 0x7F) {
				put_hex_escape (out, c);
			} else {
				out->push_back (c);
			}
		}
		++p;
		--n;
	}
	out->push_back (quote);
}


void Notation_writer::write (const Value &v)
{
	switch (v.type()) {
	case Value::undefined:
		out->push_back ('!');
		break;

	case Value::boolean:
		out->append (v.as_boolean() ? "true" : "false");
		break;

	case Value::integer:
		out->push_back ('i');
		out->append (format_integer (v.as_integer()));
		break;

	case Value::real:
		if (!isfinite (v.as_real())) {
			throw_error (unsupported_value, -1, _("the notation form cannot express the real %s."),
			             format_real (v.as_real()));
		}
		out->push_back ('r');
		out->append (format_real (v.as_real()));
		break;

	case Value::uuid:
		out->push_back ('u');
		append_uuid (*out, v.as_uuid());
		break;

	case Value::string:
		escaped (v.as_string(), '\'');
		break;

	case Value::date:
		out->append ("d\"");
		out->append (format_date (v.as_date()));
		out->push_back ('"');
		break;

	case Value::uri:
		out->push_back ('l');
		escaped (v.as_uri(), '"');
		break;

	case Value::binary: {
		const Binary &b = v.as_binary();
		if (opt.variant == bytes_variant) {
			out->append ("b(");
			out->append (std::to_string (b.size()));
			out->append (")\"");
			out->append ((const char*)b.data(), b.size());
			out->push_back ('"');
		} else {
			out->append (opt.binary_encoding == base16 ? "b16\"" : "b64\"");
			out->append (encode_binary (b, opt.binary_encoding));
			out->push_back ('"');
		}
		break;
	}

	case Value::array: {
		out->push_back ('[');
		bool first = true;
		for (const auto &child : v.as_array()) {
			if (!first) out->push_back (',');
			first = false;
			write (child);
		}
		out->push_back (']');
		break;
	}

	case Value::map: {
		out->push_back ('{');
		bool first = true;
		for (const auto &e : v.as_map()) {
			if (!first) out->push_back (',');
			first = false;
			escaped (e.first, '\'');
			out->push_back (':');
			write (e.second);
		}
		out->push_back ('}');
		break;
	}
	}
}


void Notation_writer::document (const Value &v)
{
	if (opt.header) {
		out->append (notation_header);
	}
	write (v);
}

}


Value parse_notation (const char *buf, size_t n, const Notation_options &opt)
{
	Notation_parser np (buf, n, opt);
	return np.document();
}

Value parse_notation (const std::string &s, const Notation_options &opt)
{
	return parse_notation (s.data(), s.size(), opt);
}

std::string serialize_notation (const Value &v, const Notation_options &opt)
{
	std::string res;
	Notation_writer nw (&res, opt);
	nw.document (v);
	return res;
}

}}

