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

#include "serialize.hpp"
#include "binary.hpp"
#include "notation.hpp"
#include "xml.hpp"
#include "zwrap.hpp"
#include "error.hpp"
#include <ctype.h>
#include <string.h>


namespace llsd {   namespace LLSD_SONAME {

static bool is_blank (char c)
{
	return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

static bool starts_nocase (const char *p, const char *lim, const char *word)
{
	size_t len = strlen (word);
	if (size_t(lim - p) < len) return false;
	for (size_t i = 0; i < len; ++i) {
		if (tolower ((unsigned char)p[i]) != tolower ((unsigned char)word[i])) return false;
	}
	return true;
}

// The text between "<?" and "?>", without the surrounding blanks.
static std::string header_word (const char *p, const char *lim)
{
	p += 2;
	while (p != lim && is_blank (*p)) ++p;
	const char *start = p;
	while (p != lim && !is_blank (*p) && *p != '?' && *p != '\n') ++p;
	std::string res (start, p);
	for (auto &c : res) {
		c = tolower ((unsigned char)c);
	}
	return res;
}

// Length of a leading UTF-8 byte order mark, 0 if there is none.
static size_t bom_size (const char *buf, size_t n)
{
	return n >= 3 && memcmp (buf, "\xEF\xBB\xBF", 3) == 0 ? 3 : 0;
}


Format detect_format (const char *buf, size_t n)
{
	const char *lim = buf + n;
	if (n >= size_t(binary_header_size) && memcmp (buf, binary_header, binary_header_size) == 0) {
		return binary_format;
	}

	const char *p = buf + bom_size (buf, n);
	while (p != lim && is_blank (*p)) ++p;

	if (starts_nocase (p, lim, "<llsd")) {
		return xml_format;
	}
	if (lim - p >= 2 && p[0] == '<' && p[1] == '?') {
		std::string word = header_word (p, lim);
		if (word == "llsd/binary") {
			return binary_format;
		} else if (word == "llsd/xml" || word.compare (0, 3, "xml") == 0) {
			return xml_format;
		}
	}
	return notation_format;
}


Value parse (const char *buf, size_t n)
{
	const size_t bom = bom_size (buf, n);

	switch (detect_format (buf, n)) {
	case binary_format:
		return parse_binary (buf + bom, n - bom);

	case xml_format: {
		// Drop the <? LLSD/XML ?> line, which is not XML. Expat reads the
		// byte order mark itself.
		const char *p = buf + bom;
		const char *lim = buf + n;
		while (p != lim && is_blank (*p)) ++p;
		if (lim - p >= 2 && p[0] == '<' && p[1] == '?' && header_word (p, lim) == "llsd/xml") {
			const char *eol = (const char*)memchr (p, '\n', lim - p);
			p = eol ? eol + 1 : lim;
			return parse_xml (p, lim - p);
		}
		return parse_xml (buf, n);
	}

	case notation_format:
		break;
	}
	return parse_notation (buf + bom, n - bom);
}

Value parse (const std::string &s)
{
	return parse (s.data(), s.size());
}


std::string serialize (const Value &v, Format f)
{
	switch (f) {
	case binary_format:
		return serialize_binary (v);
	case xml_format:
		return serialize_xml (v);
	case notation_format:
		break;
	}
	Notation_options opt;
	opt.header = true;
	return serialize_notation (v, opt);
}



std::string zip (const Value &v, const Zip_options &opt)
{
	std::string plain = serialize_binary (v);
	std::string res;
	ZWrapper zw (opt.level);
	if (zw.compress (plain.data(), plain.size(), &res, true) != 0) {
		throw_error (bad_compression, -1, _("zlib failed to compress: %s."), zw.error_message());
	}
	return res;
}


Value unzip (const char *buf, size_t n, const Zip_options &opt)
{
	std::string plain;
	ZWrapper zw;
	zw.set_limit (opt.max_expanded);
	if (zw.expand (buf, n, &plain, true) != 0) {
		throw_error (bad_compression, zw.tail_offset(), _("zlib failed to expand: %s."), zw.error_message());
	}
	if (!zw.finished()) {
		throw_error (bad_compression, n, _("the compressed stream is incomplete."));
	}
	if (zw.tail_offset() != n) {
		throw_error (bad_compression, zw.tail_offset(), _("%d bytes follow the compressed stream."),
		             n - zw.tail_offset());
	}
	return parse (plain);
}

Value unzip (const std::string &s, const Zip_options &opt)
{
	return unzip (s.data(), s.size(), opt);
}

}}

