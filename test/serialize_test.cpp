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
#include "error.hpp"
#include "check.hpp"
#include <string.h>

using namespace llsd;


static Value sample()
{
	Map m;
	m.insert ("name", Value::make_string ("Ahern"));
	m.insert ("size", Value(256));
	Array a;
	a.push_back (Value(0.5));
	a.push_back (Value::make_date (1138804193));
	a.push_back (Value::make_binary ("\0\1\2\3", 4));
	m.insert ("items", Value(std::move(a)));
	return Value(std::move(m));
}


void test_detect()
{
	struct Case {
		const char *text;
		Format      expected;
	} cases[] = {
		{ "<? LLSD/Binary ?>\n!", binary_format },
		{ "<?xml version=\"1.0\"?><llsd><undef/></llsd>", xml_format },
		{ "  \n<llsd><undef/></llsd>", xml_format },
		{ "<LLSD><undef/></LLSD>", xml_format },
		{ "<? LLSD/XML ?>\n<llsd><undef/></llsd>", xml_format },
		{ "<? llsd/notation ?>\n!", notation_format },
		{ "<? LLSD/Notation ?>\n!", notation_format },
		{ "{'a':i1}", notation_format },
		{ "", notation_format },
		{ "\xEF\xBB\xBF<?xml version=\"1.0\"?><llsd><undef/></llsd>", xml_format },
		{ "\xEF\xBB\xBF<llsd><undef/></llsd>", xml_format },
		{ "\xEF\xBB\xBF<? LLSD/Binary ?>\n!", binary_format },
		{ "\xEF\xBB\xBF[i1]", notation_format },
	};
	for (const Case &c : cases) {
		check (detect_format (c.text, strlen (c.text)) == c.expected, c.text);
	}
}


void test_parse_any()
{
	Value v = sample();
	check (parse (serialize (v, binary_format)) == v, "binary through parse()");
	check (parse (serialize (v, xml_format)) == v, "xml through parse()");
	check (parse (serialize (v, notation_format)) == v, "notation through parse()");

	check (serialize (Value(), notation_format) == "<? llsd/notation ?>\n!", "notation header");
	check (serialize (Value(), binary_format) == std::string(binary_header) + "!", "binary header");

	check (parse ("<? LLSD/XML ?>\n<llsd><integer>5</integer></llsd>") == Value(5), "xml header line");
	check (parse ("[i1,i2]").size() == 2, "notation without header");
	check_throws ([] { parse ("<llsd><integer>5</integer>"); }, malformed_xml, "bad xml through parse()");

	const std::string bom = "\xEF\xBB\xBF";
	check (parse (bom + "<?xml version=\"1.0\"?><llsd><integer>7</integer></llsd>") == Value(7),
	       "xml after a byte order mark");
	check (parse (bom + "<? LLSD/XML ?>\n<llsd><integer>8</integer></llsd>") == Value(8),
	       "xml header line after a byte order mark");
	check (parse (bom + "[i1,i2]").size() == 2, "notation after a byte order mark");
	check (parse (bom + serialize (v, notation_format)) == v, "notation header after a byte order mark");
	check (parse (bom + serialize (v, binary_format)) == v, "binary header after a byte order mark");
}


void test_zip()
{
	Value v = sample();
	std::string z = zip (v);
	check (z.size() > 2 && (unsigned char)z[0] == 0x78, "zlib stream header");
	check (unzip (z) == v, "zip and unzip");

	check_throws ([&] { unzip (z.substr (0, z.size() / 2)); }, bad_compression, "truncated stream");
	check_throws ([&] { unzip (z + "xx"); }, bad_compression, "data after the stream");
	check_throws ([] { unzip (std::string("not compressed")); }, bad_compression, "not zlib");

	std::string corrupt = z;
	corrupt[corrupt.size() / 2] ^= 0x55;
	try {
		unzip (corrupt);
		check (false, "corrupted stream must throw");
	} catch (const Error &e) {
		check (e.kind() == kind_malformed, "corruption is a malformed input");
	}

	Value big = Value::make_string (std::string(100000, 'a'));
	std::string bz = zip (big);
	check (bz.size() < 1000, "repeated text compresses");
	Zip_options small;
	small.max_expanded = 1000;
	check_throws ([&] { unzip (bz, small); }, bad_compression, "expansion limit");
	check (unzip (bz) == big, "within the default limit");
}


int real_main()
{
	test_detect();
	test_parse_any();
	test_zip();
	return report ("serialize_test");
}

int main()
{
	return run_main (real_main);
}

