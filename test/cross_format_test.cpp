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

#include "llsd.hpp"
#include "check.hpp"
#include <math.h>
#include <stdint.h>

using namespace llsd;


// One value of every variant, nested.
static Value every_variant()
{
	uint8_t raw[16];
	for (int i = 0; i < 16; ++i) raw[i] = 0xF0 | i;

	Array scalars;
	scalars.push_back (Value());
	scalars.push_back (Value(true));
	scalars.push_back (Value(false));
	scalars.push_back (Value(-7));
	scalars.push_back (Value(3.25));
	scalars.push_back (Value(Uuid(raw)));
	scalars.push_back (Value::make_string ("tab\there, quote ' and \" and <xml> & \xe2\x82\xac"));
	scalars.push_back (Value::make_date (-86400));
	scalars.push_back (Value::make_uri ("http://example.com/?a=1&b=2"));
	scalars.push_back (Value::make_binary ("\0\x7f\x80\xff", 4));

	Map inner;
	inner.insert ("", Value::make_string (""));
	inner.insert ("empty array", Value(Array()));
	inner.insert ("empty map", Value(Map()));

	Map top;
	top.insert ("scalars", Value(std::move(scalars)));
	top.insert ("inner", Value(std::move(inner)));
	top.insert ("k\xc3\xa9y", Value(1.0 / 3));
	return Value(std::move(top));
}


void test_round_trips()
{
	Value v = every_variant();

	check (parse_xml (serialize_xml (v)) == v, "xml round trip");
	check (parse_binary (serialize_binary (v)) == v, "binary round trip");
	check (parse_notation (serialize_notation (v)) == v, "notation byte variant round trip");

	Notation_options sv;
	sv.variant = string_variant;
	check (parse_notation (serialize_notation (v, sv), sv) == v, "notation string variant round trip");
	sv.binary_encoding = base16;
	check (parse_notation (serialize_notation (v, sv), sv) == v, "notation base16 round trip");

	Xml_options pretty;
	pretty.indent = 4;
	check (parse_xml (serialize_xml (v, pretty)) == v, "indented xml round trip");
}


void test_cross_format()
{
	Value v = every_variant();
	Value from_xml = parse_xml (serialize_xml (v));
	Value from_binary = parse_binary (serialize_binary (from_xml));
	Value from_notation = parse_notation (serialize_notation (from_binary));
	check (from_notation == v, "xml to binary to notation");
	check (serialize_binary (from_notation) == serialize_binary (v), "same binary bytes after the trip");

	// The string variant is valid character data inside XML.
	Notation_options sv;
	sv.variant = string_variant;
	std::string text = serialize_notation (v, sv);
	Value wrapped = parse_xml (serialize_xml (Value::make_string (text)));
	check (parse_notation (wrapped.as_string(), sv) == v, "notation embedded in xml");
}


void test_duplicate_keys()
{
	Value xml = parse_xml ("<llsd><map><key>a</key><integer>1</integer>"
	                       "<key>a</key><integer>2</integer></map></llsd>");
	Value notation = parse_notation ("{'a':i1,'a':i2}");
	std::string bytes = std::string(binary_header) +
	                    std::string("{\0\0\0\2k\0\0\0\1ai\0\0\0\1k\0\0\0\1ai\0\0\0\2}", 28);
	Value binary = parse_binary (bytes);

	check (xml == notation && notation == binary, "every format keeps the last duplicate");
	check (xml.size() == 1 && *xml.as_map().find ("a") == Value(2), "last write wins");
}


void test_date_range()
{
	Notation_options sv;
	sv.variant = string_variant;

	static const int64_t text_dates[] = { max_text_date, min_text_date, -1, 0 };
	for (int64_t d : text_dates) {
		Value v = Value::make_date (d);
		check (parse_xml (serialize_xml (v)) == v, "date limit through xml");
		check (parse_notation (serialize_notation (v)) == v, "date limit through notation");
		check (parse_notation (serialize_notation (v, sv), sv) == v, "date limit through the string variant");
		check (parse_binary (serialize_binary (v)) == v, "date limit through binary");
	}
	check (serialize_xml (Value::make_date (max_text_date)).find ("<date>9999-12-31T23:59:59Z</date>")
	       != std::string::npos, "year 9999 in xml");
	check_equal (serialize_notation (Value::make_date (min_text_date)), "d\"0000-01-01T00:00:00Z\"",
	             "year 0 in notation");

	// Dates without a text form only travel through binary.
	static const int64_t binary_dates[] = { max_text_date + 1, min_text_date - 1,
	                                        INT64_C(9007199254740992), -INT64_C(9007199254740992) };
	for (int64_t d : binary_dates) {
		Value v = Value::make_date (d);
		check_throws ([&] { serialize_xml (v); }, unsupported_value, "year beyond 9999 in xml");
		check_throws ([&] { serialize_notation (v); }, unsupported_value, "year beyond 9999 in notation");
		check_throws ([&] { serialize_notation (v, sv); }, unsupported_value,
		              "year beyond 9999 in the string variant");
		check (parse_binary (serialize_binary (v)) == v, "year beyond 9999 in binary");
	}

	static const int64_t extremes[] = { INT64_MAX, INT64_MIN };
	for (int64_t d : extremes) {
		Value v = Value::make_date (d);
		check_throws ([&] { serialize_xml (v); }, unsupported_value, "extreme date in xml");
		check_throws ([&] { serialize_notation (v); }, unsupported_value, "extreme date in notation");
		check_throws ([&] { serialize_binary (v); }, unsupported_value, "extreme date in binary");
	}
}


void test_determinism()
{
	Value v = every_variant();
	Value copy = v;
	check (serialize_xml (v) == serialize_xml (copy), "xml output is deterministic");
	check (serialize_binary (v) == serialize_binary (copy), "binary output is deterministic");
	check (serialize_notation (v) == serialize_notation (copy), "notation output is deterministic");

	// Map order is the order of insertion, not of the keys.
	Map m;
	m.insert ("z", Value(1));
	m.insert ("a", Value(2));
	check_equal (serialize_notation (Value(std::move(m))), "{'z':i1,'a':i2}", "insertion order");
}


void test_scenarios()
{
	std::string x = serialize_xml (Value(true));
	check (x.find ("<boolean>true</boolean>") != std::string::npos, "boolean element");
	check (parse_xml (x) == Value(true), "boolean from xml");

	std::string b = serialize_binary (Value(42));
	check_equal (b.substr (binary_header_size), std::string("i\0\0\0\x2a", 5), "integer tag and bytes");
	check (parse_binary (b) == Value(42), "integer from binary");

	Value nil ((Uuid()));
	Notation_options sv;
	sv.variant = string_variant;
	check (serialize_xml (nil).find ("<uuid>00000000-0000-0000-0000-000000000000</uuid>") != std::string::npos,
	       "nil uuid in xml");
	check_equal (serialize_notation (nil, sv), "u00000000-0000-0000-0000-000000000000", "nil uuid in notation");

	Value m = parse_notation ("{'a':i1,'a':i2}");
	check (m.size() == 1 && *m.as_map().find ("a") == Value(2), "duplicate keys in notation");

	check_throws ([] { serialize_notation (Value(INFINITY)); }, unsupported_value, "infinity in notation");
	check (parse_binary (serialize_binary (Value(INFINITY))).as_real() == INFINITY, "infinity in binary");

	try {
		parse_notation ("s(3)\"abc\"", sv);
		check (false, "byte counted string in the string variant must throw");
	} catch (const Error &e) {
		check (e.kind() == kind_unsupported, "byte counted string is unsupported");
	}
}


int real_main()
{
	test_round_trips();
	test_cross_format();
	test_duplicate_keys();
	test_date_range();
	test_determinism();
	test_scenarios();
	return report ("cross_format_test");
}

int main()
{
	return run_main (real_main);
}

