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
#include "primitive.hpp"
#include "error.hpp"
#include "check.hpp"
#include <math.h>

using namespace llsd;

static Notation_options string_form()
{
	Notation_options opt;
	opt.variant = string_variant;
	return opt;
}


void test_scalars()
{
	check (parse_notation ("!") == Value(), "undefined");
	const char *trues[] = { "1", "t", "T", "true", "TRUE", "True" };
	for (const char *s : trues) {
		check (parse_notation (s) == Value(true), s);
	}
	const char *falses[] = { "0", "f", "F", "false", "FALSE" };
	for (const char *s : falses) {
		check (parse_notation (s) == Value(false), s);
	}
	check (parse_notation ("i42") == Value(42), "integer");
	check (parse_notation ("i-2147483648") == Value(int32_t(-2147483647 - 1)), "smallest integer");
	check (parse_notation ("r1.5") == Value(1.5), "real");
	check (parse_notation ("r-2.5e3") == Value(-2500.0), "real with exponent");
	check (parse_notation ("u6bad258e-06f0-4a87-a659-493117c9c162") ==
	       Value(parse_uuid ("6bad258e-06f0-4a87-a659-493117c9c162")), "uuid");
	check (parse_notation ("'it\\'s'") == Value::make_string ("it's"), "single quotes");
	check (parse_notation ("\"say \\\"hi\\\"\"") == Value::make_string ("say \"hi\""), "double quotes");
	check (parse_notation ("'\\a\\b\\f\\n\\r\\t\\v\\\\\\x41\\q'") ==
	       Value::make_string ("\a\b\f\n\r\t\v\\Aq"), "escapes");
	check (parse_notation ("s(3)\"a'c\"") == Value::make_string ("a'c"), "byte counted string");
	check (parse_notation ("l\"http://example.com/\"") == Value::make_uri ("http://example.com/"), "uri");
	check (parse_notation ("d\"2006-02-01T14:29:53Z\"") == Value::make_date (1138804193), "date");
	check (parse_notation ("b64\"SGVsbG8=\"") == Value::make_binary ("Hello", 5), "base64 binary");
	check (parse_notation ("b16\"48656C6c6f\"") == Value::make_binary ("Hello", 5), "base16 binary");
	check (parse_notation (std::string("b(3)\"\0\xff\"\"", 9)) == Value::make_binary ("\0\xff\"", 3),
	       "byte counted binary");
}


void test_containers()
{
	Value v = parse_notation ("<? llsd/notation ?>\n"
	                          "{ 'a' : i1 ,\n \"b\" : [ true , ! ] , s(1)\"c\":{} }");
	check (v.type() == Value::map && v.size() == 3, "map with header");
	check (*v.as_map().find ("a") == Value(1), "first key");
	const Value *b = v.as_map().find ("b");
	check (b && b->size() == 2 && b->as_array()[1] == Value(), "array entry");
	check (*v.as_map().find ("c") == Value(Map()), "byte counted key");

	check (parse_notation ("[i1 i2,,i3,]").size() == 3, "lenient commas");
	check (parse_notation ("[]") == Value(Array()), "empty array");
	check (parse_notation ("  {}  ") == Value(Map()), "empty map with blanks");

	Value dup = parse_notation ("{'k':i1,'j':i5,'k':i2}");
	check (dup.size() == 2 && *dup.as_map().find ("k") == Value(2), "the last duplicate key wins");
	check (dup.as_map().begin()->first == "j", "an overwritten key moves to the end");
}


void test_serialize()
{
	Map m;
	m.insert ("a", Value(1));
	Array a;
	a.push_back (Value(true));
	a.push_back (Value());
	m.insert ("b", Value(std::move(a)));
	Value v (std::move(m));
	check_equal (serialize_notation (v), "{'a':i1,'b':[true,!]}", "map and array");

	check_equal (serialize_notation (Value(false)), "false", "false");
	check_equal (serialize_notation (Value(0.1)), "r0.1", "real");
	check_equal (serialize_notation (Value(Uuid())), "u00000000-0000-0000-0000-000000000000", "uuid");
	check_equal (serialize_notation (Value::make_date (1138804193)), "d\"2006-02-01T14:29:53Z\"", "date");
	check_equal (serialize_notation (Value::make_uri ("a\"b")), "l\"a\\\"b\"", "uri escapes its quote");
	check_equal (serialize_notation (Value::make_string ("it's\n\\")), "'it\\'s\\n\\\\'", "string escapes");
	check_equal (serialize_notation (Value::make_string ("\x01")), "'\\x01'", "control character");

	Value abc = Value::make_binary ("abc", 3);
	check_equal (serialize_notation (abc), "b(3)\"abc\"", "byte counted binary");
	check_equal (serialize_notation (abc, string_form()), "b64\"YWJj\"", "base64 binary");
	Notation_options hex = string_form();
	hex.binary_encoding = base16;
	check_equal (serialize_notation (abc, hex), "b16\"616263\"", "base16 binary");

	Notation_options header;
	header.header = true;
	check_equal (serialize_notation (Value(), header), "<? llsd/notation ?>\n!", "header line");

	Value raw = Value::make_string ("\xff\xc3\xa9\xef\xbf\xbe");
	check_equal (serialize_notation (raw), "'\xff\xc3\xa9\xef\xbf\xbe'", "the byte variant keeps raw bytes");
	check_equal (serialize_notation (raw, string_form()), "'\\xff\xc3\xa9\\xef\\xbf\\xbe'",
	             "the string variant escapes invalid UTF-8 and noncharacters");
	check (parse_notation (serialize_notation (raw, string_form())) == raw, "escaped bytes read back");

	check_throws ([] { serialize_notation (Value(INFINITY)); }, unsupported_value, "infinity");
	check_throws ([] { serialize_notation (Value(NAN)); }, unsupported_value, "nan");
}


void test_string_variant()
{
	Notation_options opt = string_form();
	check_throws ([&] { parse_notation ("s(3)\"abc\"", opt); }, unsupported_form, "byte counted string");
	check_throws ([&] { parse_notation ("b(3)\"abc\"", opt); }, unsupported_form, "byte counted binary");
	check_throws ([&] { parse_notation ("{s(1)\"a\":!}", opt); }, unsupported_form, "byte counted key");
	try {
		parse_notation ("[s(1)\"a\"]", opt);
		check (false, "byte counted string in the string variant");
	} catch (const Error &e) {
		check (e.kind() == kind_unsupported, "byte counted spans are unsupported");
		check_equal (e.offset(), 1, "offset of the span");
	}
	check (parse_notation ("['a',b64\"YWJj\"]", opt).size() == 2, "quoted forms are accepted");
}


void test_errors()
{
	check_throws ([] { parse_notation (""); }, structural_error, "empty input");
	check_throws ([] { parse_notation ("x"); }, unknown_type, "unknown tag");
	check_throws ([] { parse_notation ("'abc"); }, unterminated_structure, "unterminated string");
	check_throws ([] { parse_notation ("'abc\\"); }, unterminated_structure, "escape at the end");
	check_throws ([] { parse_notation ("[i1,i2"); }, unterminated_structure, "unterminated array");
	check_throws ([] { parse_notation ("{'a':i1"); }, unterminated_structure, "unterminated map");
	check_throws ([] { parse_notation ("{'a':"); }, unterminated_structure, "map without value");
	check_throws ([] { parse_notation ("s(10)\"abc\""); }, unterminated_structure, "short byte count");
	check_throws ([] { parse_notation ("{'a' i1}"); }, structural_error, "missing colon");
	check_throws ([] { parse_notation ("{i1:i1}"); }, structural_error, "key not quoted");
	check_throws ([] { parse_notation ("]"); }, structural_error, "stray bracket");
	check_throws ([] { parse_notation ("s(3)\"abcd\""); }, structural_error, "byte count too small");
	check_throws ([] { parse_notation ("'\\xg1'"); }, structural_error, "bad hex escape");
	check_throws ([] { parse_notation ("b32\"AA\""); }, structural_error, "unknown binary base");
	check_throws ([] { parse_notation ("i1 i2"); }, trailing_data, "two values");
	check_throws ([] { parse_notation ("i"); }, invalid_integer, "integer without digits");
	check_throws ([] { parse_notation ("i99999999999"); }, invalid_integer, "integer overflow");
	check_throws ([] { parse_notation ("r1.2.3"); }, invalid_real, "bad real");
	check_throws ([] { parse_notation ("rnan"); }, unsupported_value, "nan token");
	check_throws ([] { parse_notation ("r-inf"); }, unsupported_value, "infinity token");
	check_throws ([] { parse_notation ("tru"); }, invalid_boolean, "bad boolean");
	check_throws ([] { parse_notation ("u6bad258e-06f0"); }, invalid_uuid, "short uuid");
	check_throws ([] { parse_notation ("d\"2006-02-30T00:00:00Z\""); }, invalid_date, "bad date");
	check_throws ([] { parse_notation ("b64\"YW$j\""); }, invalid_binary, "bad base64");

	try {
		parse_notation ("[i1, x]");
		check (false, "unknown tag must throw");
	} catch (const Error &e) {
		check_equal (e.offset(), 5, "offset of the unknown tag");
	}
}


void test_depth()
{
	std::string deep (300, '[');
	deep.append (300, ']');
	check_throws ([&] { parse_notation (deep); }, too_deep, "300 nested arrays");
	Notation_options opt;
	opt.max_depth = 300;
	check (parse_notation (deep, opt).type() == Value::array, "limit raised");

	std::string edge (256, '[');
	edge.append (256, ']');
	check (parse_notation (edge).type() == Value::array, "256 levels are accepted");
}


int real_main()
{
	test_scalars();
	test_containers();
	test_serialize();
	test_string_variant();
	test_errors();
	test_depth();
	return report ("notation_test");
}

int main()
{
	return run_main (real_main);
}

