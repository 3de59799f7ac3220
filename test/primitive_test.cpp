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

#include "primitive.hpp"
#include "misc.hpp"
#include "check.hpp"
#include <math.h>
#include <string.h>
#include <stdint.h>

using namespace llsd;


void test_uuid()
{
	check_equal (format_uuid (Uuid()), "00000000-0000-0000-0000-000000000000", "nil uuid text");

	Uuid u = parse_uuid ("6BAD258E-06F0-4A87-A659-493117C9C162");
	check_equal (format_uuid (u), "6bad258e-06f0-4a87-a659-493117c9c162", "uuid text is lower case");
	check (u.bytes[0] == 0x6b && u.bytes[15] == 0x62, "uuid bytes");

	check_throws ([] { parse_uuid ("6bad258e06f04a87a659493117c9c162"); }, invalid_uuid, "uuid without hyphens");
	check_throws ([] { parse_uuid ("6bad258e-06f0-4a87-a659-493117c9c16"); }, invalid_uuid, "short uuid");
	check_throws ([] { parse_uuid ("6bad258e-06f0-4a87-a659-493117c9c1g2"); }, invalid_uuid, "uuid with a non hex digit");
	check_throws ([] { parse_uuid ("6bad258e-06f04-a87-a659-493117c9c162"); }, invalid_uuid, "uuid with wrong grouping");
}


void test_date()
{
	check_equal (format_date (0), "1970-01-01T00:00:00Z", "epoch");
	check_equal (format_date (1138804193), "2006-02-01T14:29:53Z", "date text");
	check_equal (format_date (-1), "1969-12-31T23:59:59Z", "date before the epoch");
	check_equal (format_date (951825600), "2000-02-29T12:00:00Z", "leap day");
	check_equal (format_date (-2208988800LL), "1900-01-01T00:00:00Z", "1900");

	check_equal (parse_date ("2006-02-01T14:29:53Z"), 1138804193, "parse date");
	check_equal (parse_date ("2006-02-01T14:29:53.43Z"), 1138804193, "fraction is dropped");
	check_equal (parse_date ("1969-12-31T23:59:59.5Z"), -1, "fraction before the epoch");
	check_equal (parse_date ("2006-02-01T15:29:53+01:00"), 1138804193, "positive offset");
	check_equal (parse_date ("2006-02-01T13:29:53-01:00"), 1138804193, "negative offset");
	check_equal (parse_date ("2000-02-29T12:00:00Z"), 951825600, "parse leap day");

	check_throws ([] { parse_date ("2006-02-30T00:00:00Z"); }, invalid_date, "February 30");
	check_throws ([] { parse_date ("2006-02-01"); }, invalid_date, "date without time");
	check_throws ([] { parse_date ("2006-02-01T14:29:53"); }, invalid_date, "date without zone");
	check_throws ([] { parse_date ("yesterday"); }, invalid_date, "words");
	check_throws ([] { parse_date ("2006-13-01T00:00:00Z"); }, invalid_date, "month 13");
	check_throws ([] { parse_date ("2006-02-01T24:00:00Z"); }, invalid_date, "hour 24");

	check_equal (format_date (max_text_date), "9999-12-31T23:59:59Z", "last date with text");
	check_equal (format_date (min_text_date), "0000-01-01T00:00:00Z", "first date with text");
	check_equal (parse_date ("9999-12-31T23:59:59Z"), max_text_date, "parse year 9999");
	check_equal (parse_date ("0000-01-01T00:00:00Z"), min_text_date, "parse year 0");
	check_throws ([] { format_date (max_text_date + 1); }, unsupported_value, "year 10000");
	check_throws ([] { format_date (min_text_date - 1); }, unsupported_value, "year -1");
	check_throws ([] { format_date (INT64_MAX); }, unsupported_value, "largest date");
	check_throws ([] { format_date (INT64_MIN); }, unsupported_value, "smallest date");
}


void test_real()
{
	check_equal (format_real (1.5), "1.5", "simple real");
	check_equal (format_real (0.1), "0.1", "0.1 needs 15 digits");
	check_equal (format_real (1.0 / 3), "0.3333333333333333", "one third needs 16 digits");
	check_equal (format_real (-0.0), "-0", "negative zero");
	check_equal (format_real (INFINITY), "inf", "infinity");
	check_equal (format_real (-INFINITY), "-inf", "negative infinity");
	check_equal (format_real (NAN), "nan", "nan");

	static const double samples[] = { 123.5, 1e300, 0.7757886,
	                                  9007199254740993.0, 44.38898 };
	for (double d : samples) {
		std::string s = format_real (d);
		check (parse_real (s.data(), s.size(), false) == d, "real text reads back");
	}

	check (isnan (parse_real ("nan", 3, true)), "parse nan");
	check (parse_real ("-Infinity", 9, true) == -INFINITY, "parse -Infinity");
	check_throws ([] { parse_real ("inf", 3, false); }, invalid_real, "inf when not allowed");
	check_throws ([] { parse_real ("1e999", 5, false); }, invalid_real, "overflow");
	check_throws ([] { parse_real ("1.5x", 4, false); }, invalid_real, "trailing letters");
	check_throws ([] { parse_real ("", 0, false); }, invalid_real, "empty real");
	check_throws ([] { parse_real (".", 1, false); }, invalid_real, "a lone dot");
	check (parse_real ("-1.5e3", 6, false) == -1500, "exponent");
}


void test_integer()
{
	check_equal (parse_integer ("2147483647", 10), 2147483647, "largest integer");
	check_equal (parse_integer ("-2147483648", 11), int32_t(-2147483647 - 1), "smallest integer");
	check_equal (parse_integer ("+17", 3), 17, "explicit sign");
	check_throws ([] { parse_integer ("2147483648", 10); }, invalid_integer, "overflow");
	check_throws ([] { parse_integer ("-2147483649", 11); }, invalid_integer, "underflow");
	check_throws ([] { parse_integer ("12a", 3); }, invalid_integer, "letters");
	check_throws ([] { parse_integer ("-", 1); }, invalid_integer, "lone sign");
	check_equal (format_integer (-5), "-5", "format integer");
}


void test_binary()
{
	std::string hello = "Hello world";
	Binary b (hello.begin(), hello.end());
	check_equal (encode_binary (b, base64), "SGVsbG8gd29ybGQ=", "base64");
	check_equal (encode_binary (b, base16), "48656c6c6f20776f726c64", "base16 is lower case");

	const char wrapped[] = "SGVsbG8g\n  d29ybGQ=\n";
	check (decode_binary (wrapped, strlen (wrapped), base64) == b, "base64 with line breaks");
	check (decode_binary ("48656C6C6F20776F726C64", 22, base16) == b, "upper case hex");
	check (decode_binary ("SGVsbG8gd29ybGQ", 15, base64) == b, "base64 without padding");
	check (decode_binary ("", 0, base64).empty(), "empty base64");

	check_throws ([] { decode_binary ("SGV$", 4, base64); }, invalid_binary, "character outside of base64");
	check_throws ([] { decode_binary ("SGVsbG8gd29ybGQ==", 17, base64); }, invalid_binary, "too much padding");
	check_throws ([] { decode_binary ("SG=VsbG8", 8, base64); }, invalid_binary, "data after padding");
	check_throws ([] { decode_binary ("S", 1, base64); }, invalid_binary, "single base64 character");
	check_throws ([] { decode_binary ("0fa", 3, base16); }, invalid_binary, "odd hex length");
	check_throws ([] { decode_binary ("0f a1", 5, base16); }, invalid_binary, "separator in hex");
}


void test_utf8()
{
	check (is_utf8 (std::string("plain")), "ascii");
	check (is_utf8 (std::string("\xc3\xa9t\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80")), "multibyte");
	check (!is_utf8 (std::string("\xc0\x80")), "overlong nul");
	check (!is_utf8 (std::string("\xed\xa0\x80")), "surrogate");
	check (!is_utf8 (std::string("\xf4\x90\x80\x80")), "above U+10FFFF");
	check (!is_utf8 (std::string("\xe2\x82")), "truncated sequence");
	check (!is_utf8 (std::string("\xff")), "invalid byte");
}


int real_main()
{
	test_uuid();
	test_date();
	test_real();
	test_integer();
	test_binary();
	test_utf8();
	return report ("primitive_test");
}

int main()
{
	return run_main (real_main);
}

