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
#include "error.hpp"
#include <math.h>
#include <stdio.h>
#include <ctype.h>
#include <string.h>
#include <sstream>
#include <locale>


namespace llsd {   namespace LLSD_SONAME {


// UUID

void append_uuid (std::string &dst, const Uuid &u)
{
	for (int i = 0; i < 16; ++i) {
		if (i == 4 || i == 6 || i == 8 || i == 10) {
			dst.push_back ('-');
		}
		dst.push_back (hex_digits[u.bytes[i] >> 4]);
		dst.push_back (hex_digits[u.bytes[i] & 0xF]);
	}
}

std::string format_uuid (const Uuid &u)
{
	std::string res;
	res.reserve (36);
	append_uuid (res, u);
	return res;
}

Uuid parse_uuid (const char *s, size_t n)
{
	if (n != 36) {
		throw_error (invalid_uuid, -1, _("'%s' has %d characters, a UUID has 36."),
		             std::string(s, n), n);
	}

	Uuid u;
	size_t j = 0;
	for (size_t i = 0; i < n; ) {
		if (i == 8 || i == 13 || i == 18 || i == 23) {
			if (s[i] != '-') {
				throw_error (invalid_uuid, -1, _("'%s' does not have the 8-4-4-4-12 grouping."),
				             std::string(s, n));
			}
			++i;
			continue;
		}
		int hi = hexval (s[i]);
		int lo = hexval (s[i + 1]);
		if (hi < 0 || lo < 0) {
			throw_error (invalid_uuid, -1, _("'%s' contains characters that are not hex digits."),
			             std::string(s, n));
		}
		u.bytes[j++] = (hi << 4) | lo;
		i += 2;
	}
	return u;
}



// Dates. The conversions between days and civil dates follow the
// algorithms of Howard Hinnant and work for the whole proleptic Gregorian
// calendar.

static int64_t days_from_civil (int64_t y, unsigned m, unsigned d)
{
	y -= m <= 2;
	const int64_t era = (y >= 0 ? y : y - 399) / 400;
	const unsigned yoe = static_cast<unsigned>(y - era * 400);
	const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

static void civil_from_days (int64_t z, int64_t *y, unsigned *m, unsigned *d)
{
	z += 719468;
	const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
	const unsigned doe = static_cast<unsigned>(z - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	*d = doy - (153 * mp + 2) / 5 + 1;
	*m = mp < 10 ? mp + 3 : mp - 9;
	*y = static_cast<int64_t>(yoe) + era * 400 + (*m <= 2);
}

static bool is_leap (int64_t y)
{
	return y % 4 == 0 && (y % 100 != 0 || y % 400 == 0);
}

static unsigned days_in_month (int64_t y, unsigned m)
{
	static const unsigned mdays[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
	return m == 2 && is_leap (y) ? 29 : mdays[m - 1];
}


std::string format_date (int64_t seconds)
{
	if (seconds < min_text_date || seconds > max_text_date) {
		throw_error (unsupported_value, -1, _("the date %d is outside of the years 0000 to 9999."),
		             seconds);
	}
	int64_t days = seconds / 86400;
	int64_t rem = seconds % 86400;
	if (rem < 0) {
		rem += 86400;
		--days;
	}

	int64_t y;
	unsigned m, d;
	civil_from_days (days, &y, &m, &d);

	char buf[64];
	snprintf (buf, sizeof buf, "%04lld-%02u-%02uT%02u:%02u:%02uZ",
	          (long long)y, m, d, unsigned(rem / 3600), unsigned(rem / 60 % 60),
	          unsigned(rem % 60));
	return buf;
}


// Read exactly count digits.
static bool read_digits (const char **pp, const char *e, int count, unsigned *val)
{
	const char *p = *pp;
	if (e - p < count) return false;
	unsigned v = 0;
	for (int i = 0; i < count; ++i) {
		if (p[i] < '0' || p[i] > '9') return false;
		v = v * 10 + (p[i] - '0');
	}
	*val = v;
	*pp = p + count;
	return true;
}

static bool expect (const char **pp, const char *e, char c)
{
	if (*pp == e || **pp != c) return false;
	++*pp;
	return true;
}

static bool scan_date (const char *s, size_t n, int64_t *res)
{
	const char *p = s;
	const char *e = s + n;
	unsigned year, mon, day, hour, min, sec;

	if (!read_digits (&p, e, 4, &year) || !expect (&p, e, '-') ||
	    !read_digits (&p, e, 2, &mon) || !expect (&p, e, '-') ||
	    !read_digits (&p, e, 2, &day)) {
		return false;
	}
	if (p == e || (*p != 'T' && *p != 't' && *p != ' ')) return false;
	++p;
	if (!read_digits (&p, e, 2, &hour) || !expect (&p, e, ':') ||
	    !read_digits (&p, e, 2, &min) || !expect (&p, e, ':') ||
	    !read_digits (&p, e, 2, &sec)) {
		return false;
	}

	if (p != e && *p == '.') {
		++p;
		const char *digits = p;
		while (p != e && *p >= '0' && *p <= '9') ++p;
		if (p == digits) return false;
	}

	int offset = 0;
	if (p == e) return false;
	if (*p == 'Z' || *p == 'z') {
		++p;
	} else if (*p == '+' || *p == '-') {
		int sign = *p == '-' ? -1 : 1;
		unsigned oh, om;
		++p;
		if (!read_digits (&p, e, 2, &oh) || !expect (&p, e, ':') ||
		    !read_digits (&p, e, 2, &om) || oh > 23 || om > 59) {
			return false;
		}
		offset = sign * int(oh * 3600 + om * 60);
	} else {
		return false;
	}
	if (p != e) return false;

	if (mon < 1 || mon > 12 || day < 1 || day > days_in_month (year, mon) ||
	    hour > 23 || min > 59 || sec > 60) {
		return false;
	}
	// A leap second counts as the last second of the minute.
	if (sec == 60) sec = 59;

	*res = days_from_civil (year, mon, day) * 86400 + hour * 3600 + min * 60
	       + sec - offset;
	return true;
}

int64_t parse_date (const char *s, size_t n)
{
	int64_t res;
	if (!scan_date (s, n, &res)) {
		throw_error (invalid_date, -1, _("'%s' is not a date of the form YYYY-MM-DDTHH:MM:SSZ."),
		             std::string(s, n));
	}
	return res;
}



// Reals

static bool read_back (const std::string &s, double *d)
{
	std::istringstream is (s);
	is.imbue (std::locale::classic());
	is >> *d;
	return !is.fail() && is.peek() == EOF;
}

std::string format_real (double r)
{
	if (isnan (r)) return "nan";
	if (isinf (r)) return r < 0 ? "-inf" : "inf";

	std::ostringstream os;
	os.imbue (std::locale::classic());
	for (int prec = 15; prec <= 17; ++prec) {
		os.str ("");
		os.precision (prec);
		os << r;
		double back;
		if (read_back (os.str(), &back) && back == r) break;
	}
	return os.str();
}


static bool equal_nocase (const char *s, size_t n, const char *word)
{
	size_t len = strlen (word);
	if (n != len) return false;
	for (size_t i = 0; i < n; ++i) {
		if (tolower ((unsigned char)s[i]) != word[i]) return false;
	}
	return true;
}

bool is_special_real (const char *s, size_t n)
{
	if (n > 0 && (*s == '+' || *s == '-')) {
		++s;
		--n;
	}
	return n > 0 && (*s == 'n' || *s == 'N' || *s == 'i' || *s == 'I');
}

// Check the decimal grammar. The stream conversion alone is too lenient.
static bool is_decimal (const char *s, size_t n)
{
	const char *p = s;
	const char *e = s + n;
	if (p != e && (*p == '+' || *p == '-')) ++p;
	int mantissa = 0;
	while (p != e && *p >= '0' && *p <= '9') { ++p; ++mantissa; }
	if (p != e && *p == '.') {
		++p;
		while (p != e && *p >= '0' && *p <= '9') { ++p; ++mantissa; }
	}
	if (mantissa == 0) return false;
	if (p != e && (*p == 'e' || *p == 'E')) {
		++p;
		if (p != e && (*p == '+' || *p == '-')) ++p;
		const char *exp = p;
		while (p != e && *p >= '0' && *p <= '9') ++p;
		if (p == exp) return false;
	}
	return p == e;
}

double parse_real (const char *s, size_t n, bool allow_special)
{
	if (allow_special && is_special_real (s, n)) {
		bool neg = *s == '-';
		const char *w = s;
		size_t wn = n;
		if (*w == '+' || *w == '-') {
			++w;
			--wn;
		}
		if (equal_nocase (w, wn, "nan")) {
			return NAN;
		}
		if (equal_nocase (w, wn, "inf") || equal_nocase (w, wn, "infinity")) {
			return neg ? -INFINITY : INFINITY;
		}
	}

	double d;
	if (!is_decimal (s, n) || !read_back (std::string(s, n), &d) || !isfinite (d)) {
		throw_error (invalid_real, -1, _("'%s' is not a valid real number."),
		             std::string(s, n));
	}
	return d;
}



// Integers

std::string format_integer (int32_t i)
{
	return std::to_string (i);
}

int32_t parse_integer (const char *s, size_t n)
{
	const char *p = s;
	const char *e = s + n;
	bool neg = false;
	if (p != e && (*p == '+' || *p == '-')) {
		neg = *p == '-';
		++p;
	}
	if (p == e) {
		throw_error (invalid_integer, -1, _("'%s' is not an integer."), std::string(s, n));
	}

	const int64_t limit = neg ? int64_t(INT32_MAX) + 1 : INT32_MAX;
	int64_t val = 0;
	for (; p != e; ++p) {
		if (*p < '0' || *p > '9') {
			throw_error (invalid_integer, -1, _("'%s' is not an integer."), std::string(s, n));
		}
		val = val * 10 + (*p - '0');
		if (val > limit) {
			throw_error (invalid_integer, -1, _("%s does not fit in 32 bits."), std::string(s, n));
		}
	}
	return int32_t(neg ? -val : val);
}



// Binary

std::string encode_binary (const Binary &b, Binary_encoding enc)
{
	std::string res;
	if (enc == base16) {
		write_hex (res, b.data(), b.size());
	} else {
		base64enc (b.data(), b.size(), res);
	}
	return res;
}

Binary decode_binary (const char *s, size_t n, Binary_encoding enc)
{
	Binary res;
	if (enc == base16) {
		if (!read_hex (s, n, res)) {
			throw_error (invalid_binary, -1, _("the text is not valid base16: odd length or a character that is not a hex digit."));
		}
	} else {
		if (!base64dec (s, n, res)) {
			throw_error (invalid_binary, -1, _("the text is not valid base64: a character outside of the alphabet or bad padding."));
		}
	}
	return res;
}

}}

