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

#ifndef LLSD_TEST_CHECK_HPP
#define LLSD_TEST_CHECK_HPP

// Helpers shared by the test programs. Each failure is reported on
// std::cout and counted. The programs return non zero if any check failed.

#include "format.hpp"
#include "error.hpp"
#include <iostream>

static int nerrors = 0;

inline void check (bool cond, const char *what)
{
	if (!cond) {
		llsd::format (std::cout, "error: %s\n", what);
		++nerrors;
	}
}

template <class T, class U>
void check_equal (const T &got, const U &expected, const char *what)
{
	if (!(got == expected)) {
		llsd::format (std::cout, "error: %s: got <%s>, expected <%s>\n", what, got, expected);
		++nerrors;
	}
}

// Call f and check that it throws llsd::Error with the given code. Any
// other exception is not caught and ends the program.
template <class F>
void check_throws (F f, llsd::Errc code, const char *what)
{
	try {
		f();
	} catch (const llsd::Error &e) {
		if (e.code() != code) {
			llsd::format (std::cout, "error: %s: expected %s, got \"%s\"\n", what,
			              llsd::errc_name (code), e.what());
			++nerrors;
		}
		return;
	}
	llsd::format (std::cout, "error: %s: no exception thrown\n", what);
	++nerrors;
}

inline int report (const char *name)
{
	if (nerrors == 0) {
		llsd::format (std::cout, "%s finished\n", name);
		return 0;
	}
	llsd::format (std::cout, "%s: %d errors\n", name, nerrors);
	return 1;
}

#endif

