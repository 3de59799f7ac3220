/*
 * Copyright (c) 2012-2017, Pelayo Bernedo.
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



#ifndef LLSD_ZWRAP_HPP
#define LLSD_ZWRAP_HPP

#include "soname.hpp"
#include <stddef.h>
#include <string>

namespace llsd {  namespace LLSD_SONAME {


// Wrapper around the zlib library for one stream. Pass chunks of input to
// either compress() or expand(); the output is appended to *res. Pass
// finish==true with the last chunk.

// On error the functions return a zlib error code, or limit_exceeded, and
// error_message() describes it. A ZWrapper that compressed cannot expand
// and the other way round: that throws std::logic_error.

class EXPORTFN ZWrapper {
	struct Data;
	struct Data *pimpl;

	ZWrapper (const ZWrapper &) = delete;
	ZWrapper & operator= (const ZWrapper &) = delete;

public:
	// Returned by expand() when the output would go beyond the limit.
	enum { limit_exceeded = -100 };

	// level is the zlib compression level, from 0 to 9.
	ZWrapper (int level = 9);
	~ZWrapper();

	// Maximum number of bytes that expand() will produce.
	void set_limit (size_t max_output);

	// Both return 0 on success.
	int compress (const char *buf, size_t n, std::string *res, bool finish=false);
	int expand (const char *buf, size_t n, std::string *res, bool finish=false);

	// Number of compressed bytes consumed by expand().
	size_t tail_offset() const;
	// True when expand() has seen the end of the compressed stream.
	bool finished() const;
	const char * error_message() const;
};

}}

#endif

