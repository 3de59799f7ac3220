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




#include "zwrap.hpp"
#include <stdexcept>
#include <string.h>

#include <zlib.h>
#undef compress

namespace llsd {  namespace LLSD_SONAME {

enum Mode { none, compressing, expanding };

// zlib counts with uInt.
static const size_t max_chunk = 1u << 30;

struct ZWrapper::Data {
	z_stream zs;
	int      level;
	Mode     mode;
	size_t   length;
	size_t   produced;
	size_t   limit;
	bool     finished;
	int      last_rc;
};

ZWrapper::ZWrapper (int lev)
{
	pimpl = new Data;
	pimpl->level = lev;
	pimpl->mode = none;
	pimpl->length = 0;
	pimpl->produced = 0;
	pimpl->limit = (size_t)-1;
	pimpl->finished = false;
	pimpl->last_rc = Z_OK;
}

ZWrapper::~ZWrapper()
{
	if (pimpl->mode == compressing) {
		deflateEnd (&pimpl->zs);
	} else if (pimpl->mode == expanding) {
		inflateEnd (&pimpl->zs);
	}
	delete pimpl;
}

void ZWrapper::set_limit (size_t max_output)
{
	pimpl->limit = max_output;
}


int ZWrapper::compress (const char *buf, size_t n, std::string *res, bool finish)
{
	if (pimpl->mode == expanding) {
		throw std::logic_error ("ZWrapper::compress() called while in expanding mode");
	}
	if (pimpl->mode == none) {
		memset (&pimpl->zs, 0, sizeof pimpl->zs);
		int rc = deflateInit (&pimpl->zs, pimpl->level);
		if (rc != Z_OK) {
			pimpl->last_rc = rc;
			return rc;
		}
		pimpl->mode = compressing;
	}

	char out[0x4000];
	do {
		size_t chunk = n < max_chunk ? n : max_chunk;
		bool last = chunk == n;
		int mode = finish && last ? Z_FINISH : Z_NO_FLUSH;

		pimpl->zs.next_in  = (Bytef*)buf;
		pimpl->zs.avail_in = uInt(chunk);

		for (;;) {
			pimpl->zs.next_out  = (Bytef*)out;
			pimpl->zs.avail_out = sizeof out;
			int rc = deflate (&pimpl->zs, mode);
			if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
					pimpl->last_rc = rc;
				return rc;
			}
			res->append (out, sizeof out - pimpl->zs.avail_out);
			if (pimpl->zs.avail_out != 0) {
				break;
			}
		}
		buf += chunk;
		n -= chunk;
	} while (n > 0);

	return 0;
}


int ZWrapper::expand (const char *buf, size_t n, std::string *res, bool finish)
{
	if (pimpl->mode == compressing) {
		throw std::logic_error ("ZWrapper::expand() called while in compressing mode");
	}
	if (pimpl->mode == none) {
		memset (&pimpl->zs, 0, sizeof pimpl->zs);
		int rc = inflateInit (&pimpl->zs);
		if (rc != Z_OK) {
			pimpl->last_rc = rc;
			return rc;
		}
		pimpl->mode = expanding;
	}

	char out[0x4000];
	do {
		size_t chunk = n < max_chunk ? n : max_chunk;
		bool last = chunk == n;
		int mode = finish && last ? Z_FINISH : Z_NO_FLUSH;

		pimpl->zs.next_in  = (Bytef*)buf;
		pimpl->zs.avail_in = uInt(chunk);

		for (;;) {
			pimpl->zs.next_out  = (Bytef*)out;
			pimpl->zs.avail_out = sizeof out;
			int rc = inflate (&pimpl->zs, mode);
			if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
					pimpl->last_rc = rc;
				return rc;
			}
			size_t count = sizeof out - pimpl->zs.avail_out;
			if (count > pimpl->limit - pimpl->produced) {
					pimpl->last_rc = limit_exceeded;
				return limit_exceeded;
			}
			res->append (out, count);
			pimpl->produced += count;
			if (rc == Z_STREAM_END) {
				pimpl->finished = true;
				break;
			}
			if (pimpl->zs.avail_out != 0) {
				break;
			}
		}
		pimpl->length += chunk - pimpl->zs.avail_in;
		buf += chunk;
		n -= chunk;
	} while (n > 0 && !pimpl->finished);

	return 0;
}



size_t ZWrapper::tail_offset() const
{
	return pimpl->length;
}

bool ZWrapper::finished() const
{
	return pimpl->finished;
}

const char * ZWrapper::error_message() const
{
	if (pimpl->last_rc == limit_exceeded) {
		return "the expanded data is larger than the limit";
	}
	if (pimpl->mode != none && pimpl->zs.msg) {
		return pimpl->zs.msg;
	}
	return zError (pimpl->last_rc);
}



}}

