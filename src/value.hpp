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

#ifndef LLSD_VALUE_HPP
#define LLSD_VALUE_HPP

#include "soname.hpp"
#include <stdint.h>
#include <stddef.h>
#include <string.h>
#include <string>
#include <vector>
#include <list>
#include <memory>
#include <utility>
#include <unordered_map>

namespace llsd {   namespace LLSD_SONAME {

// The 16 raw bytes of a UUID, in the order of the canonical text form.
struct Uuid {
	uint8_t bytes[16];

	Uuid() { memset (bytes, 0, sizeof bytes); }
	Uuid (const uint8_t *b) { memcpy (bytes, b, sizeof bytes); }
	bool is_nil() const;
};

inline bool operator== (const Uuid &a, const Uuid &b)
{
	return memcmp (a.bytes, b.bytes, sizeof a.bytes) == 0;
}

inline bool operator!= (const Uuid &a, const Uuid &b) { return !(a == b); }


class Value;
class Map;

typedef std::vector<Value>    Array;
typedef std::vector<uint8_t>  Binary;


// A node of the LLSD tree. Each value holds exactly one of the variants of
// Type. Arrays and maps own their children, so copying a value copies the
// whole subtree. There are no mutating operations: build the children first
// and then construct the value from them.

class EXPORTFN Value {
public:
	enum Type { undefined, boolean, integer, real, uuid, string, date, uri,
	            binary, array, map };

	Value();
	explicit Value (bool b);
	explicit Value (int32_t i);
	explicit Value (double r);
	explicit Value (const Uuid &u);
	explicit Value (const Array &a);
	explicit Value (Array &&a);
	explicit Value (const Map &m);
	explicit Value (Map &&m);
	// Would silently become a boolean.
	Value (const char *) = delete;

	static Value make_string (const std::string &s);
	static Value make_uri (const std::string &s);
	static Value make_date (int64_t seconds);
	static Value make_binary (const Binary &b);
	static Value make_binary (const void *p, size_t n);

	Value (const Value &rhs);
	Value (Value &&rhs) noexcept;
	Value & operator= (const Value &rhs);
	Value & operator= (Value &&rhs) noexcept;
	~Value();

	Type type() const { return t; }
	bool is_undefined() const { return t == undefined; }

	// Checked access. Throw an Error with code wrong_variant if the value
	// holds another variant.
	bool               as_boolean() const;
	int32_t            as_integer() const;
	double             as_real() const;
	const Uuid &       as_uuid() const;
	const std::string& as_string() const;
	int64_t            as_date() const;
	const std::string& as_uri() const;
	const Binary &     as_binary() const;
	const Array &      as_array() const;
	const Map &        as_map() const;

	// Checked access without exceptions. Return a pointer to the payload or
	// NULL if the value holds another variant.
	const bool *        get_boolean() const;
	const int32_t *     get_integer() const;
	const double *      get_real() const;
	const Uuid *        get_uuid() const;
	const std::string * get_string() const;
	const int64_t *     get_date() const;
	const std::string * get_uri() const;
	const Binary *      get_binary() const;
	const Array *       get_array() const;
	const Map *         get_map() const;

	// Number of children of an array or map. Zero for the rest.
	size_t size() const;

	static const char * type_name (Type t);

private:
	Type t;
	union {
		bool     b;
		int32_t  i;
		double   r;
		int64_t  d;
	} num;
	Uuid                    id;
	std::string             text;     // string and uri
	Binary                  bytes;
	std::unique_ptr<Array>  items;
	std::unique_ptr<Map>    entries;

	void check (Type expected) const;
};

EXPORTFN bool operator== (const Value &a, const Value &b);
inline bool operator!= (const Value &a, const Value &b) { return !(a == b); }



// String keyed collection of values. A key appears only once: inserting an
// existing key replaces the old value and moves the entry to the end, so the
// iteration order is the order of the last write of each key.
class EXPORTFN Map {
public:
	typedef std::pair<std::string, Value>    Entry;
	typedef std::list<Entry>::const_iterator const_iterator;

	Map() {}
	Map (const Map &rhs);
	Map (Map &&rhs) = default;
	Map & operator= (const Map &rhs);
	Map & operator= (Map &&rhs) = default;

	void insert (const std::string &key, const Value &v);
	void insert (std::string &&key, Value &&v);

	// Return NULL if the key is not present.
	const Value * find (const std::string &key) const;

	void reserve (size_t n) { index.reserve (n); }

	size_t size() const { return index.size(); }
	bool empty() const { return index.empty(); }
	const_iterator begin() const { return entries.begin(); }
	const_iterator end() const { return entries.end(); }

private:
	// The index points into entries, so an overwrite unlinks the old entry
	// in constant time.
	std::list<Entry>                                            entries;
	std::unordered_map<std::string, std::list<Entry>::iterator> index;
};

// Equal if both hold the same keys with equal values. The order of the
// entries is not significant.
EXPORTFN bool operator== (const Map &a, const Map &b);
inline bool operator!= (const Map &a, const Map &b) { return !(a == b); }


}}

#endif

