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

#include "value.hpp"
#include "error.hpp"
#include <math.h>
#include <iterator>

namespace llsd {   namespace LLSD_SONAME {

bool Uuid::is_nil() const
{
	for (unsigned i = 0; i < sizeof bytes; ++i) {
		if (bytes[i] != 0) return false;
	}
	return true;
}


Value::Value() : t(undefined)
{
	num.d = 0;
}

Value::Value (bool b) : t(boolean)
{
	num.d = 0;
	num.b = b;
}

Value::Value (int32_t i) : t(integer)
{
	num.d = 0;
	num.i = i;
}

Value::Value (double r) : t(real)
{
	num.r = r;
}

Value::Value (const Uuid &u) : t(uuid), id(u)
{
	num.d = 0;
}

Value::Value (const Array &a) : t(array), items(new Array(a))
{
	num.d = 0;
}

Value::Value (Array &&a) : t(array), items(new Array(std::move(a)))
{
	num.d = 0;
}

Value::Value (const Map &m) : t(map), entries(new Map(m))
{
	num.d = 0;
}

Value::Value (Map &&m) : t(map), entries(new Map(std::move(m)))
{
	num.d = 0;
}

Value Value::make_string (const std::string &s)
{
	Value v;
	v.t = string;
	v.text = s;
	return v;
}

Value Value::make_uri (const std::string &s)
{
	Value v;
	v.t = uri;
	v.text = s;
	return v;
}

Value Value::make_date (int64_t seconds)
{
	Value v;
	v.t = date;
	v.num.d = seconds;
	return v;
}

Value Value::make_binary (const Binary &b)
{
	Value v;
	v.t = binary;
	v.bytes = b;
	return v;
}

Value Value::make_binary (const void *p, size_t n)
{
	Value v;
	v.t = binary;
	const uint8_t *u = static_cast<const uint8_t*>(p);
	v.bytes.assign (u, u + n);
	return v;
}


Value::Value (const Value &rhs)
	: t(rhs.t), num(rhs.num), id(rhs.id), text(rhs.text), bytes(rhs.bytes)
{
	if (rhs.items) items.reset (new Array(*rhs.items));
	if (rhs.entries) entries.reset (new Map(*rhs.entries));
}

// The source is left undefined.
Value::Value (Value &&rhs) noexcept
	: t(rhs.t), num(rhs.num), id(rhs.id), text(std::move(rhs.text)),
	  bytes(std::move(rhs.bytes)), items(std::move(rhs.items)),
	  entries(std::move(rhs.entries))
{
	rhs.t = undefined;
	rhs.num.d = 0;
}

Value & Value::operator= (const Value &rhs)
{
	if (this != &rhs) {
		Value tmp(rhs);
		*this = std::move(tmp);
	}
	return *this;
}

Value & Value::operator= (Value &&rhs) noexcept
{
	if (this != &rhs) {
		t = rhs.t;
		num = rhs.num;
		id = rhs.id;
		text = std::move(rhs.text);
		bytes = std::move(rhs.bytes);
		items = std::move(rhs.items);
		entries = std::move(rhs.entries);
		rhs.t = undefined;
		rhs.num.d = 0;
	}
	return *this;
}

Value::~Value() = default;


const char * Value::type_name (Type t)
{
	switch (t) {
	case undefined:  return "undefined";
	case boolean:    return "boolean";
	case integer:    return "integer";
	case real:       return "real";
	case uuid:       return "uuid";
	case string:     return "string";
	case date:       return "date";
	case uri:        return "uri";
	case binary:     return "binary";
	case array:      return "array";
	case map:        return "map";
	}
	return "unknown";
}

void Value::check (Type expected) const
{
	if (t != expected) {
		throw_error (wrong_variant, -1, _("expected a value of type %s but it holds %s."),
		             type_name (expected), type_name (t));
	}
}

bool Value::as_boolean() const
{
	check (boolean);
	return num.b;
}

int32_t Value::as_integer() const
{
	check (integer);
	return num.i;
}

double Value::as_real() const
{
	check (real);
	return num.r;
}

const Uuid & Value::as_uuid() const
{
	check (uuid);
	return id;
}

const std::string & Value::as_string() const
{
	check (string);
	return text;
}

int64_t Value::as_date() const
{
	check (date);
	return num.d;
}

const std::string & Value::as_uri() const
{
	check (uri);
	return text;
}

const Binary & Value::as_binary() const
{
	check (binary);
	return bytes;
}

const Array & Value::as_array() const
{
	check (array);
	return *items;
}

const Map & Value::as_map() const
{
	check (map);
	return *entries;
}


const bool * Value::get_boolean() const
{
	return t == boolean ? &num.b : NULL;
}

const int32_t * Value::get_integer() const
{
	return t == integer ? &num.i : NULL;
}

const double * Value::get_real() const
{
	return t == real ? &num.r : NULL;
}

const Uuid * Value::get_uuid() const
{
	return t == uuid ? &id : NULL;
}

const std::string * Value::get_string() const
{
	return t == string ? &text : NULL;
}

const int64_t * Value::get_date() const
{
	return t == date ? &num.d : NULL;
}

const std::string * Value::get_uri() const
{
	return t == uri ? &text : NULL;
}

const Binary * Value::get_binary() const
{
	return t == binary ? &bytes : NULL;
}

const Array * Value::get_array() const
{
	return t == array ? items.get() : NULL;
}

const Map * Value::get_map() const
{
	return t == map ? entries.get() : NULL;
}


size_t Value::size() const
{
	switch (t) {
	case array:
		return items ? items->size() : 0;
	case map:
		return entries ? entries->size() : 0;
	default:
		return 0;
	}
}


// Structural equality. Two NaN reals compare equal, so that a tree that has
// been through a codec compares equal to the value it came from.
bool operator== (const Value &a, const Value &b)
{
	if (a.type() != b.type()) return false;

	switch (a.type()) {
	case Value::undefined:
		return true;
	case Value::boolean:
		return a.as_boolean() == b.as_boolean();
	case Value::integer:
		return a.as_integer() == b.as_integer();
	case Value::real:
		if (isnan (a.as_real())) return isnan (b.as_real());
		return a.as_real() == b.as_real();
	case Value::uuid:
		return a.as_uuid() == b.as_uuid();
	case Value::string:
		return a.as_string() == b.as_string();
	case Value::date:
		return a.as_date() == b.as_date();
	case Value::uri:
		return a.as_uri() == b.as_uri();
	case Value::binary:
		return a.as_binary() == b.as_binary();
	case Value::array:
		return a.as_array() == b.as_array();
	case Value::map:
		return a.as_map() == b.as_map();
	}
	return false;
}

Map::Map (const Map &rhs)
{
	index.reserve (rhs.size());
	for (const auto &e : rhs) {
		entries.push_back (e);
		index[e.first] = std::prev (entries.end());
	}
}

Map & Map::operator= (const Map &rhs)
{
	if (this != &rhs) {
		Map tmp (rhs);
		*this = std::move(tmp);
	}
	return *this;
}

void Map::insert (const std::string &key, const Value &v)
{
	insert (std::string(key), Value(v));
}

void Map::insert (std::string &&key, Value &&v)
{
	auto it = index.find (key);
	if (it != index.end()) {
		entries.erase (it->second);
		index.erase (it);
	}
	entries.push_back (Entry(std::move(key), std::move(v)));
	auto last = std::prev (entries.end());
	index[last->first] = last;
}

const Value * Map::find (const std::string &key) const
{
	auto it = index.find (key);
	if (it == index.end()) return NULL;
	return &it->second->second;
}

bool operator== (const Map &a, const Map &b)
{
	if (a.size() != b.size()) return false;
	for (const auto &e : a) {
		const Value *other = b.find (e.first);
		if (!other || !(*other == e.second)) return false;
	}
	return true;
}

}}

