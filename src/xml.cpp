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

#include "xml.hpp"
#include "primitive.hpp"
#include "misc.hpp"
#include "error.hpp"
#include <expat.h>
#include <string.h>
#include <limits.h>
#include <exception>
#include <vector>
#include <memory>


namespace llsd {   namespace LLSD_SONAME {

namespace {

// The element tree built by expat. The values are built only once the
// whole document has been accepted.
struct Node {
	std::string name;
	std::string encoding;    // Attribute of <binary>.
	bool        has_encoding;
	std::string text;        // Character data of this element, not of the children.
	std::vector<std::unique_ptr<Node>> children;
	ptrdiff_t   offset;
	Node       *parent;

	Node() : has_encoding(false), offset(0), parent(0) {}
};


class Tree_builder {
public:
	Tree_builder (int max_depth);
	~Tree_builder();

	// Return the root element. Throws Error if the document is not well
	// formed.
	std::unique_ptr<Node> parse (const char *buf, size_t n);

private:
	XML_Parser            parser;
	std::unique_ptr<Node> root;
	Node                 *current;
	int                   depth, max_depth;
	ptrdiff_t             too_deep_at;
	std::exception_ptr    pending;

	void start_element (const XML_Char *name, const XML_Char **atts);
	void end_element();
	void character_data (const XML_Char *s, int len);

	static void s_start_element (void *ud, const XML_Char *name, const XML_Char **atts);
	static void s_end_element (void *ud, const XML_Char *name);
	static void s_character_data (void *ud, const XML_Char *s, int len);

	Tree_builder (const Tree_builder&) = delete;
	Tree_builder & operator= (const Tree_builder&) = delete;
};


Tree_builder::Tree_builder (int maxd)
	: current(0), depth(0), too_deep_at(-1)
{
	// Room for <llsd>, the keys and the scalars at the deepest level.
	max_depth = maxd + 2;
	parser = XML_ParserCreate ("UTF-8");
	if (!parser) {
		throw std::bad_alloc();
	}
	XML_SetUserData (parser, this);
	XML_SetElementHandler (parser, s_start_element, s_end_element);
	XML_SetCharacterDataHandler (parser, s_character_data);
}

Tree_builder::~Tree_builder()
{
	XML_ParserFree (parser);
}


// Expat is C: the callbacks must not let exceptions through. Any exception
// is kept and thrown again once XML_Parse has returned.

void Tree_builder::s_start_element (void *ud, const XML_Char *name, const XML_Char **atts)
{
	Tree_builder *tb = static_cast<Tree_builder*>(ud);
	try {
		tb->start_element (name, atts);
	} catch (...) {
		tb->pending = std::current_exception();
		XML_StopParser (tb->parser, XML_FALSE);
	}
}

void Tree_builder::s_end_element (void *ud, const XML_Char *)
{
	static_cast<Tree_builder*>(ud)->end_element();
}

void Tree_builder::s_character_data (void *ud, const XML_Char *s, int len)
{
	Tree_builder *tb = static_cast<Tree_builder*>(ud);
	try {
		tb->character_data (s, len);
	} catch (...) {
		tb->pending = std::current_exception();
		XML_StopParser (tb->parser, XML_FALSE);
	}
}


void Tree_builder::start_element (const XML_Char *name, const XML_Char **atts)
{
	if (++depth > max_depth) {
		too_deep_at = XML_GetCurrentByteIndex (parser);
		XML_StopParser (parser, XML_FALSE);
		return;
	}

	std::unique_ptr<Node> node (new Node);
	node->name = name;
	node->offset = XML_GetCurrentByteIndex (parser);
	for (const XML_Char **a = atts; a && *a; a += 2) {
		if (strcmp (a[0], "encoding") == 0) {
			node->encoding = a[1];
			node->has_encoding = true;
		}
	}

	Node *np = node.get();
	if (current) {
		node->parent = current;
		current->children.push_back (std::move(node));
	} else {
		root = std::move(node);
	}
	current = np;
}

void Tree_builder::end_element()
{
	--depth;
	if (current) {
		current = current->parent;
	}
}

void Tree_builder::character_data (const XML_Char *s, int len)
{
	if (current) {
		current->text.append (s, len);
	}
}


std::unique_ptr<Node> Tree_builder::parse (const char *buf, size_t n)
{
	// XML_Parse takes an int length.
	const size_t chunk = INT_MAX / 2;
	XML_Status status = XML_STATUS_OK;
	do {
		size_t len = n < chunk ? n : chunk;
		status = XML_Parse (parser, buf, int(len), len == n);
		buf += len;
		n -= len;
	} while (status == XML_STATUS_OK && n > 0);

	if (pending) {
		std::rethrow_exception (pending);
	}
	if (too_deep_at >= 0) {
		throw_error (too_deep, too_deep_at, _("more than %d levels of nesting."),
		             max_depth - 2);
	}
	if (status != XML_STATUS_OK) {
		XML_Error code = XML_GetErrorCode (parser);
		throw_error (malformed_xml, XML_GetCurrentByteIndex (parser), _("line %d, column %d: %s."),
		             (unsigned long)XML_GetCurrentLineNumber (parser),
		             (unsigned long)XML_GetCurrentColumnNumber (parser),
		             XML_ErrorString (code));
	}
	return std::move(root);
}



bool is_xml_blank (char c)
{
	return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

std::string trim (const std::string &s)
{
	size_t b = 0;
	size_t e = s.size();
	while (b < e && is_xml_blank (s[b])) ++b;
	while (e > b && is_xml_blank (s[e - 1])) --e;
	return s.substr (b, e - b);
}

bool is_blank (const std::string &s)
{
	for (char c : s) {
		if (!is_xml_blank (c)) return false;
	}
	return true;
}


class Tree_walker {
	int max_depth;

	Value scalar (const Node &n);
	Value binary (const Node &n);
	Value array (const Node &n, int depth);
	Value map (const Node &n, int depth);

public:
	Tree_walker (int maxd) : max_depth(maxd) {}

	Value document (const Node &root);
	Value value (const Node &n, int depth);
};


Value Tree_walker::document (const Node &root)
{
	if (root.name != "llsd") {
		throw_error (structural_error, root.offset, _("the root element must be <llsd>, not <%s>."),
		             root.name);
	}
	if (!is_blank (root.text)) {
		throw_error (structural_error, root.offset, _("<llsd> contains text outside of the value."));
	}
	if (root.children.size() != 1) {
		throw_error (structural_error, root.offset, _("<llsd> must hold exactly one value, it has %d."),
		             root.children.size());
	}
	return value (*root.children[0], 0);
}


static bool is_scalar_element (const std::string &name)
{
	static const char *const names[] = {
		"undef", "boolean", "integer", "real", "uuid", "string", "date", "uri", "binary"
	};
	for (const char *x : names) {
		if (name == x) return true;
	}
	return false;
}

Value Tree_walker::value (const Node &n, int depth)
{
	if (n.name == "array") {
		return array (n, depth);
	} else if (n.name == "map") {
		return map (n, depth);
	}

	if (!n.children.empty()) {
		if (n.name != "llsd" && n.name != "key" && !is_scalar_element (n.name)) {
			throw_error (unknown_type, n.offset, _("<%s> is not an LLSD element."), n.name);
		}
		if (n.name == "llsd" || n.name == "key") {
			throw_error (structural_error, n.offset, _("<%s> is not allowed here."), n.name);
		}
		throw_error (structural_error, n.children[0]->offset, _("<%s> cannot contain elements."),
		             n.name);
	}
	return scalar (n);
}


Value Tree_walker::scalar (const Node &n)
{
	const std::string &name = n.name;

	if (name == "string") {
		return Value::make_string (n.text);
	} else if (name == "binary") {
		return binary (n);
	} else if (name == "llsd" || name == "key") {
		throw_error (structural_error, n.offset, _("<%s> is not allowed here."), name);
	}

	std::string t = trim (n.text);
	try {
		if (name == "undef") {
			if (!t.empty()) {
				throw_error (structural_error, -1, _("<undef> cannot have content."));
			}
			return Value();
		} else if (name == "boolean") {
			if (t == "true" || t == "1") {
				return Value(true);
			} else if (t == "false" || t == "0" || t.empty()) {
				return Value(false);
			}
			throw_error (invalid_boolean, -1, _("'%s' is not a boolean."), t);
		} else if (name == "integer") {
			return Value(t.empty() ? 0 : parse_integer (t.data(), t.size()));
		} else if (name == "real") {
			return Value(t.empty() ? 0.0 : parse_real (t.data(), t.size(), true));
		} else if (name == "uuid") {
			return Value(t.empty() ? Uuid() : parse_uuid (t));
		} else if (name == "date") {
			return Value::make_date (t.empty() ? 0 : parse_date (t));
		} else if (name == "uri") {
			return Value::make_uri (t);
		}
	} catch (const Error &e) {
		rethrow_at (e, n.offset);
	}

	throw_error (unknown_type, n.offset, _("<%s> is not an LLSD element."), name);
	return Value();
}


Value Tree_walker::binary (const Node &n)
{
	Binary_encoding enc = base64;
	if (n.has_encoding) {
		if (n.encoding == "base16" || n.encoding == "hex") {
			enc = base16;
		} else if (n.encoding != "base64") {
			throw_error (invalid_binary, n.offset, _("unknown binary encoding '%s'."), n.encoding);
		}
	}

	std::string t = trim (n.text);
	try {
		return Value::make_binary (decode_binary (t.data(), t.size(), enc));
	} catch (const Error &e) {
		rethrow_at (e, n.offset);
	}
	return Value();
}


Value Tree_walker::array (const Node &n, int depth)
{
	if (depth >= max_depth) {
		throw_error (too_deep, n.offset, _("more than %d levels of nesting."), max_depth);
	}
	if (!is_blank (n.text)) {
		throw_error (structural_error, n.offset, _("<array> contains text outside of its values."));
	}

	Array items;
	items.reserve (n.children.size());
	for (const auto &c : n.children) {
		items.push_back (value (*c, depth + 1));
	}
	return Value(std::move(items));
}


Value Tree_walker::map (const Node &n, int depth)
{
	if (depth >= max_depth) {
		throw_error (too_deep, n.offset, _("more than %d levels of nesting."), max_depth);
	}
	if (!is_blank (n.text)) {
		throw_error (structural_error, n.offset, _("<map> contains text outside of its entries."));
	}

	Map m;
	m.reserve (n.children.size() / 2);
	for (size_t i = 0; i < n.children.size(); i += 2) {
		const Node &key = *n.children[i];
		if (key.name != "key") {
			throw_error (structural_error, key.offset, _("expected <key> in <map>, found <%s>."),
			             key.name);
		}
		if (!key.children.empty()) {
			throw_error (structural_error, key.offset, _("<key> cannot contain elements."));
		}
		if (i + 1 == n.children.size()) {
			throw_error (structural_error, key.offset, _("the key '%s' has no value."), key.text);
		}
		const Node &val = *n.children[i + 1];
		if (val.name == "key") {
			throw_error (structural_error, val.offset, _("the key '%s' is followed by another key."),
			             key.text);
		}
		m.insert (key.text, value (val, depth + 1));
	}
	return Value(std::move(m));
}




class Xml_writer {
	std::string *out;
	int          indent;

	void newline (int level);
	void escape (const std::string &s, const char *what);
	void simple (const char *tag, const std::string &text, int level);
	void write (const Value &v, int level);

public:
	Xml_writer (std::string *dest, int ind) : out(dest), indent(ind) {}
	void document (const Value &v);
};


void Xml_writer::newline (int level)
{
	if (indent > 0) {
		out->push_back ('\n');
		out->append (size_t(indent) * level, ' ');
	}
}

// Characters that XML 1.0 allows in a document.
static bool is_xml_char (uint32_t c)
{
	return c == 0x9 || c == 0xA || c == 0xD ||
	       (c >= 0x20 && c <= 0xD7FF) ||
	       (c >= 0xE000 && c <= 0xFFFD) ||
	       (c >= 0x10000 && c <= 0x10FFFF);
}

void Xml_writer::escape (const std::string &s, const char *what)
{
	const char *p = s.data();
	size_t n = s.size();
	while (n > 0) {
		uint32_t cp;
		size_t len = utf8_sequence (p, n, &cp);
		if (len == 0) {
			throw_error (unsupported_value, -1, _("the %s is not valid UTF-8 at byte %d."),
			             what, s.size() - n);
		}
		if (!is_xml_char (cp)) {
			throw_error (unsupported_value, -1, _("the %s contains the character U+%04X, which XML does not allow."),
			             what, cp);
		}
		switch (cp) {
		case '&':  out->append ("&amp;");  break;
		case '<':  out->append ("&lt;");   break;
		case '>':  out->append ("&gt;");   break;
		case '\'': out->append ("&apos;"); break;
		case '"':  out->append ("&quot;"); break;
		// A literal CR would be turned into LF by the parser.
		case '\r': out->append ("&#13;");  break;
		default:
			out->append (p, len);
		}
		p += len;
		n -= len;
	}
}

void Xml_writer::simple (const char *tag, const std::string &text, int level)
{
	newline (level);
	out->push_back ('<');
	out->append (tag);
	out->push_back ('>');
	out->append (text);
	out->append ("</");
	out->append (tag);
	out->push_back ('>');
}

void Xml_writer::write (const Value &v, int level)
{
	switch (v.type()) {
	case Value::undefined:
		newline (level);
		out->append ("<undef />");
		break;

	case Value::boolean:
		simple ("boolean", v.as_boolean() ? "true" : "false", level);
		break;

	case Value::integer:
		simple ("integer", format_integer (v.as_integer()), level);
		break;

	case Value::real:
		simple ("real", format_real (v.as_real()), level);
		break;

	case Value::uuid:
		simple ("uuid", format_uuid (v.as_uuid()), level);
		break;

	case Value::string:
		newline (level);
		out->append ("<string>");
		escape (v.as_string(), "string");
		out->append ("</string>");
		break;

	case Value::date:
		simple ("date", format_date (v.as_date()), level);
		break;

	case Value::uri:
		newline (level);
		out->append ("<uri>");
		escape (v.as_uri(), "URI");
		out->append ("</uri>");
		break;

	case Value::binary:
		newline (level);
		out->append ("<binary encoding=\"base64\">");
		base64enc (v.as_binary().data(), v.as_binary().size(), *out);
		out->append ("</binary>");
		break;

	case Value::array:
		newline (level);
		if (v.size() == 0) {
			out->append ("<array />");
			break;
		}
		out->append ("<array>");
		for (const auto &child : v.as_array()) {
			write (child, level + 1);
		}
		newline (level);
		out->append ("</array>");
		break;

	case Value::map:
		newline (level);
		if (v.size() == 0) {
			out->append ("<map />");
			break;
		}
		out->append ("<map>");
		for (const auto &e : v.as_map()) {
			newline (level + 1);
			out->append ("<key>");
			escape (e.first, "key");
			out->append ("</key>");
			write (e.second, level + 1);
		}
		newline (level);
		out->append ("</map>");
		break;
	}
}

void Xml_writer::document (const Value &v)
{
	out->append ("<?xml version=\"1.0\" encoding=\"UTF-8\"?>");
	if (indent > 0) {
		out->push_back ('\n');
	}
	out->append ("<llsd>");
	write (v, 1);
	if (indent > 0) {
		out->push_back ('\n');
	}
	out->append ("</llsd>");
	if (indent > 0) {
		out->push_back ('\n');
	}
}

}


Value parse_xml (const char *buf, size_t n, const Xml_options &opt)
{
	std::unique_ptr<Node> root;
	{
		Tree_builder tb (opt.max_depth);
		root = tb.parse (buf, n);
	}
	if (!root) {
		throw_error (malformed_xml, 0, _("the document has no elements."));
	}
	Tree_walker tw (opt.max_depth);
	return tw.document (*root);
}

Value parse_xml (const std::string &s, const Xml_options &opt)
{
	return parse_xml (s.data(), s.size(), opt);
}

std::string serialize_xml (const Value &v, const Xml_options &opt)
{
	std::string res;
	Xml_writer wr (&res, opt.indent);
	wr.document (v);
	return res;
}

}}

