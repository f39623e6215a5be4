#pragma once
/*
 * Copyright 2010-2020, Tarantool AUTHORS, please see AUTHORS file.
 *
 * Redistribution and use in source and binary forms, with or
 * without modification, are permitted provided that the following
 * conditions are met:
 *
 * 1. Redistributions of source code must retain the above
 *    copyright notice, this list of conditions and the
 *    following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above
 *    copyright notice, this list of conditions and the following
 *    disclaimer in the documentation and/or other materials
 *    provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY <COPYRIGHT HOLDER> ``AS IS'' AND
 * ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL
 * <COPYRIGHT HOLDER> OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT,
 * INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
 * DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR
 * BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF
 * THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF
 * SUCH DAMAGE.
 */

#include <cstddef>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "Common.hpp"
#include "Constants.hpp"

namespace sce {

/** One step of the path to the place where encoding failed. */
struct Location {
	enum Type : uint8_t {
		FIELD,
		VARIANT,
		INDEX
	};
	Type type;
	std::string name;
	size_t idx;

	static Location field(std::string_view name)
	{
		return {FIELD, std::string(name), 0};
	}
	static Location variant(std::string_view name)
	{
		return {VARIANT, std::string(name), 0};
	}
	static Location index(size_t idx)
	{
		return {INDEX, {}, idx};
	}
};

inline bool
operator==(const Location &a, const Location &b)
{
	return a.type == b.type && a.name == b.name && a.idx == b.idx;
}

inline std::ostream&
operator<<(std::ostream& strm, const Location &loc)
{
	switch (loc.type) {
	case Location::FIELD:
		return strm << '.' << loc.name;
	case Location::VARIANT:
		return strm << '(' << loc.name << ')';
	case Location::INDEX:
		return strm << '[' << loc.idx << ']';
	}
	return strm << "?";
}

/** Printable form of a type id, used in error details. */
template <class TYPE_ID>
std::string
type_id_str(const TYPE_ID &id)
{
	if constexpr (scl::is_streamable_v<TYPE_ID>) {
		std::stringstream strm;
		strm << id;
		return std::move(strm).str();
	} else {
		return "<opaque>";
	}
}

/**
 * Failure of an encode call. Only fields relevant to the kind are set.
 * The context keeps the path innermost first: every frame that propagates
 * the error appends its own segment.
 */
struct Error {
	ErrorKind kind;
	/** WRONG_SHAPE: shape of the source value. */
	Kind actual = KIND_END;
	/** Printed id of the target type that was expected. */
	std::string expectedId;
	/** WRONG_LENGTH. */
	size_t actualLen = 0;
	size_t expectedLen = 0;
	/** NUMBER_OUT_OF_RANGE: printed source number. */
	std::string value;
	/** Name of a missing/duplicate field or a missing variant. */
	std::string name;
	/** UNSUPPORTED and CUSTOM: human readable message. */
	std::string msg;
	std::vector<Location> context;

	Error &at(Location loc)
	{
		context.push_back(std::move(loc));
		return *this;
	}
	Error &atIdx(size_t idx) { return at(Location::index(idx)); }
	Error &atField(std::string_view name) { return at(Location::field(name)); }
	Error &atVariant(std::string_view name) { return at(Location::variant(name)); }

	/** Path from the root value to the failure. */
	std::string path() const
	{
		if (context.empty())
			return "<root>";
		std::stringstream strm;
		for (auto it = context.rbegin(); it != context.rend(); ++it)
			strm << *it;
		std::string res = std::move(strm).str();
		if (res[0] == '.')
			res.erase(0, 1);
		return res;
	}

	template <class TYPE_ID>
	static Error typeNotFound(const TYPE_ID &id)
	{
		Error e{TYPE_NOT_FOUND};
		e.expectedId = type_id_str(id);
		return e;
	}
	template <class TYPE_ID>
	static Error wrongShape(Kind actual, const TYPE_ID &id)
	{
		Error e{WRONG_SHAPE};
		e.actual = actual;
		e.expectedId = type_id_str(id);
		return e;
	}
	static Error wrongLength(size_t actual_len, size_t expected_len)
	{
		Error e{WRONG_LENGTH};
		e.actualLen = actual_len;
		e.expectedLen = expected_len;
		return e;
	}
	template <class TYPE_ID>
	static Error numberOutOfRange(const Number &value, const TYPE_ID &id)
	{
		Error e{NUMBER_OUT_OF_RANGE};
		e.value = to_string(value);
		e.expectedId = type_id_str(id);
		return e;
	}
	static Error cannotFindField(std::string_view name)
	{
		Error e{CANNOT_FIND_FIELD};
		e.name = std::string(name);
		return e;
	}
	static Error duplicateField(std::string_view name)
	{
		Error e{DUPLICATE_FIELD};
		e.name = std::string(name);
		return e;
	}
	template <class TYPE_ID>
	static Error cannotFindVariant(std::string_view name, const TYPE_ID &id)
	{
		Error e{CANNOT_FIND_VARIANT};
		e.name = std::string(name);
		e.expectedId = type_id_str(id);
		return e;
	}
	static Error unsupported(std::string msg)
	{
		Error e{UNSUPPORTED};
		e.msg = std::move(msg);
		return e;
	}
	static Error recursionLimitExceeded()
	{
		return Error{RECURSION_LIMIT_EXCEEDED};
	}
	static Error custom(std::string msg)
	{
		Error e{CUSTOM};
		e.msg = std::move(msg);
		return e;
	}
};

/** Description of the failure without the path. */
inline std::string
describe(const Error &e)
{
	std::stringstream strm;
	switch (e.kind) {
	case TYPE_NOT_FOUND:
		strm << "Cannot find type with identifier " << e.expectedId;
		break;
	case WRONG_SHAPE:
		strm << "Cannot encode " << e.actual
		     << " into type with identifier " << e.expectedId;
		break;
	case WRONG_LENGTH:
		strm << "Cannot encode to type; expected length "
		     << e.expectedLen << " but got length " << e.actualLen;
		break;
	case NUMBER_OUT_OF_RANGE:
		strm << "Number " << e.value
		     << " is out of range for target type with identifier "
		     << e.expectedId;
		break;
	case CANNOT_FIND_FIELD:
		strm << "Field " << e.name
		     << " does not exist in the source value";
		break;
	case DUPLICATE_FIELD:
		strm << "Field " << e.name
		     << " is given more than once in the source value";
		break;
	case CANNOT_FIND_VARIANT:
		strm << "Variant " << e.name
		     << " does not exist on type with identifier "
		     << e.expectedId;
		break;
	case UNSUPPORTED:
		strm << "Unsupported: " << e.msg;
		break;
	case RECURSION_LIMIT_EXCEEDED:
		strm << "Nesting is deeper than " << SCE_RECURSION_LIMIT
		     << " levels";
		break;
	case CUSTOM:
		strm << "Custom error: " << e.msg;
		break;
	default:
		strm << e.kind;
	}
	return std::move(strm).str();
}

inline std::ostream&
operator<<(std::ostream& strm, const Error &e)
{
	return strm << "Error at " << e.path() << ": " << describe(e);
}

} // namespace sce {
