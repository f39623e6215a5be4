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

#include <cstdint>
#include <iostream>
#include <iterator>

namespace sce {

/** Primitive kinds a target type can declare. */
enum PrimitiveKind : uint8_t {
	BOOL,
	CHAR,
	STR,
	U8,
	U16,
	U32,
	U64,
	U128,
	U256,
	I8,
	I16,
	I32,
	I64,
	I128,
	I256,
	PRIMITIVE_KIND_END
};

inline const char *PrimitiveKindName[] = {
	"bool",
	"char",
	"str",
	"u8",
	"u16",
	"u32",
	"u64",
	"u128",
	"u256",
	"i8",
	"i16",
	"i32",
	"i64",
	"i128",
	"i256",
	"bad"
};
static_assert(std::size(PrimitiveKindName) == PRIMITIVE_KIND_END + 1,
	      "Smth is forgotten");

inline std::ostream&
operator<<(std::ostream& strm, PrimitiveKind k)
{
	if (k >= PRIMITIVE_KIND_END)
		return strm << PrimitiveKindName[PRIMITIVE_KIND_END]
			    << "(" << static_cast<uint64_t>(k) << ")";
	return strm << PrimitiveKindName[k];
}

constexpr bool
is_unsigned_kind(PrimitiveKind k)
{
	return k >= U8 && k <= U256;
}

constexpr bool
is_signed_kind(PrimitiveKind k)
{
	return k >= I8 && k <= I256;
}

constexpr bool
is_integer_kind(PrimitiveKind k)
{
	return is_unsigned_kind(k) || is_signed_kind(k);
}

/** Width in bits of an integer kind, 0 for other kinds. */
constexpr unsigned
kind_bits(PrimitiveKind k)
{
	switch (k) {
	case U8: case I8: return 8;
	case U16: case I16: return 16;
	case U32: case I32: return 32;
	case U64: case I64: return 64;
	case U128: case I128: return 128;
	case U256: case I256: return 256;
	default: return 0;
	}
}

/** Order of bits inside of a store word of a bit sequence. */
enum BitOrder : uint8_t {
	LSB0,
	MSB0,
	BIT_ORDER_END
};

inline const char *BitOrderName[] = {
	"Lsb0",
	"Msb0",
	"bad"
};
static_assert(std::size(BitOrderName) == BIT_ORDER_END + 1, "Smth is forgotten");

inline std::ostream&
operator<<(std::ostream& strm, BitOrder o)
{
	return strm << BitOrderName[o < BIT_ORDER_END ? o : BIT_ORDER_END];
}

/** Word type in which bits of a bit sequence are packed. */
enum BitStore : uint8_t {
	STORE_U8,
	STORE_U16,
	STORE_U32,
	STORE_U64,
	BIT_STORE_END
};

inline const char *BitStoreName[] = {
	"u8",
	"u16",
	"u32",
	"u64",
	"bad"
};
static_assert(std::size(BitStoreName) == BIT_STORE_END + 1, "Smth is forgotten");

inline std::ostream&
operator<<(std::ostream& strm, BitStore s)
{
	return strm << BitStoreName[s < BIT_STORE_END ? s : BIT_STORE_END];
}

/** Width in bits of a store word, 0 for an unknown store. */
constexpr unsigned
store_bits(BitStore s)
{
	return s < BIT_STORE_END ? 8u << s : 0;
}

/** Shape of a source value, as reported in WRONG_SHAPE errors. */
enum Kind : uint8_t {
	KIND_STRUCT,
	KIND_TUPLE,
	KIND_VARIANT,
	KIND_ARRAY,
	KIND_BIT_SEQUENCE,
	KIND_BOOL,
	KIND_CHAR,
	KIND_STR,
	KIND_NUMBER,
	KIND_END
};

inline const char *KindName[] = {
	"Struct",
	"Tuple",
	"Variant",
	"Array",
	"BitSequence",
	"Bool",
	"Char",
	"Str",
	"Number",
	"Bad"
};
static_assert(std::size(KindName) == KIND_END + 1, "Smth is forgotten");

inline std::ostream&
operator<<(std::ostream& strm, Kind k)
{
	return strm << KindName[k < KIND_END ? k : KIND_END];
}

enum ErrorKind : uint8_t {
	TYPE_NOT_FOUND,
	WRONG_SHAPE,
	WRONG_LENGTH,
	NUMBER_OUT_OF_RANGE,
	CANNOT_FIND_FIELD,
	DUPLICATE_FIELD,
	CANNOT_FIND_VARIANT,
	UNSUPPORTED,
	RECURSION_LIMIT_EXCEEDED,
	CUSTOM,
	ERROR_KIND_END
};

inline const char *ErrorKindName[] = {
	"TYPE_NOT_FOUND",
	"WRONG_SHAPE",
	"WRONG_LENGTH",
	"NUMBER_OUT_OF_RANGE",
	"CANNOT_FIND_FIELD",
	"DUPLICATE_FIELD",
	"CANNOT_FIND_VARIANT",
	"UNSUPPORTED",
	"RECURSION_LIMIT_EXCEEDED",
	"CUSTOM",
	"BAD"
};
static_assert(std::size(ErrorKindName) == ERROR_KIND_END + 1,
	      "Smth is forgotten");

inline std::ostream&
operator<<(std::ostream& strm, ErrorKind k)
{
	return strm << ErrorKindName[k < ERROR_KIND_END ? k : ERROR_KIND_END];
}

} // namespace sce {
