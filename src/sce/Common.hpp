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
#include <string>
#include <type_traits>

#include "../Utils/Traits.hpp"

/**
 * Maximal nesting depth of one encode call. Deeper nesting is reported as
 * RECURSION_LIMIT_EXCEEDED; that happens only with self-referential type
 * graphs that have no base case.
 */
#ifndef SCE_RECURSION_LIMIT
#define SCE_RECURSION_LIMIT 512
#endif

namespace sce {

__extension__ typedef unsigned __int128 uint128_t;
__extension__ typedef __int128 int128_t;

/**
 * Sign and magnitude of any source integer up to 128 bits. The magnitude
 * of the smallest int128_t (2^127) still fits into uint128_t.
 */
struct Number {
	uint128_t magnitude;
	bool negative;

	template <class T>
	static constexpr Number of(T t)
	{
		static_assert(scl::is_integer_v<T>);
		using base_t = scl::base_enum_t<T>;
		base_t v = static_cast<base_t>(t);
		if constexpr (scl::is_signed_integer_v<T>) {
			if (v < 0)
				return {uint128_t(0) - uint128_t(int128_t(v)), true};
		}
		return {uint128_t(v), false};
	}

	/** Two's complement representation of the number. */
	constexpr uint128_t bits() const
	{
		return negative ? uint128_t(0) - magnitude : magnitude;
	}
};

inline bool
operator==(const Number &a, const Number &b)
{
	return a.magnitude == b.magnitude &&
	       (a.negative == b.negative || a.magnitude == 0);
}

inline std::string
to_string(uint128_t v)
{
	if (v == 0)
		return "0";
	char buf[40];
	char *p = buf + sizeof(buf);
	while (v != 0) {
		*--p = char('0' + unsigned(v % 10));
		v /= 10;
	}
	return std::string(p, buf + sizeof(buf));
}

inline std::string
to_string(const Number &n)
{
	return n.negative && n.magnitude != 0 ?
	       "-" + to_string(n.magnitude) : to_string(n.magnitude);
}

/** Largest value of unsigned integer of given bit width (up to 128). */
constexpr uint128_t
uint_max(unsigned bits)
{
	return bits >= 128 ? ~uint128_t(0) : (uint128_t(1) << bits) - 1;
}

} // namespace sce {
