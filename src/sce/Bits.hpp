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

#include <bitset>
#include <cstddef>
#include <initializer_list>
#include <type_traits>
#include <utility>
#include <vector>

namespace sce {

/** Dynamic sequence of bits, source of BitSequence targets. */
class Bits {
public:
	Bits() = default;
	Bits(std::initializer_list<bool> list) : m_Bits(list) {}
	explicit Bits(std::vector<bool> bits) : m_Bits(std::move(bits)) {}

	void push_back(bool bit) { m_Bits.push_back(bit); }
	size_t size() const { return m_Bits.size(); }
	bool empty() const { return m_Bits.empty(); }
	bool operator[](size_t i) const { return m_Bits[i]; }
	bool operator==(const Bits& other) const { return m_Bits == other.m_Bits; }

private:
	std::vector<bool> m_Bits;
};

namespace details {
template <class T>
struct is_bits_h : std::false_type {};
template <>
struct is_bits_h<Bits> : std::true_type {};
template <size_t N>
struct is_bits_h<std::bitset<N>> : std::true_type {};
} // namespace details

/** Check whether the type is a bit sequence: sce::Bits or std::bitset. */
template <class T>
constexpr bool is_bits_v = details::is_bits_h<std::remove_cv_t<T>>::value;

} // namespace sce
