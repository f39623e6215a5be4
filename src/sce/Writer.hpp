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
#include <cstdint>
#include <cstring>
#include <string_view>

#include "Common.hpp"
#include "Constants.hpp"
#include "ContAdapter.hpp"

namespace sce {

/**
 * Low level SCALE writer on top of any container supported by
 * encode_details::wr(). All multi-byte integers are little endian.
 */
template <class CONT>
class Writer {
public:
	explicit Writer(CONT& cont) : m_Out(encode_details::wr(cont)) {}

	void writeBool(bool b)
	{
		uint8_t byte = b ? 1 : 0;
		writeBytes(&byte, 1);
	}

	/** Integer of any width up to 128 bits, as is. */
	template <class T>
	void writeFixed(T t)
	{
		static_assert(scl::is_integer_v<T>);
		writeFixed(Number::of(t).bits(), sizeof(T));
	}

	/** Lower @a size bytes of two's complement @a bits. */
	void writeFixed(uint128_t bits, size_t size)
	{
		uint8_t buf[16];
		for (size_t i = 0; i < size; i++)
			buf[i] = uint8_t(bits >> (8 * i));
		writeBytes(buf, size);
	}

	/** 256 bit integer: 128 bits of @a num extended with its sign. */
	void writeExtended(const Number &num)
	{
		writeFixed(num.bits(), 16);
		uint8_t ext[16];
		std::memset(ext, num.negative && num.magnitude != 0 ? 0xff : 0,
			    sizeof(ext));
		writeBytes(ext, sizeof(ext));
	}

	void writeChar(char32_t c)
	{
		writeFixed(uint32_t(c));
	}

	/**
	 * Compact unsigned integer: values below 2^6 take one byte, below
	 * 2^14 two bytes, below 2^30 four bytes. Larger values are written
	 * as a prefix byte with the byte count followed by the shortest
	 * (but at least 4 bytes) little endian representation.
	 */
	void writeCompact(uint128_t v)
	{
		if (v < (uint128_t(1) << 6)) {
			writeFixed(v << 2, 1);
		} else if (v < (uint128_t(1) << 14)) {
			writeFixed((v << 2) | 1, 2);
		} else if (v < (uint128_t(1) << 30)) {
			writeFixed((v << 2) | 2, 4);
		} else {
			size_t size = 4;
			while (size < 16 && (v >> (8 * size)) != 0)
				size++;
			uint8_t prefix = uint8_t(((size - 4) << 2) | 3);
			writeBytes(&prefix, 1);
			writeFixed(v, size);
		}
	}

	void writeLength(size_t len)
	{
		writeCompact(len);
	}

	void writeStr(std::string_view str)
	{
		writeLength(str.size());
		writeBytes(str.data(), str.size());
	}

	void writeBytes(const void *data, size_t size)
	{
		m_Out.write(encode_details::WData{
			static_cast<const char *>(data), size});
	}

	/**
	 * Bit sequence: compact count of bits and then the bits packed into
	 * words of @a store width, each word little endian. @a order tells
	 * whether the first bit of a word is its least or most significant.
	 * BITS must provide size() and operator[] convertible to bool.
	 * Nothing is written for an unknown store.
	 */
	template <class BITS>
	void writeBits(const BITS& bits, BitOrder order, BitStore store)
	{
		size_t word_bits = store_bits(store);
		if (word_bits == 0)
			return;
		size_t count = bits.size();
		writeLength(count);
		size_t word_bytes = word_bits / 8;
		for (size_t i = 0; i < count; i += word_bits) {
			uint64_t word = 0;
			for (size_t j = 0; j < word_bits && i + j < count; j++) {
				if (!static_cast<bool>(bits[i + j]))
					continue;
				size_t pos = order == LSB0 ? j : word_bits - 1 - j;
				word |= uint64_t(1) << pos;
			}
			writeFixed(uint128_t(word), word_bytes);
		}
	}

private:
	decltype(encode_details::wr(std::declval<CONT&>())) m_Out;
};

} // namespace sce {
