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
#include <iterator>
#include <type_traits>
#include <utility>

#include "../Utils/Traits.hpp"

namespace sce {

namespace encode_details {

/** Span of encoded bytes handed to a container at once. */
struct WData {
	const char *data;
	size_t size;
};

/** Test that container is Buffer-like: has write({data, size}) method. */
template <class CONT, class _ = void>
struct is_write_callable_h : std::false_type {};

template <class CONT>
struct is_write_callable_h<CONT,
	std::void_t<decltype(std::declval<CONT&>().write({(const char *)0, size_t{1}}))>>
	: std::true_type {};

template <class CONT>
constexpr bool is_write_callable_v = is_write_callable_h<CONT>::value;

/** Container with its own write method, e.g. a chunked buffer. */
template <class CONT>
class BufferWriter {
public:
	explicit BufferWriter(CONT& cont) : m_Cont(cont) {}
	void write(WData data) { m_Cont.write({data.data, data.size}); }

private:
	CONT& m_Cont;
};

/** std::vector<uint8_t>, std::string and alike: bytes are appended. */
template <class CONT>
class StdContWriter {
public:
	static_assert(sizeof(*std::data(std::declval<CONT&>())) == 1,
		      "Container must consist of bytes");
	explicit StdContWriter(CONT& cont) : m_Cont(cont) {}
	void write(WData data)
	{
		if (data.size == 0)
			return;
		size_t pos = std::size(m_Cont);
		m_Cont.resize(pos + data.size);
		std::memcpy(std::data(m_Cont) + pos, data.data, data.size);
	}

private:
	CONT& m_Cont;
};

/**
 * Raw memory of sufficient size. The pointer is advanced by every
 * write, so after encoding it points right after the last byte.
 */
template <class C>
class PtrWriter {
public:
	static_assert(sizeof(C) == 1 && !std::is_const_v<C>,
		      "Pointer must be to mutable bytes");
	explicit PtrWriter(C *& ptr) : m_Ptr(ptr) {}
	void write(WData data)
	{
		if (data.size == 0)
			return;
		std::memcpy(m_Ptr, data.data, data.size);
		m_Ptr += data.size;
	}

private:
	C *& m_Ptr;
};

template <class CONT>
auto
wr(CONT& cont)
{
	if constexpr (is_write_callable_v<CONT>)
		return BufferWriter<CONT>{cont};
	else if constexpr (scl::is_resizable_v<CONT> && scl::is_contiguous_v<CONT>)
		return StdContWriter<CONT>{cont};
	else if constexpr (std::is_pointer_v<CONT>)
		return PtrWriter<std::remove_pointer_t<CONT>>{cont};
	else
		static_assert(scl::always_false_v<CONT>,
			      "Unsupported output container");
}

} // namespace encode_details

} // namespace sce
