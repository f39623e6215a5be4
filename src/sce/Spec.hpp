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

/**
 * Field specifications used in record rules:
 *  &T::m                  - positional (unnamed) field;
 *  sce::named("n", &T::m) - field presented under name "n";
 *  sce::skip(&T::m)       - field that is neither counted nor encoded.
 */

#include <string_view>
#include <type_traits>

#include "../Utils/Traits.hpp"

namespace sce {

template <class M>
struct NamedField {
	static_assert(scl::is_member_ptr_v<M>, "Pointer to member expected");
	std::string_view name;
	M member;
};

template <class M>
struct SkipField {
	static_assert(scl::is_member_ptr_v<M>, "Pointer to member expected");
	M member;
};

template <class M>
constexpr NamedField<M> named(std::string_view name, M member)
{
	return {name, member};
}

template <class M>
constexpr SkipField<M> skip(M member)
{
	return {member};
}

namespace details {
template <class T>
struct is_named_field_h : std::false_type {};
template <class M>
struct is_named_field_h<NamedField<M>> : std::true_type {};

template <class T>
struct is_skip_field_h : std::false_type {};
template <class M>
struct is_skip_field_h<SkipField<M>> : std::true_type {};
} // namespace details

template <class T>
constexpr bool is_named_field_v = details::is_named_field_h<std::remove_cv_t<T>>::value;

template <class T>
constexpr bool is_skip_field_v = details::is_skip_field_h<std::remove_cv_t<T>>::value;

} // namespace sce
