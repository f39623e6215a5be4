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
 * A user type tells how it is encoded with a rule, either with a static
 * member `sce` or with a specialization of sce_rule<T> with static member
 * `value`. Inside the class the namespace must be spelled `::sce` since
 * the member hides it:
 *
 *  struct Point {
 *      int x, y;
 *      static constexpr auto sce = std::make_tuple(
 *          ::sce::named("x", &Point::x), ::sce::named("y", &Point::y));
 *  };
 *
 * A type that is an alternative of std::variant presents its variant name
 * with static member `sce_name`.
 *
 * A type may take the whole encoding over: either with a method
 *  template <class ENC>
 *  std::optional<sce::Error> sce_encode(const typename ENC::TypeId&, ENC&) const;
 * or with a specialization of sce_custom_rule<T> with a static method
 *  encode(const T&, const typename ENC::TypeId&, ENC&).
 */

#include <string_view>
#include <type_traits>
#include <utility>

#include "../Utils/Traits.hpp"

template <class T> struct sce_rule;
template <class T> struct sce_custom_rule;

namespace sce {

namespace details {
template <class T>
struct has_member_base {
	static constexpr bool value = !std::is_member_pointer_v<T>;
};

template <class T, typename = void>
struct has_member_rule_h : std::false_type {};
template <class T>
struct has_member_rule_h<T, std::void_t<decltype(T::sce)>>
	: has_member_base<decltype(&T::sce)> {};

template <class T, typename = void>
struct has_spec_rule_h : std::false_type {};
template <class T>
struct has_spec_rule_h<T, std::void_t<decltype(sce_rule<T>::value)>>
	: has_member_base<decltype(&sce_rule<T>::value)> {};

template <class T, typename = void>
struct has_variant_name_h : std::false_type {};
template <class T>
struct has_variant_name_h<T, std::void_t<decltype(T::sce_name)>>
	: std::is_convertible<decltype(T::sce_name), std::string_view> {};

template <class T, class ENC, typename = void>
struct has_member_custom_h : std::false_type {};
template <class T, class ENC>
struct has_member_custom_h<T, ENC, std::void_t<
	decltype(std::declval<const T&>().sce_encode(
		std::declval<const typename ENC::TypeId&>(),
		std::declval<ENC&>()))>> : std::true_type {};

template <class T, class ENC, typename = void>
struct has_spec_custom_h : std::false_type {};
template <class T, class ENC>
struct has_spec_custom_h<T, ENC, std::void_t<
	decltype(sce_custom_rule<T>::encode(std::declval<const T&>(),
		std::declval<const typename ENC::TypeId&>(),
		std::declval<ENC&>()))>> : std::true_type {};
} // namespace details

template <class T>
constexpr bool has_enc_rule_v =
	details::has_member_rule_h<T>::value ||
	details::has_spec_rule_h<T>::value;

template <class T>
constexpr auto& get_enc_rule()
{
	if constexpr (details::has_member_rule_h<T>::value)
		return T::sce;
	else if constexpr (details::has_spec_rule_h<T>::value)
		return sce_rule<T>::value;
	else
		static_assert(scl::always_false_v<T>,
			      "Failed to find a rule for given type");
}

template <class T>
constexpr bool has_variant_name_v = details::has_variant_name_h<T>::value;

template <class T>
constexpr std::string_view get_variant_name()
{
	static_assert(has_variant_name_v<T>,
		      "Alternative of std::variant must have sce_name");
	return T::sce_name;
}

template <class T, class ENC>
constexpr bool has_custom_hook_v =
	details::has_member_custom_h<T, ENC>::value ||
	details::has_spec_custom_h<T, ENC>::value;

} // namespace sce
