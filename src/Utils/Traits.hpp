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
 * Generic trait library for type analysis at compile time.
 * Short list (see full description below):
 *
 * always_false_v
 * base_enum_t (safe for non-enums)
 * is_integer_v (including 128 bit integers)
 * is_signed_integer_v
 * is_unsigned_integer_v
 * is_bounded_array_v (c array)
 * is_tuplish_v (standard tuple, pair, array)
 * is_variant_v
 * is_optional_v
 * is_member_ptr_v
 * member_class_t
 * demember_t
 * is_const_iterable_v
 * is_sizable_v
 * is_contiguous_v
 * is_resizable_v
 * is_string_like_v
 * is_pairs_iterable_v
 * is_smart_ptr_v
 * is_reference_wrapper_v
 * is_streamable_v
 */

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <ostream>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace scl {

/**
 * Delayer of static_assert evaluation.
 */
template <class>
constexpr bool always_false_v = false;

/**
 * Safe underlying_type extractor by enum type.
 * Unlike std::underlying_type_t which is (can be) undefined for non-enum
 * type, the checker below reveals underlying type for enums and leaves the
 * type for the rest types.
 */
namespace details {
template <class T, bool IS_ENUM> struct base_enum_h;
template <class T> struct base_enum_h<T, false> { using type = T; };
template <class T> struct base_enum_h<T, true> {
	using type = std::underlying_type_t<T>;
};
} // namespace details {

template <class T> using base_enum_t =
	typename details::base_enum_h<T, std::is_enum_v<T>>::type;

/**
 * Check that the type can represent integer numbers.
 * More formally, is_integer_v is true for enum types, integral types
 * (see std::is_integral for the list) except bool, and for 128 bit
 * integers even if the standard library does not count them as integral.
 */
namespace details {
template <class T>
constexpr bool is_int128_v =
	std::is_same_v<std::remove_cv_t<T>, __int128> ||
	std::is_same_v<std::remove_cv_t<T>, unsigned __int128>;
template <class T>
constexpr bool is_signed_h_v =
	std::is_same_v<std::remove_cv_t<T>, __int128> || std::is_signed_v<T>;
} // namespace details {

template <class T>
constexpr bool is_integer_v = std::is_enum_v<T> || details::is_int128_v<T> ||
	(std::is_integral_v<T> && !std::is_same_v<std::remove_cv_t<T>, bool>);

/**
 * Trait whether is_integer_v (see above) which is signed.
 */
template <class T>
constexpr bool is_signed_integer_v =
	is_integer_v<T> && details::is_signed_h_v<base_enum_t<T>>;

/**
 * Trait whether is_integer_v (see above) which is unsigned.
 */
template <class T>
constexpr bool is_unsigned_integer_v =
	is_integer_v<T> && !details::is_signed_h_v<base_enum_t<T>>;

/**
 * Check whether the type is C bounded array (with certain size), like int [10].
 * Identical to std::is_bounded_array_v from C++20.
 * Note that cv qualifiers for C array are passed to its elements.
 */
namespace details {
template <class T>
struct is_bounded_array_h : std::false_type {};
template <class T, std::size_t N>
struct is_bounded_array_h<T[N]> : std::true_type {};
} //namespace details {
template <class T>
constexpr bool is_bounded_array_v = details::is_bounded_array_h<T>::value;

/**
 * Check whether the type is compatible with std::tuple, that is it
 * has std::tuple_size and std::get. That includes std::tuple, std::pair
 * and std::array.
 */
namespace details {
template <class T, class _ = void>
struct is_tuplish_h : std::false_type {};

template <class T>
struct is_tuplish_h<T, std::void_t<decltype(std::tuple_size<T>::value)>>
	: std::true_type {};
} //namespace details {

template <class T>
constexpr bool is_tuplish_v = details::is_tuplish_h<std::remove_cv_t<T>>::value;

/**
 * Check whether the type is looks like std::variant. That means that it
 * is accessible with std variant_size, variant_alternative and get.
 */
namespace details {
template <class T, class _ = void>
struct is_variant_h : std::false_type {};
template <class T>
struct is_variant_h<T, std::void_t<
	decltype(std::declval<T>().index()),
	decltype(std::variant_size<T>::value),
	typename std::variant_alternative<0, T>::type,
	decltype(std::get<std::variant_alternative_t<0, T>>(std::declval<T>()))>>
: std::is_same<size_t, std::decay_t<decltype(std::declval<T>().index())>> {};
} //namespace details {

template <class T>
constexpr bool is_variant_v =
	!std::is_reference_v<std::remove_cv_t<T>> &&
	details::is_variant_h<std::remove_cv_t<T>>::value;

/**
 * Check whether the type looks like std::optional, at least it has
 * operator bool, operator *, bool has_value() and value() methods.
 */
namespace details {
template <class T, class _ = void>
struct is_optional_h : std::false_type {};
template <class T>
struct is_optional_h<T, std::void_t<
	decltype(std::declval<T>().has_value()),
	decltype((bool)std::declval<T>()),
	decltype(std::declval<T>().value()),
	decltype(*std::declval<T>())>>
: std::is_same<bool, std::decay_t<decltype(std::declval<T>().has_value())>> {};
} // namespace details {

template <class T>
constexpr bool is_optional_v =
	!std::is_reference_v<std::remove_cv_t<T>> &&
	details::is_optional_h<std::remove_cv_t<T>>::value;

/**
 * Check whether the type is pointer to member (member object, not method).
 */
template <class T>
constexpr bool is_member_ptr_v = std::is_member_object_pointer_v<T>;

/**
 * Safe getter that for pointer to member returns class and original
 * type in any other case.
 */
namespace details {
template <class T> struct member_class_h { using type = T; };
template <class T, class U> struct member_class_h<T U::*> { using type = U; };
} //namespace details {

template <class T>
using member_class_t = std::conditional_t<is_member_ptr_v<T>,
	typename details::member_class_h<std::remove_cv_t<T>>::type, T>;

/**
 * Safe getter that for pointer to member returns member type and original
 * type in any other case.
 */
namespace details {
template <class T> struct demember_h { using type = T; };
template <class T, class U> struct demember_h<T U::*> { using type = T; };
} //namespace details {

template <class T>
using demember_t = std::conditional_t<is_member_ptr_v<T>,
	typename details::demember_h<std::remove_cv_t<T>>::type, T>;

/**
 * Check whether the type can be iterated with std::begin/std::end
 * through a const reference.
 */
namespace details {
template <class T, class _ = void>
struct is_const_iterable_h : std::false_type {};
template <class T>
struct is_const_iterable_h<T, std::void_t<
	decltype(std::begin(std::declval<const T&>())),
	decltype(std::end(std::declval<const T&>()))>>
: std::true_type {};
} // namespace details {

template <class T>
constexpr bool is_const_iterable_v =
	details::is_const_iterable_h<std::remove_cv_t<T>>::value;

/**
 * Check whether std::size can be applied to the type.
 */
namespace details {
template <class T, class _ = void>
struct is_sizable_h : std::false_type {};
template <class T>
struct is_sizable_h<T, std::void_t<decltype(std::size(std::declval<const T&>()))>>
: std::true_type {};
} // namespace details {

template <class T>
constexpr bool is_sizable_v = details::is_sizable_h<std::remove_cv_t<T>>::value;

/**
 * Check whether the type keeps its elements in one contiguous chunk
 * accessible with std::data and std::size.
 */
namespace details {
template <class T, class _ = void>
struct is_contiguous_h : std::false_type {};
template <class T>
struct is_contiguous_h<T, std::void_t<
	decltype(std::data(std::declval<T&>())),
	decltype(std::size(std::declval<T&>()))>>
: std::is_pointer<decltype(std::data(std::declval<T&>()))> {};
} // namespace details {

template <class T>
constexpr bool is_contiguous_v = details::is_contiguous_h<T>::value;

/**
 * Check whether the type can be resized with resize(size_t) method.
 */
namespace details {
template <class T, class _ = void>
struct is_resizable_h : std::false_type {};
template <class T>
struct is_resizable_h<T, std::void_t<
	decltype(std::declval<T&>().resize(size_t{}))>>
: std::true_type {};
} // namespace details {

template <class T>
constexpr bool is_resizable_v = details::is_resizable_h<T>::value;

/**
 * Check whether the type is a character string: std::string,
 * std::string_view, (cv) pointer to char, or char array.
 */
template <class T>
constexpr bool is_string_like_v =
	std::is_convertible_v<const T&, std::string_view> ||
	(is_bounded_array_v<T> &&
	 std::is_same_v<char, std::remove_cv_t<std::remove_extent_t<T>>>);

/**
 * Check whether the type is iterable and its elements are pairs whose
 * first member is a string. Such is std::map<std::string, X>.
 */
namespace details {
template <class T, bool IS_ITERABLE, class _ = void>
struct is_pairs_iterable_h : std::false_type {};
template <class T>
struct is_pairs_iterable_h<T, true, std::void_t<
	decltype(std::begin(std::declval<const T&>())->first),
	decltype(std::begin(std::declval<const T&>())->second)>>
: std::bool_constant<is_string_like_v<std::remove_cv_t<std::remove_reference_t<
	decltype(std::begin(std::declval<const T&>())->first)>>>> {};
} // namespace details {

template <class T>
constexpr bool is_pairs_iterable_v =
	details::is_pairs_iterable_h<std::remove_cv_t<T>,
				     is_const_iterable_v<T>>::value;

/**
 * Check whether the type is std::unique_ptr or std::shared_ptr.
 */
namespace details {
template <class T>
struct is_smart_ptr_h : std::false_type {};
template <class T, class D>
struct is_smart_ptr_h<std::unique_ptr<T, D>> : std::true_type {};
template <class T>
struct is_smart_ptr_h<std::shared_ptr<T>> : std::true_type {};
} // namespace details {

template <class T>
constexpr bool is_smart_ptr_v = details::is_smart_ptr_h<std::remove_cv_t<T>>::value;

/**
 * Check whether the type is std::reference_wrapper.
 */
namespace details {
template <class T>
struct is_reference_wrapper_h : std::false_type {};
template <class T>
struct is_reference_wrapper_h<std::reference_wrapper<T>> : std::true_type {};
} // namespace details {

template <class T>
constexpr bool is_reference_wrapper_v =
	details::is_reference_wrapper_h<std::remove_cv_t<T>>::value;

/**
 * Check whether the type can be printed to std::ostream.
 */
namespace details {
template <class T, class _ = void>
struct is_streamable_h : std::false_type {};
template <class T>
struct is_streamable_h<T, std::void_t<
	decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
: std::true_type {};
} // namespace details {

template <class T>
constexpr bool is_streamable_v = details::is_streamable_h<T>::value;

} // namespace scl {
