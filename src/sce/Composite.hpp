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

#include <optional>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "../Utils/Traits.hpp"
#include "ClassRule.hpp"
#include "Error.hpp"
#include "Spec.hpp"

namespace sce {

/** Explicit unit value. std::monostate and std::tuple<> are units too. */
struct Unit {};

template <class T>
constexpr bool is_unit_v = std::is_same_v<std::remove_cv_t<T>, Unit> ||
	std::is_same_v<std::remove_cv_t<T>, std::monostate> ||
	std::is_same_v<std::remove_cv_t<T>, std::tuple<>>;

/**
 * Type erased reference to one source field: its presented name (if any),
 * the value and the function that encodes the value with encoder ENC.
 */
template <class ENC>
struct FieldRef {
	using TypeId = typename ENC::TypeId;
	using encode_f = std::optional<Error> (*)(ENC&, const void *, const TypeId&);

	std::optional<std::string_view> name;
	const void *value;
	encode_f encode;

	std::optional<Error> encodeAsType(ENC& enc, const TypeId& id) const
	{
		return encode(enc, value, id);
	}

	template <class T>
	static FieldRef make(std::optional<std::string_view> name, const T& t)
	{
		return {name, &t,
			[](ENC& enc, const void *ptr, const TypeId& id) {
				return enc.encodeAsType(
					*static_cast<const T *>(ptr), id);
			}};
	}
};

/**
 * Element of a hand written field list: optional name and a reference
 * to the value. The value must outlive the encode call.
 */
template <class T>
struct CompositeEntry {
	std::optional<std::string_view> name;
	const T& value;
};

template <class T>
CompositeEntry<T> field(std::string_view name, const T& value)
{
	return {name, value};
}

template <class T>
CompositeEntry<T> field(const T& value)
{
	return {std::nullopt, value};
}

/* An entry would outlive a temporary value. */
template <class T>
void field(std::string_view name, const T&& value) = delete;
template <class T>
void field(const T&& value) = delete;

/**
 * Hand written list of fields, encodable as any composite-like target.
 * Mostly useful in custom encoding hooks.
 */
template <class... T>
struct Composite {
	std::tuple<CompositeEntry<T>...> entries;
};

template <class... T>
Composite<T...> composite(CompositeEntry<T>... entries)
{
	return {std::make_tuple(entries...)};
}

namespace details {
template <class T>
struct is_composite_h : std::false_type {};
template <class... T>
struct is_composite_h<Composite<T...>> : std::true_type {};
} // namespace details

template <class T>
constexpr bool is_composite_v = details::is_composite_h<std::remove_cv_t<T>>::value;

/** Tuple or pair, but not std::array which is a sequence. */
template <class T>
constexpr bool is_tuple_v = scl::is_tuplish_v<T> && !scl::is_const_iterable_v<T>;

/** Record rule that is a single member pointer: transparent wrapper. */
namespace details {
template <class T, bool HAS_RULE = has_enc_rule_v<T>>
struct is_wrapper_rule_h : std::false_type {};
template <class T>
struct is_wrapper_rule_h<T, true> : std::bool_constant<scl::is_member_ptr_v<
	std::remove_cv_t<std::remove_reference_t<decltype(get_enc_rule<T>())>>>> {};
} // namespace details

template <class T>
constexpr bool is_wrapper_rule_v = details::is_wrapper_rule_h<std::remove_cv_t<T>>::value;

namespace details {
template <class ENC, class T, class SPEC>
void add_rule_field(const T& t, const SPEC& spec, std::vector<FieldRef<ENC>>& out)
{
	if constexpr (is_skip_field_v<SPEC>) {
		(void)t; (void)spec; (void)out;
	} else if constexpr (is_named_field_v<SPEC>) {
		out.push_back(FieldRef<ENC>::make(spec.name, t.*spec.member));
	} else {
		static_assert(scl::is_member_ptr_v<SPEC>,
			      "Field spec must be a member pointer, "
			      "sce::named or sce::skip");
		out.push_back(FieldRef<ENC>::make(std::nullopt, t.*spec));
	}
}
} // namespace details

/** Check whether the value is presented as a list of fields. */
template <class T>
constexpr bool has_fields_v = has_enc_rule_v<T> || is_tuple_v<T> ||
	is_composite_v<T> || is_unit_v<T> || scl::is_pairs_iterable_v<T> ||
	(std::is_class_v<T> && std::is_empty_v<T>);

/**
 * Append fields of the value to @a out in declaration order. Skipped
 * record fields are not appended.
 */
template <class ENC, class T>
void collect_fields(const T& t, std::vector<FieldRef<ENC>>& out)
{
	static_assert(has_fields_v<T>, "The type has no fields");
	if constexpr (has_enc_rule_v<T>) {
		const auto& rule = get_enc_rule<T>();
		using rule_t = std::remove_cv_t<std::remove_reference_t<decltype(rule)>>;
		if constexpr (scl::is_member_ptr_v<rule_t>) {
			out.push_back(FieldRef<ENC>::make(std::nullopt, t.*rule));
		} else {
			static_assert(scl::is_tuplish_v<rule_t>,
				      "Rule must be a member pointer or a tuple");
			std::apply([&](const auto&... spec) {
				(details::add_rule_field<ENC>(t, spec, out), ...);
			}, rule);
		}
	} else if constexpr (is_composite_v<T>) {
		std::apply([&](const auto&... entry) {
			(out.push_back(FieldRef<ENC>::make(entry.name, entry.value)), ...);
		}, t.entries);
	} else if constexpr (is_unit_v<T>) {
		(void)t;
	} else if constexpr (is_tuple_v<T>) {
		std::apply([&](const auto&... elem) {
			(out.push_back(FieldRef<ENC>::make(std::nullopt, elem)), ...);
		}, t);
	} else if constexpr (scl::is_pairs_iterable_v<T>) {
		for (const auto& [key, value] : t)
			out.push_back(FieldRef<ENC>::make(std::string_view(key), value));
	} else {
		/* Empty class without a rule, like a unit variant alternative. */
		(void)t;
	}
}

} // namespace sce
