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
#include <optional>
#include <string_view>
#include <type_traits>

#include "Composite.hpp"

namespace sce {

/**
 * Hand written tagged union value: the name of the active variant, its
 * index (used only against targets whose variants have no names) and its
 * fields.
 */
template <class... T>
struct Variant {
	std::string_view name;
	std::optional<size_t> index;
	Composite<T...> fields;
};

template <class... T>
Variant<T...> variant(std::string_view name, CompositeEntry<T>... entries)
{
	return {name, std::nullopt, composite(entries...)};
}

template <class... T>
Variant<T...> indexed_variant(std::string_view name, size_t index,
			      CompositeEntry<T>... entries)
{
	return {name, index, composite(entries...)};
}

namespace details {
template <class T>
struct is_sce_variant_h : std::false_type {};
template <class... T>
struct is_sce_variant_h<Variant<T...>> : std::true_type {};
} // namespace details

template <class T>
constexpr bool is_sce_variant_v = details::is_sce_variant_h<std::remove_cv_t<T>>::value;

} // namespace sce
