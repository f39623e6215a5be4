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
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "Constants.hpp"

namespace sce {

/** Field of a composite type or of a variant. Order is significant. */
template <class TYPE_ID>
struct Field {
	std::optional<std::string> name;
	TYPE_ID id;
};

struct PrimitiveShape {
	PrimitiveKind kind;
};

/** Compact (variable length) encoding of an unsigned integer type. */
template <class TYPE_ID>
struct CompactShape {
	TYPE_ID inner;
};

template <class TYPE_ID>
struct CompositeShape {
	std::vector<Field<TYPE_ID>> fields;
};

template <class TYPE_ID>
struct VariantDef {
	std::optional<std::string> name;
	uint8_t index;
	std::vector<Field<TYPE_ID>> fields;
};

template <class TYPE_ID>
struct VariantShape {
	std::vector<VariantDef<TYPE_ID>> variants;
};

template <class TYPE_ID>
struct SequenceShape {
	TYPE_ID element;
};

template <class TYPE_ID>
struct ArrayShape {
	TYPE_ID element;
	size_t len;
};

template <class TYPE_ID>
struct TupleShape {
	std::vector<TYPE_ID> elements;
};

struct BitSequenceShape {
	BitOrder order;
	BitStore store;
};

/** Type carrying no data; only unit values are encodable into it. */
struct VoidShape {};

/**
 * Declared shape of a target type, as told by a type resolver. Strings
 * are PrimitiveShape{STR}.
 */
template <class TYPE_ID>
using TypeShape = std::variant<
	PrimitiveShape,
	CompactShape<TYPE_ID>,
	CompositeShape<TYPE_ID>,
	VariantShape<TYPE_ID>,
	SequenceShape<TYPE_ID>,
	ArrayShape<TYPE_ID>,
	TupleShape<TYPE_ID>,
	BitSequenceShape,
	VoidShape>;

} // namespace sce {
