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
#include <utility>
#include <vector>

#include "../Utils/Logger.hpp"
#include "Shape.hpp"

namespace sce {

/**
 * In-memory type resolver: type ids are indexes in a table of shapes.
 * Recursive types are declared with reserve() and defined later with set().
 * Resolving is read only and may be done from several threads as long as
 * nobody modifies the registry.
 */
class Registry {
public:
	using TypeId = uint32_t;
	using Shape = TypeShape<TypeId>;

	TypeId add(Shape shape)
	{
		m_Types.emplace_back(std::move(shape));
		return TypeId(m_Types.size() - 1);
	}
	/** New id without a shape yet. */
	TypeId reserve()
	{
		m_Types.emplace_back(std::nullopt);
		return TypeId(m_Types.size() - 1);
	}
	/** Define the shape of a known id. Return false if id is unknown. */
	bool set(TypeId id, Shape shape)
	{
		if (id >= m_Types.size())
			return false;
		m_Types[id] = std::move(shape);
		return true;
	}

	TypeId primitive(PrimitiveKind kind) { return add(PrimitiveShape{kind}); }
	TypeId str() { return primitive(STR); }
	TypeId compact(TypeId inner) { return add(CompactShape<TypeId>{inner}); }
	TypeId composite(std::vector<Field<TypeId>> fields)
	{
		return add(CompositeShape<TypeId>{std::move(fields)});
	}
	TypeId variant(std::vector<VariantDef<TypeId>> variants)
	{
		return add(VariantShape<TypeId>{std::move(variants)});
	}
	TypeId sequence(TypeId element) { return add(SequenceShape<TypeId>{element}); }
	TypeId array(TypeId element, size_t len)
	{
		return add(ArrayShape<TypeId>{element, len});
	}
	TypeId tuple(std::vector<TypeId> elements)
	{
		return add(TupleShape<TypeId>{std::move(elements)});
	}
	TypeId bitSequence(BitOrder order, BitStore store)
	{
		return add(BitSequenceShape{order, store});
	}
	TypeId voidType() { return add(VoidShape{}); }

	std::optional<Shape> resolve(TypeId id) const
	{
		if (id >= m_Types.size() || !m_Types[id].has_value()) {
			SCL_LOG_DEBUG("Type ", id, " is not registered");
			return std::nullopt;
		}
		return m_Types[id];
	}

	size_t size() const { return m_Types.size(); }

private:
	std::vector<std::optional<Shape>> m_Types;
};

} // namespace sce
