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

#include "Shape.hpp"

namespace sce {

/**
 * Resolver with type ids of type TYPE_ID behind a virtual interface, so
 * that one encoder instantiation serves any number of concrete resolvers.
 */
template <class TYPE_ID>
class AnyResolver {
public:
	using TypeId = TYPE_ID;

	virtual ~AnyResolver() = default;
	virtual std::optional<TypeShape<TypeId>> resolve(const TypeId& id) const = 0;
};

/** AnyResolver on top of a concrete resolver, which must outlive it. */
template <class RESOLVER>
class ResolverAdapter final : public AnyResolver<typename RESOLVER::TypeId> {
public:
	using TypeId = typename RESOLVER::TypeId;

	explicit ResolverAdapter(const RESOLVER& resolver) : m_Resolver(resolver) {}

	std::optional<TypeShape<TypeId>> resolve(const TypeId& id) const override
	{
		return m_Resolver.resolve(id);
	}

private:
	const RESOLVER& m_Resolver;
};

} // namespace sce
