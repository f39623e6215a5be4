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

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "../Utils/Logger.hpp"
#include "../Utils/Traits.hpp"
#include "Bits.hpp"
#include "ClassRule.hpp"
#include "Common.hpp"
#include "Composite.hpp"
#include "Error.hpp"
#include "Shape.hpp"
#include "Variant.hpp"
#include "Writer.hpp"

namespace sce {

namespace encode_details {

/** Category of a source value, detected from its C++ type. */
enum Category {
	CAT_BOOL,
	CAT_CHAR,
	CAT_NUMBER,
	CAT_STR,
	CAT_BITS,
	CAT_UNIT,
	CAT_OPTIONAL,
	CAT_STD_VARIANT,
	CAT_VARIANT,
	CAT_COMPOSITE,
	CAT_WRAPPER,
	CAT_RECORD,
	CAT_POINTER,
	CAT_REFERENCE,
	CAT_MAP,
	CAT_SEQUENCE,
	CAT_TUPLE,
	CAT_NONE
};

template <class T>
constexpr Category detectCategory()
{
	static_assert(!std::is_floating_point_v<T>,
		      "Floating point numbers have no SCALE representation");
	if constexpr (std::is_same_v<T, bool>)
		return CAT_BOOL;
	else if constexpr (std::is_same_v<T, char32_t>)
		return CAT_CHAR;
	else if constexpr (scl::is_integer_v<T>)
		return CAT_NUMBER;
	else if constexpr (scl::is_string_like_v<T>)
		return CAT_STR;
	else if constexpr (is_bits_v<T>)
		return CAT_BITS;
	else if constexpr (is_unit_v<T>)
		return CAT_UNIT;
	else if constexpr (scl::is_optional_v<T>)
		return CAT_OPTIONAL;
	else if constexpr (scl::is_variant_v<T>)
		return CAT_STD_VARIANT;
	else if constexpr (is_sce_variant_v<T>)
		return CAT_VARIANT;
	else if constexpr (is_composite_v<T>)
		return CAT_COMPOSITE;
	else if constexpr (is_wrapper_rule_v<T>)
		return CAT_WRAPPER;
	else if constexpr (has_enc_rule_v<T>)
		return CAT_RECORD;
	else if constexpr (scl::is_smart_ptr_v<T>)
		return CAT_POINTER;
	else if constexpr (scl::is_reference_wrapper_v<T>)
		return CAT_REFERENCE;
	else if constexpr (scl::is_pairs_iterable_v<T>)
		return CAT_MAP;
	else if constexpr (scl::is_const_iterable_v<T> || scl::is_bounded_array_v<T>)
		return CAT_SEQUENCE;
	else if constexpr (is_tuple_v<T>)
		return CAT_TUPLE;
	else
		return CAT_NONE;
}

struct DepthGuard {
	explicit DepthGuard(size_t& depth) : m_Depth(depth) { ++m_Depth; }
	~DepthGuard() { --m_Depth; }
	size_t& m_Depth;
};

template <class T>
size_t
count_elements(const T& t)
{
	if constexpr (scl::is_sizable_v<T>)
		return std::size(t);
	else
		return std::distance(std::begin(t), std::end(t));
}

/** Identity projection of sequence elements. */
struct Self {
	template <class T>
	const T& operator()(const T& t) const { return t; }
};

/** Projection of map entries to their values. */
struct Second {
	template <class T>
	const auto& operator()(const T& t) const { return t.second; }
};

} // namespace encode_details

/**
 * Encoder of values into SCALE representation of target types described
 * by RESOLVER. Holds the state of one encode call: the resolver, the
 * output and the current nesting depth.
 *
 * RESOLVER must provide type TypeId and method
 *  std::optional<TypeShape<TypeId>> resolve(const TypeId&) const.
 */
template <class RESOLVER, class CONT>
class Encoder {
public:
	using TypeId = typename RESOLVER::TypeId;
	using Shape = TypeShape<TypeId>;
	using Fields = std::vector<Field<TypeId>>;
	using SourceFields = std::vector<FieldRef<Encoder>>;

	Encoder(const RESOLVER& types, CONT& cont) : m_Types(types), m_Out(cont) {}

	const RESOLVER& types() const { return m_Types; }
	Writer<CONT>& writer() { return m_Out; }

	/** Encode @a t as target type @a id. */
	template <class T>
	std::optional<Error> encodeAsType(const T& t, const TypeId& id);

	/** Encode fields of @a t as the field list of a target type. */
	template <class T>
	std::optional<Error> encodeAsFields(const T& t, const Fields& fields);

	/**
	 * Match source fields against target fields, by name if both sides
	 * name all their fields, by position otherwise, and encode them in
	 * the order of target fields.
	 */
	std::optional<Error> encodeFields(const SourceFields& src, const Fields& fields);

	/** Shape of a type, or TYPE_NOT_FOUND error. */
	std::optional<Error> resolve(const TypeId& id, Shape& shape) const;

private:
	template <class T>
	std::optional<Error> encodeShaped(const T& t, const TypeId& id, Shape& shape);

	std::optional<Error> unwrap(TypeId& id, Shape& shape) const;
	std::optional<Error> recursionLimit() const;

	std::optional<Error> encodeBool(bool b, TypeId id, Shape& shape);
	std::optional<Error> encodeChar(char32_t c, TypeId id, Shape& shape);
	std::optional<Error> encodeNumber(const Number& num, TypeId id, Shape& shape);
	std::optional<Error> encodeStr(std::string_view str, TypeId id, Shape& shape);
	template <class BITS>
	std::optional<Error> encodeBits(const BITS& bits, TypeId id, Shape& shape);
	std::optional<Error> encodeVariant(std::string_view name,
					   std::optional<size_t> index,
					   const SourceFields& src,
					   TypeId id, Shape& shape);
	std::optional<Error> encodeComposite(const SourceFields& src, Kind kind,
					     const TypeId& id, const Shape& shape);
	template <class T, class PROJ>
	std::optional<Error> encodeSequence(const T& t, const TypeId& id,
					    const Shape& shape, PROJ proj);
	template <class T, class PROJ>
	std::optional<Error> encodeElements(const T& t, const TypeId& elem,
					    PROJ proj);

	static bool fits(const Number& num, PrimitiveKind kind);

	const RESOLVER& m_Types;
	Writer<CONT> m_Out;
	size_t m_Depth = 0;
};

template <class RESOLVER, class CONT>
template <class T>
std::optional<Error>
Encoder<RESOLVER, CONT>::encodeAsType(const T& t, const TypeId& id)
{
	using namespace encode_details;
	DepthGuard guard(m_Depth);
	if (m_Depth > SCE_RECURSION_LIMIT)
		return recursionLimit();

	if constexpr (details::has_member_custom_h<T, Encoder>::value) {
		return t.sce_encode(id, *this);
	} else if constexpr (details::has_spec_custom_h<T, Encoder>::value) {
		return sce_custom_rule<T>::encode(t, id, *this);
	} else {
		constexpr Category cat = detectCategory<T>();
		static_assert(cat != CAT_NONE, "Unsupported type of source value");
		if constexpr (cat == CAT_WRAPPER) {
			return encodeAsType(t.*get_enc_rule<T>(), id);
		} else if constexpr (cat == CAT_POINTER) {
			if (!t)
				return Error::custom("cannot encode null pointer");
			return encodeAsType(*t, id);
		} else if constexpr (cat == CAT_REFERENCE) {
			return encodeAsType(t.get(), id);
		} else {
			Shape shape;
			if (auto err = resolve(id, shape))
				return err;
			if (std::holds_alternative<VoidShape>(shape)) {
				if constexpr (cat == CAT_UNIT)
					return std::nullopt;
				else
					return Error::unsupported(
						"only unit values can be encoded "
						"into void type " + type_id_str(id));
			}
			return encodeShaped(t, id, shape);
		}
	}
}

template <class RESOLVER, class CONT>
template <class T>
std::optional<Error>
Encoder<RESOLVER, CONT>::encodeShaped(const T& t, const TypeId& id, Shape& shape)
{
	using namespace encode_details;
	constexpr Category cat = detectCategory<T>();
	if constexpr (cat == CAT_BOOL) {
		return encodeBool(t, id, shape);
	} else if constexpr (cat == CAT_CHAR) {
		return encodeChar(t, id, shape);
	} else if constexpr (cat == CAT_NUMBER) {
		return encodeNumber(Number::of(t), id, shape);
	} else if constexpr (cat == CAT_STR) {
		if constexpr (scl::is_bounded_array_v<T>) {
			size_t len = 0;
			while (len < std::size(t) && t[len] != 0)
				len++;
			return encodeStr(std::string_view(t, len), id, shape);
		} else if constexpr (std::is_pointer_v<T>) {
			if (t == nullptr)
				return Error::custom("cannot encode null string");
			return encodeStr(std::string_view(t), id, shape);
		} else {
			return encodeStr(std::string_view(t), id, shape);
		}
	} else if constexpr (cat == CAT_BITS) {
		return encodeBits(t, id, shape);
	} else if constexpr (cat == CAT_OPTIONAL) {
		SourceFields src;
		if (!t.has_value())
			return encodeVariant("None", 0, src, id, shape);
		src.push_back(FieldRef<Encoder>::make(std::nullopt, *t));
		return encodeVariant("Some", 1, src, id, shape);
	} else if constexpr (cat == CAT_STD_VARIANT) {
		if (t.valueless_by_exception())
			return Error::custom("cannot encode valueless variant");
		return std::visit([&](const auto& alt) -> std::optional<Error> {
			using alt_t = std::decay_t<decltype(alt)>;
			SourceFields src;
			collect_fields<Encoder>(alt, src);
			return encodeVariant(get_variant_name<alt_t>(), t.index(),
					     src, id, shape);
		}, t);
	} else if constexpr (cat == CAT_VARIANT) {
		SourceFields src;
		collect_fields<Encoder>(t.fields, src);
		return encodeVariant(t.name, t.index, src, id, shape);
	} else if constexpr (cat == CAT_MAP) {
		if (std::holds_alternative<SequenceShape<TypeId>>(shape) ||
		    std::holds_alternative<ArrayShape<TypeId>>(shape))
			return encodeSequence(t, id, shape, Second{});
		SourceFields src;
		collect_fields<Encoder>(t, src);
		return encodeComposite(src, KIND_STRUCT, id, shape);
	} else if constexpr (cat == CAT_SEQUENCE) {
		return encodeSequence(t, id, shape, Self{});
	} else if constexpr (cat == CAT_TUPLE) {
		SourceFields src;
		collect_fields<Encoder>(t, src);
		return encodeComposite(src, KIND_TUPLE, id, shape);
	} else {
		static_assert(cat == CAT_UNIT || cat == CAT_COMPOSITE ||
			      cat == CAT_RECORD);
		SourceFields src;
		collect_fields<Encoder>(t, src);
		return encodeComposite(src, KIND_STRUCT, id, shape);
	}
}

template <class RESOLVER, class CONT>
template <class T>
std::optional<Error>
Encoder<RESOLVER, CONT>::encodeAsFields(const T& t, const Fields& fields)
{
	encode_details::DepthGuard guard(m_Depth);
	if (m_Depth > SCE_RECURSION_LIMIT)
		return recursionLimit();
	SourceFields src;
	collect_fields<Encoder>(t, src);
	return encodeFields(src, fields);
}

template <class RESOLVER, class CONT>
std::optional<Error>
Encoder<RESOLVER, CONT>::encodeFields(const SourceFields& src, const Fields& fields)
{
	auto is_named = [](const auto& f) { return f.name.has_value(); };
	bool by_name = !fields.empty() && !src.empty() &&
		       std::all_of(fields.begin(), fields.end(), is_named) &&
		       std::all_of(src.begin(), src.end(), is_named);

	if (!by_name) {
		if (src.size() != fields.size())
			return Error::wrongLength(src.size(), fields.size());
		for (size_t i = 0; i < src.size(); i++) {
			auto err = src[i].encodeAsType(*this, fields[i].id);
			if (!err)
				continue;
			if (src[i].name)
				err->atField(*src[i].name);
			else
				err->atIdx(i);
			return err;
		}
		return std::nullopt;
	}

	for (size_t i = 0; i < src.size(); i++) {
		for (size_t j = i + 1; j < src.size(); j++) {
			if (*src[i].name == *src[j].name)
				return Error::duplicateField(*src[i].name);
		}
	}
#ifndef SCE_IGNORE_EXTRA_FIELDS
	if (src.size() > fields.size())
		return Error::wrongLength(src.size(), fields.size());
#endif
	for (const auto& field : fields) {
		std::string_view name = *field.name;
		auto itr = std::find_if(src.begin(), src.end(),
					[name](const auto& f) { return *f.name == name; });
		if (itr == src.end())
			return Error::cannotFindField(name);
		if (auto err = itr->encodeAsType(*this, field.id)) {
			err->atField(name);
			return err;
		}
	}
	return std::nullopt;
}

template <class RESOLVER, class CONT>
std::optional<Error>
Encoder<RESOLVER, CONT>::resolve(const TypeId& id, Shape& shape) const
{
	std::optional<Shape> res = m_Types.resolve(id);
	if (!res)
		return Error::typeNotFound(id);
	shape = std::move(*res);
	return std::nullopt;
}

/**
 * Follow composites with one field and tuples with one element down to
 * the type they wrap.
 */
template <class RESOLVER, class CONT>
std::optional<Error>
Encoder<RESOLVER, CONT>::unwrap(TypeId& id, Shape& shape) const
{
	for (size_t depth = m_Depth; ; depth++) {
		const TypeId *inner = nullptr;
		if (auto *c = std::get_if<CompositeShape<TypeId>>(&shape);
		    c != nullptr && c->fields.size() == 1)
			inner = &c->fields[0].id;
		else if (auto *t = std::get_if<TupleShape<TypeId>>(&shape);
			 t != nullptr && t->elements.size() == 1)
			inner = &t->elements[0];
		if (inner == nullptr)
			return std::nullopt;
		if (depth >= SCE_RECURSION_LIMIT)
			return recursionLimit();
		id = *inner;
		if (auto err = resolve(id, shape))
			return err;
	}
}

template <class RESOLVER, class CONT>
std::optional<Error>
Encoder<RESOLVER, CONT>::recursionLimit() const
{
	SCL_LOG_WARNING("Nesting limit ", SCE_RECURSION_LIMIT,
			" is reached; the type graph is probably recursive");
	return Error::recursionLimitExceeded();
}

template <class RESOLVER, class CONT>
std::optional<Error>
Encoder<RESOLVER, CONT>::encodeBool(bool b, TypeId id, Shape& shape)
{
	if (auto err = unwrap(id, shape))
		return err;
	auto *prim = std::get_if<PrimitiveShape>(&shape);
	if (prim == nullptr || prim->kind != BOOL)
		return Error::wrongShape(KIND_BOOL, id);
	m_Out.writeBool(b);
	return std::nullopt;
}

template <class RESOLVER, class CONT>
std::optional<Error>
Encoder<RESOLVER, CONT>::encodeChar(char32_t c, TypeId id, Shape& shape)
{
	if (auto err = unwrap(id, shape))
		return err;
	auto *prim = std::get_if<PrimitiveShape>(&shape);
	if (prim != nullptr && prim->kind == CHAR) {
		m_Out.writeChar(c);
		return std::nullopt;
	}
	if (prim != nullptr && is_integer_kind(prim->kind))
		return encodeNumber(Number::of(uint32_t(c)), id, shape);
	return Error::wrongShape(KIND_CHAR, id);
}

template <class RESOLVER, class CONT>
bool
Encoder<RESOLVER, CONT>::fits(const Number& num, PrimitiveKind kind)
{
	unsigned bits = kind_bits(kind);
	if (is_unsigned_kind(kind))
		return !num.negative && (bits >= 128 || num.magnitude <= uint_max(bits));
	if (bits > 128)
		return true;
	if (num.negative)
		return num.magnitude <= uint_max(bits - 1) + 1;
	return num.magnitude <= uint_max(bits - 1);
}

template <class RESOLVER, class CONT>
std::optional<Error>
Encoder<RESOLVER, CONT>::encodeNumber(const Number& num, TypeId id, Shape& shape)
{
	if (auto err = unwrap(id, shape))
		return err;
	if (auto *prim = std::get_if<PrimitiveShape>(&shape)) {
		if (!is_integer_kind(prim->kind))
			return Error::wrongShape(KIND_NUMBER, id);
		if (!fits(num, prim->kind))
			return Error::numberOutOfRange(num, id);
		if (kind_bits(prim->kind) > 128)
			m_Out.writeExtended(num);
		else
			m_Out.writeFixed(num.bits(), kind_bits(prim->kind) / 8);
		return std::nullopt;
	}
	if (auto *compact = std::get_if<CompactShape<TypeId>>(&shape)) {
		TypeId inner_id = compact->inner;
		Shape inner;
		if (auto err = resolve(inner_id, inner))
			return err;
		if (auto err = unwrap(inner_id, inner))
			return err;
		auto *prim = std::get_if<PrimitiveShape>(&inner);
		if (prim == nullptr || !is_unsigned_kind(prim->kind) ||
		    kind_bits(prim->kind) > 128)
			return Error::wrongShape(KIND_NUMBER, id);
		if (!fits(num, prim->kind))
			return Error::numberOutOfRange(num, id);
		m_Out.writeCompact(num.magnitude);
		return std::nullopt;
	}
	return Error::wrongShape(KIND_NUMBER, id);
}

template <class RESOLVER, class CONT>
std::optional<Error>
Encoder<RESOLVER, CONT>::encodeStr(std::string_view str, TypeId id, Shape& shape)
{
	if (auto err = unwrap(id, shape))
		return err;
	auto *prim = std::get_if<PrimitiveShape>(&shape);
	if (prim == nullptr || prim->kind != STR)
		return Error::wrongShape(KIND_STR, id);
	m_Out.writeStr(str);
	return std::nullopt;
}

template <class RESOLVER, class CONT>
template <class BITS>
std::optional<Error>
Encoder<RESOLVER, CONT>::encodeBits(const BITS& bits, TypeId id, Shape& shape)
{
	if (auto err = unwrap(id, shape))
		return err;
	auto *seq = std::get_if<BitSequenceShape>(&shape);
	if (seq == nullptr)
		return Error::wrongShape(KIND_BIT_SEQUENCE, id);
	if (seq->order >= BIT_ORDER_END || seq->store >= BIT_STORE_END)
		return Error::unsupported("bad bit order or store of type " +
					  type_id_str(id));
	m_Out.writeBits(bits, seq->order, seq->store);
	return std::nullopt;
}

/**
 * The variant is looked up by name. Only if the target variants have no
 * names at all, the source index is used instead.
 */
template <class RESOLVER, class CONT>
std::optional<Error>
Encoder<RESOLVER, CONT>::encodeVariant(std::string_view name,
				       std::optional<size_t> index,
				       const SourceFields& src,
				       TypeId id, Shape& shape)
{
	if (auto err = unwrap(id, shape))
		return err;
	auto *var = std::get_if<VariantShape<TypeId>>(&shape);
	if (var == nullptr)
		return Error::wrongShape(KIND_VARIANT, id);

	const auto& variants = var->variants;
	auto found = std::find_if(variants.begin(), variants.end(),
				  [name](const auto& v) { return v.name == name; });
	bool any_named = std::any_of(variants.begin(), variants.end(),
				     [](const auto& v) { return v.name.has_value(); });
	if (found == variants.end() && !any_named && index.has_value())
		found = std::find_if(variants.begin(), variants.end(),
				     [&index](const auto& v) { return v.index == *index; });
	if (found == variants.end())
		return Error::cannotFindVariant(name, id);

	m_Out.writeFixed(found->index);
	if (auto err = encodeFields(src, found->fields)) {
		err->atVariant(name);
		return err;
	}
	return std::nullopt;
}

template <class RESOLVER, class CONT>
std::optional<Error>
Encoder<RESOLVER, CONT>::encodeComposite(const SourceFields& src, Kind kind,
					 const TypeId& id, const Shape& shape)
{
	auto locate = [&src](Error& err, size_t i) {
		if (src[i].name)
			err.atField(*src[i].name);
		else
			err.atIdx(i);
	};
	auto encode_all = [&](const TypeId& elem) -> std::optional<Error> {
		for (size_t i = 0; i < src.size(); i++) {
			if (auto err = src[i].encodeAsType(*this, elem)) {
				locate(*err, i);
				return err;
			}
		}
		return std::nullopt;
	};
	auto visitor = [&](const auto& target) -> std::optional<Error> {
		using shape_t = std::decay_t<decltype(target)>;
		if constexpr (std::is_same_v<shape_t, CompositeShape<TypeId>>) {
			const Fields& fields = target.fields;
			if (src.size() == 1 && !src[0].name && fields.size() == 1) {
				auto err = src[0].encodeAsType(*this, fields[0].id);
				if (err)
					err->atIdx(0);
				return err;
			}
			return encodeFields(src, fields);
		} else if constexpr (std::is_same_v<shape_t, TupleShape<TypeId>>) {
			const auto& elements = target.elements;
			if (src.size() == 1 && elements.size() == 1) {
				auto err = src[0].encodeAsType(*this, elements[0]);
				if (err)
					locate(*err, 0);
				return err;
			}
			Fields fields;
			fields.reserve(elements.size());
			for (const auto& elem : elements)
				fields.push_back({std::nullopt, elem});
			return encodeFields(src, fields);
		} else if constexpr (std::is_same_v<shape_t, ArrayShape<TypeId>>) {
			if (src.size() != target.len)
				return Error::wrongLength(src.size(), target.len);
			return encode_all(target.element);
		} else if constexpr (std::is_same_v<shape_t, SequenceShape<TypeId>>) {
			m_Out.writeLength(src.size());
			return encode_all(target.element);
		} else if constexpr (std::is_same_v<shape_t, VoidShape>) {
			return Error::unsupported("only unit values can be "
						  "encoded into void type " +
						  type_id_str(id));
		} else {
			static_assert(std::is_same_v<shape_t, PrimitiveShape> ||
				      std::is_same_v<shape_t, CompactShape<TypeId>> ||
				      std::is_same_v<shape_t, VariantShape<TypeId>> ||
				      std::is_same_v<shape_t, BitSequenceShape>);
			if (src.size() != 1)
				return Error::wrongShape(kind, id);
			auto err = src[0].encodeAsType(*this, id);
			if (err)
				locate(*err, 0);
			return err;
		}
	};
	return std::visit(visitor, shape);
}

template <class RESOLVER, class CONT>
template <class T, class PROJ>
std::optional<Error>
Encoder<RESOLVER, CONT>::encodeElements(const T& t, const TypeId& elem, PROJ proj)
{
	size_t i = 0;
	for (const auto& e : t) {
		if (auto err = encodeAsType(proj(e), elem)) {
			err->atIdx(i);
			return err;
		}
		i++;
	}
	return std::nullopt;
}

template <class RESOLVER, class CONT>
template <class T, class PROJ>
std::optional<Error>
Encoder<RESOLVER, CONT>::encodeSequence(const T& t, const TypeId& id,
					const Shape& shape, PROJ proj)
{
	size_t count = encode_details::count_elements(t);
	auto visitor = [&](const auto& target) -> std::optional<Error> {
		using shape_t = std::decay_t<decltype(target)>;
		if constexpr (std::is_same_v<shape_t, SequenceShape<TypeId>>) {
			m_Out.writeLength(count);
			return encodeElements(t, target.element, proj);
		} else if constexpr (std::is_same_v<shape_t, ArrayShape<TypeId>>) {
			if (count != target.len)
				return Error::wrongLength(count, target.len);
			return encodeElements(t, target.element, proj);
		} else if constexpr (std::is_same_v<shape_t, TupleShape<TypeId>>) {
			const auto& elements = target.elements;
			if (elements.size() != count) {
				if (elements.size() == 1)
					return encodeAsType(t, elements[0]);
				return Error::wrongLength(count, elements.size());
			}
			size_t i = 0;
			for (const auto& e : t) {
				if (auto err = encodeAsType(proj(e), elements[i])) {
					err->atIdx(i);
					return err;
				}
				i++;
			}
			return std::nullopt;
		} else if constexpr (std::is_same_v<shape_t, CompositeShape<TypeId>>) {
			const Fields& fields = target.fields;
			if (fields.size() == 1)
				return encodeAsType(t, fields[0].id);
			if (fields.size() != count)
				return Error::wrongLength(count, fields.size());
			size_t i = 0;
			for (const auto& e : t) {
				if (auto err = encodeAsType(proj(e), fields[i].id)) {
					err->atIdx(i);
					return err;
				}
				i++;
			}
			return std::nullopt;
		} else if constexpr (std::is_same_v<shape_t, VoidShape>) {
			return Error::unsupported("only unit values can be "
						  "encoded into void type " +
						  type_id_str(id));
		} else {
			static_assert(std::is_same_v<shape_t, PrimitiveShape> ||
				      std::is_same_v<shape_t, CompactShape<TypeId>> ||
				      std::is_same_v<shape_t, VariantShape<TypeId>> ||
				      std::is_same_v<shape_t, BitSequenceShape>);
			return Error::wrongShape(KIND_ARRAY, id);
		}
	};
	return std::visit(visitor, shape);
}

/**
 * Encode @a value as type @a id described by @a types, appending the
 * bytes to @a cont. On failure the container may keep a partial output
 * that must be discarded.
 */
template <class T, class RESOLVER, class CONT>
std::optional<Error>
encode_as_type(const T& value, const typename RESOLVER::TypeId& id,
	       const RESOLVER& types, CONT& cont)
{
	Encoder<RESOLVER, CONT> enc(types, cont);
	std::optional<Error> err = enc.encodeAsType(value, id);
	if (err)
		SCL_LOG_DEBUG("Failed to encode value as type ",
			      type_id_str(id), ": ", *err);
	return err;
}

/**
 * Encode fields of @a value (a record, tuple, map or sce::Composite) as
 * the list of target @a fields, appending the bytes to @a cont.
 */
template <class T, class RESOLVER, class CONT>
std::optional<Error>
encode_as_fields(const T& value,
		 const std::vector<Field<typename RESOLVER::TypeId>>& fields,
		 const RESOLVER& types, CONT& cont)
{
	Encoder<RESOLVER, CONT> enc(types, cont);
	std::optional<Error> err = enc.encodeAsFields(value, fields);
	if (err)
		SCL_LOG_DEBUG("Failed to encode value as fields: ", *err);
	return err;
}

} // namespace sce
