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
#define SCE_IGNORE_EXTRA_FIELDS
#define SCE_RECURSION_LIMIT 3

#include "../src/sce/sce.hpp"

#include <map>
#include <string>
#include <vector>

#include "Utils/Helpers.hpp"

using TypeId = sce::Registry::TypeId;

struct Point3 {
	int8_t x;
	int8_t y;
	int8_t z;
	static constexpr auto sce = std::make_tuple(::sce::named("x", &Point3::x),
		::sce::named("y", &Point3::y), ::sce::named("z", &Point3::z));
};

void
test_extra_fields()
{
	TEST_INIT(0);

	sce::Registry reg;
	TypeId i8 = reg.primitive(sce::I8);
	TypeId point2 = reg.composite({{"z", i8}, {"x", i8}});
	std::vector<uint8_t> out;

	/* Fields unknown to the target are dropped. */
	fail_if_error(sce::encode_as_type(Point3{1, 2, 3}, point2, reg, out));
	fail_unless_bytes(out, {0x03, 0x01});

	out.clear();
	std::map<std::string, int8_t> m{{"a", 5}, {"x", 6}, {"z", 7}};
	fail_if_error(sce::encode_as_type(m, point2, reg, out));
	fail_unless_bytes(out, {0x07, 0x06});

	/* Missing fields are still errors. */
	out.clear();
	std::map<std::string, int8_t> partial{{"x", 6}};
	auto err = sce::encode_as_type(partial, point2, reg, out);
	fail_unless(err && err->kind == sce::CANNOT_FIND_FIELD);
	fail_unless(err->name == "z");

	/* Positional matching is not affected. */
	out.clear();
	fail_unless_error(sce::encode_as_type(std::make_tuple(1, 2, 3),
					      reg.tuple({i8, i8}), reg, out),
			  sce::WRONG_LENGTH);
}

void
test_small_limit()
{
	TEST_INIT(0);

	sce::Registry reg;
	TypeId u8 = reg.primitive(sce::U8);
	TypeId seq1 = reg.sequence(u8);
	TypeId seq2 = reg.sequence(seq1);
	TypeId seq3 = reg.sequence(seq2);
	std::vector<uint8_t> out;
	scl::LogLevel saved = scl::gLogger.getLogLevel();
	scl::gLogger.setLogLevel(scl::ERROR);

	std::vector<std::vector<uint8_t>> two{{1}};
	fail_if_error(sce::encode_as_type(two, seq2, reg, out));
	fail_unless_bytes(out, {0x04, 0x04, 0x01});

	out.clear();
	std::vector<std::vector<std::vector<uint8_t>>> three{{{1}}};
	auto err = sce::encode_as_type(three, seq3, reg, out);
	fail_unless(err && err->kind == sce::RECURSION_LIMIT_EXCEEDED);
	fail_unless(err->path() == "[0][0][0]");

	/* Empty containers never reach the limit. */
	out.clear();
	std::vector<std::vector<std::vector<uint8_t>>> hollow{{}};
	fail_if_error(sce::encode_as_type(hollow, seq3, reg, out));
	fail_unless_bytes(out, {0x04, 0x00});

	/* One-field wrappers count too. */
	TypeId w1 = reg.composite({{"a", u8}});
	TypeId w2 = reg.tuple({w1});
	TypeId w3 = reg.composite({{std::nullopt, w2}});
	TypeId w4 = reg.tuple({w3});
	out.clear();
	fail_unless_error(sce::encode_as_type(uint8_t{1}, w4, reg, out),
			  sce::RECURSION_LIMIT_EXCEEDED);
	out.clear();
	fail_if_error(sce::encode_as_type(uint8_t{1}, w2, reg, out));
	fail_unless_bytes(out, {0x01});

	scl::gLogger.setLogLevel(saved);
}

int main()
{
	test_extra_fields();
	test_small_limit();
}
