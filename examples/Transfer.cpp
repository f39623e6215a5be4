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
#include "../src/sce/sce.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

//doclabel01-1
/** Application record; the rule lists the fields presented to encoder. */
struct Transfer {
	std::string memo;
	uint32_t from;
	uint32_t to;
	uint64_t amount;
	static constexpr auto sce = std::make_tuple(
		::sce::named("from", &Transfer::from),
		::sce::named("to", &Transfer::to),
		::sce::named("value", &Transfer::amount),
		::sce::skip(&Transfer::memo));
};

struct Burn {
	static constexpr std::string_view sce_name = "Burn";
	uint64_t amount;
	static constexpr auto sce = std::make_tuple(::sce::named("amount", &Burn::amount));
};

struct Send {
	static constexpr std::string_view sce_name = "Send";
	Transfer transfer;
	static constexpr auto sce = &Send::transfer;
};

using Call = std::variant<Burn, Send>;
//doclabel01-2

static void
print_hex(const std::vector<uint8_t> &bytes)
{
	std::cout << "0x";
	for (uint8_t b : bytes)
		std::cout << std::hex << std::setw(2) << std::setfill('0') << unsigned(b);
	std::cout << std::dec << std::endl;
}

int
main()
{
	//doclabel02-1
	/* Schema of the remote side: field order differs from the struct. */
	sce::Registry reg;
	auto u32 = reg.primitive(sce::U32);
	auto u64 = reg.primitive(sce::U64);
	auto amount = reg.compact(u64);
	auto transfer = reg.composite({{"value", amount}, {"from", u32}, {"to", u32}});
	auto call = reg.variant({{"Burn", 0, {{"amount", amount}}},
				 {"Send", 7, {{std::nullopt, transfer}}}});
	//doclabel02-2

	//doclabel03-1
	std::vector<Call> calls{Send{Transfer{"rent", 1, 2, 1000}}, Burn{64}};
	for (const Call &c : calls) {
		std::vector<uint8_t> out;
		std::optional<sce::Error> err = sce::encode_as_type(c, call, reg, out);
		if (err) {
			SCL_LOG_ERROR("Failed to encode call: ", *err);
			return 1;
		}
		print_hex(out);
	}
	//doclabel03-2

	/* The same struct against an incompatible schema. */
	auto narrow = reg.composite({{"value", reg.primitive(sce::U8)},
				     {"from", u32}, {"to", u32}});
	std::vector<uint8_t> out;
	std::optional<sce::Error> err =
		sce::encode_as_type(Transfer{"", 1, 2, 1000}, narrow, reg, out);
	if (err)
		std::cout << *err << std::endl;
	return 0;
}
