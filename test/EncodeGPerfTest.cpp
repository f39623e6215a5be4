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

#include <benchmark/benchmark.h>

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "../src/sce/sce.hpp"

enum random_variant {
	// Random numbers.
	RND,
	// Random numbers with all compact modes equally likely.
	MIX,
};

std::mt19937_64 gen{std::random_device{}()};
std::uniform_int_distribution<uint64_t> uint_chooser{0, 3};
std::uniform_int_distribution<uint64_t> uint_distr[4] {
	std::uniform_int_distribution<uint64_t>{0, 0x3F},
	std::uniform_int_distribution<uint64_t>{0x40, 0x3FFF},
	std::uniform_int_distribution<uint64_t>{0x4000, 0x3FFFFFFF},
	std::uniform_int_distribution<uint64_t>{0x40000000ull},
};

template <random_variant R>
void generate(uint64_t &data)
{
	if constexpr (R == RND)
		data = gen();
	else
		data = uint_distr[uint_chooser(gen)](gen);
}

struct Transfer {
	uint32_t from;
	uint32_t to;
	uint64_t amount;
	std::string memo;
	static constexpr auto sce = std::make_tuple(
		::sce::named("from", &Transfer::from),
		::sce::named("to", &Transfer::to),
		::sce::named("amount", &Transfer::amount),
		::sce::named("memo", &Transfer::memo));
};

struct Schema {
	sce::Registry reg;
	sce::Registry::TypeId u32 = reg.primitive(sce::U32);
	sce::Registry::TypeId u64 = reg.primitive(sce::U64);
	sce::Registry::TypeId str = reg.str();
	sce::Registry::TypeId compact = reg.compact(u64);
	sce::Registry::TypeId compacts = reg.sequence(compact);
	sce::Registry::TypeId transfer = reg.composite({
		{"amount", compact}, {"from", u32}, {"to", u32}, {"memo", str}});
	sce::Registry::TypeId transfers = reg.sequence(transfer);
};

template <random_variant R>
static void BM_compact(benchmark::State& state)
{
	constexpr size_t N = 1024;
	Schema schema;
	std::vector<uint64_t> data(N);
	std::vector<uint8_t> out;
	out.reserve(N * 9 + 8);
	size_t total_size = 0;

	for (auto _ : state)
	{
		state.PauseTiming();
		for (auto &val : data)
			generate<R>(val);
		out.clear();
		state.ResumeTiming();

		auto err = sce::encode_as_type(data, schema.compacts,
					       schema.reg, out);
		if (err)
			state.SkipWithError("encode failed");
		benchmark::DoNotOptimize(out.data());
		total_size += out.size();
	}

	state.SetItemsProcessed(state.iterations() * N);
	state.SetBytesProcessed(total_size);
}

static void BM_records(benchmark::State& state)
{
	constexpr size_t N = 256;
	Schema schema;
	std::vector<Transfer> data(N);
	for (auto &t : data) {
		t.from = static_cast<uint32_t>(gen());
		t.to = static_cast<uint32_t>(gen());
		generate<MIX>(t.amount);
		t.memo = "payment #" + std::to_string(t.from % 1000);
	}
	std::vector<uint8_t> out;
	size_t total_size = 0;

	for (auto _ : state)
	{
		out.clear();
		auto err = sce::encode_as_type(data, schema.transfers,
					       schema.reg, out);
		if (err)
			state.SkipWithError("encode failed");
		benchmark::DoNotOptimize(out.data());
		total_size += out.size();
	}

	state.SetItemsProcessed(state.iterations() * N);
	state.SetBytesProcessed(total_size);
}

BENCHMARK_TEMPLATE(BM_compact, RND);
BENCHMARK_TEMPLATE(BM_compact, MIX);
BENCHMARK(BM_records);

BENCHMARK_MAIN();
