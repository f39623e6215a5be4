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
#include "../src/sce/Writer.hpp"
#include "../src/sce/Bits.hpp"

#include <bitset>
#include <cstring>
#include <limits>
#include <string>
#include <vector>

#include "Utils/Helpers.hpp"
#include "Utils/ScaleReader.hpp"

/** Buffer-like sink, has its own write method. */
struct ChunkSink {
	struct Chunk {
		const char *data;
		size_t size;
	};
	std::vector<std::string> chunks;

	void write(Chunk chunk) { chunks.emplace_back(chunk.data, chunk.size); }
};

template <class T>
std::vector<uint8_t>
fixed(T t)
{
	std::vector<uint8_t> out;
	sce::Writer<std::vector<uint8_t>> wr(out);
	wr.writeFixed(t);
	return out;
}

std::vector<uint8_t>
compact(sce::uint128_t v)
{
	std::vector<uint8_t> out;
	sce::Writer<std::vector<uint8_t>> wr(out);
	wr.writeCompact(v);
	return out;
}

void
test_fixed()
{
	TEST_INIT(0);

	fail_unless_bytes(fixed(uint8_t{0xab}), {0xab});
	fail_unless_bytes(fixed(uint16_t{0x0102}), {0x02, 0x01});
	fail_unless_bytes(fixed(uint32_t{0x01020304}), {0x04, 0x03, 0x02, 0x01});
	fail_unless_bytes(fixed(int16_t{-2}), {0xfe, 0xff});
	fail_unless_bytes(fixed(int64_t{-1}),
			  {0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff});

	sce::uint128_t big = (sce::uint128_t(1) << 120) | 0x42;
	std::vector<uint8_t> exp(16, 0);
	exp[0] = 0x42;
	exp[15] = 0x01;
	fail_unless(fixed(big) == exp);

	std::vector<uint8_t> out;
	sce::Writer<std::vector<uint8_t>> wr(out);
	wr.writeBool(true);
	wr.writeBool(false);
	wr.writeChar(U'é');
	fail_unless_bytes(out, {0x01, 0x00, 0xe9, 0x00, 0x00, 0x00});
}

void
test_extended()
{
	TEST_INIT(0);

	std::vector<uint8_t> out;
	sce::Writer<std::vector<uint8_t>> wr(out);
	wr.writeExtended(sce::Number::of(-1));
	fail_unless(out.size() == 32);
	for (uint8_t b : out)
		fail_unless(b == 0xff);

	out.clear();
	wr.writeExtended(sce::Number::of(uint64_t{5}));
	fail_unless(out.size() == 32);
	fail_unless(out[0] == 5);
	for (size_t i = 1; i < out.size(); i++)
		fail_unless(out[i] == 0);
}

void
test_compact()
{
	TEST_INIT(0);

	fail_unless_bytes(compact(0), {0x00});
	fail_unless_bytes(compact(1), {0x04});
	fail_unless_bytes(compact(63), {0xfc});
	fail_unless_bytes(compact(64), {0x01, 0x01});
	fail_unless_bytes(compact(16383), {0xfd, 0xff});
	fail_unless_bytes(compact(16384), {0x02, 0x00, 0x01, 0x00});
	fail_unless_bytes(compact((1u << 30) - 1), {0xfe, 0xff, 0xff, 0xff});
	fail_unless_bytes(compact(1u << 30), {0x03, 0x00, 0x00, 0x00, 0x40});
	fail_unless_bytes(compact(uint64_t(1) << 32),
			  {0x07, 0x00, 0x00, 0x00, 0x00, 0x01});
	fail_unless_bytes(compact(std::numeric_limits<uint64_t>::max()),
			  {0x13, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff});

	std::vector<uint8_t> max128 = compact(~sce::uint128_t(0));
	fail_unless(max128.size() == 17);
	fail_unless(max128[0] == 0x33);

	/* Every mode reads back to the original value. */
	sce::uint128_t samples[] = {0, 5, 63, 64, 300, 16383, 16384, 70000,
				    (1u << 30) - 1, 1u << 30, 0xdeadbeefcafe,
				    ~sce::uint128_t(0)};
	for (sce::uint128_t v : samples) {
		ScaleReader rd(compact(v));
		fail_unless(rd.readCompact() == v);
		fail_unless(rd.atEnd());
		fail_if(rd.failed());
	}
}

void
test_str()
{
	TEST_INIT(0);

	std::vector<uint8_t> out;
	sce::Writer<std::vector<uint8_t>> wr(out);
	wr.writeStr("abc");
	wr.writeStr("");
	fail_unless_bytes(out, {0x0c, 'a', 'b', 'c', 0x00});

	std::string long_str(100, 'x');
	out.clear();
	wr.writeStr(long_str);
	ScaleReader rd(out);
	fail_unless(rd.readStr() == long_str);
	fail_unless(rd.atEnd());
}

void
test_bits()
{
	TEST_INIT(0);

	sce::Bits bits{true, false, true, true, false, false, false, false, true};
	std::vector<uint8_t> out;
	sce::Writer<std::vector<uint8_t>> wr(out);

	wr.writeBits(bits, sce::LSB0, sce::STORE_U8);
	fail_unless_bytes(out, {0x24, 0x0d, 0x01});

	out.clear();
	wr.writeBits(bits, sce::MSB0, sce::STORE_U8);
	fail_unless_bytes(out, {0x24, 0xb0, 0x80});

	out.clear();
	wr.writeBits(bits, sce::LSB0, sce::STORE_U16);
	fail_unless_bytes(out, {0x24, 0x0d, 0x01});

	out.clear();
	wr.writeBits(bits, sce::MSB0, sce::STORE_U16);
	fail_unless_bytes(out, {0x24, 0x80, 0xb0});

	out.clear();
	wr.writeBits(bits, sce::LSB0, sce::STORE_U32);
	fail_unless_bytes(out, {0x24, 0x0d, 0x01, 0x00, 0x00});

	out.clear();
	wr.writeBits(sce::Bits{}, sce::LSB0, sce::STORE_U64);
	fail_unless_bytes(out, {0x00});

	std::bitset<3> set;
	set[1] = true;
	out.clear();
	wr.writeBits(set, sce::LSB0, sce::STORE_U8);
	fail_unless_bytes(out, {0x0c, 0x02});

	out.clear();
	wr.writeBits(bits, sce::LSB0, sce::BitStore(4));
	fail_unless(out.empty());
	fail_unless(sce::store_bits(sce::BitStore(40)) == 0);
	fail_unless(sce::store_bits(sce::STORE_U64) == 64);

	/* Long sequences read back in every order and store. */
	sce::Bits many;
	for (size_t i = 0; i < 200; i++)
		many.push_back(i % 3 == 0 || i % 7 == 0);
	sce::BitStore stores[] = {sce::STORE_U8, sce::STORE_U16,
				  sce::STORE_U32, sce::STORE_U64};
	for (sce::BitStore store : stores) {
		for (sce::BitOrder order : {sce::LSB0, sce::MSB0}) {
			out.clear();
			wr.writeBits(many, order, store);
			ScaleReader rd(out);
			std::vector<bool> got = rd.readBits(order == sce::MSB0,
							    sce::store_bits(store) / 8);
			fail_unless(sce::Bits(got) == many);
			fail_unless(rd.atEnd());
		}
	}
}

void
test_containers()
{
	TEST_INIT(0);

	std::string str;
	sce::Writer<std::string> str_wr(str);
	str_wr.writeFixed(uint16_t{0x4142});
	str_wr.writeStr("z");
	fail_unless(str == std::string("BA\x04z", 4));

	char buf[16];
	char *pos = buf;
	sce::Writer<char *> ptr_wr(pos);
	ptr_wr.writeFixed(uint32_t{7});
	ptr_wr.writeCompact(64);
	fail_unless(pos == buf + 6);
	fail_unless(std::memcmp(buf, "\x07\x00\x00\x00\x01\x01", 6) == 0);

	ChunkSink sink;
	sce::Writer<ChunkSink> sink_wr(sink);
	sink_wr.writeBool(true);
	sink_wr.writeStr("hi");
	fail_unless(sink.chunks.size() == 3);
	fail_unless(sink.chunks[0] == std::string("\x01", 1));
	fail_unless(sink.chunks[1] == std::string("\x08", 1));
	fail_unless(sink.chunks[2] == "hi");
}

int main()
{
	test_fixed();
	test_extended();
	test_compact();
	test_str();
	test_bits();
	test_containers();
}
