#include "test_util.hpp"
#include <zipnum/compressor.hpp>

#include <stdexcept>

using namespace zipnum;

static Chunk make_chunk(std::vector<std::string> lines) {
  Chunk c;
  c.lines = std::move(lines);
  return c;
}

TEST_CASE("chunk compresses to a gzip member of its concatenated lines") {
  ChunkCompressor z;
  Chunk c = make_chunk({"a 1 {\"x\": 1}\n", "b 2 {\"x\": 2}\n", "c 3"});
  std::string gz = z.compress(c);

  REQUIRE(gz.size() > 18);
  REQUIRE(static_cast<unsigned char>(gz[0]) == 0x1f);
  REQUIRE(static_cast<unsigned char>(gz[1]) == 0x8b);
  REQUIRE(gunzip(gz) == "a 1 {\"x\": 1}\nb 2 {\"x\": 2}\nc 3");
}

TEST_CASE("members are independent and concatenate as multi-member gzip") {
  ChunkCompressor z(9);
  const std::string p1 = make_cdxj(50);
  const std::string p2 = make_cdxj(70, 40);
  std::string m1 = z.compress(p1);
  std::string m2 = z.compress(p2);

  // каждый кусок распаковывается сам по себе
  REQUIRE(gunzip(m1) == p1);
  REQUIRE(gunzip(m2) == p2);
  // и склейка читается как один поток
  REQUIRE(gunzip(m1 + m2) == p1 + p2);
  // состояние компрессора между чанками не протекает
  REQUIRE(z.compress(p1) == m1);
}

TEST_CASE("large chunk spans several output buffers") {
  ChunkCompressor z(1);
  std::string big;
  for (int i = 0; i < 20000; ++i)
    big += std::to_string(i * 7919u % 104729u) + " {\"v\": " + std::to_string(i) + "}\n";
  REQUIRE(gunzip(z.compress(big)) == big);
}

TEST_CASE("compression level must be within 1..9") {
  REQUIRE_THROWS_AS(ChunkCompressor(0), std::invalid_argument);
  REQUIRE_THROWS_AS(ChunkCompressor(10), std::invalid_argument);
  REQUIRE(ChunkCompressor(1).level() == 1);
  REQUIRE(ChunkCompressor(9).level() == 9);
}

TEST_CASE("truncated member is reported") {
  ChunkCompressor z;
  std::string gz = z.compress(make_cdxj(20));
  REQUIRE_THROWS_AS(gunzip(std::string_view(gz).substr(0, gz.size() / 2)),
                    std::runtime_error);
}

TEST_CASE("chunk of many lines compresses like its joined bytes") {
  ChunkCompressor z(1);
  Chunk c;
  std::string joined;
  for (int i = 0; i < 3000; ++i) {
    c.lines.push_back("com,example)/p" + std::to_string(i) + " 2024 {\"i\": " +
                      std::to_string(i) + "}\n");
    joined += c.lines.back();
  }
  const std::string gz = z.compress(c);
  REQUIRE(gz == z.compress(joined));
  REQUIRE(gz.size() < joined.size() / 2);
  REQUIRE(gunzip(gz) == joined);
}

TEST_CASE("empty input still makes a valid member") {
  ChunkCompressor z;
  const std::string gz = z.compress(std::string_view{});
  REQUIRE(gz.size() >= 20);
  REQUIRE(gunzip(gz).empty());
}
