#include <catch2/catch_all.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "blobfeed/avro/container.hpp"
#include "tests/support/feed_fixtures.hpp"

using namespace blobfeed::avro;
using blobfeed::core::error_code;
using test_support::events_for;
using test_support::ShardBuilder;

namespace {

std::shared_ptr<const ContainerHeader> header_of(const std::vector<std::uint8_t>& bytes) {
  auto h = parse_header(bytes);
  REQUIRE(h.has_value());
  REQUIRE(h->has_value());
  return std::make_shared<const ContainerHeader>(std::move(**h));
}

std::vector<std::uint8_t> tail(const std::vector<std::uint8_t>& bytes, std::uint64_t from) {
  return {bytes.begin() + static_cast<std::ptrdiff_t>(from), bytes.end()};
}

} // namespace

TEST_CASE("header parses incrementally", "[avro][container]") {
  ShardBuilder b;
  const auto& header = b.header();
  for (std::size_t n = 0; n < header.size(); ++n) {
    auto h = parse_header(std::span<const std::uint8_t>(header.data(), n));
    REQUIRE(h.has_value());
    REQUIRE_FALSE(h->has_value());
  }
  auto full = header_of(header);
  REQUIRE(full->size == header.size());
  REQUIRE(full->codec == Codec::null);
  REQUIRE(full->sync == test_support::kTestSync);
  REQUIRE(full->schema.root().fullname == "com.microsoft.azure.storage.blob.BlobChangeEvent");
}

TEST_CASE("bad magic is schema_mismatch", "[avro][container]") {
  std::vector<std::uint8_t> bytes{'O', 'b', 'j', 0x02, 0x00};
  auto h = parse_header(bytes);
  REQUIRE_FALSE(h.has_value());
  REQUIRE(h.error().code == error_code::schema_mismatch);
}

TEST_CASE("header metadata with the most negative block count is schema_mismatch", "[avro][container]") {
  // Zig-zag varint of INT64_MIN as the metadata map count.
  std::vector<std::uint8_t> bytes{'O', 'b', 'j', 0x01};
  for (int i = 0; i < 9; ++i) bytes.push_back(0xFF);
  bytes.push_back(0x01);
  bytes.push_back(0x00);
  auto h = parse_header(bytes);
  REQUIRE_FALSE(h.has_value());
  REQUIRE(h.error().code == error_code::schema_mismatch);
}

TEST_CASE("unknown codec is schema_mismatch", "[avro][codec]") {
  auto c = parse_codec("snappy");
  REQUIRE_FALSE(c.has_value());
  REQUIRE(c.error().code == error_code::schema_mismatch);
  REQUIRE(parse_codec("null").value() == Codec::null);
  REQUIRE(parse_codec("deflate").value() == Codec::deflate);
  REQUIRE(codec_name(Codec::zstandard) == "zstandard");
}

TEST_CASE("block stream yields whole blocks with boundary offsets", "[avro][container]") {
  ShardBuilder b;
  const auto bytes = b.container({events_for("00", 0, 3), events_for("00", 3, 5)});
  auto header = header_of(bytes);
  BlockStream stream(header, header->size);
  stream.append(tail(bytes, header->size));

  auto first = stream.next_block();
  REQUIRE(first.has_value());
  REQUIRE(first->has_value());
  REQUIRE((*first)->records.size() == 3);
  REQUIRE((*first)->start_offset == header->size);

  auto second = stream.next_block();
  REQUIRE(second.has_value());
  REQUIRE(second->has_value());
  REQUIRE((*second)->start_offset == (*first)->end_offset);
  REQUIRE((*second)->end_offset == bytes.size());
  REQUIRE((*second)->records[1].field("id")->text() == "evt-00-4");

  auto none = stream.next_block();
  REQUIRE(none.has_value());
  REQUIRE_FALSE(none->has_value());
  REQUIRE(stream.offset() == bytes.size());
}

TEST_CASE("a truncated trailing block is not complete yet", "[avro][container]") {
  ShardBuilder b;
  const auto bytes = b.container({events_for("00", 0, 4)});
  auto header = header_of(bytes);
  BlockStream stream(header, header->size);
  const auto body = tail(bytes, header->size);

  // Feed the block a byte at a time; only the last byte completes it.
  for (std::size_t i = 0; i + 1 < body.size(); ++i) {
    stream.append(std::span<const std::uint8_t>(&body[i], 1));
    auto r = stream.next_block();
    REQUIRE(r.has_value());
    REQUIRE_FALSE(r->has_value());
  }
  stream.append(std::span<const std::uint8_t>(&body.back(), 1));
  auto r = stream.next_block();
  REQUIRE(r.has_value());
  REQUIRE(r->has_value());
  REQUIRE((*r)->records.size() == 4);
  REQUIRE(stream.buffered() == 0);
}

TEST_CASE("sync mismatch is corrupt_block and the stream stays failed until reset", "[avro][container]") {
  ShardBuilder b;
  const auto good = b.block(events_for("00", 0, 2));
  auto bytes = b.container({events_for("00", 0, 2), events_for("00", 2, 4)});
  auto header = header_of(bytes);
  const auto second_start = header->size + good.size();
  bytes.back() ^= 0xFF;  // last sync byte of the second block

  BlockStream stream(header, header->size);
  stream.append(tail(bytes, header->size));
  auto ok = stream.next_block();
  REQUIRE(ok.has_value());
  REQUIRE(ok->has_value());

  auto bad = stream.next_block();
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().code == error_code::corrupt_block);
  REQUIRE(bad.error().message.find("sync") != std::string::npos);
  REQUIRE(stream.offset() == second_start);
  REQUIRE_FALSE(stream.next_block().has_value());

  stream.reset(header->size);
  stream.append(tail(bytes, header->size));
  auto again = stream.next_block();
  REQUIRE(again.has_value());
  REQUIRE(again->has_value());
  REQUIRE((*again)->records.size() == 2);
}

TEST_CASE("block limits reject implausible counts and sizes", "[avro][container]") {
  ShardBuilder b;
  const auto bytes = b.container({events_for("00", 0, 3)});
  auto header = header_of(bytes);

  SECTION("record count") {
    BlockStream stream(header, header->size, BlockLimits{64ull * 1024 * 1024, 2});
    stream.append(tail(bytes, header->size));
    auto r = stream.next_block();
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == error_code::corrupt_block);
  }
  SECTION("block bytes") {
    BlockStream stream(header, header->size, BlockLimits{16, 1024});
    stream.append(tail(bytes, header->size));
    auto r = stream.next_block();
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == error_code::corrupt_block);
  }
}

TEST_CASE("deflate blocks decode to the same records", "[avro][codec]") {
  ShardBuilder plain;
  ShardBuilder packed(test_support::kEventSchemaJson, Codec::deflate);
  const auto events = events_for("03", 10, 60);
  const auto a = plain.container({events});
  const auto z = packed.container({events});
  REQUIRE(z.size() < a.size());

  auto ha = header_of(a);
  auto hz = header_of(z);
  REQUIRE(hz->codec == Codec::deflate);
  BlockStream sa(ha, ha->size);
  BlockStream sz(hz, hz->size);
  sa.append(tail(a, ha->size));
  sz.append(tail(z, hz->size));
  auto ra = sa.next_block();
  auto rz = sz.next_block();
  REQUIRE(ra.has_value());
  REQUIRE(rz.has_value());
  REQUIRE((*ra)->records == (*rz)->records);
}

TEST_CASE("truncated deflate payload is corrupt_block", "[avro][codec]") {
  const std::vector<std::uint8_t> raw(4096, 'x');
  auto packed = compress(Codec::deflate, raw);
  REQUIRE(packed.has_value());
  packed->resize(packed->size() / 2);
  auto r = decompress(Codec::deflate, *packed, 1 << 20);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == error_code::corrupt_block);

  auto full = compress(Codec::deflate, raw);
  auto capped = decompress(Codec::deflate, *full, 1024);
  REQUIRE_FALSE(capped.has_value());
  REQUIRE(capped.error().code == error_code::corrupt_block);
}

#ifdef BLOBFEED_HAS_ZSTD
TEST_CASE("zstandard blocks decode", "[avro][codec]") {
  ShardBuilder packed(test_support::kEventSchemaJson, Codec::zstandard);
  const auto bytes = packed.container({events_for("01", 0, 20)});
  auto header = header_of(bytes);
  REQUIRE(header->codec == Codec::zstandard);
  BlockStream stream(header, header->size);
  stream.append(tail(bytes, header->size));
  auto r = stream.next_block();
  REQUIRE(r.has_value());
  REQUIRE(r->has_value());
  REQUIRE((*r)->records.size() == 20);
}
#endif
