#include "blobfeed/avro/container.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <random>

namespace blobfeed::avro {

using core::error;
using core::error_code;

namespace {

auto mismatch(std::string msg) -> std::unexpected<error> {
  return std::unexpected(error{error_code::schema_mismatch, std::move(msg), "avro.container"});
}

bool is_eof(const error& e) { return e.code == error_code::io_eof; }

} // namespace

auto parse_header(std::span<const std::uint8_t> bytes)
    -> std::expected<std::optional<ContainerHeader>, error> {
  if (bytes.empty()) return std::optional<ContainerHeader>{};
  const std::size_t magic_avail = std::min(bytes.size(), kContainerMagic.size());
  if (std::memcmp(bytes.data(), kContainerMagic.data(), magic_avail) != 0) {
    return mismatch("bad container magic");
  }
  if (bytes.size() < kContainerMagic.size()) return std::optional<ContainerHeader>{};

  BinaryReader in(bytes.subspan(kContainerMagic.size()));
  ContainerHeader h;
  while (true) {
    auto n = in.read_long();
    if (!n) {
      if (is_eof(n.error())) return std::optional<ContainerHeader>{};
      return mismatch("header metadata: " + n.error().message);
    }
    if (*n == 0) break;
    std::int64_t count = *n;
    if (count < 0) {
      if (count == std::numeric_limits<std::int64_t>::min()) return mismatch("header metadata: invalid block count");
      count = -count;
      auto block_bytes = in.read_long();
      if (!block_bytes) {
        if (is_eof(block_bytes.error())) return std::optional<ContainerHeader>{};
        return mismatch("header metadata: " + block_bytes.error().message);
      }
    }
    for (std::int64_t i = 0; i < count; ++i) {
      auto key = in.read_string();
      if (!key) {
        if (is_eof(key.error())) return std::optional<ContainerHeader>{};
        return mismatch("header metadata key: " + key.error().message);
      }
      auto val = in.read_bytes();
      if (!val) {
        if (is_eof(val.error())) return std::optional<ContainerHeader>{};
        return mismatch("header metadata value: " + val.error().message);
      }
      h.metadata[std::move(*key)] = std::vector<std::uint8_t>(val->begin(), val->end());
    }
  }
  auto sync = in.read_fixed(kSyncSize);
  if (!sync) return std::optional<ContainerHeader>{};
  std::copy(sync->begin(), sync->end(), h.sync.begin());

  auto sit = h.metadata.find("avro.schema");
  if (sit == h.metadata.end()) return mismatch("header has no avro.schema");
  auto schema = Schema::parse(std::string_view(reinterpret_cast<const char*>(sit->second.data()), sit->second.size()));
  if (!schema) return std::unexpected(schema.error());
  h.schema = std::move(*schema);

  std::string codec_text;
  if (auto cit = h.metadata.find("avro.codec"); cit != h.metadata.end()) {
    codec_text.assign(cit->second.begin(), cit->second.end());
  }
  auto codec = parse_codec(codec_text);
  if (!codec) return std::unexpected(codec.error());
  h.codec = *codec;
  h.size = kContainerMagic.size() + in.position();
  return std::optional<ContainerHeader>{std::move(h)};
}

BlockStream::BlockStream(std::shared_ptr<const ContainerHeader> header, std::uint64_t start_offset,
                         BlockLimits limits)
    : header_(std::move(header)), limits_(limits), offset_(start_offset) {}

void BlockStream::append(std::span<const std::uint8_t> bytes) {
  buf_.insert(buf_.end(), bytes.begin(), bytes.end());
}

void BlockStream::reset(std::uint64_t offset) {
  buf_.clear();
  head_ = 0;
  offset_ = offset;
  failed_.reset();
}

void BlockStream::compact() {
  if (head_ == 0) return;
  if (head_ == buf_.size()) { buf_.clear(); head_ = 0; return; }
  if (head_ * 2 < buf_.size()) return;
  buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(head_));
  head_ = 0;
}

auto BlockStream::fail(std::string msg) -> std::unexpected<error> {
  failed_ = error{error_code::corrupt_block, "block at offset " + std::to_string(offset_) + ": " + std::move(msg),
                  "avro.container"};
  return std::unexpected(*failed_);
}

auto BlockStream::next_block() -> std::expected<std::optional<DecodedBlock>, error> {
  if (failed_) return std::unexpected(*failed_);
  const std::span<const std::uint8_t> avail{buf_.data() + head_, buf_.size() - head_};
  BinaryReader in(avail);

  auto count = in.read_long();
  if (!count) {
    if (is_eof(count.error())) return std::optional<DecodedBlock>{};
    return fail("record count: " + count.error().message);
  }
  auto size = in.read_long();
  if (!size) {
    if (is_eof(size.error())) return std::optional<DecodedBlock>{};
    return fail("block size: " + size.error().message);
  }
  if (*count < 0 || static_cast<std::uint64_t>(*count) > limits_.max_block_records) {
    return fail("implausible record count " + std::to_string(*count));
  }
  if (*size < 0 || static_cast<std::uint64_t>(*size) > limits_.max_block_bytes) {
    return fail("implausible block size " + std::to_string(*size));
  }
  const std::size_t prefix = in.position();
  const std::uint64_t total = prefix + static_cast<std::uint64_t>(*size) + kSyncSize;
  if (total > avail.size()) return std::optional<DecodedBlock>{}; // trailing block still being written

  const auto payload = avail.subspan(prefix, static_cast<std::size_t>(*size));
  const auto marker = avail.subspan(prefix + static_cast<std::size_t>(*size), kSyncSize);
  if (!std::equal(marker.begin(), marker.end(), header_->sync.begin())) {
    return fail("sync marker mismatch");
  }

  auto raw = decompress(header_->codec, payload, static_cast<std::size_t>(limits_.max_block_bytes));
  if (!raw) return fail(raw.error().message);

  DecodedBlock block;
  block.start_offset = offset_;
  block.end_offset = offset_ + total;
  block.records.reserve(static_cast<std::size_t>(*count));
  BinaryReader records(*raw);
  for (std::int64_t i = 0; i < *count; ++i) {
    auto d = decode_datum(records, header_->schema.root());
    if (!d) return fail("record " + std::to_string(i) + ": " + d.error().message);
    block.records.push_back(std::move(*d));
  }
  if (!records.at_end()) return fail("trailing bytes after " + std::to_string(*count) + " records");

  head_ += static_cast<std::size_t>(total);
  offset_ += total;
  compact();
  return std::optional<DecodedBlock>{std::move(block)};
}

auto ContainerWriter::create(std::string_view schema_json, Codec codec, std::optional<SyncMarker> sync)
    -> std::expected<ContainerWriter, error> {
  auto schema = Schema::parse(schema_json);
  if (!schema) return std::unexpected(schema.error());
  ContainerWriter w;
  w.schema_ = std::move(*schema);
  w.codec_ = codec;
  if (sync) {
    w.sync_ = *sync;
  } else {
    std::random_device rd;
    for (auto& b : w.sync_) b = static_cast<std::uint8_t>(rd());
  }

  auto& out = w.header_;
  out.assign(kContainerMagic.begin(), kContainerMagic.end());
  const auto cname = codec_name(codec);
  write_long(out, 2);
  write_string(out, "avro.codec");
  write_bytes(out, {reinterpret_cast<const std::uint8_t*>(cname.data()), cname.size()});
  write_string(out, "avro.schema");
  write_bytes(out, {reinterpret_cast<const std::uint8_t*>(schema_json.data()), schema_json.size()});
  write_long(out, 0);
  out.insert(out.end(), w.sync_.begin(), w.sync_.end());
  return w;
}

auto ContainerWriter::encode_block(std::span<const Datum> records) const
    -> std::expected<std::vector<std::uint8_t>, error> {
  std::vector<std::uint8_t> payload;
  for (const auto& r : records) {
    if (auto e = encode_datum(payload, schema_.root(), r); !e) return std::unexpected(e.error());
  }
  auto packed = compress(codec_, payload);
  if (!packed) return std::unexpected(packed.error());

  std::vector<std::uint8_t> out;
  out.reserve(packed->size() + 20 + kSyncSize);
  write_long(out, static_cast<std::int64_t>(records.size()));
  write_long(out, static_cast<std::int64_t>(packed->size()));
  out.insert(out.end(), packed->begin(), packed->end());
  out.insert(out.end(), sync_.begin(), sync_.end());
  return out;
}

} // namespace blobfeed::avro
