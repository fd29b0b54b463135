#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "blobfeed/avro/container.hpp"
#include "blobfeed/avro/datum.hpp"
#include "blobfeed/feed/blob_client.hpp"

namespace test_support {

// Change-feed record schema as written upstream: enum event type, opaque data
// record carrying the hexadecimal sequencer.
extern const char* const kEventSchemaJson;
// Variant with a top-level long sequenceNumber and a string event type.
extern const char* const kSequencedEventSchemaJson;

inline constexpr blobfeed::avro::SyncMarker kTestSync{0x10, 0x21, 0x32, 0x43, 0x54, 0x65, 0x76, 0x87,
                                                      0x98, 0xA9, 0xBA, 0xCB, 0xDC, 0xED, 0xFE, 0x0F};

struct EventSpec {
  std::uint64_t seq{0};
  std::string shard{"00"};
  std::string type{"BlobCreated"};
  std::string container{"photos"};
  std::string blob{"img.png"};
  std::string time{};     // empty: 2024-01-01T00:00:00Z + seq seconds
};

std::string event_id(const EventSpec& e);
std::string event_time_text(const EventSpec& e);
std::string sequencer_hex(std::uint64_t seq);

// Builds a record for the schema at \p root (either fixture schema).
blobfeed::avro::Datum make_event_datum(const blobfeed::avro::Node& root, const EventSpec& e);

// Encodes container headers and blocks of change-feed events.
class ShardBuilder {
public:
  explicit ShardBuilder(std::string schema_json = kEventSchemaJson,
                        blobfeed::avro::Codec codec = blobfeed::avro::Codec::null);

  const std::vector<std::uint8_t>& header() const { return writer_.header_bytes(); }
  const blobfeed::avro::ContainerWriter& writer() const { return writer_; }

  std::vector<std::uint8_t> block(const std::vector<EventSpec>& events) const;
  std::vector<std::uint8_t> container(const std::vector<std::vector<EventSpec>>& blocks) const;

private:
  blobfeed::avro::ContainerWriter writer_;
};

// Events seq_begin..seq_end-1 of one shard.
std::vector<EventSpec> events_for(std::string shard, std::uint64_t seq_begin, std::uint64_t seq_end);

// Writes the change-feed layout (segments.json, segment manifests, chunks) into a MemoryBlobClient.
class FeedLayout {
public:
  explicit FeedLayout(std::shared_ptr<blobfeed::feed::MemoryBlobClient> client,
                      std::string root = "$blobchangefeed/");

  // time_path is "YYYY/MM/DD/HHMM"; returns the segment id.
  std::string add_segment(std::string_view time_path, bool finalized, const std::vector<std::string>& shard_numbers);
  void finalize(const std::string& segment_id);
  void set_last_consumable(std::string_view iso_time);

  // Shard id of shard number NN in the segment at time_path: "log/NN/YYYY/MM/DD/HHMM/".
  static std::string shard_id(std::string_view shard_number, std::string_view time_path);

  void put_chunk(const std::string& shard_id, std::string_view chunk, std::vector<std::uint8_t> bytes);
  void append_chunk(const std::string& shard_id, std::string_view chunk, const std::vector<std::uint8_t>& bytes);

  const std::string& root() const { return root_; }
  blobfeed::feed::MemoryBlobClient& client() { return *client_; }

private:
  void write_manifest(const std::string& segment_id);

  struct SegmentSpec {
    std::string id;
    std::string time_path;
    bool finalized{false};
    std::vector<std::string> shard_ids;
  };

  std::shared_ptr<blobfeed::feed::MemoryBlobClient> client_;
  std::string root_;
  std::vector<SegmentSpec> segments_;
};

// Wraps a client; the next N reads fail with a chosen code. Listings pass through.
class FlakyBlobClient final : public blobfeed::feed::BlobClient {
public:
  explicit FlakyBlobClient(std::shared_ptr<blobfeed::feed::BlobClient> inner) : inner_(std::move(inner)) {}

  void fail_next_reads(int n, blobfeed::core::error_code code = blobfeed::core::error_code::unavailable);
  int attempts() const { return attempts_.load(); }

  auto list_blobs(std::string_view prefix)
      -> std::expected<std::vector<blobfeed::feed::BlobInfo>, blobfeed::core::error> override;
  auto read_range(std::string_view name, std::uint64_t offset, std::uint64_t length,
                  std::chrono::milliseconds timeout)
      -> std::expected<std::vector<std::uint8_t>, blobfeed::core::error> override;

private:
  std::shared_ptr<blobfeed::feed::BlobClient> inner_;
  std::mutex mu_;
  int remaining_failures_{0};
  blobfeed::core::error_code failure_code_{blobfeed::core::error_code::unavailable};
  std::atomic<int> attempts_{0};
};

std::filesystem::path make_temp_dir(const std::string& name);

} // namespace test_support
