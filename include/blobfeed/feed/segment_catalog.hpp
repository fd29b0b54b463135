#pragma once

/** \file segment_catalog.hpp
 *  \brief Discovery of change-feed segments, their finalization state and shard chunk listings.
 *
 * Layout under CatalogOptions::root (default "$blobchangefeed/"):
 *   meta/segments.json                          feed-level "lastConsumable" timestamp
 *   idx/segments/YYYY/MM/DD/HHMM/meta.json      segment manifest ("status", "begin",
 *                                               "intervalSecs", "chunkFilePaths")
 *   log/NN/YYYY/MM/DD/HHMM/00000.avro, ...      shard chunk files (one prefix per shard)
 *
 * Segment ids and shard ids are relative to the root. Finalized segments are
 * immutable: their manifest and, once listed after finalization, their chunk
 * listings are cached for the life of the catalog. Unfinalized segments are
 * re-read on every call.
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "blobfeed/core/time.hpp"
#include "blobfeed/error.hpp"
#include "blobfeed/feed/blob_client.hpp"

namespace blobfeed::feed {

struct ChunkInfo {
  std::string name;            /**< blob name relative to the shard prefix, e.g. "00000.avro" */
  std::uint64_t length{0};
  bool operator==(const ChunkInfo&) const = default;
};

struct Shard {
  std::string id;              /**< shard prefix relative to the root, ends with '/' */
  std::string prefix;          /**< full blob-name prefix (root + id) */
  std::vector<ChunkInfo> chunks;
  bool sealed{false};          /**< listed after the segment was finalized: no byte will be added */

  auto blob_name(std::string_view chunk) const -> std::string { return prefix + std::string(chunk); }
  auto find_chunk(std::string_view chunk) const noexcept -> const ChunkInfo*;
};

struct Segment {
  std::string id;              /**< manifest path relative to the root */
  core::timestamp begin{};
  std::chrono::seconds interval{0};
  bool finalized{false};
  std::vector<std::string> shard_ids;

  core::timestamp end() const noexcept { return begin + interval; }
};

struct CatalogOptions {
  std::string root{"$blobchangefeed/"};
  std::optional<core::timestamp> start_time;
  std::optional<core::timestamp> end_time;
  std::chrono::milliseconds fetch_timeout{std::chrono::seconds(30)};
  std::uint64_t max_manifest_bytes{1u << 20};
};

class SegmentCatalog {
public:
  SegmentCatalog(std::shared_ptr<BlobClient> client, CatalogOptions options = {});

  /** \brief Segments with id >= \p from (all when nullopt), ascending, after time filters. */
  [[nodiscard]] auto list_segments_from(const std::optional<std::string>& from)
      -> std::expected<std::vector<Segment>, core::error>;

  /** \brief Current manifest of one segment. */
  [[nodiscard]] auto segment(std::string_view segment_id) -> std::expected<Segment, core::error>;

  /** \brief Shards of a segment with their chunk listings, in manifest order. */
  [[nodiscard]] auto shards_of(std::string_view segment_id)
      -> std::expected<std::vector<Shard>, core::error>;

  [[nodiscard]] auto is_finalized(std::string_view segment_id) -> std::expected<bool, core::error>;

  /** \brief "lastConsumable" of meta/segments.json; nullopt when the file or field is absent. */
  [[nodiscard]] auto last_consumable() -> std::expected<std::optional<core::timestamp>, core::error>;

  const CatalogOptions& options() const noexcept { return options_; }

private:
  auto read_small(const std::string& name) -> std::expected<std::optional<std::string>, core::error>;
  auto load_segment(std::string_view segment_id) -> std::expected<Segment, core::error>;
  auto list_shard(const std::string& shard_id) -> std::expected<Shard, core::error>;

  std::shared_ptr<BlobClient> client_;
  CatalogOptions options_;
  std::mutex mu_;
  std::map<std::string, Segment, std::less<>> finalized_;
  std::map<std::string, std::vector<Shard>, std::less<>> finalized_shards_;
};

/** \brief Begin time encoded in a segment id ("idx/segments/YYYY/MM/DD/HHMM/meta.json"). */
auto segment_time_from_id(std::string_view segment_id) -> std::optional<core::timestamp>;

} // namespace blobfeed::feed
