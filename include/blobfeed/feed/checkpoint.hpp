#pragma once

/** \file checkpoint.hpp
 *  \brief Resumption state of a feed and its text serialization.
 *
 * Format (v1):
 *   header: "blobfeed-cursor v1"\n
 *   lines:  generation=<u64>\n
 *           segment=<id>\n
 *           shard=<id> chunk=<name> offset=<u64> record=<u64>\n          (one per shard)
 *           stalled=<id> segment=<id> chunk=<name> offset=<u64> record=<u64> reason=<text>\n
 * String values are percent-encoded (space, '%', '=', control bytes) so every
 * line splits on single spaces.
 *
 * `offset` is always the start of a block that has not been fully delivered;
 * `record` counts the records of that block already delivered.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "blobfeed/error.hpp"

namespace blobfeed::feed {

struct ShardCursor {
  std::string shard_id;
  std::string chunk;               /**< current chunk blob; empty before the first chunk exists */
  std::uint64_t byte_offset{0};
  std::uint64_t record_offset{0};

  bool operator==(const ShardCursor&) const = default;
};

struct StalledShard {
  std::string segment_id;
  ShardCursor cursor;              /**< last good position */
  std::string reason;

  bool operator==(const StalledShard&) const = default;
};

struct Checkpoint {
  std::uint64_t generation{0};     /**< store generation this state was loaded at */
  std::string segment_id;          /**< oldest unfinished segment; empty before the first one */
  std::vector<ShardCursor> shards;
  std::vector<StalledShard> stalled;

  auto find_shard(std::string_view shard_id) const noexcept -> const ShardCursor*;
  auto find_stalled(std::string_view shard_id) const noexcept -> const StalledShard*;
  bool empty() const noexcept { return segment_id.empty() && shards.empty() && stalled.empty(); }

  bool operator==(const Checkpoint&) const = default;
};

[[nodiscard]] auto format_checkpoint(const Checkpoint& cp) -> std::string;

/** \brief Parses format_checkpoint output; data_integrity naming the offending line otherwise. */
[[nodiscard]] auto parse_checkpoint(std::string_view text) -> std::expected<Checkpoint, core::error>;

/** \brief Single-line opaque form of a checkpoint, for callers resuming without a store. */
[[nodiscard]] auto to_continuation_token(const Checkpoint& cp) -> std::string;
[[nodiscard]] auto from_continuation_token(std::string_view token) -> std::expected<Checkpoint, core::error>;

/** \brief Percent-encoding used by the checkpoint format (exposed for file naming). */
auto percent_encode(std::string_view raw) -> std::string;
auto percent_decode(std::string_view enc) -> std::expected<std::string, core::error>;

} // namespace blobfeed::feed
