#pragma once

/** \file shard_reader.hpp
 *  \brief Incremental reader of one shard: ranged fetches, block decoding, per-event cursors.
 *
 * A shard is an ordered series of chunk blobs, each an Avro container. The
 * session fetches at most ShardReaderOptions::range_bytes per request, parses
 * each chunk header once, and decodes whole blocks only. Every returned event
 * carries the cursor that resumes immediately after it:
 *   - inside a block: {chunk, block start, records delivered so far}
 *   - after a block's last record: {chunk, next block start, 0}
 *
 * Fetch failures with unavailable/timed_out are retried with exponential
 * backoff and then reported as transient_fetch; the session stays at its last
 * whole block so pulling again later is always safe. A corrupt block stalls
 * the session: the error is returned now and on every later pull.
 *
 * Thread-safety: a session is used by one task at a time; distinct sessions
 * may be pulled concurrently through the same reader.
 */

#include <chrono>
#include <cstdint>
#include <deque>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "blobfeed/avro/container.hpp"
#include "blobfeed/core/cancellation.hpp"
#include "blobfeed/error.hpp"
#include "blobfeed/event.hpp"
#include "blobfeed/feed/blob_client.hpp"
#include "blobfeed/feed/checkpoint.hpp"
#include "blobfeed/feed/segment_catalog.hpp"

namespace blobfeed::feed {

struct ShardReaderOptions {
  std::uint64_t range_bytes{4u << 20};
  std::uint32_t max_attempts{4};
  std::chrono::milliseconds backoff_initial{100};
  std::chrono::milliseconds backoff_max{std::chrono::seconds(5)};
  std::chrono::milliseconds fetch_timeout{std::chrono::seconds(30)};
  avro::BlockLimits limits{};
};

struct PositionedEvent {
  Event event;
  ShardCursor cursor;   /**< resume point right after this event */
};

struct PullResult {
  std::vector<PositionedEvent> events;
  ShardCursor cursor;               /**< resume point after the last returned event */
  bool exhausted_for_now{false};    /**< no further complete block is available yet */
};

class ShardSession {
public:
  const std::string& shard_id() const noexcept { return shard_.id; }
  const Shard& shard() const noexcept { return shard_; }
  /** Resume point after the last event handed out by pull(). */
  const ShardCursor& cursor() const noexcept { return cursor_; }
  bool stalled() const noexcept { return stall_.has_value(); }
  const std::optional<core::error>& stall_error() const noexcept { return stall_; }
  /** True while decoded events are pending or listed bytes lie beyond the cursor. */
  bool has_unread() const noexcept;

private:
  friend class ShardReader;

  Shard shard_;
  ShardCursor cursor_;
  std::shared_ptr<const avro::ContainerHeader> header_;
  std::optional<avro::BlockStream> stream_;
  std::deque<PositionedEvent> pending_;
  std::uint64_t skip_{0};   // records of the first block already delivered before open()
  std::optional<core::error> stall_;
};

class ShardReader {
public:
  ShardReader(std::shared_ptr<BlobClient> client, ShardReaderOptions options = {},
              core::CancellationToken cancel = {});

  /** \brief Session positioned at \p cursor (an empty chunk means the start of the shard).
   *  not_found when the cursor names a chunk the listing does not have. */
  [[nodiscard]] auto open(const Shard& shard, const ShardCursor& cursor) const
      -> std::expected<ShardSession, core::error>;

  /** \brief Returns up to \p max_events further events of the session. */
  [[nodiscard]] auto pull(ShardSession& session, std::size_t max_events) const
      -> std::expected<PullResult, core::error>;

  /** \brief Adopts a newer listing of the session's shard (grown chunks, new chunks). */
  void refresh(ShardSession& session, const Shard& shard) const;

  const ShardReaderOptions& options() const noexcept { return options_; }

private:
  auto fetch(const std::string& blob, std::uint64_t offset, std::uint64_t length) const
      -> std::expected<std::vector<std::uint8_t>, core::error>;
  /** Parses the current chunk's header; false when it is not fully written yet. */
  auto load_header(ShardSession& s, const ChunkInfo& chunk) const -> std::expected<bool, core::error>;
  auto decode_block(ShardSession& s, avro::DecodedBlock block) const -> std::expected<void, core::error>;
  void stall(ShardSession& s, const core::error& e) const;

  std::shared_ptr<BlobClient> client_;
  ShardReaderOptions options_;
  core::CancellationToken cancel_;
};

} // namespace blobfeed::feed
