#pragma once

/** \file options.hpp
 *  \brief Feed configuration: typed defaults, environment overlay and validation.
 *
 * Environment knobs (read through core::safe_getenv):
 *   BLOBFEED_POLL_INTERVAL_MS, BLOBFEED_SHARD_CONCURRENCY, BLOBFEED_BATCH_MAX_EVENTS,
 *   BLOBFEED_BATCH_MAX_WAIT_MS, BLOBFEED_START_TIME, BLOBFEED_END_TIME, BLOBFEED_CONTAINER
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

#include "blobfeed/core/time.hpp"
#include "blobfeed/error.hpp"
#include "blobfeed/feed/segment_catalog.hpp"
#include "blobfeed/feed/shard_reader.hpp"

namespace blobfeed::feed {

struct CommitRetryOptions {
  std::uint32_t max_attempts{5};
  std::chrono::milliseconds backoff_initial{200};
  std::chrono::milliseconds backoff_max{std::chrono::seconds(10)};
};

struct FeedOptions {
  std::string feed_identity{"default"};
  std::optional<core::timestamp> start_time;   /**< events before are skipped */
  std::optional<core::timestamp> end_time;     /**< events at or after are skipped */
  std::chrono::milliseconds poll_interval{std::chrono::seconds(10)};
  std::size_t shard_concurrency{4};
  std::size_t batch_max_events{1000};
  std::chrono::milliseconds batch_max_wait{std::chrono::seconds(1)};
  std::optional<std::string> container;        /**< only events of this container are delivered */
  bool deliver_control_events{false};
  /** Resume point used when the store holds nothing for feed_identity. */
  std::optional<std::string> continuation_token;
  CommitRetryOptions commit_retry{};
  ShardReaderOptions reader{};
  CatalogOptions catalog{};
};

/** \brief Overlays BLOBFEED_* environment variables on \p base; config_invalid on unparsable values. */
[[nodiscard]] auto feed_options_from_env(FeedOptions base = {}) -> std::expected<FeedOptions, core::error>;

/** \brief config_invalid describing the first inconsistent value. */
[[nodiscard]] auto validate(const FeedOptions& options) -> std::expected<void, core::error>;

} // namespace blobfeed::feed
