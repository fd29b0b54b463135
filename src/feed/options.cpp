#include "blobfeed/feed/options.hpp"

#include "blobfeed/core/platform_utils.hpp"

namespace blobfeed::feed {

using core::error;
using core::error_code;

namespace {

auto invalid(std::string msg) -> std::unexpected<error> {
  return std::unexpected(error{error_code::config_invalid, std::move(msg), "feed.options"});
}

auto env_u64(const char* name) -> std::expected<std::optional<std::uint64_t>, error> {
  auto v = core::safe_getenv(name);
  if (!v || v->empty()) return std::optional<std::uint64_t>{};
  auto n = core::parse_u64(*v);
  if (!n) return invalid(std::string(name) + "=\"" + *v + "\" is not an unsigned integer");
  return std::optional<std::uint64_t>{*n};
}

auto env_time(const char* name) -> std::expected<std::optional<core::timestamp>, error> {
  auto v = core::safe_getenv(name);
  if (!v || v->empty()) return std::optional<core::timestamp>{};
  auto t = core::parse_timestamp(*v);
  if (!t) return invalid(std::string(name) + "=\"" + *v + "\": " + t.error().message);
  return std::optional<core::timestamp>{*t};
}

} // namespace

auto feed_options_from_env(FeedOptions base) -> std::expected<FeedOptions, error> {
  auto poll = env_u64("BLOBFEED_POLL_INTERVAL_MS");
  if (!poll) return std::unexpected(poll.error());
  if (*poll) base.poll_interval = std::chrono::milliseconds(static_cast<std::int64_t>(**poll));

  auto conc = env_u64("BLOBFEED_SHARD_CONCURRENCY");
  if (!conc) return std::unexpected(conc.error());
  if (*conc) base.shard_concurrency = static_cast<std::size_t>(**conc);

  auto batch = env_u64("BLOBFEED_BATCH_MAX_EVENTS");
  if (!batch) return std::unexpected(batch.error());
  if (*batch) base.batch_max_events = static_cast<std::size_t>(**batch);

  auto wait = env_u64("BLOBFEED_BATCH_MAX_WAIT_MS");
  if (!wait) return std::unexpected(wait.error());
  if (*wait) base.batch_max_wait = std::chrono::milliseconds(static_cast<std::int64_t>(**wait));

  auto start = env_time("BLOBFEED_START_TIME");
  if (!start) return std::unexpected(start.error());
  if (*start) base.start_time = **start;

  auto end = env_time("BLOBFEED_END_TIME");
  if (!end) return std::unexpected(end.error());
  if (*end) base.end_time = **end;

  if (auto c = core::safe_getenv("BLOBFEED_CONTAINER"); c && !c->empty()) base.container = *c;
  return base;
}

auto validate(const FeedOptions& o) -> std::expected<void, error> {
  if (o.feed_identity.empty()) return invalid("feed_identity must not be empty");
  if (o.shard_concurrency == 0) return invalid("shard_concurrency must be at least 1");
  if (o.batch_max_events == 0) return invalid("batch_max_events must be at least 1");
  if (o.poll_interval.count() < 0) return invalid("poll_interval must not be negative");
  if (o.batch_max_wait.count() < 0) return invalid("batch_max_wait must not be negative");
  if (o.start_time && o.end_time && *o.start_time >= *o.end_time) {
    return invalid("start_time " + core::format_timestamp(*o.start_time) + " is not before end_time " +
                   core::format_timestamp(*o.end_time));
  }
  if (o.container && o.container->empty()) return invalid("container filter must not be empty");
  if (o.reader.range_bytes == 0) return invalid("reader.range_bytes must be positive");
  if (o.reader.max_attempts == 0) return invalid("reader.max_attempts must be at least 1");
  if (o.reader.backoff_initial > o.reader.backoff_max) return invalid("reader.backoff_initial exceeds backoff_max");
  if (o.reader.limits.max_block_bytes == 0 || o.reader.limits.max_block_records == 0) {
    return invalid("reader block limits must be positive");
  }
  if (o.commit_retry.max_attempts == 0) return invalid("commit_retry.max_attempts must be at least 1");
  if (o.catalog.root.empty() || o.catalog.root.back() != '/') return invalid("catalog.root must end with '/'");
  return {};
}

} // namespace blobfeed::feed
