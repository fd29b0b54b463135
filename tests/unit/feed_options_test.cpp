#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <string>

#include "blobfeed/feed/options.hpp"

using namespace blobfeed::feed;
using blobfeed::core::error_code;
using blobfeed::core::parse_timestamp;

namespace {

const char* const kVars[] = {
  "BLOBFEED_POLL_INTERVAL_MS", "BLOBFEED_SHARD_CONCURRENCY", "BLOBFEED_BATCH_MAX_EVENTS",
  "BLOBFEED_BATCH_MAX_WAIT_MS", "BLOBFEED_START_TIME", "BLOBFEED_END_TIME", "BLOBFEED_CONTAINER",
};

void set_env_var(const char* name, const char* value) {
#if defined(_WIN32)
  _putenv_s(name, value ? value : "");
#else
  if (value) setenv(name, value, 1); else unsetenv(name);
#endif
}

// Clears every knob on entry and exit.
struct EnvGuard {
  EnvGuard() { clear(); }
  ~EnvGuard() { clear(); }
  static void clear() {
    for (const char* v : kVars) set_env_var(v, nullptr);
  }
};

} // namespace

TEST_CASE("defaults validate", "[options]") {
  FeedOptions o;
  REQUIRE(validate(o).has_value());
  REQUIRE(o.feed_identity == "default");
  REQUIRE(o.shard_concurrency == 4);
  REQUIRE(o.batch_max_events == 1000);
  REQUIRE(o.catalog.root == "$blobchangefeed/");
  REQUIRE_FALSE(o.deliver_control_events);
}

TEST_CASE("environment overlays the base options", "[options][env]") {
  EnvGuard guard;
  FeedOptions base;
  base.feed_identity = "orders";
  set_env_var("BLOBFEED_POLL_INTERVAL_MS", "250");
  set_env_var("BLOBFEED_SHARD_CONCURRENCY", "8");
  set_env_var("BLOBFEED_BATCH_MAX_EVENTS", "50");
  set_env_var("BLOBFEED_START_TIME", "2024-01-01T00:00:00Z");
  set_env_var("BLOBFEED_CONTAINER", "photos");

  auto o = feed_options_from_env(base);
  REQUIRE(o.has_value());
  REQUIRE(o->feed_identity == "orders");
  REQUIRE(o->poll_interval == std::chrono::milliseconds(250));
  REQUIRE(o->shard_concurrency == 8);
  REQUIRE(o->batch_max_events == 50);
  REQUIRE(o->batch_max_wait == std::chrono::seconds(1));
  REQUIRE(o->start_time == parse_timestamp("2024-01-01T00:00:00Z").value());
  REQUIRE_FALSE(o->end_time.has_value());
  REQUIRE(o->container == "photos");
}

TEST_CASE("empty variables leave the base untouched", "[options][env]") {
  EnvGuard guard;
  set_env_var("BLOBFEED_BATCH_MAX_EVENTS", "");
  auto o = feed_options_from_env();
  REQUIRE(o.has_value());
  REQUIRE(o->batch_max_events == 1000);
}

TEST_CASE("unparsable variables are config_invalid", "[options][env]") {
  EnvGuard guard;
  SECTION("number") {
    set_env_var("BLOBFEED_SHARD_CONCURRENCY", "four");
    auto o = feed_options_from_env();
    REQUIRE_FALSE(o.has_value());
    REQUIRE(o.error().code == error_code::config_invalid);
    REQUIRE(o.error().message.find("BLOBFEED_SHARD_CONCURRENCY") != std::string::npos);
  }
  SECTION("timestamp") {
    set_env_var("BLOBFEED_END_TIME", "tomorrow");
    auto o = feed_options_from_env();
    REQUIRE_FALSE(o.has_value());
    REQUIRE(o.error().code == error_code::config_invalid);
  }
}

TEST_CASE("inconsistent options are config_invalid", "[options]") {
  auto rejects = [](FeedOptions o) {
    auto r = validate(o);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == error_code::config_invalid);
  };
  { FeedOptions o; o.feed_identity.clear(); rejects(o); }
  { FeedOptions o; o.shard_concurrency = 0; rejects(o); }
  { FeedOptions o; o.batch_max_events = 0; rejects(o); }
  { FeedOptions o; o.poll_interval = std::chrono::milliseconds(-1); rejects(o); }
  { FeedOptions o; o.container = ""; rejects(o); }
  { FeedOptions o; o.reader.range_bytes = 0; rejects(o); }
  { FeedOptions o; o.reader.max_attempts = 0; rejects(o); }
  { FeedOptions o; o.reader.backoff_initial = std::chrono::seconds(60); rejects(o); }
  { FeedOptions o; o.reader.limits.max_block_records = 0; rejects(o); }
  { FeedOptions o; o.commit_retry.max_attempts = 0; rejects(o); }
  { FeedOptions o; o.catalog.root = "$blobchangefeed"; rejects(o); }
  {
    FeedOptions o;
    o.start_time = parse_timestamp("2024-01-02T00:00:00Z").value();
    o.end_time = parse_timestamp("2024-01-01T00:00:00Z").value();
    rejects(o);
  }
}
