#include "blobfeed/feed/sequencer.hpp"

#include <algorithm>
#include <future>

#include "blobfeed/log.hpp"

namespace blobfeed::feed {

using core::error;
using core::error_code;

namespace {

void upsert(std::vector<ShardCursor>& cursors, const ShardCursor& c) {
  auto it = std::find_if(cursors.begin(), cursors.end(),
                         [&](const ShardCursor& x) { return x.shard_id == c.shard_id; });
  if (it == cursors.end()) cursors.push_back(c);
  else *it = c;
}

bool stalled_in(const Checkpoint& cp, std::string_view segment_id, std::string_view shard_id) {
  const auto* s = cp.find_stalled(shard_id);
  return s != nullptr && s->segment_id == segment_id;
}

} // namespace

auto to_string(FeedState s) noexcept -> std::string_view {
  switch (s) {
    case FeedState::idle: return "idle";
    case FeedState::resuming: return "resuming";
    case FeedState::polling: return "polling";
    case FeedState::draining: return "draining";
    case FeedState::committing: return "committing";
    case FeedState::waiting: return "waiting";
    case FeedState::stopped: return "stopped";
  }
  return "unknown";
}

FeedSequencer::FeedSequencer(std::shared_ptr<SegmentCatalog> catalog, std::shared_ptr<ShardReader> reader,
                             std::shared_ptr<CursorStore> store, FeedOptions options, core::CancellationToken cancel)
    : catalog_(std::move(catalog)),
      reader_(std::move(reader)),
      store_(std::move(store)),
      options_(std::move(options)),
      cancel_(std::move(cancel)),
      pool_(options_.shard_concurrency) {}

FeedSequencer::~FeedSequencer() = default;

auto FeedSequencer::create(std::shared_ptr<BlobClient> client, std::shared_ptr<CursorStore> store,
                           FeedOptions options, core::CancellationToken cancel)
    -> std::expected<std::unique_ptr<FeedSequencer>, error> {
  if (auto v = validate(options); !v) return std::unexpected(v.error());
  CatalogOptions cat = options.catalog;
  if (!cat.start_time) cat.start_time = options.start_time;
  if (!cat.end_time) cat.end_time = options.end_time;
  auto catalog = std::make_shared<SegmentCatalog>(client, std::move(cat));
  auto reader = std::make_shared<ShardReader>(client, options.reader, cancel);
  return std::make_unique<FeedSequencer>(std::move(catalog), std::move(reader), std::move(store),
                                         std::move(options), std::move(cancel));
}

auto FeedSequencer::checkpoint() const -> Checkpoint {
  std::lock_guard<std::mutex> lk(cp_mu_);
  return committed_;
}

auto FeedSequencer::resume() -> std::expected<void, error> {
  set_state(FeedState::resuming);
  auto loaded = store_->load(options_.feed_identity);
  if (!loaded) return std::unexpected(loaded.error());
  Checkpoint cp;
  if (*loaded) {
    cp = std::move(**loaded);
  } else if (options_.continuation_token) {
    auto t = from_continuation_token(*options_.continuation_token);
    if (!t) return std::unexpected(t.error());
    cp = std::move(*t);
    cp.generation = 0;
  }
  {
    std::lock_guard<std::mutex> lk(cp_mu_);
    committed_ = cp;
  }
  shards_.clear();
  listing_.clear();
  segment_open_ = false;
  resumed_ = true;
  BLOBFEED_LOG_INFO("feed {} resuming at segment '{}' (generation {}, {} stalled shard(s))", options_.feed_identity,
                    cp.segment_id, cp.generation, cp.stalled.size());
  return {};
}

void FeedSequencer::reset_progress() {
  shards_.clear();
  listing_.clear();
  segment_open_ = false;
  resumed_ = false;
}

auto FeedSequencer::open_segment() -> std::expected<void, error> {
  if (committed_.segment_id.empty()) {
    auto segs = catalog_->list_segments_from(std::nullopt);
    if (!segs) return std::unexpected(segs.error());
    if (segs->empty()) return {};
    Checkpoint next = committed_;
    next.segment_id = segs->front().id;
    next.shards.clear();
    if (auto c = commit(std::move(next)); !c) return c;
    BLOBFEED_LOG_INFO("feed {} starting at segment {}", options_.feed_identity, committed_.segment_id);
  }
  shards_.clear();
  listing_.clear();
  segment_open_ = true;
  return {};
}

auto FeedSequencer::refresh_segment() -> std::expected<Segment, error> {
  auto seg = catalog_->segment(committed_.segment_id);
  if (!seg) return std::unexpected(seg.error());
  auto listing = catalog_->shards_of(seg->id);
  if (!listing) return std::unexpected(listing.error());

  for (const auto& shard : *listing) {
    auto it = std::find_if(shards_.begin(), shards_.end(),
                           [&](const ShardState& st) { return st.session.shard_id() == shard.id; });
    if (it != shards_.end()) {
      reader_->refresh(it->session, shard);
      continue;
    }
    if (stalled_in(committed_, seg->id, shard.id)) continue;
    const auto* saved = committed_.find_shard(shard.id);
    auto session = reader_->open(shard, saved ? *saved : ShardCursor{shard.id, {}, 0, 0});
    if (!session) return std::unexpected(session.error());
    shards_.push_back(ShardState{std::move(*session), {}, false});
  }
  listing_ = std::move(*listing);
  return seg;
}

auto FeedSequencer::fill_buffers() -> std::expected<void, error> {
  set_state(FeedState::draining);
  const auto deadline = std::chrono::steady_clock::now() + options_.batch_max_wait;
  const std::size_t want = options_.batch_max_events;
  for (auto& st : shards_) st.exhausted = st.session.stalled();

  while (true) {
    std::vector<std::size_t> todo;
    for (std::size_t i = 0; i < shards_.size(); ++i) {
      if (!shards_[i].exhausted && shards_[i].buffer.size() < want) todo.push_back(i);
    }
    if (todo.empty()) break;

    std::vector<std::future<std::expected<PullResult, error>>> pending;
    pending.reserve(todo.size());
    for (auto i : todo) {
      auto& st = shards_[i];
      const std::size_t n = want - st.buffer.size();
      pending.push_back(pool_.submit([this, &st, n] { return reader_->pull(st.session, n); }));
    }

    std::optional<error> fatal;
    for (std::size_t k = 0; k < todo.size(); ++k) {
      auto r = pending[k].get();
      auto& st = shards_[todo[k]];
      if (!r) {
        st.exhausted = true;
        if (r.error().code == error_code::schema_mismatch) {
          fatal = r.error();
        } else if (!st.session.stalled()) {
          BLOBFEED_LOG_WARN("shard {} deferred to a later poll: {}", st.session.shard_id(), core::describe(r.error()));
        }
        continue;
      }
      for (auto& pe : r->events) st.buffer.push_back(std::move(pe));
      if (r->exhausted_for_now) st.exhausted = true;
    }
    if (fatal) return std::unexpected(*fatal);

    std::size_t total = 0;
    for (const auto& st : shards_) total += st.buffer.size();
    if (total >= want || std::chrono::steady_clock::now() >= deadline) break;
  }
  return {};
}

bool FeedSequencer::filtered_out(const Event& ev) const {
  if (ev.is_control() && !options_.deliver_control_events) return true;
  if (options_.container && !ev.is_control() && ev.container() != *options_.container) return true;
  if (options_.start_time && ev.event_time < *options_.start_time) return true;
  if (options_.end_time && ev.event_time >= *options_.end_time) return true;
  return false;
}

auto FeedSequencer::commit(Checkpoint next) -> std::expected<void, error> {
  set_state(FeedState::committing);
  auto backoff = options_.commit_retry.backoff_initial;
  error last{};
  for (std::uint32_t attempt = 1; attempt <= options_.commit_retry.max_attempts; ++attempt) {
    auto r = store_->save(options_.feed_identity, next);
    if (r) {
      next.generation += 1;
      BLOBFEED_LOG_DEBUG("feed {} committed generation {} at segment {}", options_.feed_identity, next.generation,
                         next.segment_id);
      std::lock_guard<std::mutex> lk(cp_mu_);
      committed_ = std::move(next);
      return {};
    }
    last = r.error();
    if (last.code == error_code::conflict) {
      BLOBFEED_LOG_ERROR("feed {} checkpoint conflict: {}", options_.feed_identity, core::describe(last));
      return std::unexpected(last);
    }
    if (attempt == options_.commit_retry.max_attempts) break;
    BLOBFEED_LOG_WARN("feed {} commit failed (attempt {}/{}): {}; retrying in {}ms", options_.feed_identity, attempt,
                      options_.commit_retry.max_attempts, core::describe(last), backoff.count());
    if (cancel_.wait_for(backoff)) {
      return std::unexpected(error{error_code::cancelled, "commit retry cancelled", "feed.sequencer"});
    }
    backoff = std::min(backoff * 2, options_.commit_retry.backoff_max);
  }
  return std::unexpected(last);
}

bool FeedSequencer::segment_complete(const Segment& seg, const std::vector<Shard>& listing) const {
  if (!seg.finalized) return false;
  for (const auto& shard : listing) {
    if (stalled_in(committed_, seg.id, shard.id)) continue;
    auto it = std::find_if(shards_.begin(), shards_.end(),
                           [&](const ShardState& st) { return st.session.shard_id() == shard.id; });
    if (it == shards_.end()) return false;
    if (!it->buffer.empty()) return false;
    if (it->session.stalled()) continue;
    if (it->session.has_unread()) return false;
  }
  return true;
}

auto FeedSequencer::advance_segment() -> std::expected<bool, error> {
  auto segs = catalog_->list_segments_from(committed_.segment_id);
  if (!segs) return std::unexpected(segs.error());
  auto it = std::find_if(segs->begin(), segs->end(),
                         [&](const Segment& s) { return s.id > committed_.segment_id; });
  if (it == segs->end()) return false;

  const std::string done = committed_.segment_id;
  Checkpoint next = committed_;
  next.segment_id = it->id;
  next.shards.clear();
  if (auto c = commit(std::move(next)); !c) return std::unexpected(c.error());
  BLOBFEED_LOG_INFO("feed {} segment {} complete, advancing to {}", options_.feed_identity, done,
                    committed_.segment_id);
  shards_.clear();
  listing_.clear();
  segment_open_ = false;
  return true;
}

auto FeedSequencer::poll_once(const FeedConsumer& consumer) -> std::expected<PollOutcome, error> {
  std::lock_guard<std::mutex> lk(poll_mu_);
  PollOutcome out;

  if (!resumed_) {
    if (auto r = resume(); !r) {
      set_state(FeedState::idle);
      return std::unexpected(r.error());
    }
  }
  set_state(FeedState::polling);
  if (!segment_open_) {
    if (auto r = open_segment(); !r) {
      reset_progress();
      return std::unexpected(r.error());
    }
    if (!segment_open_) {
      out.caught_up = true;
      return out;
    }
  }

  auto seg = refresh_segment();
  if (!seg) {
    BLOBFEED_LOG_WARN("feed {} segment {} refresh failed: {}", options_.feed_identity, committed_.segment_id,
                      core::describe(seg.error()));
    return std::unexpected(seg.error());
  }
  out.segment_id = seg->id;

  if (auto f = fill_buffers(); !f) {
    reset_progress();
    return std::unexpected(f.error());
  }

  // Round-robin merge in shard order; per-shard order is preserved.
  std::vector<PositionedEvent> batch;
  std::vector<std::optional<ShardCursor>> last(shards_.size());
  for (bool progress = true; progress && batch.size() < options_.batch_max_events;) {
    progress = false;
    for (std::size_t i = 0; i < shards_.size() && batch.size() < options_.batch_max_events; ++i) {
      auto& buf = shards_[i].buffer;
      if (buf.empty()) continue;
      last[i] = buf.front().cursor;
      batch.push_back(std::move(buf.front()));
      buf.pop_front();
      progress = true;
    }
  }

  FeedNotice notice;
  notice.kind = FeedNotice::Kind::events;
  notice.segment_id = seg->id;
  for (auto& pe : batch) {
    if (filtered_out(pe.event)) {
      BLOBFEED_LOG_TRACE("skipping event {} ({})", pe.event.id, blobfeed::to_string(pe.event.type));
      ++out.skipped;
      continue;
    }
    notice.events.push_back(std::move(pe));
  }

  Checkpoint next = committed_;
  next.segment_id = seg->id;
  bool new_stall = false;
  for (std::size_t i = 0; i < shards_.size(); ++i) {
    const auto& st = shards_[i];
    if (st.session.stalled() && st.buffer.empty()) {
      if (!next.find_stalled(st.session.shard_id())) {
        std::erase_if(next.shards, [&](const ShardCursor& c) { return c.shard_id == st.session.shard_id(); });
        next.stalled.push_back(StalledShard{seg->id, st.session.cursor(), core::describe(*st.session.stall_error())});
        new_stall = true;
      }
      continue;
    }
    if (last[i]) upsert(next.shards, *last[i]);
    else if (st.buffer.empty()) upsert(next.shards, st.session.cursor());
  }

  if (consumer && new_stall) {
    FeedNotice stalled_notice;
    stalled_notice.kind = FeedNotice::Kind::shard_stalled;
    stalled_notice.segment_id = seg->id;
    stalled_notice.stalled = next.stalled;
    if (auto r = consumer(stalled_notice); !r) {
      BLOBFEED_LOG_WARN("consumer rejected stall notice: {}", core::describe(r.error()));
      reset_progress();
      return std::unexpected(r.error());
    }
  }
  if (consumer && !notice.events.empty()) {
    notice.stalled = next.stalled;
    if (auto r = consumer(notice); !r) {
      BLOBFEED_LOG_WARN("consumer rejected batch of {} event(s): {}; redelivering from last checkpoint",
                        notice.events.size(), core::describe(r.error()));
      reset_progress();
      return std::unexpected(r.error());
    }
  }
  out.delivered = notice.events.size();

  if (!(next == committed_)) {
    if (auto c = commit(std::move(next)); !c) {
      reset_progress();
      return std::unexpected(c.error());
    }
    out.committed = true;
  }

  if (segment_complete(*seg, listing_)) {
    auto adv = advance_segment();
    if (!adv) {
      reset_progress();
      return std::unexpected(adv.error());
    }
    out.segment_advanced = *adv;
  }
  out.caught_up = batch.empty() && !out.segment_advanced && !new_stall;
  set_state(FeedState::polling);
  return out;
}

auto FeedSequencer::run(const FeedConsumer& consumer) -> std::expected<void, error> {
  BLOBFEED_LOG_INFO("feed {} running (poll interval {}ms, {} fetch worker(s))", options_.feed_identity,
                    options_.poll_interval.count(), pool_.num_threads());
  while (!cancel_.stop_requested()) {
    auto r = poll_once(consumer);
    if (!r) {
      const auto code = r.error().code;
      if (code == error_code::schema_mismatch || code == error_code::conflict) {
        BLOBFEED_LOG_ERROR("feed {} stopping: {}", options_.feed_identity, core::describe(r.error()));
        set_state(FeedState::stopped);
        return std::unexpected(r.error());
      }
      BLOBFEED_LOG_WARN("feed {} poll failed: {}; retrying in {}ms", options_.feed_identity,
                        core::describe(r.error()), options_.poll_interval.count());
      set_state(FeedState::waiting);
      if (cancel_.wait_for(options_.poll_interval)) break;
      continue;
    }
    if (r->caught_up) {
      if (consumer) {
        FeedNotice n;
        n.kind = FeedNotice::Kind::caught_up;
        n.segment_id = r->segment_id;
        n.stalled = checkpoint().stalled;
        if (auto c = consumer(n); !c) {
          BLOBFEED_LOG_WARN("consumer rejected caught-up notice: {}", core::describe(c.error()));
        }
      }
      set_state(FeedState::waiting);
      if (cancel_.wait_for(options_.poll_interval)) break;
    }
  }
  set_state(FeedState::stopped);
  BLOBFEED_LOG_INFO("feed {} stopped at segment '{}'", options_.feed_identity, checkpoint().segment_id);
  return {};
}

auto FeedSequencer::resolve_stalled(std::string_view shard_id) -> std::expected<void, error> {
  std::lock_guard<std::mutex> lk(poll_mu_);
  if (!resumed_) {
    if (auto r = resume(); !r) return r;
  }
  Checkpoint next = committed_;
  auto it = std::find_if(next.stalled.begin(), next.stalled.end(),
                         [&](const StalledShard& s) { return s.cursor.shard_id == shard_id; });
  if (it == next.stalled.end()) {
    return std::unexpected(error{error_code::not_found, "shard " + std::string(shard_id) + " is not stalled",
                                 "feed.sequencer"});
  }
  const StalledShard resolved = *it;
  next.stalled.erase(it);
  if (resolved.segment_id == next.segment_id) upsert(next.shards, resolved.cursor);
  if (auto c = commit(std::move(next)); !c) return c;
  std::erase_if(shards_, [&](const ShardState& st) { return st.session.shard_id() == shard_id; });
  BLOBFEED_LOG_INFO("feed {} shard {} resolved; resuming at {}@{}", options_.feed_identity, shard_id,
                    resolved.cursor.chunk, resolved.cursor.byte_offset);
  set_state(FeedState::idle);
  return {};
}

} // namespace blobfeed::feed
