#pragma once

/** \file sequencer.hpp
 *  \brief Turns the segment/shard hierarchy into one resumable stream of event batches.
 *
 * Each poll works on the oldest unfinished segment of the checkpoint:
 *   resume   load the checkpoint (store, else continuation token) and open one
 *            shard session per shard at its cursor
 *   poll     re-read the segment manifest and shard listings
 *   drain    pull all shards concurrently on the fetch pool, merge round-robin
 *            by shard order into a batch of at most batch_max_events
 *   deliver  hand the filtered batch to the consumer
 *   commit   save the checkpoint: per shard, the cursor right after its last
 *            delivered (or filtered) event
 * A segment is complete once it is finalized, its listing was refreshed after
 * finalization, and every non-stalled shard has no unread bytes or buffered
 * events; the checkpoint then moves to the next segment.
 *
 * Delivery is at-least-once: a consumer error or a failed commit drops all
 * in-memory progress and the next poll resumes from the last committed
 * checkpoint.
 *
 * Thread-safety: poll_once/run/resolve_stalled are serialized internally;
 * state() and checkpoint() may be called from any thread. A consumer must not
 * call resolve_stalled from inside its callback.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "blobfeed/core/cancellation.hpp"
#include "blobfeed/core/fetch_pool.hpp"
#include "blobfeed/error.hpp"
#include "blobfeed/feed/checkpoint.hpp"
#include "blobfeed/feed/cursor_store.hpp"
#include "blobfeed/feed/options.hpp"
#include "blobfeed/feed/segment_catalog.hpp"
#include "blobfeed/feed/shard_reader.hpp"

namespace blobfeed::feed {

enum class FeedState : std::uint8_t { idle, resuming, polling, draining, committing, waiting, stopped };

auto to_string(FeedState s) noexcept -> std::string_view;

struct FeedNotice {
  enum class Kind : std::uint8_t { events, caught_up, shard_stalled };

  Kind kind{Kind::events};
  std::string segment_id;
  std::vector<PositionedEvent> events;    /**< round-robin by shard; per-shard order preserved */
  std::vector<StalledShard> stalled;      /**< every unresolved stalled shard */
};

/** Returning an error withholds the commit; the same events are delivered again. */
using FeedConsumer = std::function<std::expected<void, core::error>(const FeedNotice&)>;

struct PollOutcome {
  std::size_t delivered{0};     /**< events handed to the consumer */
  std::size_t skipped{0};       /**< events consumed by filters */
  bool committed{false};
  bool segment_advanced{false};
  bool caught_up{false};        /**< nothing new was available */
  std::string segment_id;
};

class FeedSequencer {
public:
  FeedSequencer(std::shared_ptr<SegmentCatalog> catalog, std::shared_ptr<ShardReader> reader,
                std::shared_ptr<CursorStore> store, FeedOptions options, core::CancellationToken cancel = {});
  ~FeedSequencer();

  FeedSequencer(const FeedSequencer&) = delete;
  FeedSequencer& operator=(const FeedSequencer&) = delete;

  /** \brief Validates \p options and wires a catalog and reader over \p client. */
  static auto create(std::shared_ptr<BlobClient> client, std::shared_ptr<CursorStore> store, FeedOptions options,
                     core::CancellationToken cancel = {})
      -> std::expected<std::unique_ptr<FeedSequencer>, core::error>;

  /** \brief One resume/poll/drain/deliver/commit cycle. */
  [[nodiscard]] auto poll_once(const FeedConsumer& consumer) -> std::expected<PollOutcome, core::error>;

  /** \brief Polls until the token given at construction is requested; waits
   *  poll_interval whenever caught up. The same token interrupts the fetch and
   *  commit backoff waits, so a stop never sits out a retry delay.
   *  Returns early only for errors that cannot heal by retrying (schema_mismatch, conflict). */
  [[nodiscard]] auto run(const FeedConsumer& consumer) -> std::expected<void, core::error>;

  FeedState state() const noexcept { return state_.load(std::memory_order_acquire); }

  /** \brief Last committed checkpoint. */
  auto checkpoint() const -> Checkpoint;

  /** \brief Drops the stalled entry of \p shard_id and commits; a shard of the current
   *  segment resumes from its recorded cursor on the next poll. not_found if not stalled. */
  [[nodiscard]] auto resolve_stalled(std::string_view shard_id) -> std::expected<void, core::error>;

  const FeedOptions& options() const noexcept { return options_; }

private:
  struct ShardState {
    ShardSession session;
    std::deque<PositionedEvent> buffer;   // pulled, not yet delivered
    bool exhausted{false};                // nothing more available during this poll
  };

  auto resume() -> std::expected<void, core::error>;
  auto open_segment() -> std::expected<void, core::error>;
  auto refresh_segment() -> std::expected<Segment, core::error>;
  auto fill_buffers() -> std::expected<void, core::error>;
  auto commit(Checkpoint next) -> std::expected<void, core::error>;
  auto advance_segment() -> std::expected<bool, core::error>;
  bool segment_complete(const Segment& seg, const std::vector<Shard>& listing) const;
  bool filtered_out(const Event& ev) const;
  void reset_progress();
  void set_state(FeedState s) noexcept { state_.store(s, std::memory_order_release); }

  std::shared_ptr<SegmentCatalog> catalog_;
  std::shared_ptr<ShardReader> reader_;
  std::shared_ptr<CursorStore> store_;
  FeedOptions options_;
  core::CancellationToken cancel_;
  core::FetchPool pool_;

  std::mutex poll_mu_;
  mutable std::mutex cp_mu_;
  Checkpoint committed_;                  // guarded by cp_mu_
  std::atomic<FeedState> state_{FeedState::idle};

  bool resumed_{false};
  bool segment_open_{false};
  std::vector<ShardState> shards_;        // manifest order of the current segment
  std::vector<Shard> listing_;            // latest listing of the current segment
};

} // namespace blobfeed::feed
