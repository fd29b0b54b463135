#pragma once

/** \file cancellation.hpp
 *  \brief Stop signal shared between a long-running loop and its owner.
 *
 * Copies share state. wait_for() is the live-tail suspension point: it returns
 * early (true) as soon as a stop is requested.
 */

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace blobfeed::core {

class CancellationToken {
public:
  CancellationToken() : state_(std::make_shared<State>()) {}

  void request_stop() noexcept {
    {
      std::lock_guard<std::mutex> lk(state_->mu);
      state_->stopped = true;
    }
    state_->cv.notify_all();
  }

  [[nodiscard]] bool stop_requested() const noexcept {
    std::lock_guard<std::mutex> lk(state_->mu);
    return state_->stopped;
  }

  /** \brief Sleeps up to \p d; returns true if stopped (before or during the wait). */
  template <class Rep, class Period>
  bool wait_for(std::chrono::duration<Rep, Period> d) const {
    std::unique_lock<std::mutex> lk(state_->mu);
    return state_->cv.wait_for(lk, d, [this] { return state_->stopped; });
  }

private:
  struct State {
    mutable std::mutex mu;
    std::condition_variable cv;
    bool stopped{false};
  };
  std::shared_ptr<State> state_;
};

} // namespace blobfeed::core
