#pragma once

/** \file fetch_pool.hpp
 *  \brief Bounded worker pool for concurrent shard fetch/decode tasks.
 *
 * Centralized FIFO task queue; the worker count is the shard concurrency
 * limit, so at most that many range reads are in flight at once.
 */

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#if defined(__linux__)
#include <pthread.h>
#endif

namespace blobfeed::core {

class FetchPool {
public:
    /** \param num_threads Number of workers (0 = 1). */
    explicit FetchPool(std::size_t num_threads)
        : stop_(false) {
        num_threads = std::max<std::size_t>(1, num_threads);
        workers_.reserve(num_threads);
        for (std::size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    ~FetchPool() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) worker.join();
        }
    }

    FetchPool(const FetchPool&) = delete;
    FetchPool& operator=(const FetchPool&) = delete;

    /** \brief Submit task; the future carries its result (or exception). */
    template<typename Func>
    auto submit(Func&& func) -> std::future<std::invoke_result_t<Func>> {
        using return_type = std::invoke_result_t<Func>;
        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<Func>(func));
        auto future = task->get_future();
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw std::runtime_error("fetch pool is stopped");
            }
            tasks_.emplace_back([task] { (*task)(); });
        }
        cv_.notify_one();
        return future;
    }

    [[nodiscard]] auto num_threads() const noexcept -> std::size_t { return workers_.size(); }

private:
    auto worker_loop() -> void {
#if defined(__linux__)
        pthread_setname_np(pthread_self(), "blobfeed-fetch");
#endif
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) return;
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    bool stop_;
};

} // namespace blobfeed::core
