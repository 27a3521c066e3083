// === Worker Pool =============================================================
//
// Fixed-size pool of background threads used for network completions and the
// travel-time ranking stage. Submission never blocks the caller.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "place_discovery/logging.hpp"

namespace place_discovery {

/**
 * @brief FIFO task pool backed by a fixed set of std::thread workers.
 *
 * Tasks that block on a deadline occupy their worker until it passes; there
 * is no work stealing, so queued tasks wait behind them.
 */
class WorkerPool final {
  public:
    using Task = std::function<void()>;

    explicit WorkerPool(std::size_t thread_count);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue @p task for execution on a worker thread.
     *
     * @throws std::runtime_error when the pool has been shut down.
     */
    void submit(Task task);

    [[nodiscard]] std::size_t thread_count() const noexcept;

    /** @brief Run every queued task, then join the workers. Idempotent. */
    void shutdown();

  private:
    void worker_loop();

    std::mutex mutex_;
    std::condition_variable cv_tasks_;
    std::deque<Task> queue_tasks_;
    std::vector<std::thread> list_threads_;
    bool flag_stopping_{false};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace place_discovery
