// === Dispatch Queue ==========================================================
//
// Thread-safe FIFO of closures standing in for the UI-owning context. Any
// thread may post; only the owning loop drains the queue, so everything posted
// here runs on that single thread in posting order.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>

#include "place_discovery/logging.hpp"

#include "place_discovery/types.hpp"

namespace place_discovery {

class DispatchQueue final {
  public:
    using Task = std::function<void()>;

    DispatchQueue();

    /** @brief Enqueue @p task for the owning loop. */
    void post(Task task);

    /**
     * @brief Run the tasks queued at call time on the calling thread.
     *
     * Tasks posted while draining wait for the next call. A task that throws
     * std::exception is logged and the rest of the batch still runs.
     * @return Number of tasks executed, failed ones included.
     */
    std::size_t run_pending();

    /** @brief Block until at least one task is queued or @p timeout elapses. */
    [[nodiscard]] bool wait_for_pending(Duration timeout);

    [[nodiscard]] std::size_t pending_count() const;

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_posted_;
    std::deque<Task> queue_tasks_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace place_discovery
