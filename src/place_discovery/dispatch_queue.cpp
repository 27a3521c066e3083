#include "place_discovery/dispatch_queue.hpp"

#include <chrono>
#include <exception>
#include <utility>

namespace place_discovery {

DispatchQueue::DispatchQueue()
    : logger_(get_logger()) {}

void DispatchQueue::post(Task task) {
    {
        std::scoped_lock lock(mutex_);
        queue_tasks_.push_back(std::move(task));
    }
    cv_posted_.notify_all();
}

std::size_t DispatchQueue::run_pending() {
    std::deque<Task> queue_batch;
    {
        std::scoped_lock lock(mutex_);
        queue_batch.swap(queue_tasks_);
    }
    for (Task& task : queue_batch) {
        try {
            task();
        } catch (const std::exception& exc) {
            logger_->error(R"({{"component":"dispatch_queue","error":"{}"}})", exc.what());
        }
    }
    return queue_batch.size();
}

bool DispatchQueue::wait_for_pending(Duration timeout) {
    std::unique_lock lock(mutex_);
    return cv_posted_.wait_for(
        lock,
        std::chrono::duration_cast<SteadyClock::duration>(timeout),
        [this]() { return !queue_tasks_.empty(); }
    );
}

std::size_t DispatchQueue::pending_count() const {
    std::scoped_lock lock(mutex_);
    return queue_tasks_.size();
}

}  // namespace place_discovery
