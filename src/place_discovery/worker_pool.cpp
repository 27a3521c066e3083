#include "place_discovery/worker_pool.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace place_discovery {

WorkerPool::WorkerPool(std::size_t thread_count)
    : logger_(get_logger()) {
    if (thread_count == 0) {
        thread_count = 1;
    }
    list_threads_.reserve(thread_count);
    for (std::size_t index = 0; index < thread_count; ++index) {
        list_threads_.emplace_back(&WorkerPool::worker_loop, this);
    }
    logger_->debug("Worker pool started with {} threads", thread_count);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::submit(Task task) {
    {
        std::scoped_lock lock(mutex_);
        if (flag_stopping_) {
            throw std::runtime_error("WorkerPool::submit called after shutdown");
        }
        queue_tasks_.push_back(std::move(task));
    }
    cv_tasks_.notify_one();
}

std::size_t WorkerPool::thread_count() const noexcept {
    return list_threads_.size();
}

void WorkerPool::shutdown() {
    {
        std::scoped_lock lock(mutex_);
        if (flag_stopping_) {
            return;
        }
        flag_stopping_ = true;
    }
    cv_tasks_.notify_all();
    for (std::thread& worker : list_threads_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    logger_->debug("Worker pool stopped");
}

void WorkerPool::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock lock(mutex_);
            cv_tasks_.wait(lock, [this]() { return flag_stopping_ || !queue_tasks_.empty(); });
            if (queue_tasks_.empty()) {
                return;
            }
            task = std::move(queue_tasks_.front());
            queue_tasks_.pop_front();
        }
        try {
            task();
        } catch (const std::exception& exc) {
            logger_->error(R"({{"component":"worker_pool","error":"{}"}})", exc.what());
        }
    }
}

}  // namespace place_discovery
