#include "ferry/worker_pool.hpp"
#include "ferry/log.hpp"
#include <exception>

namespace ferry {

WorkerPool::WorkerPool(WorkerPoolOptions options) : options_(options) {
    std::size_t num_threads = (options_.workers > 0) ? options_.workers : 1;
    if (options_.queue_capacity == 0) options_.queue_capacity = 1;
    workers_.reserve(num_threads);
    for (std::size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&WorkerPool::worker_loop, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

SubmitResult WorkerPool::submit(Job job) {
    if (!job) return SubmitResult::Rejected;
    {
        std::unique_lock lock(mutex_);
        bool has_room = not_full_.wait_for(lock, options_.submit_timeout, [this] {
            return shutdown_ || queue_.size() < options_.queue_capacity;
        });
        if (shutdown_ || !has_room) return SubmitResult::Rejected;
        queue_.push_back(std::move(job));
    }
    not_empty_.notify_one();
    return SubmitResult::Accepted;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard lock(mutex_);
        shutdown_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
    for (auto& w : workers_) {
        if (w.joinable() && w.get_id() != std::this_thread::get_id()) w.join();
    }
}

std::size_t WorkerPool::queued() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

void WorkerPool::worker_loop() {
    for (;;) {
        Job job;
        {
            std::unique_lock lock(mutex_);
            not_empty_.wait(lock, [this] { return shutdown_ || !queue_.empty(); });
            if (shutdown_ && queue_.empty()) return;
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        not_full_.notify_one();
        try {
            job();
        } catch (const std::exception& e) {
            faults_.fetch_add(1);
            log_error("worker_pool") << "job failed: " << e.what();
        } catch (...) {
            faults_.fetch_add(1);
            log_error("worker_pool") << "job failed with a non-standard exception";
        }
    }
}

}  // namespace ferry
