#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace ferry {

struct WorkerPoolOptions {
    std::size_t workers{4};
    std::size_t queue_capacity{64};
    /// How long submit() waits for a free queue slot before rejecting.
    std::chrono::milliseconds submit_timeout{100};
};

enum class SubmitResult : std::uint8_t {
    Accepted,
    Rejected,
};

/// Fixed set of worker threads fed from a bounded FIFO queue.
class WorkerPool {
public:
    using Job = std::function<void()>;

    explicit WorkerPool(WorkerPoolOptions options);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Enqueues \a job, waiting up to submit_timeout while the queue is full.
    /// Rejected after shutdown() or when no slot frees up in time.
    SubmitResult submit(Job job);

    /// Stops accepting jobs, runs the ones already queued, joins the workers. Idempotent.
    void shutdown();

    std::size_t num_workers() const { return workers_.size(); }
    std::size_t queued() const;
    /// Jobs that ended with an exception.
    std::size_t faults() const { return faults_.load(); }

private:
    void worker_loop();

    WorkerPoolOptions options_;
    std::vector<std::thread> workers_;
    std::deque<Job> queue_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    bool shutdown_{false};
    std::atomic<std::size_t> faults_{0};
};

}  // namespace ferry
