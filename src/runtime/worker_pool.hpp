#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace wrapmcp::runtime {

// Fixed set of threads draining a FIFO task queue.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once stop() has begun.
    bool submit(std::function<void()> task);

    // Runs everything already queued, then joins. Idempotent.
    void stop();

    std::size_t size() const { return workers_.size(); }
    std::size_t processed() const { return processed_.load(); }

private:
    void run();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> queue_;
    bool stopping_ = false;

    std::atomic<std::size_t> processed_{0};
    std::vector<std::thread> workers_;
};

}  // namespace wrapmcp::runtime
