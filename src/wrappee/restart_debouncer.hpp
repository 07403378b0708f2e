#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace wrapmcp::wrappee {

// Collapses bursts of signals into one action that runs after `window` of quiet.
// Each signal() pushes the deadline out again. The action runs on the debouncer's own thread.
class RestartDebouncer {
public:
    RestartDebouncer(std::chrono::milliseconds window, std::function<void()> action);
    ~RestartDebouncer();

    RestartDebouncer(const RestartDebouncer&) = delete;
    RestartDebouncer& operator=(const RestartDebouncer&) = delete;

    void signal();

    // Drops a scheduled action that has not fired yet.
    void cancel();

    // Joins the worker; pending actions are dropped. Idempotent.
    void stop();

    bool is_pending() const;
    std::size_t fired_count() const;

private:
    void run();

    const std::chrono::milliseconds window_;
    const std::function<void()> action_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    bool stopping_ = false;
    std::size_t fired_ = 0;

    std::thread worker_;
};

}  // namespace wrapmcp::wrappee
