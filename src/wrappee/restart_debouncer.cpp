#include "wrappee/restart_debouncer.hpp"

#include <utility>

namespace wrapmcp::wrappee {

RestartDebouncer::RestartDebouncer(const std::chrono::milliseconds window,
                                   std::function<void()> action)
    : window_(window), action_(std::move(action)) {
    worker_ = std::thread([this] { run(); });
}

RestartDebouncer::~RestartDebouncer() {
    stop();
}

void RestartDebouncer::signal() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        deadline_ = std::chrono::steady_clock::now() + window_;
    }
    cv_.notify_all();
}

void RestartDebouncer::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deadline_.reset();
    }
    cv_.notify_all();
}

void RestartDebouncer::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        deadline_.reset();
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

bool RestartDebouncer::is_pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deadline_.has_value();
}

std::size_t RestartDebouncer::fired_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fired_;
}

void RestartDebouncer::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (!deadline_.has_value()) {
            cv_.wait(lock, [this] { return stopping_ || deadline_.has_value(); });
            continue;
        }

        const auto deadline = *deadline_;
        if (std::chrono::steady_clock::now() < deadline) {
            // Woken early by a new signal, a cancel or stop; loop and re-read the deadline.
            cv_.wait_until(lock, deadline);
            continue;
        }

        deadline_.reset();
        ++fired_;
        lock.unlock();
        action_();
        lock.lock();
    }
}

}  // namespace wrapmcp::wrappee
