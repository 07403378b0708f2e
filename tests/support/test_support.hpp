#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "process/process_handle.hpp"

#ifndef WRAPMCP_FAKE_WRAPPEE
#error "WRAPMCP_FAKE_WRAPPEE must point at the fake_wrappee test binary"
#endif

namespace wrapmcp::testing {

    inline std::string fake_wrappee_path() {
        return WRAPMCP_FAKE_WRAPPEE;
    }

    inline process::SpawnOptions fake_wrappee(std::vector<std::string> flags = {}) {
        process::SpawnOptions options;
        options.command = fake_wrappee_path();
        options.args = std::move(flags);
        return options;
    }

    // Thread-safe sink for lines produced on reader threads.
    class LineCollector {
    public:
        void add(const std::string& line) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                lines_.push_back(line);
            }
            cv_.notify_all();
        }

        bool wait_for_line(const std::string& needle,
                           std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
            std::unique_lock<std::mutex> lock(mutex_);
            return cv_.wait_for(lock, timeout, [&] {
                for (const auto& line : lines_) {
                    if (line.find(needle) != std::string::npos) {
                        return true;
                    }
                }
                return false;
            });
        }

        std::vector<std::string> lines() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return lines_;
        }

    private:
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::vector<std::string> lines_;
    };

    // Polls `predicate` until it holds or `timeout` passes.
    inline bool eventually(const std::function<bool()>& predicate,
                           std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return predicate();
    }

} // namespace wrapmcp::testing
