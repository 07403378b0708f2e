#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <mutex>
#include <thread>
#include "core/errors/proxy_errors.hpp"

namespace wrapmcp::wrappee {

enum class FileChange {
    Created,
    Modified,
    Removed
};

std::string to_string(FileChange change);

// Polls one file and reports creation, modification and removal.
class BinaryWatcher {
public:
    using Listener = std::function<void(FileChange)>;

    BinaryWatcher(std::filesystem::path path, Listener listener,
                  std::chrono::milliseconds interval = std::chrono::milliseconds(250));
    ~BinaryWatcher();

    BinaryWatcher(const BinaryWatcher&) = delete;
    BinaryWatcher& operator=(const BinaryWatcher&) = delete;

    // Requires an absolute path whose parent directory exists.
    core::errors::Status start();
    void stop();

    const std::filesystem::path& path() const { return path_; }

private:
    struct Snapshot {
        bool exists = false;
        std::filesystem::file_time_type modified{};
        std::uintmax_t size = 0;
    };

    Snapshot take_snapshot() const;
    void run();

    const std::filesystem::path path_;
    const Listener listener_;
    const std::chrono::milliseconds interval_;

    std::mutex mutex_;
    std::atomic<bool> running_{false};
    std::thread worker_;
};

}  // namespace wrapmcp::wrappee
