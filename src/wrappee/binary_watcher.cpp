#include "wrappee/binary_watcher.hpp"

#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace wrapmcp::wrappee {

using core::errors::ErrorCategory;
using core::errors::ProxyError;

std::string to_string(const FileChange change) {
    switch (change) {
        case FileChange::Created: return "created";
        case FileChange::Modified: return "modified";
        case FileChange::Removed: return "removed";
        default: return "unknown";
    }
}

BinaryWatcher::BinaryWatcher(std::filesystem::path path, Listener listener,
                             const std::chrono::milliseconds interval)
    : path_(std::move(path)), listener_(std::move(listener)), interval_(interval) {}

BinaryWatcher::~BinaryWatcher() {
    stop();
}

core::errors::Status BinaryWatcher::start() {
    if (!path_.is_absolute()) {
        return ProxyError{ErrorCategory::FileWatch,
                          "Watch mode needs an absolute path to the wrapped binary: " +
                              path_.string(),
                          "relative_watch_path", "Pass the full path after '--'."};
    }

    std::error_code ec;
    const auto parent = path_.parent_path();
    if (!std::filesystem::is_directory(parent, ec)) {
        return ProxyError{ErrorCategory::FileWatch,
                          "Cannot watch " + path_.string() + ": directory " + parent.string() +
                              " does not exist",
                          "watch_dir_missing"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.exchange(true)) {
        return core::errors::ok();
    }
    worker_ = std::thread([this] { run(); });
    LOG_INFO("Watching " + path_.string() + " for changes");
    return core::errors::ok();
}

void BinaryWatcher::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    running_.store(false);
    if (worker_.joinable()) {
        worker_.join();
    }
}

BinaryWatcher::Snapshot BinaryWatcher::take_snapshot() const {
    Snapshot snapshot;
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec) || ec) {
        return snapshot;
    }
    snapshot.exists = true;
    snapshot.modified = std::filesystem::last_write_time(path_, ec);
    if (ec) {
        snapshot.modified = {};
    }
    snapshot.size = std::filesystem::file_size(path_, ec);
    if (ec) {
        snapshot.size = 0;
    }
    return snapshot;
}

void BinaryWatcher::run() {
    Snapshot previous = take_snapshot();
    while (running_.load()) {
        std::this_thread::sleep_for(interval_);
        if (!running_.load()) {
            break;
        }

        const Snapshot current = take_snapshot();
        if (current.exists && !previous.exists) {
            listener_(FileChange::Created);
        } else if (!current.exists && previous.exists) {
            listener_(FileChange::Removed);
        } else if (current.exists &&
                   (current.modified != previous.modified || current.size != previous.size)) {
            listener_(FileChange::Modified);
        }
        previous = current;
    }
}

}  // namespace wrapmcp::wrappee
