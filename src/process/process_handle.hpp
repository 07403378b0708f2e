#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <sys/types.h>
#include "core/errors/proxy_errors.hpp"

namespace wrapmcp::process {

struct SpawnOptions {
    std::string command;
    std::vector<std::string> args;
    std::vector<std::pair<std::string, std::string>> env_overrides;
    // Adds NO_COLOR=1, CLICOLOR=0 and RUST_LOG_STYLE=never to the child environment.
    bool suppress_colors = true;
};

// A running child with its three standard streams piped to us.
// The handle owns the pipe descriptors and reaps the child; destroying it terminates the child.
class ProcessHandle {
public:
    static constexpr std::chrono::milliseconds kDefaultWriteTimeout{5000};

    static core::errors::Result<std::unique_ptr<ProcessHandle>> spawn(const SpawnOptions& options);

    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    pid_t pid() const { return pid_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

    // Writes all bytes to the child's stdin. Serialized across threads.
    // Gives up with a Timeout error once `timeout` passes with the pipe still full; a frame
    // cut short that way leaves the stream unusable, so stdin is closed behind it.
    core::errors::Status write(const std::string& bytes,
                               std::chrono::milliseconds timeout = kDefaultWriteTimeout);

    void close_stdin();

    bool is_running();
    std::optional<int> exit_status() const;

    // SIGTERM, then SIGKILL after `grace`. Idempotent; returns the exit status
    // (exit code, or 128 + signal number). A writer blocked on a full pipe is released first.
    int terminate(std::chrono::milliseconds grace);

private:
    ProcessHandle(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);

    void record_status(int raw_status);
    void close_stdin_locked();

    const pid_t pid_;
    int stdin_fd_;
    const int stdout_fd_;
    const int stderr_fd_;

    std::atomic<bool> closing_{false};
    std::mutex write_mutex_;
    mutable std::mutex state_mutex_;
    std::optional<int> exit_status_;
};

// Builds the child environment: the current environment with overrides applied.
std::vector<std::string> build_environment(const SpawnOptions& options);

}  // namespace wrapmcp::process
