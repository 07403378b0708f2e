#include "process/process_handle.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include "core/logging/logger.hpp"

extern char** environ;

namespace wrapmcp::process {

using core::errors::ErrorCategory;
using core::errors::ProxyError;

namespace {

constexpr std::chrono::milliseconds kReapInterval{10};
// Longest a blocked writer goes without rechecking for terminate().
constexpr std::chrono::milliseconds kWriteSlice{50};

void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { static_cast<void>(std::signal(SIGPIPE, SIG_IGN)); });
}

void close_pair(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            static_cast<void>(close(fds[i]));
            fds[i] = -1;
        }
    }
}

int decode_status(const int raw_status) {
    if (WIFEXITED(raw_status)) {
        return WEXITSTATUS(raw_status);
    }
    if (WIFSIGNALED(raw_status)) {
        return 128 + WTERMSIG(raw_status);
    }
    return -1;
}

std::vector<char*> to_c_array(std::vector<std::string>& values) {
    std::vector<char*> out;
    out.reserve(values.size() + 1);
    for (auto& value : values) {
        out.push_back(value.data());
    }
    out.push_back(nullptr);
    return out;
}

}  // namespace

std::vector<std::string> build_environment(const SpawnOptions& options) {
    std::vector<std::pair<std::string, std::string>> overrides;
    if (options.suppress_colors) {
        overrides.emplace_back("NO_COLOR", "1");
        overrides.emplace_back("CLICOLOR", "0");
        overrides.emplace_back("RUST_LOG_STYLE", "never");
    }
    overrides.insert(overrides.end(), options.env_overrides.begin(), options.env_overrides.end());

    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string current(*entry);
        const auto eq = current.find('=');
        const std::string key = current.substr(0, eq);
        bool replaced = false;
        for (const auto& [name, value] : overrides) {
            if (name == key) {
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            env.push_back(current);
        }
    }
    for (const auto& [name, value] : overrides) {
        env.push_back(name + "=" + value);
    }
    return env;
}

core::errors::Result<std::unique_ptr<ProcessHandle>> ProcessHandle::spawn(
    const SpawnOptions& options) {
    if (options.command.empty()) {
        return ProxyError{ErrorCategory::Spawn, "No command given for the wrapped server.",
                          "missing_command"};
    }
    ignore_sigpipe_once();

    // argv and envp are prepared before fork; the child only calls async-signal-safe functions.
    std::vector<std::string> argv_storage;
    argv_storage.push_back(options.command);
    argv_storage.insert(argv_storage.end(), options.args.begin(), options.args.end());
    std::vector<std::string> env_storage = build_environment(options);
    std::vector<char*> argv = to_c_array(argv_storage);
    std::vector<char*> envp = to_c_array(env_storage);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0) {
        const int err = errno;
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return ProxyError{ErrorCategory::Spawn,
                          std::string("Failed to create process pipes: ") + std::strerror(err),
                          "pipe_creation_failed"};
    }

    const pid_t pid = fork();
    if (pid < 0) {
        const int err = errno;
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return ProxyError{ErrorCategory::Spawn,
                          std::string("Failed to fork process: ") + std::strerror(err),
                          "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(signal(SIGPIPE, SIG_DFL));
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        execvpe(argv[0], argv.data(), envp.data());
        const int err = errno;
        static_cast<void>(::write(exec_pipe[1], &err, sizeof(err)));
        _exit(127);
    }

    static_cast<void>(close(stdin_pipe[0]));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    static_cast<void>(close(exec_pipe[1]));
    // Only our end; the child's read end is a separate open file description.
    static_cast<void>(fcntl(stdin_pipe[1], F_SETFL, fcntl(stdin_pipe[1], F_GETFL) | O_NONBLOCK));

    // EOF on the exec pipe means execvpe succeeded and closed it via O_CLOEXEC.
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    static_cast<void>(close(exec_pipe[0]));

    if (n > 0) {
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        static_cast<void>(close(stdin_pipe[1]));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stderr_pipe[0]));
        return ProxyError{ErrorCategory::Spawn,
                          "Failed to execute '" + options.command +
                              "': " + std::strerror(child_errno),
                          child_errno == ENOENT ? "command_not_found" : "exec_failed",
                          "Check that the command exists and is executable."};
    }

    LOG_DEBUG("Spawned '" + options.command + "' as pid " + std::to_string(pid));
    return std::unique_ptr<ProcessHandle>(
        new ProcessHandle(pid, stdin_pipe[1], stdout_pipe[0], stderr_pipe[0]));
}

ProcessHandle::ProcessHandle(const pid_t pid, const int stdin_fd, const int stdout_fd,
                             const int stderr_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

ProcessHandle::~ProcessHandle() {
    static_cast<void>(terminate(std::chrono::milliseconds(500)));
    static_cast<void>(close(stdout_fd_));
    static_cast<void>(close(stderr_fd_));
}

core::errors::Status ProcessHandle::write(const std::string& bytes,
                                          const std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (stdin_fd_ < 0 || closing_.load()) {
        return ProxyError{ErrorCategory::Forwarding, "Wrapped server stdin is closed.",
                          "stdin_closed"};
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::size_t offset = 0;
    while (offset < bytes.size()) {
        const ssize_t n = ::write(stdin_fd_, bytes.data() + offset, bytes.size() - offset);
        if (n >= 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            const int err = errno;
            return ProxyError{ErrorCategory::Forwarding,
                              std::string("Failed to write to wrapped server: ") +
                                  std::strerror(err),
                              err == EPIPE ? "wrappee_pipe_closed" : "write_failed"};
        }

        // Pipe full: the child is not reading.
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (closing_.load() || remaining.count() <= 0) {
            const bool torn = offset > 0;
            if (torn) {
                close_stdin_locked();
            }
            if (closing_.load()) {
                return ProxyError{ErrorCategory::Forwarding,
                                  "Wrapped server is being terminated.", "stdin_closed"};
            }
            LOG_WARN("pid " + std::to_string(pid_) + " stopped reading stdin; write of " +
                     std::to_string(bytes.size()) + " bytes abandoned after " +
                     std::to_string(offset) + " bytes" + (torn ? ", stdin closed" : ""));
            return ProxyError{ErrorCategory::Timeout,
                              "Wrapped server did not accept input within " +
                                  std::to_string(timeout.count()) + "ms",
                              "write_timeout", "The wrapped server is not reading its stdin."};
        }
        pollfd pfd{stdin_fd_, POLLOUT, 0};
        const auto slice = std::min(remaining, kWriteSlice);
        static_cast<void>(poll(&pfd, 1, static_cast<int>(slice.count())));
    }
    return core::errors::ok();
}

void ProcessHandle::close_stdin() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    close_stdin_locked();
}

void ProcessHandle::close_stdin_locked() {
    if (stdin_fd_ >= 0) {
        static_cast<void>(close(stdin_fd_));
        stdin_fd_ = -1;
    }
}

void ProcessHandle::record_status(const int raw_status) {
    exit_status_ = decode_status(raw_status);
}

bool ProcessHandle::is_running() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (exit_status_.has_value()) {
        return false;
    }
    int status = 0;
    const pid_t waited = waitpid(pid_, &status, WNOHANG);
    if (waited == pid_) {
        record_status(status);
        return false;
    }
    return waited == 0;
}

std::optional<int> ProcessHandle::exit_status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return exit_status_;
}

int ProcessHandle::terminate(const std::chrono::milliseconds grace) {
    closing_.store(true);
    close_stdin();

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (exit_status_.has_value()) {
        return *exit_status_;
    }

    int status = 0;
    if (waitpid(pid_, &status, WNOHANG) == pid_) {
        record_status(status);
        return *exit_status_;
    }

    static_cast<void>(kill(pid_, SIGTERM));
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            record_status(status);
            LOG_DEBUG("pid " + std::to_string(pid_) + " exited after SIGTERM");
            return *exit_status_;
        }
        std::this_thread::sleep_for(kReapInterval);
    }

    LOG_WARN("pid " + std::to_string(pid_) + " ignored SIGTERM; sending SIGKILL");
    static_cast<void>(kill(pid_, SIGKILL));
    pid_t waited = 0;
    do {
        waited = waitpid(pid_, &status, 0);
    } while (waited < 0 && errno == EINTR);
    if (waited == pid_) {
        record_status(status);
    } else {
        exit_status_ = -1;
    }
    return *exit_status_;
}

}  // namespace wrapmcp::process
