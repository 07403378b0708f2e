#include <chrono>
#include <csignal>
#include <poll.h>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>
#include <gtest/gtest.h>
#include "process/process_handle.hpp"

namespace {

using wrapmcp::core::errors::ErrorCategory;
using wrapmcp::core::errors::get_error;
using wrapmcp::core::errors::is_error;
using wrapmcp::core::errors::take_value;
using wrapmcp::process::build_environment;
using wrapmcp::process::ProcessHandle;
using wrapmcp::process::SpawnOptions;

std::string read_all(int fd) {
    std::string out;
    char buffer[512];
    while (true) {
        pollfd pfd{fd, POLLIN, 0};
        if (poll(&pfd, 1, 5000) <= 0) {
            break;
        }
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n <= 0) {
            break;
        }
        out.append(buffer, static_cast<std::size_t>(n));
    }
    return out;
}

bool contains(const std::vector<std::string>& env, const std::string& entry) {
    for (const auto& item : env) {
        if (item == entry) {
            return true;
        }
    }
    return false;
}

TEST(ProcessHandleTest, MissingBinaryIsSpawnError) {
    SpawnOptions options;
    options.command = "/definitely/not/a/binary";
    auto spawned = ProcessHandle::spawn(options);
    ASSERT_TRUE(is_error(spawned));
    EXPECT_EQ(get_error(spawned).category, ErrorCategory::Spawn);
    EXPECT_EQ(get_error(spawned).code, "command_not_found");
}

TEST(ProcessHandleTest, EmptyCommandIsSpawnError) {
    auto spawned = ProcessHandle::spawn(SpawnOptions{});
    ASSERT_TRUE(is_error(spawned));
    EXPECT_EQ(get_error(spawned).code, "missing_command");
}

TEST(ProcessHandleTest, EchoesStdinThroughCat) {
    SpawnOptions options;
    options.command = "cat";
    auto spawned = ProcessHandle::spawn(options);
    ASSERT_FALSE(is_error(spawned));
    auto process = take_value(spawned);

    ASSERT_FALSE(is_error(process->write("hello\n")));
    process->close_stdin();
    EXPECT_EQ(read_all(process->stdout_fd()), "hello\n");
    EXPECT_EQ(process->terminate(std::chrono::milliseconds(1000)), 0);
}

TEST(ProcessHandleTest, AppliesColourSuppressionAndOverrides) {
    SpawnOptions options;
    options.command = "/bin/sh";
    options.args = {"-c", "echo \"$NO_COLOR $CLICOLOR $RUST_LOG_STYLE $EXTRA\""};
    options.env_overrides = {{"EXTRA", "yes"}};
    auto spawned = ProcessHandle::spawn(options);
    ASSERT_FALSE(is_error(spawned));
    auto process = take_value(spawned);
    EXPECT_EQ(read_all(process->stdout_fd()), "1 0 never yes\n");
}

TEST(ProcessHandleTest, ColourSuppressionCanBeDisabled) {
    SpawnOptions options;
    options.suppress_colors = false;
    EXPECT_FALSE(contains(build_environment(options), "RUST_LOG_STYLE=never"));

    options.suppress_colors = true;
    const auto env = build_environment(options);
    EXPECT_TRUE(contains(env, "NO_COLOR=1"));
    EXPECT_TRUE(contains(env, "CLICOLOR=0"));
}

TEST(ProcessHandleTest, SeparatesStderr) {
    SpawnOptions options;
    options.command = "/bin/sh";
    options.args = {"-c", "echo out; echo err >&2"};
    auto spawned = ProcessHandle::spawn(options);
    ASSERT_FALSE(is_error(spawned));
    auto process = take_value(spawned);
    EXPECT_EQ(read_all(process->stdout_fd()), "out\n");
    EXPECT_EQ(read_all(process->stderr_fd()), "err\n");
}

TEST(ProcessHandleTest, TerminateIsIdempotent) {
    SpawnOptions options;
    options.command = "sleep";
    options.args = {"30"};
    auto spawned = ProcessHandle::spawn(options);
    ASSERT_FALSE(is_error(spawned));
    auto process = take_value(spawned);
    EXPECT_TRUE(process->is_running());

    const int first = process->terminate(std::chrono::milliseconds(1000));
    EXPECT_EQ(first, 128 + SIGTERM);
    EXPECT_EQ(process->terminate(std::chrono::milliseconds(1000)), first);
    EXPECT_FALSE(process->is_running());
    ASSERT_TRUE(process->exit_status().has_value());
    EXPECT_EQ(*process->exit_status(), first);
}

TEST(ProcessHandleTest, EscalatesToKillAfterGrace) {
    SpawnOptions options;
    options.command = "/bin/sh";
    options.args = {"-c", "trap '' TERM; echo ready; while true; do sleep 1; done"};
    auto spawned = ProcessHandle::spawn(options);
    ASSERT_FALSE(is_error(spawned));
    auto process = take_value(spawned);

    // Wait until the trap is installed
    char buffer[16];
    pollfd pfd{process->stdout_fd(), POLLIN, 0};
    ASSERT_GT(poll(&pfd, 1, 5000), 0);
    ASSERT_GT(read(process->stdout_fd(), buffer, sizeof(buffer)), 0);

    const auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(process->terminate(std::chrono::milliseconds(200)), 128 + SIGKILL);
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(200));
}

TEST(ProcessHandleTest, WriteAfterCloseFails) {
    SpawnOptions options;
    options.command = "cat";
    auto spawned = ProcessHandle::spawn(options);
    ASSERT_FALSE(is_error(spawned));
    auto process = take_value(spawned);
    process->close_stdin();
    auto written = process->write("late\n");
    ASSERT_TRUE(is_error(written));
    EXPECT_EQ(get_error(written).category, ErrorCategory::Forwarding);
}

TEST(ProcessHandleTest, WriteToChildNotReadingTimesOut) {
    SpawnOptions options;
    options.command = "sleep";
    options.args = {"30"};
    auto spawned = ProcessHandle::spawn(options);
    ASSERT_FALSE(is_error(spawned));
    auto process = take_value(spawned);

    const std::string payload(1 << 20, 'x');
    const auto started = std::chrono::steady_clock::now();
    auto written = process->write(payload, std::chrono::milliseconds(200));
    const auto elapsed = std::chrono::steady_clock::now() - started;
    ASSERT_TRUE(is_error(written));
    EXPECT_EQ(get_error(written).category, ErrorCategory::Timeout);
    EXPECT_EQ(get_error(written).code, "write_timeout");
    EXPECT_GE(elapsed, std::chrono::milliseconds(200));
    EXPECT_LT(elapsed, std::chrono::seconds(3));

    // Part of the payload went into the pipe, so the stream cannot carry another frame.
    auto again = process->write("next\n");
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "stdin_closed");
    EXPECT_EQ(process->terminate(std::chrono::milliseconds(1000)), 128 + SIGTERM);
}

TEST(ProcessHandleTest, TerminateReleasesBlockedWriter) {
    SpawnOptions options;
    options.command = "sleep";
    options.args = {"30"};
    auto spawned = ProcessHandle::spawn(options);
    ASSERT_FALSE(is_error(spawned));
    auto process = take_value(spawned);

    wrapmcp::core::errors::Status written = wrapmcp::core::errors::ok();
    std::thread writer([&] {
        written = process->write(std::string(1 << 20, 'x'), std::chrono::seconds(30));
    });
    // Give the writer time to fill the pipe.
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    const auto started = std::chrono::steady_clock::now();
    const int status = process->terminate(std::chrono::milliseconds(100));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(3));
    writer.join();

    EXPECT_EQ(status, 128 + SIGTERM);
    ASSERT_TRUE(is_error(written));
    EXPECT_EQ(get_error(written).code, "stdin_closed");
}

}  // namespace
