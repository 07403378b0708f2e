#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <gtest/gtest.h>
#include "support/test_support.hpp"
#include "wrappee/wrappee_controller.hpp"

namespace {

using wrapmcp::core::errors::ErrorCategory;
using wrapmcp::core::errors::ProxyError;
using wrapmcp::core::errors::Status;
using wrapmcp::core::errors::get_error;
using wrapmcp::core::errors::get_value;
using wrapmcp::core::errors::is_error;
using wrapmcp::testing::eventually;
using wrapmcp::testing::fake_wrappee;
using wrapmcp::testing::LineCollector;
using wrapmcp::wrappee::ControllerOptions;
using wrapmcp::wrappee::FileChange;
using wrapmcp::wrappee::WrappeeClient;
using wrapmcp::wrappee::WrappeeController;
using wrapmcp::wrappee::WrappeeStatus;
using namespace std::chrono_literals;

ControllerOptions options_for(std::vector<std::string> flags = {}) {
    ControllerOptions options;
    options.spawn = fake_wrappee(std::move(flags));
    options.handshake_timeout = 5s;
    options.terminate_grace = 500ms;
    options.debounce_window = 300ms;
    return options;
}

class WrappeeControllerTest : public ::testing::Test {
protected:
    std::unique_ptr<WrappeeController> make(ControllerOptions options) {
        auto lines = stderr_lines_;
        auto controller = std::make_unique<WrappeeController>(
            std::move(options), [lines](const std::string& line) { lines->add(line); });
        controller->set_discovery_hook([this](WrappeeClient& client) -> Status {
            const int call = discoveries_.fetch_add(1);
            if (call > 0 && restart_discovery_delay_.count() > 0) {
                std::this_thread::sleep_for(restart_discovery_delay_);
            }
            if (call > 0 && fail_restart_discovery_) {
                return ProxyError{ErrorCategory::Discovery, "discovery broke", "discovery_failed"};
            }
            auto tools = client.list_tools(5s);
            if (is_error(tools)) {
                return get_error(tools);
            }
            return wrapmcp::core::errors::ok();
        });
        controller->set_tools_changed_hook([this] { tools_changed_.fetch_add(1); });
        return controller;
    }

    std::shared_ptr<LineCollector> stderr_lines_ = std::make_shared<LineCollector>();
    std::atomic<int> discoveries_{0};
    std::atomic<int> tools_changed_{0};
    std::chrono::milliseconds restart_discovery_delay_{0};
    bool fail_restart_discovery_ = false;
};

TEST_F(WrappeeControllerTest, StartReachesRunning) {
    auto controller = make(options_for());
    EXPECT_EQ(controller->state().status, WrappeeStatus::NotStarted);

    ASSERT_FALSE(is_error(controller->start()));
    const auto state = controller->state();
    EXPECT_EQ(state.status, WrappeeStatus::Running);
    ASSERT_TRUE(state.pid.has_value());
    EXPECT_GT(*state.pid, 0);
    EXPECT_EQ(tools_changed_.load(), 1);

    auto client = controller->acquire_client();
    ASSERT_FALSE(is_error(client));
    EXPECT_EQ(get_value(client)->pid(), *state.pid);
}

TEST_F(WrappeeControllerTest, SecondStartIsRejected) {
    auto controller = make(options_for());
    ASSERT_FALSE(is_error(controller->start()));
    const auto again = controller->start();
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "already_started");
}

TEST_F(WrappeeControllerTest, SpawnFailureMovesToFailed) {
    ControllerOptions options = options_for();
    options.spawn.command = "/nonexistent/wrapmcp-test-server";
    auto controller = make(options);

    const auto started = controller->start();
    ASSERT_TRUE(is_error(started));
    EXPECT_EQ(get_error(started).category, ErrorCategory::Spawn);
    EXPECT_EQ(controller->state().status, WrappeeStatus::Failed);
    EXPECT_FALSE(controller->state().reason.empty());

    auto client = controller->acquire_client();
    ASSERT_TRUE(is_error(client));
    EXPECT_EQ(get_error(client).category, ErrorCategory::Unavailable);
    EXPECT_FALSE(get_error(client).hint.empty());
}

TEST_F(WrappeeControllerTest, HandshakeFailureMovesToFailed) {
    auto controller = make(options_for({"--fail-handshake"}));
    const auto started = controller->start();
    ASSERT_TRUE(is_error(started));
    EXPECT_EQ(get_error(started).category, ErrorCategory::Handshake);
    EXPECT_EQ(controller->state().status, WrappeeStatus::Failed);
    EXPECT_EQ(tools_changed_.load(), 0);
}

TEST_F(WrappeeControllerTest, RestartBeforeStartIsRefused) {
    auto controller = make(options_for());
    const auto restarted = controller->restart();
    ASSERT_TRUE(is_error(restarted));
    EXPECT_EQ(get_error(restarted).category, ErrorCategory::Unavailable);
    EXPECT_EQ(get_error(restarted).code, "invalid_state");
}

TEST_F(WrappeeControllerTest, RestartReplacesProcess) {
    auto controller = make(options_for());
    ASSERT_FALSE(is_error(controller->start()));
    const pid_t old_pid = *controller->state().pid;

    const auto restarted = controller->restart();
    ASSERT_FALSE(is_error(restarted));
    const auto& outcome = get_value(restarted);
    ASSERT_TRUE(outcome.old_pid.has_value());
    EXPECT_EQ(*outcome.old_pid, old_pid);
    EXPECT_NE(outcome.new_pid, old_pid);

    EXPECT_EQ(controller->state().status, WrappeeStatus::Running);
    EXPECT_EQ(*controller->state().pid, outcome.new_pid);
    EXPECT_EQ(discoveries_.load(), 2);
    EXPECT_EQ(tools_changed_.load(), 2);
}

TEST_F(WrappeeControllerTest, DiscoveryFailureOnRestartKeepsRunning) {
    fail_restart_discovery_ = true;
    auto controller = make(options_for());
    ASSERT_FALSE(is_error(controller->start()));

    const auto restarted = controller->restart();
    ASSERT_FALSE(is_error(restarted));
    EXPECT_EQ(controller->state().status, WrappeeStatus::Running);
    EXPECT_EQ(tools_changed_.load(), 1);
}

TEST_F(WrappeeControllerTest, ConcurrentRestartIsRefused) {
    restart_discovery_delay_ = 600ms;
    auto controller = make(options_for());
    ASSERT_FALSE(is_error(controller->start()));

    auto first = std::async(std::launch::async, [&controller] { return controller->restart(); });
    ASSERT_TRUE(eventually([&controller] {
        return controller->state().status != WrappeeStatus::Running;
    }));

    const auto second = controller->restart();
    ASSERT_TRUE(is_error(second));
    EXPECT_EQ(get_error(second).category, ErrorCategory::Unavailable);
    EXPECT_EQ(get_error(second).code, "restart_in_progress");

    auto client = controller->acquire_client();
    ASSERT_TRUE(is_error(client));
    EXPECT_EQ(get_error(client).category, ErrorCategory::Unavailable);

    const auto first_result = first.get();
    ASSERT_FALSE(is_error(first_result));
    EXPECT_EQ(controller->state().status, WrappeeStatus::Running);
}

TEST_F(WrappeeControllerTest, FileChangeBurstRestartsOnce) {
    auto controller = make(options_for());
    ASSERT_FALSE(is_error(controller->start()));
    const pid_t old_pid = *controller->state().pid;

    controller->handle_file_change_signal();
    std::this_thread::sleep_for(50ms);
    controller->handle_file_change_signal();
    EXPECT_TRUE(controller->restart_pending());

    ASSERT_TRUE(eventually([&controller, old_pid] {
        const auto state = controller->state();
        return state.status == WrappeeStatus::Running && state.pid && *state.pid != old_pid;
    }));
    std::this_thread::sleep_for(600ms);
    EXPECT_EQ(tools_changed_.load(), 2);
    EXPECT_FALSE(controller->restart_pending());
}

TEST_F(WrappeeControllerTest, RemovedBinaryHoldsRestartUntilRecreated) {
    auto controller = make(options_for());
    ASSERT_FALSE(is_error(controller->start()));
    const pid_t old_pid = *controller->state().pid;

    controller->handle_file_change(FileChange::Modified);
    controller->handle_file_change(FileChange::Removed);
    EXPECT_FALSE(controller->restart_pending());
    controller->handle_file_change(FileChange::Modified);
    EXPECT_FALSE(controller->restart_pending());

    controller->handle_file_change(FileChange::Created);
    EXPECT_TRUE(controller->restart_pending());
    ASSERT_TRUE(eventually([&controller, old_pid] {
        const auto state = controller->state();
        return state.status == WrappeeStatus::Running && state.pid && *state.pid != old_pid;
    }));
}

TEST_F(WrappeeControllerTest, FileChangeBeforeStartStartsServer) {
    auto controller = make(options_for());
    controller->handle_file_change(FileChange::Created);
    ASSERT_TRUE(eventually([&controller] {
        return controller->state().status == WrappeeStatus::Running;
    }));
    EXPECT_EQ(tools_changed_.load(), 1);
}

TEST_F(WrappeeControllerTest, UnexpectedExitMovesToFailedAndRestartRecovers) {
    auto controller = make(options_for());
    ASSERT_FALSE(is_error(controller->start()));

    auto client = controller->acquire_client();
    ASSERT_FALSE(is_error(client));
    const auto crashed = get_value(client)->call(
        "tools/call", nlohmann::json{{"name", "crash"}, {"arguments", nlohmann::json::object()}},
        5s);
    ASSERT_TRUE(is_error(crashed));

    ASSERT_TRUE(eventually([&controller] {
        return controller->state().status == WrappeeStatus::Failed;
    }));
    EXPECT_NE(controller->state().reason.find("exited unexpectedly"), std::string::npos);

    const auto restarted = controller->restart();
    ASSERT_FALSE(is_error(restarted));
    EXPECT_FALSE(get_value(restarted).old_pid.has_value());
    EXPECT_EQ(controller->state().status, WrappeeStatus::Running);
}

TEST_F(WrappeeControllerTest, ForwardsStderrToSink) {
    auto controller = make(options_for({"--panic-on-start"}));
    ASSERT_FALSE(is_error(controller->start()));
    EXPECT_TRUE(stderr_lines_->wait_for_line("panic: index out of range"));
}

TEST_F(WrappeeControllerTest, ShutdownIsIdempotent) {
    auto controller = make(options_for());
    ASSERT_FALSE(is_error(controller->start()));

    controller->shutdown();
    controller->shutdown();
    EXPECT_EQ(controller->state().status, WrappeeStatus::Stopped);
    EXPECT_TRUE(is_error(controller->acquire_client()));

    const auto restarted = controller->restart();
    ASSERT_TRUE(is_error(restarted));
    EXPECT_EQ(get_error(restarted).code, "invalid_state");
}

TEST_F(WrappeeControllerTest, WatchBinaryRejectsRelativePath) {
    auto controller = make(options_for());
    const auto watched = controller->watch_binary("relative/server");
    ASSERT_TRUE(is_error(watched));
    EXPECT_EQ(get_error(watched).category, ErrorCategory::FileWatch);
}

}  // namespace
