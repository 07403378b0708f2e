#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <sys/types.h>
#include "core/errors/proxy_errors.hpp"
#include "process/process_handle.hpp"
#include "protocol/tool_contract.hpp"
#include "wrappee/binary_watcher.hpp"
#include "wrappee/request_id_allocator.hpp"
#include "wrappee/restart_debouncer.hpp"
#include "wrappee/wrappee_client.hpp"

namespace wrapmcp::wrappee {

enum class WrappeeStatus {
    NotStarted,
    Starting,
    Running,
    Restarting,
    Stopped,
    Failed
};

struct WrappeeState {
    WrappeeStatus status = WrappeeStatus::NotStarted;
    std::optional<pid_t> pid;  // Running: current pid, Restarting: the pid being replaced
    std::string reason;        // Failed only
};

std::string to_string(WrappeeStatus status);
std::string describe(const WrappeeState& state);

struct ControllerOptions {
    process::SpawnOptions spawn;
    std::string protocol_version = "2025-03-26";
    bool preserve_ansi = false;
    std::chrono::milliseconds handshake_timeout{30000};
    std::chrono::milliseconds terminate_grace{2000};
    std::chrono::milliseconds debounce_window{2000};
};

struct RestartOutcome {
    std::optional<pid_t> old_pid;
    pid_t new_pid = -1;
};

// Owns the wrappee's lifecycle:
//   NotStarted -> Starting -> Running -> Stopped
//   Running -> Restarting -> Starting -> Running
//   any -> Failed
// State reads take a shared lock; restarts are serialized by a separate gate that is only
// ever try-locked, so a second restart is refused rather than queued.
class WrappeeController {
public:
    // Runs tool discovery against a freshly started client.
    using DiscoveryHook = std::function<core::errors::Status(WrappeeClient&)>;
    using ToolsChangedHook = std::function<void()>;
    using DescriptorSource = std::function<std::vector<protocol::ToolDescriptor>()>;

    WrappeeController(ControllerOptions options, StderrSink stderr_sink);
    ~WrappeeController();

    WrappeeController(const WrappeeController&) = delete;
    WrappeeController& operator=(const WrappeeController&) = delete;

    // Hooks must be installed before start().
    void set_discovery_hook(DiscoveryHook hook);
    void set_tools_changed_hook(ToolsChangedHook hook);
    void set_descriptor_source(DescriptorSource source);

    core::errors::Status start();
    core::errors::Result<RestartOutcome> restart();

    // Waits for an in-flight restart, terminates the wrappee and moves to Stopped. Idempotent.
    void shutdown();

    WrappeeState state() const;

    // The live client, or Unavailable unless the state is Running.
    core::errors::Result<std::shared_ptr<WrappeeClient>> acquire_client() const;

    std::vector<protocol::ToolDescriptor> current_tool_descriptors() const;

    // Debounced trigger: a burst of calls produces exactly one restart after the quiet window.
    void handle_file_change_signal();
    void handle_file_change(FileChange change);
    core::errors::Status watch_binary(const std::filesystem::path& path);
    bool restart_pending() const;

    const ControllerOptions& options() const { return options_; }

private:
    core::errors::Result<std::shared_ptr<WrappeeClient>> launch_client();
    void set_state(WrappeeState state);
    void fail(const std::string& reason);
    void on_unexpected_exit(pid_t pid);
    void on_debounce_elapsed();

    const ControllerOptions options_;
    const StderrSink stderr_sink_;
    const std::shared_ptr<RequestIdAllocator> ids_;

    DiscoveryHook discovery_hook_;
    ToolsChangedHook tools_changed_hook_;
    DescriptorSource descriptor_source_;

    mutable std::shared_mutex state_mutex_;
    WrappeeState state_;
    std::shared_ptr<WrappeeClient> client_;

    std::mutex restart_gate_;

    std::mutex watch_mutex_;
    bool binary_removed_ = false;
    std::unique_ptr<BinaryWatcher> watcher_;

    std::once_flag shutdown_once_;
    std::unique_ptr<RestartDebouncer> debouncer_;
};

}  // namespace wrapmcp::wrappee
