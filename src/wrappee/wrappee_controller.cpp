#include "wrappee/wrappee_controller.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace wrapmcp::wrappee {

using core::errors::ErrorCategory;
using core::errors::ProxyError;

std::string to_string(const WrappeeStatus status) {
    switch (status) {
        case WrappeeStatus::NotStarted: return "not_started";
        case WrappeeStatus::Starting: return "starting";
        case WrappeeStatus::Running: return "running";
        case WrappeeStatus::Restarting: return "restarting";
        case WrappeeStatus::Stopped: return "stopped";
        case WrappeeStatus::Failed: return "failed";
        default: return "unknown";
    }
}

std::string describe(const WrappeeState& state) {
    std::string out = to_string(state.status);
    if (state.pid.has_value()) {
        out += " (pid " + std::to_string(*state.pid) + ")";
    }
    if (!state.reason.empty()) {
        out += ": " + state.reason;
    }
    return out;
}

WrappeeController::WrappeeController(ControllerOptions options, StderrSink stderr_sink)
    : options_(std::move(options)),
      stderr_sink_(std::move(stderr_sink)),
      ids_(std::make_shared<RequestIdAllocator>()) {
    debouncer_ = std::make_unique<RestartDebouncer>(options_.debounce_window,
                                                    [this] { on_debounce_elapsed(); });
}

WrappeeController::~WrappeeController() {
    shutdown();
}

void WrappeeController::set_discovery_hook(DiscoveryHook hook) {
    discovery_hook_ = std::move(hook);
}

void WrappeeController::set_tools_changed_hook(ToolsChangedHook hook) {
    tools_changed_hook_ = std::move(hook);
}

void WrappeeController::set_descriptor_source(DescriptorSource source) {
    descriptor_source_ = std::move(source);
}

void WrappeeController::set_state(WrappeeState state) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    LOG_DEBUG("Wrapped server state: " + describe(state_) + " -> " + describe(state));
    state_ = std::move(state);
}

void WrappeeController::fail(const std::string& reason) {
    LOG_ERROR("Wrapped server failed: " + reason);
    set_state(WrappeeState{WrappeeStatus::Failed, std::nullopt, reason});
}

core::errors::Result<std::shared_ptr<WrappeeClient>> WrappeeController::launch_client() {
    ClientOptions client_options;
    client_options.preserve_ansi = options_.preserve_ansi;
    client_options.stderr_sink = stderr_sink_;
    client_options.on_unexpected_exit = [this](const pid_t pid) { on_unexpected_exit(pid); };

    auto launched = WrappeeClient::launch(options_.spawn, ids_, std::move(client_options));
    if (core::errors::is_error(launched)) {
        return core::errors::get_error(launched);
    }
    auto client = core::errors::take_value(launched);

    auto handshake = client->initialize(options_.protocol_version, options_.handshake_timeout);
    if (core::errors::is_error(handshake)) {
        static_cast<void>(client->shutdown(options_.terminate_grace));
        return core::errors::get_error(handshake);
    }
    return client;
}

core::errors::Status WrappeeController::start() {
    std::lock_guard<std::mutex> gate(restart_gate_);
    {
        std::unique_lock<std::shared_mutex> lock(state_mutex_);
        if (state_.status != WrappeeStatus::NotStarted) {
            return ProxyError{ErrorCategory::Internal,
                              "Wrapped server already started: " + describe(state_),
                              "already_started"};
        }
        state_ = WrappeeState{WrappeeStatus::Starting, std::nullopt, ""};
    }

    LOG_INFO("Starting wrapped server: " + options_.spawn.command);
    auto launched = launch_client();
    if (core::errors::is_error(launched)) {
        fail(core::errors::get_error(launched).message);
        return core::errors::get_error(launched);
    }
    auto client = core::errors::take_value(launched);

    if (discovery_hook_) {
        const auto discovered = discovery_hook_(*client);
        if (core::errors::is_error(discovered)) {
            static_cast<void>(client->shutdown(options_.terminate_grace));
            fail(core::errors::get_error(discovered).message);
            return core::errors::get_error(discovered);
        }
    }

    const pid_t pid = client->pid();
    {
        std::unique_lock<std::shared_mutex> lock(state_mutex_);
        client_ = std::move(client);
        state_ = WrappeeState{WrappeeStatus::Running, pid, ""};
    }
    LOG_INFO("Wrapped server running (pid " + std::to_string(pid) + ")");

    if (tools_changed_hook_) {
        tools_changed_hook_();
    }
    return core::errors::ok();
}

core::errors::Result<RestartOutcome> WrappeeController::restart() {
    std::unique_lock<std::mutex> gate(restart_gate_, std::try_to_lock);
    if (!gate.owns_lock()) {
        return ProxyError{ErrorCategory::Unavailable, "A restart is already in progress.",
                          "restart_in_progress", "Retry once the current restart finishes."};
    }

    RestartOutcome outcome;
    std::shared_ptr<WrappeeClient> previous;
    {
        std::unique_lock<std::shared_mutex> lock(state_mutex_);
        if (state_.status != WrappeeStatus::Running && state_.status != WrappeeStatus::Failed) {
            return ProxyError{ErrorCategory::Unavailable,
                              "Cannot restart wrapped server while " + describe(state_),
                              "invalid_state"};
        }
        if (state_.status == WrappeeStatus::Running) {
            outcome.old_pid = state_.pid;
        }
        previous = std::move(client_);
        state_ = WrappeeState{WrappeeStatus::Restarting, outcome.old_pid, ""};
    }

    if (previous) {
        const int status = previous->shutdown(options_.terminate_grace);
        LOG_INFO("Stopped wrapped server (pid " + std::to_string(previous->pid()) +
                 ", status " + std::to_string(status) + ")");
        previous.reset();
    }

    set_state(WrappeeState{WrappeeStatus::Starting, std::nullopt, ""});
    auto launched = launch_client();
    if (core::errors::is_error(launched)) {
        fail(core::errors::get_error(launched).message);
        return core::errors::get_error(launched);
    }
    auto client = core::errors::take_value(launched);

    bool tools_refreshed = false;
    if (discovery_hook_) {
        const auto discovered = discovery_hook_(*client);
        if (core::errors::is_error(discovered)) {
            LOG_WARN("Keeping previous tool list after restart: " +
                     core::errors::get_error(discovered).message);
        } else {
            tools_refreshed = true;
        }
    }

    outcome.new_pid = client->pid();
    {
        std::unique_lock<std::shared_mutex> lock(state_mutex_);
        client_ = std::move(client);
        state_ = WrappeeState{WrappeeStatus::Running, outcome.new_pid, ""};
    }
    LOG_INFO("Wrapped server restarted: pid " +
             (outcome.old_pid ? std::to_string(*outcome.old_pid) : std::string("none")) +
             " -> " + std::to_string(outcome.new_pid));

    if (tools_refreshed && tools_changed_hook_) {
        tools_changed_hook_();
    }
    return outcome;
}

void WrappeeController::shutdown() {
    std::call_once(shutdown_once_, [this] {
        std::unique_ptr<BinaryWatcher> watcher;
        {
            std::lock_guard<std::mutex> lock(watch_mutex_);
            watcher = std::move(watcher_);
        }
        // The watcher thread calls back into handle_file_change, so stop it unlocked.
        if (watcher) {
            watcher->stop();
        }
        debouncer_->stop();

        // Blocks until an in-flight restart settles.
        std::lock_guard<std::mutex> gate(restart_gate_);
        std::shared_ptr<WrappeeClient> client;
        {
            std::unique_lock<std::shared_mutex> lock(state_mutex_);
            client = std::move(client_);
            state_ = WrappeeState{WrappeeStatus::Stopped, std::nullopt, ""};
        }
        if (client) {
            const int status = client->shutdown(options_.terminate_grace);
            LOG_INFO("Wrapped server (pid " + std::to_string(client->pid()) +
                     ") stopped with status " + std::to_string(status));
        }
    });
}

WrappeeState WrappeeController::state() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return state_;
}

core::errors::Result<std::shared_ptr<WrappeeClient>> WrappeeController::acquire_client() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    if (state_.status == WrappeeStatus::Running && client_) {
        return client_;
    }

    std::string hint;
    switch (state_.status) {
        case WrappeeStatus::Restarting:
        case WrappeeStatus::Starting:
            hint = "Retry in a moment.";
            break;
        case WrappeeStatus::Failed:
            hint = "Use restart_wrapped_server to try again.";
            break;
        default:
            break;
    }
    return ProxyError{ErrorCategory::Unavailable,
                      "Wrapped server is unavailable: " + describe(state_),
                      "wrappee_unavailable", hint};
}

std::vector<protocol::ToolDescriptor> WrappeeController::current_tool_descriptors() const {
    if (!descriptor_source_) {
        return {};
    }
    return descriptor_source_();
}

void WrappeeController::on_unexpected_exit(const pid_t pid) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    if (state_.status != WrappeeStatus::Running || !state_.pid || *state_.pid != pid) {
        return;
    }
    const std::string reason = "Wrapped server (pid " + std::to_string(pid) + ") exited unexpectedly";
    LOG_ERROR(reason);
    state_ = WrappeeState{WrappeeStatus::Failed, std::nullopt, reason};
}

void WrappeeController::handle_file_change_signal() {
    debouncer_->signal();
}

void WrappeeController::handle_file_change(const FileChange change) {
    LOG_DEBUG("Wrapped binary " + to_string(change));
    std::lock_guard<std::mutex> lock(watch_mutex_);
    switch (change) {
        case FileChange::Removed:
            // A rebuild usually deletes then recreates the binary; wait for it to come back.
            binary_removed_ = true;
            debouncer_->cancel();
            LOG_INFO("Wrapped binary removed; waiting for it to reappear");
            break;
        case FileChange::Created:
            binary_removed_ = false;
            debouncer_->signal();
            break;
        case FileChange::Modified:
            if (!binary_removed_) {
                debouncer_->signal();
            }
            break;
    }
}

core::errors::Status WrappeeController::watch_binary(const std::filesystem::path& path) {
    auto watcher = std::make_unique<BinaryWatcher>(
        path, [this](const FileChange change) { handle_file_change(change); });
    const auto started = watcher->start();
    if (core::errors::is_error(started)) {
        return started;
    }
    std::lock_guard<std::mutex> lock(watch_mutex_);
    watcher_ = std::move(watcher);
    return core::errors::ok();
}

bool WrappeeController::restart_pending() const {
    return debouncer_->is_pending();
}

void WrappeeController::on_debounce_elapsed() {
    const WrappeeStatus status = state().status;
    if (status == WrappeeStatus::NotStarted) {
        LOG_INFO("Wrapped binary appeared; starting it");
        const auto started = start();
        if (core::errors::is_error(started)) {
            LOG_ERROR("Start after file change failed: " + core::errors::get_error(started).message);
        }
        return;
    }
    if (status != WrappeeStatus::Running && status != WrappeeStatus::Failed) {
        LOG_DEBUG("Ignoring file change while " + to_string(status));
        return;
    }

    LOG_INFO("Wrapped binary changed; restarting");
    const auto restarted = restart();
    if (core::errors::is_error(restarted)) {
        LOG_ERROR("Restart after file change failed: " +
                  core::errors::get_error(restarted).message);
    }
}

}  // namespace wrapmcp::wrappee
