#include "app/application.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <thread>
#include <utility>
#include "app/http_transport.hpp"
#include "app/stdio_transport.hpp"
#include "core/logging/logger.hpp"
#include "tools/builtin_tools.hpp"

namespace wrapmcp::app {

using core::config::TransportKind;

namespace {

constexpr std::size_t kControlThreads = 2;
constexpr std::size_t kForwardThreads = 8;
constexpr std::chrono::milliseconds kStopPollInterval{200};

std::atomic<bool> g_stop_requested{false};

void handle_signal(int /*signal*/) {
    Application::request_stop();
}

}  // namespace

Application::Application(core::config::ProxyConfig config) : config_(std::move(config)) {}

Application::~Application() {
    shutdown();
}

void Application::request_stop() {
    g_stop_requested.store(true);
}

bool Application::stop_requested() {
    return g_stop_requested.load();
}

core::errors::Status Application::initialize() {
    store_ = std::make_shared<logstore::LogStore>(config_.log_size);

    wrappee::ControllerOptions options;
    options.spawn.command = config_.command;
    options.spawn.args = config_.args;
    options.spawn.suppress_colors = !config_.preserve_ansi;
    options.protocol_version = config_.protocol_version;
    options.preserve_ansi = config_.preserve_ansi;
    options.handshake_timeout = std::chrono::seconds(config_.tool_timeout_secs);

    auto store = store_;
    controller_ = std::make_unique<wrappee::WrappeeController>(
        std::move(options), [store](const std::string& line) { store->record_stderr(line); });

    tools::BuiltinTools builtins(store_, [this] { return controller_->restart(); });
    tools_ = std::make_unique<tools::ToolManager>(
        std::move(builtins), *controller_, std::chrono::seconds(config_.tool_timeout_secs));
    tools_->attach();

    orchestrator_ =
        std::make_unique<proxy::ProxyOrchestrator>(*tools_, store_, config_.protocol_version);
    controller_->set_tools_changed_hook([this] { orchestrator_->notify_tools_changed(); });

    LOG_INFO("wrap-mcp " + std::string(core::config::kProgramVersion) + " (transport " +
             core::config::to_string(config_.transport) + ", log size " +
             std::to_string(config_.log_size) + ", timeout " +
             std::to_string(config_.tool_timeout_secs) + "s)");
    return start_wrappee();
}

core::errors::Status Application::start_wrappee() {
    if (!config_.watch_binary) {
        return controller_->start();
    }

    const auto watched = controller_->watch_binary(config_.command);
    if (core::errors::is_error(watched)) {
        LOG_WARN("File watching disabled: " + core::errors::get_error(watched).message);
    }

    std::error_code ec;
    if (!std::filesystem::exists(config_.command, ec)) {
        LOG_INFO("Waiting for " + config_.command + " to appear");
        return core::errors::ok();
    }

    // In watch mode a broken binary is expected to be fixed and rebuilt.
    const auto started = controller_->start();
    if (core::errors::is_error(started)) {
        LOG_WARN("Initial start failed, waiting for the binary to change: " +
                 core::errors::get_error(started).message);
    }
    return core::errors::ok();
}

void Application::arm_signal_handlers() {
    static_cast<void>(std::signal(SIGINT, handle_signal));
    static_cast<void>(std::signal(SIGTERM, handle_signal));
}

int Application::run() {
    control_pool_ = std::make_unique<runtime::WorkerPool>(kControlThreads);
    forward_pool_ = std::make_unique<runtime::WorkerPool>(kForwardThreads);
    arm_signal_handlers();

    const int code = config_.transport == TransportKind::Http ? serve_http() : serve_stdio();
    LOG_INFO("Shutting down");
    return code;
}

int Application::serve_stdio() {
    StdioTransport transport(*orchestrator_, *control_pool_, *forward_pool_);
    orchestrator_->attach_sink(&transport);
    transport.run(g_stop_requested);

    // Queued requests still answer through the transport, so it has to outlive the pools.
    shutdown();
    orchestrator_->attach_sink(nullptr);
    return 0;
}

int Application::serve_http() {
    HttpTransport transport(*orchestrator_, config_.http_host, config_.http_port);
    const auto started = transport.start();
    if (core::errors::is_error(started)) {
        const auto& err = core::errors::get_error(started);
        LOG_ERROR("Failed to start HTTP transport [" + err.code + "]: " + err.message);
        shutdown();
        return 3;
    }
    orchestrator_->attach_sink(&transport);

    while (!g_stop_requested.load()) {
        std::this_thread::sleep_for(kStopPollInterval);
    }

    shutdown();
    orchestrator_->attach_sink(nullptr);
    transport.stop();
    return 0;
}

void Application::shutdown() {
    std::call_once(shutdown_once_, [this] {
        if (orchestrator_) {
            orchestrator_->stop_accepting();
        }
        if (controller_) {
            controller_->shutdown();
        }
        if (forward_pool_) {
            forward_pool_->stop();
        }
        if (control_pool_) {
            control_pool_->stop();
        }
        if (store_) {
            LOG_INFO("Stopped; " + std::to_string(store_->size()) + " log entries retained");
        }
    });
}

}  // namespace wrapmcp::app
