#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include "core/config/proxy_config.hpp"
#include "core/errors/proxy_errors.hpp"
#include "logstore/log_store.hpp"
#include "proxy/proxy_orchestrator.hpp"
#include "runtime/worker_pool.hpp"
#include "tools/tool_manager.hpp"
#include "wrappee/wrappee_controller.hpp"

namespace wrapmcp::app {

// Owns every long-lived component and wires them together.
// Startup is two-phase: initialize() builds the graph and starts the wrappee,
// run() arms the signal handlers and serves the configured transport.
class Application {
public:
    explicit Application(core::config::ProxyConfig config);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    core::errors::Status initialize();

    // Blocks until the client goes away or SIGINT/SIGTERM arrives. Returns the exit code.
    int run();

    // Stops accepting requests, terminates the wrappee, drains workers. Idempotent.
    void shutdown();

    // Async-signal-safe.
    static void request_stop();
    static bool stop_requested();

    logstore::LogStore& store() { return *store_; }
    wrappee::WrappeeController& controller() { return *controller_; }
    tools::ToolManager& tools() { return *tools_; }
    proxy::ProxyOrchestrator& orchestrator() { return *orchestrator_; }

private:
    core::errors::Status start_wrappee();
    void arm_signal_handlers();
    int serve_stdio();
    int serve_http();

    const core::config::ProxyConfig config_;

    std::shared_ptr<logstore::LogStore> store_;
    std::unique_ptr<wrappee::WrappeeController> controller_;
    std::unique_ptr<tools::ToolManager> tools_;
    std::unique_ptr<proxy::ProxyOrchestrator> orchestrator_;
    std::unique_ptr<runtime::WorkerPool> control_pool_;
    std::unique_ptr<runtime::WorkerPool> forward_pool_;

    std::once_flag shutdown_once_;
};

}  // namespace wrapmcp::app
