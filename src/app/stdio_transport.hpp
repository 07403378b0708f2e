#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include "proxy/proxy_orchestrator.hpp"
#include "runtime/worker_pool.hpp"

namespace wrapmcp::app {

// Newline-delimited JSON-RPC over a pair of file descriptors (stdin/stdout by default).
// Forwarded tool calls run on `forward_pool`, every other request on `control_pool`, so
// wrappee calls stuck until their timeout never delay built-ins or protocol requests.
// Responses are written whole, one per line, in completion order.
class StdioTransport : public proxy::NotificationSink {
public:
    // Longer lines are answered with -32600 and skipped.
    static constexpr std::size_t kMaxMessageBytes = 16 * 1024 * 1024;

    StdioTransport(proxy::ProxyOrchestrator& orchestrator, runtime::WorkerPool& control_pool,
                   runtime::WorkerPool& forward_pool, int in_fd = STDIN_FILENO,
                   int out_fd = STDOUT_FILENO, std::size_t max_line_bytes = kMaxMessageBytes);

    // Returns on end of input or once `stop_requested` is set.
    void run(const std::atomic<bool>& stop_requested);

    void send_notification(const nlohmann::json& message) override;

    std::size_t lines_read() const { return lines_read_.load(); }

private:
    void dispatch(const std::string& line);
    void write_message(const nlohmann::json& message);
    void reject_oversized(std::size_t length);

    proxy::ProxyOrchestrator& orchestrator_;
    runtime::WorkerPool& control_pool_;
    runtime::WorkerPool& forward_pool_;
    const int in_fd_;
    const int out_fd_;
    const std::size_t max_line_bytes_;

    std::mutex write_mutex_;
    std::atomic<std::size_t> lines_read_{0};
};

}  // namespace wrapmcp::app
