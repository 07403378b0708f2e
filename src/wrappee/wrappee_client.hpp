#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/proxy_errors.hpp"
#include "process/process_handle.hpp"
#include "protocol/tool_contract.hpp"
#include "wrappee/request_id_allocator.hpp"

namespace wrapmcp::wrappee {

using StderrSink = std::function<void(const std::string& line)>;

constexpr std::size_t kDefaultMaxLineBytes = 16 * 1024 * 1024;

struct ClientOptions {
    bool preserve_ansi = false;
    // Longer lines on either stream are dropped with a warning.
    std::size_t max_line_bytes = kDefaultMaxLineBytes;
    StderrSink stderr_sink;
    // Fires once when the wrappee's stdout closes without shutdown() having been called.
    std::function<void(pid_t pid)> on_unexpected_exit;
};

// Line-delimited JSON-RPC connection to one wrappee process.
//
// Calls are correlated by id through a table of pending promises. Two reader threads
// run for the lifetime of the client: one for protocol frames on stdout, one for the
// diagnostic stream on stderr. Neither waits on the other.
class WrappeeClient {
public:
    static core::errors::Result<std::shared_ptr<WrappeeClient>> launch(
        const process::SpawnOptions& spawn, std::shared_ptr<RequestIdAllocator> ids,
        ClientOptions options);

    WrappeeClient(std::unique_ptr<process::ProcessHandle> process,
                  std::shared_ptr<RequestIdAllocator> ids, ClientOptions options);
    ~WrappeeClient();

    WrappeeClient(const WrappeeClient&) = delete;
    WrappeeClient& operator=(const WrappeeClient&) = delete;

    // Sends a request and waits up to `timeout` for the matching response.
    // A JSON-RPC error from the wrappee comes back as a Forwarding error carrying the
    // wrappee's code, message and data.
    core::errors::Result<nlohmann::json> call(const std::string& method,
                                              const nlohmann::json& params,
                                              std::chrono::milliseconds timeout);

    core::errors::Status notify(const std::string& method, const nlohmann::json& params = nullptr);

    // initialize + notifications/initialized. Returns the wrappee's initialize result.
    core::errors::Result<nlohmann::json> initialize(const std::string& protocol_version,
                                                    std::chrono::milliseconds timeout);

    // tools/list, following nextCursor until the wrappee stops paginating.
    core::errors::Result<std::vector<protocol::ToolDescriptor>> list_tools(
        std::chrono::milliseconds timeout);

    // Terminates the process and joins both readers. Idempotent.
    int shutdown(std::chrono::milliseconds grace);

    pid_t pid() const { return pid_; }
    bool is_closed() const { return closed_.load(); }
    std::size_t pending_count() const;
    bool has_pending(protocol::RequestId id) const;

private:
    using PendingMap =
        std::unordered_map<std::uint64_t, std::promise<core::errors::Result<nlohmann::json>>>;

    void start_readers();
    void stdout_loop();
    void stderr_loop();

    void handle_frame(const std::string& line);
    void handle_wrappee_request(const nlohmann::json& message);
    void fail_all_pending(const core::errors::ProxyError& error);
    void emit_stderr(const std::string& line);

    std::unique_ptr<process::ProcessHandle> process_;
    std::shared_ptr<RequestIdAllocator> ids_;
    ClientOptions options_;
    const pid_t pid_;

    mutable std::mutex pending_mutex_;
    PendingMap pending_;

    std::atomic<bool> stopping_{false};
    std::atomic<bool> closed_{false};

    std::mutex shutdown_mutex_;
    bool shut_down_ = false;
    int exit_status_ = -1;

    std::thread stdout_reader_;
    std::thread stderr_reader_;
};

}  // namespace wrapmcp::wrappee
