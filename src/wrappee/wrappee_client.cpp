#include "wrappee/wrappee_client.hpp"

#include <cerrno>
#include <optional>
#include <poll.h>
#include <unistd.h>
#include <utility>
#include "core/config/proxy_config.hpp"
#include "core/logging/logger.hpp"
#include "protocol/jsonrpc.hpp"
#include "wrappee/ansi_filter.hpp"

namespace wrapmcp::wrappee {

using core::errors::ErrorCategory;
using core::errors::ProxyError;
using nlohmann::json;

namespace {

constexpr int kPollTimeoutMs = 100;
constexpr std::size_t kMaxToolPages = 100;

// Reads `fd` until EOF and hands over one line at a time, without the trailing newline.
// Returns early once `stopping` is set and the pipe has gone quiet. A line longer than
// `max_line` is dropped whole; `describe` names the stream in the warning.
template <typename LineHandler>
void pump_lines(const int fd, const std::atomic<bool>& stopping, const std::size_t max_line,
                const char* describe, LineHandler&& on_line) {
    std::string buffer;
    bool discarding = false;
    char chunk[4096];
    while (true) {
        pollfd pfd{fd, POLLIN, 0};
        const int ready = poll(&pfd, 1, kPollTimeoutMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ready == 0) {
            if (stopping.load()) {
                break;
            }
            continue;
        }

        const ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            break;
        }
        if (n == 0) {
            break;
        }
        buffer.append(chunk, static_cast<std::size_t>(n));

        std::size_t start = 0;
        for (std::size_t newline = buffer.find('\n', start); newline != std::string::npos;
             newline = buffer.find('\n', start)) {
            const std::size_t length = newline - start;
            if (discarding) {
                discarding = false;
            } else if (length > max_line) {
                LOG_WARN(std::string("Dropping ") + describe + " line of " +
                         std::to_string(length) + " bytes (limit " + std::to_string(max_line) + ")");
            } else {
                std::string line = buffer.substr(start, length);
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                on_line(line);
            }
            start = newline + 1;
        }
        buffer.erase(0, start);

        if (buffer.size() > max_line) {
            if (!discarding) {
                LOG_WARN(std::string("Dropping ") + describe + " line longer than " +
                         std::to_string(max_line) + " bytes");
            }
            discarding = true;
            buffer.clear();
        }
    }
    if (!buffer.empty() && !discarding) {
        on_line(buffer);
    }
}

void join_reader(std::thread& reader) {
    if (!reader.joinable()) {
        return;
    }
    if (reader.get_id() == std::this_thread::get_id()) {
        reader.detach();
        return;
    }
    reader.join();
}

ProxyError forwarding_error_from(const json& error) {
    ProxyError out{ErrorCategory::Forwarding, "Wrapped server returned an error.",
                   "wrappee_error"};
    if (!error.is_object()) {
        return out;
    }
    if (const auto code = error.find("code"); code != error.end() && code->is_number_integer()) {
        out.rpc_code = code->get<int>();
    }
    if (const auto message = error.find("message");
        message != error.end() && message->is_string()) {
        out.message = message->get<std::string>();
    }
    if (const auto data = error.find("data"); data != error.end()) {
        out.rpc_data = *data;
    }
    return out;
}

std::string format_timeout(const std::chrono::milliseconds timeout) {
    if (timeout.count() % 1000 == 0) {
        return std::to_string(timeout.count() / 1000) + "s";
    }
    return std::to_string(timeout.count()) + "ms";
}

ProxyError timeout_error(const std::chrono::milliseconds timeout) {
    return ProxyError{ErrorCategory::Timeout,
                      "Request to wrapped server timed out after " + format_timeout(timeout),
                      "call_timeout", "The wrapped server may still be processing the request."};
}

}  // namespace

core::errors::Result<std::shared_ptr<WrappeeClient>> WrappeeClient::launch(
    const process::SpawnOptions& spawn, std::shared_ptr<RequestIdAllocator> ids,
    ClientOptions options) {
    auto spawned = process::ProcessHandle::spawn(spawn);
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }
    return std::make_shared<WrappeeClient>(core::errors::take_value(spawned), std::move(ids),
                                           std::move(options));
}

WrappeeClient::WrappeeClient(std::unique_ptr<process::ProcessHandle> process,
                             std::shared_ptr<RequestIdAllocator> ids, ClientOptions options)
    : process_(std::move(process)),
      ids_(std::move(ids)),
      options_(std::move(options)),
      pid_(process_->pid()) {
    start_readers();
}

WrappeeClient::~WrappeeClient() {
    static_cast<void>(shutdown(std::chrono::milliseconds(500)));
}

void WrappeeClient::start_readers() {
    stdout_reader_ = std::thread([this] { stdout_loop(); });
    stderr_reader_ = std::thread([this] { stderr_loop(); });
}

void WrappeeClient::stdout_loop() {
    pump_lines(process_->stdout_fd(), stopping_, options_.max_line_bytes, "wrapped server stdout",
               [this](const std::string& line) { handle_frame(line); });

    fail_all_pending(ProxyError{ErrorCategory::Forwarding,
                                "Wrapped server closed its output before responding.",
                                "wrappee_exited"});
    if (!stopping_.load()) {
        LOG_WARN("Wrapped server (pid " + std::to_string(pid_) + ") closed stdout unexpectedly");
        if (options_.on_unexpected_exit) {
            options_.on_unexpected_exit(pid_);
        }
    }
}

void WrappeeClient::stderr_loop() {
    pump_lines(process_->stderr_fd(), stopping_, options_.max_line_bytes, "wrapped server stderr",
               [this](const std::string& line) { emit_stderr(line); });
}

void WrappeeClient::emit_stderr(const std::string& line) {
    if (line.empty() || !options_.stderr_sink) {
        return;
    }
    options_.stderr_sink(options_.preserve_ansi ? line : strip_ansi(line));
}

void WrappeeClient::handle_frame(const std::string& line) {
    if (line.find_first_not_of(" \t") == std::string::npos) {
        return;
    }

    json message = json::parse(line, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        LOG_WARN("Discarding unparsable frame from wrapped server: " + line.substr(0, 200));
        return;
    }

    if (message.contains("method")) {
        if (message.contains("id") && !message["id"].is_null()) {
            handle_wrappee_request(message);
        } else {
            LOG_DEBUG("Notification from wrapped server: " + message["method"].dump());
        }
        return;
    }

    const auto id_it = message.find("id");
    if (id_it == message.end() || !id_it->is_number_unsigned()) {
        LOG_WARN("Discarding response with unrecognised id from wrapped server: " +
                 line.substr(0, 200));
        return;
    }

    const std::uint64_t id = id_it->get<std::uint64_t>();
    std::promise<core::errors::Result<json>> promise;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        const auto it = pending_.find(id);
        if (it == pending_.end()) {
            LOG_WARN("Discarding response for unknown request id " + std::to_string(id) +
                     " (timed out or never issued)");
            return;
        }
        promise = std::move(it->second);
        pending_.erase(it);
    }
    promise.set_value(std::move(message));
}

void WrappeeClient::handle_wrappee_request(const json& message) {
    const json& id = message["id"];
    const json method = message["method"];

    protocol::OutboundResponse reply;
    if (method == "ping") {
        reply = protocol::success(id, json::object());
    } else {
        reply = protocol::failure(
            id, protocol::RpcError{protocol::rpc_codes::kMethodNotFound,
                                   "Method not found: " + method.dump(), std::nullopt});
    }

    const auto written = process_->write(protocol::frame(protocol::encode(reply)));
    if (core::errors::is_error(written)) {
        LOG_WARN("Could not answer wrapped server request: " +
                 core::errors::get_error(written).message);
    }
}

void WrappeeClient::fail_all_pending(const ProxyError& error) {
    PendingMap drained;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        closed_.store(true);
        drained.swap(pending_);
    }
    for (auto& [id, promise] : drained) {
        LOG_DEBUG("Failing pending request " + std::to_string(id) + ": " + error.message);
        promise.set_value(error);
    }
}

core::errors::Result<json> WrappeeClient::call(const std::string& method, const json& params,
                                              const std::chrono::milliseconds timeout) {
    const protocol::RequestId id = ids_->next();
    std::future<core::errors::Result<json>> future;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (closed_.load()) {
            return ProxyError{ErrorCategory::Forwarding, "Wrapped server is not running.",
                              "wrappee_exited"};
        }
        future = pending_[id.value()].get_future();
    }

    // The write and the wait share one budget, so a wrappee that stops reading stdin
    // cannot hold the caller past `timeout`.
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const auto written =
        process_->write(protocol::frame(protocol::make_request(id.value(), method, params)), timeout);
    if (core::errors::is_error(written)) {
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            pending_.erase(id.value());
        }
        if (core::errors::get_error(written).category == ErrorCategory::Timeout) {
            LOG_WARN("Request " + id.to_string() + " (" + method + ") could not be sent within " +
                     format_timeout(timeout));
            return timeout_error(timeout);
        }
        return core::errors::get_error(written);
    }

    if (future.wait_until(deadline) != std::future_status::ready) {
        bool removed = false;
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            removed = pending_.erase(id.value()) > 0;
        }
        // If the entry is already gone the reader is resolving it right now.
        if (removed) {
            LOG_WARN("Request " + id.to_string() + " (" + method + ") timed out after " +
                     format_timeout(timeout));
            return timeout_error(timeout);
        }
    }

    auto response = future.get();
    if (core::errors::is_error(response)) {
        return core::errors::get_error(response);
    }

    const json& message = core::errors::get_value(response);
    if (const auto error = message.find("error"); error != message.end()) {
        return forwarding_error_from(*error);
    }
    if (const auto result = message.find("result"); result != message.end()) {
        return *result;
    }
    return json::object();
}

core::errors::Status WrappeeClient::notify(const std::string& method, const json& params) {
    if (closed_.load()) {
        return ProxyError{ErrorCategory::Forwarding, "Wrapped server is not running.",
                          "wrappee_exited"};
    }
    return process_->write(protocol::frame(protocol::make_notification(method, params)));
}

core::errors::Result<json> WrappeeClient::initialize(const std::string& protocol_version,
                                                    const std::chrono::milliseconds timeout) {
    const json params = {
        {"protocolVersion", protocol_version},
        {"capabilities", json::object()},
        {"clientInfo",
         {{"name", core::config::kProgramName}, {"version", core::config::kProgramVersion}}}};

    auto response = call("initialize", params, timeout);
    if (core::errors::is_error(response)) {
        const auto& cause = core::errors::get_error(response);
        return ProxyError{ErrorCategory::Handshake,
                          "Handshake with wrapped server failed: " + cause.message,
                          "handshake_failed", "Is the wrapped command an MCP server?"};
    }
    json result = core::errors::take_value(response);
    if (!result.is_object()) {
        return ProxyError{ErrorCategory::Handshake,
                          "Wrapped server sent a malformed initialize result.",
                          "handshake_failed"};
    }

    const auto sent = notify("notifications/initialized");
    if (core::errors::is_error(sent)) {
        return ProxyError{ErrorCategory::Handshake,
                          "Could not complete handshake: " + core::errors::get_error(sent).message,
                          "handshake_failed"};
    }

    LOG_INFO("Wrapped server (pid " + std::to_string(pid_) + ") speaks protocol " +
             result.value("protocolVersion", std::string("unknown")));
    return result;
}

core::errors::Result<std::vector<protocol::ToolDescriptor>> WrappeeClient::list_tools(
    const std::chrono::milliseconds timeout) {
    std::vector<protocol::ToolDescriptor> tools;
    std::optional<std::string> cursor;

    for (std::size_t page = 0; page < kMaxToolPages; ++page) {
        json params = json::object();
        if (cursor.has_value()) {
            params["cursor"] = *cursor;
        }

        auto response = call("tools/list", params, timeout);
        if (core::errors::is_error(response)) {
            const auto& cause = core::errors::get_error(response);
            return ProxyError{ErrorCategory::Discovery,
                              "Tool discovery failed: " + cause.message, "discovery_failed"};
        }
        const json& result = core::errors::get_value(response);
        const auto listed = result.find("tools");
        if (!result.is_object() || listed == result.end() || !listed->is_array()) {
            return ProxyError{ErrorCategory::Discovery,
                              "Wrapped server returned a tools/list result without a tools array.",
                              "discovery_failed"};
        }

        for (const auto& item : *listed) {
            if (!item.is_object() || !item.contains("name") || !item["name"].is_string()) {
                LOG_WARN("Ignoring tool without a name: " + item.dump());
                continue;
            }
            protocol::ToolDescriptor tool{protocol::ToolName(item["name"].get<std::string>())};
            if (item.contains("description") && item["description"].is_string()) {
                tool.description = item["description"].get<std::string>();
            }
            if (item.contains("inputSchema") && item["inputSchema"].is_object()) {
                tool.input_schema = item["inputSchema"];
            } else {
                tool.input_schema = json{{"type", "object"}};
            }
            tool.origin = protocol::ToolOrigin::Wrappee;
            for (auto it = item.begin(); it != item.end(); ++it) {
                if (it.key() != "name" && it.key() != "description" && it.key() != "inputSchema") {
                    tool.extra[it.key()] = it.value();
                }
            }
            tools.push_back(std::move(tool));
        }

        const auto next = result.find("nextCursor");
        if (next == result.end() || !next->is_string() || next->get<std::string>().empty()) {
            return tools;
        }
        cursor = next->get<std::string>();
    }

    LOG_WARN("tools/list pagination stopped after " + std::to_string(kMaxToolPages) + " pages");
    return tools;
}

int WrappeeClient::shutdown(const std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    if (shut_down_) {
        return exit_status_;
    }
    stopping_.store(true);
    exit_status_ = process_->terminate(grace);
    join_reader(stdout_reader_);
    join_reader(stderr_reader_);
    fail_all_pending(ProxyError{ErrorCategory::Forwarding, "Wrapped server was shut down.",
                                "wrappee_stopped"});
    shut_down_ = true;
    LOG_DEBUG("Wrapped server (pid " + std::to_string(pid_) + ") exited with status " +
              std::to_string(exit_status_));
    return exit_status_;
}

std::size_t WrappeeClient::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

bool WrappeeClient::has_pending(const protocol::RequestId id) const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.count(id.value()) > 0;
}

}  // namespace wrapmcp::wrappee
