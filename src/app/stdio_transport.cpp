#include "app/stdio_transport.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include "core/logging/logger.hpp"

namespace wrapmcp::app {

using nlohmann::json;

namespace {

constexpr int kPollTimeoutMs = 100;

}  // namespace

StdioTransport::StdioTransport(proxy::ProxyOrchestrator& orchestrator,
                               runtime::WorkerPool& control_pool,
                               runtime::WorkerPool& forward_pool, const int in_fd,
                               const int out_fd, const std::size_t max_line_bytes)
    : orchestrator_(orchestrator),
      control_pool_(control_pool),
      forward_pool_(forward_pool),
      in_fd_(in_fd),
      out_fd_(out_fd),
      max_line_bytes_(max_line_bytes) {}

void StdioTransport::run(const std::atomic<bool>& stop_requested) {
    std::string buffer;
    bool discarding = false;
    char chunk[8192];
    while (!stop_requested.load()) {
        pollfd pfd{in_fd_, POLLIN, 0};
        const int ready = poll(&pfd, 1, kPollTimeoutMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR(std::string("poll on client input failed: ") + std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        const ssize_t n = read(in_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            LOG_ERROR(std::string("read on client input failed: ") + std::strerror(errno));
            break;
        }
        if (n == 0) {
            LOG_INFO("Client closed input");
            break;
        }
        buffer.append(chunk, static_cast<std::size_t>(n));

        std::size_t start = 0;
        for (std::size_t newline = buffer.find('\n', start); newline != std::string::npos;
             newline = buffer.find('\n', start)) {
            const std::size_t length = newline - start;
            if (discarding) {
                discarding = false;
            } else if (length > max_line_bytes_) {
                reject_oversized(length);
            } else {
                std::string line = buffer.substr(start, length);
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                if (!line.empty()) {
                    dispatch(line);
                }
            }
            start = newline + 1;
        }
        buffer.erase(0, start);

        // The rest of an oversized message is skipped up to its newline.
        if (buffer.size() > max_line_bytes_) {
            if (!discarding) {
                reject_oversized(buffer.size());
            }
            discarding = true;
            buffer.clear();
        }
    }
    if (!buffer.empty() && !discarding && !stop_requested.load()) {
        dispatch(buffer);
    }
}

void StdioTransport::reject_oversized(const std::size_t length) {
    LOG_WARN("Dropping client message of at least " + std::to_string(length) +
             " bytes (limit " + std::to_string(max_line_bytes_) + ")");
    write_message(protocol::encode(protocol::failure(
        nullptr,
        protocol::RpcError{protocol::rpc_codes::kInvalidRequest,
                           "Message exceeds " + std::to_string(max_line_bytes_) + " bytes",
                           std::nullopt})));
}

void StdioTransport::dispatch(const std::string& line) {
    lines_read_.fetch_add(1);
    auto decoded = protocol::decode_message(line);
    if (core::errors::is_error(decoded)) {
        const auto& error = core::errors::get_error(decoded);
        LOG_WARN("Rejecting client message: " + error.message);
        write_message(protocol::encode(protocol::failure(
            nullptr, protocol::RpcError{error.rpc_code.value_or(protocol::rpc_codes::kInvalidRequest),
                                        error.message, std::nullopt})));
        return;
    }

    protocol::InboundMessage message = core::errors::take_value(decoded);
    if (!std::holds_alternative<protocol::InboundRequest>(message)) {
        // Notifications are cheap and must keep their order relative to later requests.
        static_cast<void>(orchestrator_.handle_message(message));
        return;
    }

    const json id = std::get<protocol::InboundRequest>(message).id;
    runtime::WorkerPool& pool = orchestrator_.forwards(message) ? forward_pool_ : control_pool_;
    const bool queued = pool.submit([this, message = std::move(message)] {
        if (auto response = orchestrator_.handle_message(message)) {
            write_message(*response);
        }
    });
    if (!queued) {
        write_message(protocol::encode(protocol::failure(
            id, protocol::RpcError{protocol::rpc_codes::kShuttingDown, "Server is shutting down",
                                   std::nullopt})));
    }
}

void StdioTransport::write_message(const json& message) {
    const std::string framed = protocol::frame(message);
    std::lock_guard<std::mutex> lock(write_mutex_);
    std::size_t offset = 0;
    while (offset < framed.size()) {
        const ssize_t n = write(out_fd_, framed.data() + offset, framed.size() - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR(std::string("Failed to write to client: ") + std::strerror(errno));
            return;
        }
        offset += static_cast<std::size_t>(n);
    }
}

void StdioTransport::send_notification(const json& message) {
    write_message(message);
}

}  // namespace wrapmcp::app
