#pragma once

#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "core/errors/proxy_errors.hpp"

namespace wrapmcp::protocol {

namespace rpc_codes {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
// Implementation-defined server errors
constexpr int kShuttingDown = -32000;
constexpr int kUnavailable = -32002;
}  // namespace rpc_codes

struct RpcError {
    int code = rpc_codes::kInternalError;
    std::string message;
    std::optional<nlohmann::json> data;
};

// Canonical inbound shapes, after the transport has decoded the bytes.
struct InboundRequest {
    nlohmann::json id;
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

struct InboundNotification {
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

// A response the client sent back to us; the proxy issues no client-bound requests.
struct InboundResponse {
    nlohmann::json id;
};

using InboundMessage = std::variant<InboundRequest, InboundNotification, InboundResponse>;

struct OutboundResponse {
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;
};

core::errors::Result<InboundMessage> decode_message(const std::string& line);
core::errors::Result<InboundMessage> decode_message(const nlohmann::json& message);

nlohmann::json encode(const OutboundResponse& response);
nlohmann::json make_request(std::uint64_t id, const std::string& method,
                            const nlohmann::json& params);
nlohmann::json make_notification(const std::string& method,
                                 const nlohmann::json& params = nullptr);

OutboundResponse success(const nlohmann::json& id, nlohmann::json result);
OutboundResponse failure(const nlohmann::json& id, RpcError error);

// Serializes without throwing; invalid UTF-8 in strings is replaced with U+FFFD.
std::string dump_safe(const nlohmann::json& value, int indent = -1);

// Single-line wire form: compact JSON followed by '\n'.
std::string frame(const nlohmann::json& message);

}  // namespace wrapmcp::protocol
