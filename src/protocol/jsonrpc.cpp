#include "protocol/jsonrpc.hpp"

#include <utility>

namespace wrapmcp::protocol {

using core::errors::ErrorCategory;
using core::errors::ProxyError;
using nlohmann::json;

core::errors::Result<InboundMessage> decode_message(const std::string& line) {
    json parsed = json::parse(line, nullptr, false);
    if (parsed.is_discarded()) {
        ProxyError error{ErrorCategory::Input, "Message is not valid JSON.", "parse_error"};
        error.rpc_code = rpc_codes::kParseError;
        return error;
    }
    return decode_message(parsed);
}

core::errors::Result<InboundMessage> decode_message(const json& message) {
    if (!message.is_object()) {
        ProxyError error{ErrorCategory::Input, "Message must be a JSON object.",
                         "invalid_request"};
        error.rpc_code = rpc_codes::kInvalidRequest;
        return error;
    }

    const bool has_id = message.contains("id") && !message.at("id").is_null();
    const auto method_it = message.find("method");
    if (method_it == message.end()) {
        if (has_id && (message.contains("result") || message.contains("error"))) {
            return InboundMessage{InboundResponse{message.at("id")}};
        }
        ProxyError error{ErrorCategory::Input, "Message has no method.", "invalid_request"};
        error.rpc_code = rpc_codes::kInvalidRequest;
        return error;
    }
    if (!method_it->is_string()) {
        ProxyError error{ErrorCategory::Input, "Method must be a string.", "invalid_request"};
        error.rpc_code = rpc_codes::kInvalidRequest;
        return error;
    }

    json params = json::object();
    if (auto params_it = message.find("params");
        params_it != message.end() && !params_it->is_null()) {
        params = *params_it;
    }

    if (has_id) {
        const json& id = message.at("id");
        if (!id.is_number_integer() && !id.is_string()) {
            ProxyError error{ErrorCategory::Input, "Request id must be a string or integer.",
                             "invalid_request"};
            error.rpc_code = rpc_codes::kInvalidRequest;
            return error;
        }
        return InboundMessage{InboundRequest{id, method_it->get<std::string>(), std::move(params)}};
    }
    return InboundMessage{InboundNotification{method_it->get<std::string>(), std::move(params)}};
}

json encode(const OutboundResponse& response) {
    json out;
    out["jsonrpc"] = "2.0";
    out["id"] = response.id;
    if (response.error.has_value()) {
        json error;
        error["code"] = response.error->code;
        error["message"] = response.error->message;
        if (response.error->data.has_value() && !response.error->data->is_null()) {
            error["data"] = *response.error->data;
        }
        out["error"] = std::move(error);
    } else {
        out["result"] = response.result.value_or(json::object());
    }
    return out;
}

json make_request(const std::uint64_t id, const std::string& method, const json& params) {
    json out;
    out["jsonrpc"] = "2.0";
    out["id"] = id;
    out["method"] = method;
    out["params"] = params.is_null() ? json::object() : params;
    return out;
}

json make_notification(const std::string& method, const json& params) {
    json out;
    out["jsonrpc"] = "2.0";
    out["method"] = method;
    if (!params.is_null()) {
        out["params"] = params;
    }
    return out;
}

OutboundResponse success(const json& id, json result) {
    OutboundResponse response;
    response.id = id;
    response.result = std::move(result);
    return response;
}

OutboundResponse failure(const json& id, RpcError error) {
    OutboundResponse response;
    response.id = id;
    response.error = std::move(error);
    return response;
}

std::string dump_safe(const json& value, const int indent) {
    return value.dump(indent, ' ', false, json::error_handler_t::replace);
}

std::string frame(const json& message) {
    // Invalid UTF-8 from the wrappee must not throw out of the writer.
    return dump_safe(message) + "\n";
}

}  // namespace wrapmcp::protocol
