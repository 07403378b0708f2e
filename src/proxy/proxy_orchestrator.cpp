#include "proxy/proxy_orchestrator.hpp"

#include <chrono>
#include <utility>
#include "core/config/proxy_config.hpp"
#include "core/logging/logger.hpp"

namespace wrapmcp::proxy {

using core::errors::ErrorCategory;
using core::errors::ProxyError;
using nlohmann::json;
namespace rpc_codes = protocol::rpc_codes;

namespace {

constexpr const char* kInstructions =
    "This is a transparent MCP wrapper that logs all requests/responses while proxying to a "
    "wrapped MCP server. Use show_log to inspect recorded traffic, clear_log to reset it and "
    "restart_wrapped_server to relaunch the wrapped server.";

protocol::RpcError rpc_error(const int code, std::string message,
                             std::optional<json> data = std::nullopt) {
    return protocol::RpcError{code, std::move(message), std::move(data)};
}

}  // namespace

protocol::RpcError to_rpc_error(const ProxyError& error) {
    std::optional<json> data;
    if (!error.hint.empty()) {
        data = json{{"code", error.code}, {"hint", error.hint}};
    }

    switch (error.category) {
        case ErrorCategory::Forwarding:
            if (error.rpc_code.has_value()) {
                std::optional<json> passthrough;
                if (!error.rpc_data.is_null()) {
                    passthrough = error.rpc_data;
                }
                return rpc_error(*error.rpc_code, error.message, std::move(passthrough));
            }
            return rpc_error(rpc_codes::kInternalError, error.message, std::move(data));
        case ErrorCategory::NotFound:
        case ErrorCategory::Input:
            return rpc_error(error.rpc_code.value_or(rpc_codes::kInvalidParams), error.message,
                             std::move(data));
        case ErrorCategory::Unavailable:
            return rpc_error(rpc_codes::kUnavailable, error.message, std::move(data));
        default:
            return rpc_error(rpc_codes::kInternalError, error.message, std::move(data));
    }
}

ProxyOrchestrator::ProxyOrchestrator(tools::ToolManager& tools,
                                     std::shared_ptr<logstore::LogStore> store,
                                     std::string protocol_version)
    : tools_(tools), store_(std::move(store)), protocol_version_(std::move(protocol_version)) {}

void ProxyOrchestrator::attach_sink(NotificationSink* sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = sink;
}

json ProxyOrchestrator::server_info() const {
    return json{{"name", core::config::kProgramName},
                {"version", core::config::kProgramVersion}};
}

std::optional<json> ProxyOrchestrator::handle_message(const protocol::InboundMessage& message) {
    if (const auto* request = std::get_if<protocol::InboundRequest>(&message)) {
        return protocol::encode(handle_request(*request));
    }
    if (const auto* notification = std::get_if<protocol::InboundNotification>(&message)) {
        handle_notification(*notification);
        return std::nullopt;
    }
    LOG_DEBUG("Ignoring client response for id " +
              std::get<protocol::InboundResponse>(message).id.dump());
    return std::nullopt;
}

protocol::OutboundResponse ProxyOrchestrator::handle_request(
    const protocol::InboundRequest& request) {
    if (!accepting_.load()) {
        return protocol::failure(request.id,
                                 rpc_error(rpc_codes::kShuttingDown, "Server is shutting down"));
    }

    LOG_DEBUG("Client request " + request.id.dump() + ": " + request.method);
    if (request.method == "initialize") {
        return handle_initialize(request);
    }
    if (request.method == "ping") {
        return protocol::success(request.id, json::object());
    }
    if (request.method == "tools/list") {
        return handle_tools_list(request);
    }
    if (request.method == "tools/call") {
        return handle_tools_call(request);
    }
    return protocol::failure(request.id, rpc_error(rpc_codes::kMethodNotFound,
                                                   "Method not found: " + request.method));
}

bool ProxyOrchestrator::forwards(const protocol::InboundMessage& message) const {
    const auto* request = std::get_if<protocol::InboundRequest>(&message);
    if (request == nullptr || request->method != "tools/call" || !request->params.is_object()) {
        return false;
    }
    const auto name = request->params.find("name");
    if (name == request->params.end() || !name->is_string()) {
        return false;
    }
    return !tools_.is_builtin(protocol::ToolName(name->get<std::string>()));
}

void ProxyOrchestrator::handle_notification(const protocol::InboundNotification& notification) {
    if (notification.method == "notifications/initialized") {
        client_initialized_.store(true);
        LOG_INFO("Client initialized");
        return;
    }
    // Forwarded calls are only ever cancelled by their timeout.
    LOG_DEBUG("Ignoring client notification: " + notification.method);
}

protocol::OutboundResponse ProxyOrchestrator::handle_initialize(
    const protocol::InboundRequest& request) {
    std::string version = protocol_version_;
    if (const auto requested = request.params.find("protocolVersion");
        requested != request.params.end() && requested->is_string() &&
        !requested->get<std::string>().empty()) {
        version = requested->get<std::string>();
    }

    json result;
    result["protocolVersion"] = version;
    result["capabilities"] = json{{"tools", {{"listChanged", true}}}};
    result["serverInfo"] = server_info();
    result["instructions"] = kInstructions;
    return protocol::success(request.id, std::move(result));
}

protocol::OutboundResponse ProxyOrchestrator::handle_tools_list(
    const protocol::InboundRequest& request) {
    json listed = json::array();
    for (const auto& tool : tools_.tools()) {
        listed.push_back(protocol::to_json(tool));
    }
    return protocol::success(request.id, json{{"tools", std::move(listed)}});
}

protocol::OutboundResponse ProxyOrchestrator::handle_tools_call(
    const protocol::InboundRequest& request) {
    const json& params = request.params;
    const auto name_it = params.find("name");
    if (!params.is_object() || name_it == params.end() || !name_it->is_string()) {
        return protocol::failure(
            request.id, rpc_error(rpc_codes::kInvalidParams, "tools/call requires a string 'name'"));
    }

    const protocol::ToolName name(name_it->get<std::string>());
    json arguments = json::object();
    if (const auto args = params.find("arguments"); args != params.end() && !args->is_null()) {
        arguments = *args;
    }

    // Built-ins are answered locally and stay out of the interaction log.
    if (tools_.is_builtin(name)) {
        auto result = tools_.invoke(name, arguments);
        if (core::errors::is_error(result)) {
            return protocol::failure(request.id, to_rpc_error(core::errors::get_error(result)));
        }
        return protocol::success(request.id, core::errors::take_value(result));
    }

    const protocol::RequestId correlation(store_->record_request(name, arguments));
    const auto started = std::chrono::steady_clock::now();
    auto result = tools_.invoke(name, arguments);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (!core::errors::is_error(result)) {
        json value = core::errors::take_value(result);
        store_->record_response(name, correlation, value, elapsed);
        return protocol::success(request.id, std::move(value));
    }

    const ProxyError& error = core::errors::get_error(result);
    store_->record_error(name, correlation, error.message, elapsed);
    if (error.category == ErrorCategory::Timeout) {
        return protocol::success(request.id, protocol::text_result(error.message, true));
    }
    return protocol::failure(request.id, to_rpc_error(error));
}

void ProxyOrchestrator::notify_tools_changed() {
    if (!client_initialized_.load()) {
        LOG_DEBUG("Tool list changed before the client initialized; not notifying");
        return;
    }
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (sink_ == nullptr) {
        return;
    }
    LOG_INFO("Sending tools/list_changed notification to client");
    sink_->send_notification(protocol::make_notification("notifications/tools/list_changed"));
}

void ProxyOrchestrator::stop_accepting() {
    if (accepting_.exchange(false)) {
        LOG_INFO("No longer accepting client requests");
    }
}

}  // namespace wrapmcp::proxy
