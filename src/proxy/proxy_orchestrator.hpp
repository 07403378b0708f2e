#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/proxy_errors.hpp"
#include "logstore/log_store.hpp"
#include "protocol/jsonrpc.hpp"
#include "tools/tool_manager.hpp"

namespace wrapmcp::proxy {

// Outbound side of a client-facing transport.
class NotificationSink {
public:
    virtual ~NotificationSink() = default;
    virtual void send_notification(const nlohmann::json& message) = 0;
};

// Maps a proxy error onto the JSON-RPC error the client sees.
protocol::RpcError to_rpc_error(const core::errors::ProxyError& error);

// Protocol front door. Transports decode bytes into InboundMessage values and hand them here;
// the orchestrator answers, logs forwarded tool calls and relays list-changed notifications.
class ProxyOrchestrator {
public:
    ProxyOrchestrator(tools::ToolManager& tools, std::shared_ptr<logstore::LogStore> store,
                      std::string protocol_version);

    ProxyOrchestrator(const ProxyOrchestrator&) = delete;
    ProxyOrchestrator& operator=(const ProxyOrchestrator&) = delete;

    // Non-owning; pass nullptr to detach.
    void attach_sink(NotificationSink* sink);

    // Returns the encoded response for requests, nothing for notifications and responses.
    std::optional<nlohmann::json> handle_message(const protocol::InboundMessage& message);

    protocol::OutboundResponse handle_request(const protocol::InboundRequest& request);

    // True for a tools/call that goes to the wrappee. Only these can wait out the
    // forwarding timeout; transports keep them apart from everything else.
    bool forwards(const protocol::InboundMessage& message) const;
    void handle_notification(const protocol::InboundNotification& notification);

    // Sends notifications/tools/list_changed once the client has initialized.
    void notify_tools_changed();

    // Every request after this is refused.
    void stop_accepting();
    bool accepting() const { return accepting_.load(); }

    nlohmann::json server_info() const;

private:
    protocol::OutboundResponse handle_initialize(const protocol::InboundRequest& request);
    protocol::OutboundResponse handle_tools_list(const protocol::InboundRequest& request);
    protocol::OutboundResponse handle_tools_call(const protocol::InboundRequest& request);

    tools::ToolManager& tools_;
    std::shared_ptr<logstore::LogStore> store_;
    const std::string protocol_version_;

    std::atomic<bool> accepting_{true};
    std::atomic<bool> client_initialized_{false};

    std::mutex sink_mutex_;
    NotificationSink* sink_ = nullptr;
};

}  // namespace wrapmcp::proxy
