#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/proxy_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/builtin_tools.hpp"
#include "wrappee/wrappee_client.hpp"
#include "wrappee/wrappee_controller.hpp"

namespace wrapmcp::tools {

// Routes tool calls to the built-ins or to the wrappee, and caches the advertised tool list.
class ToolManager {
public:
    ToolManager(BuiltinTools builtins, wrappee::WrappeeController& controller,
                std::chrono::milliseconds call_timeout);

    // Refreshes the wrappee half of the cache from the currently running client.
    core::errors::Status discover();

    // Same, against a specific client (used by the controller before it publishes the client).
    core::errors::Status discover_with(wrappee::WrappeeClient& client);

    // Built-ins first, then the wrappee. Forwarded calls use `timeout` or the configured default.
    core::errors::Result<nlohmann::json> invoke(
        const protocol::ToolName& name, const nlohmann::json& arguments,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    std::vector<protocol::ToolDescriptor> tools() const;
    std::optional<protocol::ToolDescriptor> find(const protocol::ToolName& name) const;
    bool is_builtin(const protocol::ToolName& name) const { return builtins_.handles(name); }

    // Wires discovery and descriptor lookup into the controller.
    void attach();

private:
    void replace_cache(std::vector<protocol::ToolDescriptor> wrappee_tools);

    BuiltinTools builtins_;
    wrappee::WrappeeController& controller_;
    const std::chrono::milliseconds call_timeout_;

    mutable std::shared_mutex cache_mutex_;
    std::vector<protocol::ToolDescriptor> cache_;
};

}  // namespace wrapmcp::tools
