#include "tools/tool_manager.hpp"

#include <mutex>
#include <unordered_set>
#include <utility>
#include "core/logging/logger.hpp"

namespace wrapmcp::tools {

using core::errors::ErrorCategory;
using core::errors::ProxyError;
using nlohmann::json;

ToolManager::ToolManager(BuiltinTools builtins, wrappee::WrappeeController& controller,
                         const std::chrono::milliseconds call_timeout)
    : builtins_(std::move(builtins)), controller_(controller), call_timeout_(call_timeout) {
    cache_ = builtins_.descriptors();
}

void ToolManager::attach() {
    controller_.set_discovery_hook(
        [this](wrappee::WrappeeClient& client) { return discover_with(client); });
    controller_.set_descriptor_source([this] { return tools(); });
}

core::errors::Status ToolManager::discover() {
    auto client = controller_.acquire_client();
    if (core::errors::is_error(client)) {
        return ProxyError{ErrorCategory::Discovery,
                          "Cannot discover tools: " + core::errors::get_error(client).message,
                          "discovery_failed"};
    }
    return discover_with(*core::errors::get_value(client));
}

core::errors::Status ToolManager::discover_with(wrappee::WrappeeClient& client) {
    auto listed = client.list_tools(call_timeout_);
    if (core::errors::is_error(listed)) {
        LOG_WARN(core::errors::get_error(listed).message);
        return core::errors::get_error(listed);
    }
    replace_cache(core::errors::take_value(listed));
    return core::errors::ok();
}

void ToolManager::replace_cache(std::vector<protocol::ToolDescriptor> wrappee_tools) {
    std::vector<protocol::ToolDescriptor> merged = builtins_.descriptors();
    std::unordered_set<protocol::ToolName> seen;
    for (const auto& tool : merged) {
        seen.insert(tool.name);
    }

    std::size_t forwarded = 0;
    for (auto& tool : wrappee_tools) {
        if (seen.count(tool.name) > 0) {
            LOG_WARN("Wrapped server tool '" + tool.name.str() +
                     "' is shadowed by the built-in of the same name");
            continue;
        }
        seen.insert(tool.name);
        merged.push_back(std::move(tool));
        ++forwarded;
    }

    {
        std::unique_lock<std::shared_mutex> lock(cache_mutex_);
        cache_ = std::move(merged);
    }
    LOG_INFO("Discovered " + std::to_string(forwarded) + " tools from wrapped server");
}

std::vector<protocol::ToolDescriptor> ToolManager::tools() const {
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    return cache_;
}

std::optional<protocol::ToolDescriptor> ToolManager::find(const protocol::ToolName& name) const {
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    for (const auto& tool : cache_) {
        if (tool.name == name) {
            return tool;
        }
    }
    return std::nullopt;
}

core::errors::Result<json> ToolManager::invoke(
    const protocol::ToolName& name, const json& arguments,
    const std::optional<std::chrono::milliseconds> timeout) {
    if (builtins_.handles(name)) {
        return builtins_.call(name, arguments);
    }

    auto client = controller_.acquire_client();
    if (core::errors::is_error(client)) {
        return core::errors::get_error(client);
    }

    const auto tool = find(name);
    if (!tool.has_value()) {
        return ProxyError{ErrorCategory::NotFound, "Unknown tool: " + name.str(),
                          "tool_not_found", "Call tools/list for the available tools."};
    }

    json params = {{"name", name.str()}};
    params["arguments"] = arguments.is_null() ? json::object() : arguments;
    return core::errors::get_value(client)->call("tools/call", params,
                                                 timeout.value_or(call_timeout_));
}

}  // namespace wrapmcp::tools
