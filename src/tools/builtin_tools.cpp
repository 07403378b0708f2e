#include "tools/builtin_tools.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <utility>
#include "core/logging/logger.hpp"

namespace wrapmcp::tools {

using core::errors::ErrorCategory;
using core::errors::ProxyError;
using nlohmann::json;

namespace {

// First double that no longer fits in size_t.
const double kSizeRange = std::ldexp(1.0, std::numeric_limits<std::size_t>::digits);

protocol::ToolDescriptor make_builtin(const protocol::ToolName& name, std::string description,
                                      json properties) {
    protocol::ToolDescriptor tool{name};
    tool.description = std::move(description);
    tool.input_schema = json{{"type", "object"}, {"properties", std::move(properties)}};
    tool.origin = protocol::ToolOrigin::Builtin;
    return tool;
}

ProxyError invalid_argument(const std::string& message) {
    return ProxyError{ErrorCategory::Input, message, "invalid_argument"};
}

core::errors::Result<std::optional<std::string>> optional_string(const json& arguments,
                                                                 const char* key) {
    const auto it = arguments.find(key);
    if (it == arguments.end() || it->is_null()) {
        return std::optional<std::string>{};
    }
    if (!it->is_string()) {
        return invalid_argument(std::string("'") + key + "' must be a string");
    }
    return std::optional<std::string>{it->get<std::string>()};
}

}  // namespace

core::errors::Result<std::pair<logstore::LogFilter, logstore::RenderFormat>> parse_show_log_arguments(
    const json& arguments) {
    if (!arguments.is_null() && !arguments.is_object()) {
        return invalid_argument("show_log arguments must be an object");
    }
    const json args = arguments.is_object() ? arguments : json::object();

    logstore::LogFilter filter;
    if (const auto limit = args.find("limit"); limit != args.end() && !limit->is_null()) {
        if (limit->is_number_unsigned() ||
            (limit->is_number_integer() && limit->get<std::int64_t>() >= 0)) {
            filter.limit = limit->get<std::size_t>();
        } else if (const double value = limit->is_number_float() ? limit->get<double>() : -1.0;
                   value >= 0 && std::floor(value) == value) {
            // Whole numbers past the size_t range mean "everything".
            filter.limit = value < kSizeRange ? static_cast<std::size_t>(value)
                                              : std::numeric_limits<std::size_t>::max();
        } else {
            return invalid_argument("'limit' must be a non-negative integer");
        }
    }

    auto tool_name = optional_string(args, "tool_name");
    if (core::errors::is_error(tool_name)) {
        return core::errors::get_error(tool_name);
    }
    if (const auto& name = core::errors::get_value(tool_name); name.has_value()) {
        filter.tool_name = protocol::ToolName(*name);
    }

    auto entry_type = optional_string(args, "entry_type");
    if (core::errors::is_error(entry_type)) {
        return core::errors::get_error(entry_type);
    }
    if (const auto& type = core::errors::get_value(entry_type); type.has_value()) {
        const auto kind = logstore::parse_kind(*type);
        if (!kind.has_value()) {
            return invalid_argument("'entry_type' must be one of request, response, error, stderr");
        }
        filter.kind = kind;
    }

    auto keyword = optional_string(args, "keyword");
    if (core::errors::is_error(keyword)) {
        return core::errors::get_error(keyword);
    }
    filter.keyword = core::errors::get_value(keyword);

    auto format = optional_string(args, "format");
    if (core::errors::is_error(format)) {
        return core::errors::get_error(format);
    }
    const auto render_format =
        logstore::parse_format(core::errors::get_value(format).value_or("ai"));

    return std::make_pair(std::move(filter), render_format);
}

BuiltinTools::BuiltinTools(std::shared_ptr<logstore::LogStore> store, RestartFn restart)
    : store_(std::move(store)), restart_(std::move(restart)) {}

std::vector<protocol::ToolDescriptor> BuiltinTools::descriptors() const {
    std::vector<protocol::ToolDescriptor> out;
    out.push_back(make_builtin(
        kShowLog, "Display recorded request/response logs from the wrapper",
        json{{"limit",
              {{"type", "integer"},
               {"description", "Maximum number of log entries to show (default: 20)"},
               {"default", 20}}},
             {"tool_name", {{"type", "string"}, {"description", "Filter logs by tool name"}}},
             {"entry_type",
              {{"type", "string"},
               {"enum", {"request", "response", "error", "stderr"}},
               {"description", "Filter logs by entry type"}}},
             {"keyword",
              {{"type", "string"},
               {"description",
                "Regular expression pattern to search in log content (fallback to literal "
                "search if invalid regex)"}}},
             {"format",
              {{"type", "string"},
               {"enum", {"ai", "text", "json"}},
               {"description", "Output format (default: ai)"},
               {"default", "ai"}}}}));
    out.push_back(make_builtin(kClearLog, "Clear all recorded logs", json::object()));
    out.push_back(make_builtin(kRestartWrappedServer,
                               "Restart the wrapped MCP server while preserving logs",
                               json::object()));
    return out;
}

bool BuiltinTools::handles(const protocol::ToolName& name) const {
    return name == kShowLog || name == kClearLog || name == kRestartWrappedServer;
}

core::errors::Result<json> BuiltinTools::call(const protocol::ToolName& name,
                                              const json& arguments) const {
    if (name == kShowLog) {
        return show_log(arguments);
    }
    if (name == kClearLog) {
        return clear_log();
    }
    if (name == kRestartWrappedServer) {
        return restart_wrapped_server();
    }
    return ProxyError{ErrorCategory::NotFound, "Unknown built-in tool: " + name.str(),
                      "tool_not_found"};
}

core::errors::Result<json> BuiltinTools::show_log(const json& arguments) const {
    auto parsed = parse_show_log_arguments(arguments);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    const auto& [filter, format] = core::errors::get_value(parsed);
    const auto entries = store_->query(filter);
    LOG_DEBUG("show_log returned " + std::to_string(entries.size()) + " entries");
    return protocol::text_result(logstore::render(entries, format));
}

core::errors::Result<json> BuiltinTools::clear_log() const {
    const std::size_t cleared = store_->clear();
    return protocol::text_result("Cleared " + std::to_string(cleared) + " log entries");
}

core::errors::Result<json> BuiltinTools::restart_wrapped_server() const {
    if (!restart_) {
        return ProxyError{ErrorCategory::Unavailable, "Restart is not available.",
                          "restart_unavailable"};
    }
    auto restarted = restart_();
    if (core::errors::is_error(restarted)) {
        return core::errors::get_error(restarted);
    }
    const auto& outcome = core::errors::get_value(restarted);
    std::string text = "Wrapped server restarted successfully (pid ";
    text += outcome.old_pid ? std::to_string(*outcome.old_pid) : std::string("none");
    text += " -> " + std::to_string(outcome.new_pid) + ")";
    return protocol::text_result(text);
}

}  // namespace wrapmcp::tools
