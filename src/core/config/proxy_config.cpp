#include "core/config/proxy_config.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <system_error>

namespace wrapmcp::core::config {

using errors::ErrorCategory;
using errors::ProxyError;

std::optional<std::string> system_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

errors::Result<TransportKind> parse_transport(const std::string& value) {
    if (value == "stdio") {
        return TransportKind::Stdio;
    }
    if (value == "http" || value == "streamable-http") {
        return TransportKind::Http;
    }
    return ProxyError{ErrorCategory::Input, "Unknown transport: " + value,
                      "unknown_transport", "Use 'stdio' or 'http'."};
}

errors::Result<std::uint64_t> parse_positive(const std::string& name,
                                             const std::string& value,
                                             const std::uint64_t max_value) {
    std::uint64_t parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (value.empty() || ec != std::errc() || ptr != end) {
        return ProxyError{ErrorCategory::Input, "Invalid number for " + name + ": " + value,
                          "invalid_integer", "Provide a positive integer."};
    }
    if (parsed == 0 || parsed > max_value) {
        return ProxyError{ErrorCategory::Input, name + " out of bounds: " + value,
                          "bounds_error",
                          "Must be between 1 and " + std::to_string(max_value) + "."};
    }
    return parsed;
}

std::string to_string(const TransportKind transport) {
    switch (transport) {
        case TransportKind::Stdio:
            return "stdio";
        case TransportKind::Http:
            return "http";
        default:
            return "unknown";
    }
}

errors::Result<ProxyConfig> load_from_env(const EnvLookup& lookup) {
    ProxyConfig config;

    if (auto transport = lookup("WRAP_MCP_TRANSPORT")) {
        auto parsed = parse_transport(*transport);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.transport = errors::get_value(parsed);
    }

    if (auto log_size = lookup("WRAP_MCP_LOGSIZE")) {
        auto parsed = parse_positive("WRAP_MCP_LOGSIZE", *log_size, 10'000'000);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.log_size = static_cast<std::size_t>(errors::get_value(parsed));
    }

    if (auto timeout = lookup("WRAP_MCP_TOOL_TIMEOUT")) {
        auto parsed = parse_positive("WRAP_MCP_TOOL_TIMEOUT", *timeout, 86'400);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.tool_timeout_secs = static_cast<std::uint32_t>(errors::get_value(parsed));
    }

    if (auto version = lookup("WRAP_MCP_PROTOCOL_VERSION")) {
        if (version->empty()) {
            return ProxyError{ErrorCategory::Input, "WRAP_MCP_PROTOCOL_VERSION is empty",
                              "invalid_protocol_version"};
        }
        config.protocol_version = *version;
    }

    if (auto level = lookup("WRAP_MCP_LOG_LEVEL")) {
        auto parsed = logging::parse_level(*level);
        if (!parsed.has_value()) {
            return ProxyError{ErrorCategory::Input, "Unknown log level: " + *level,
                              "invalid_log_level", "Use debug, info, warn or error."};
        }
        config.log_level = *parsed;
    }

    if (auto port = lookup("WRAP_MCP_HTTP_PORT")) {
        auto parsed = parse_positive("WRAP_MCP_HTTP_PORT", *port,
                                     std::numeric_limits<std::uint16_t>::max());
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.http_port = static_cast<std::uint16_t>(errors::get_value(parsed));
    }

    return config;
}

}  // namespace wrapmcp::core::config
