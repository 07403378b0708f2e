#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/proxy_errors.hpp"
#include "core/logging/logger.hpp"

namespace wrapmcp::core::config {

    inline constexpr const char* kProgramName = "wrap-mcp";
    inline constexpr const char* kProgramVersion = "0.1.0";

    enum class TransportKind {
        Stdio,
        Http
    };

    // Everything the proxy needs to start, after env and CLI have been merged.
    struct ProxyConfig {
        TransportKind transport = TransportKind::Stdio;
        std::size_t log_size = 1000;
        std::string protocol_version = "2025-03-26";
        std::uint32_t tool_timeout_secs = 30;
        logging::LogLevel log_level = logging::LogLevel::INFO;
        std::string http_host = "127.0.0.1";
        std::uint16_t http_port = 8000;

        bool preserve_ansi = false;
        bool watch_binary = false;

        // Wrappee launch line (everything after "--")
        std::string command;
        std::vector<std::string> args;
    };

    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    std::optional<std::string> system_env(const std::string& name);

    // Reads the WRAP_MCP_* variables on top of the defaults.
    errors::Result<ProxyConfig> load_from_env(const EnvLookup& lookup = system_env);

    errors::Result<TransportKind> parse_transport(const std::string& value);

    // Exception-free parsing of a strictly positive integer no larger than max_value.
    errors::Result<std::uint64_t> parse_positive(const std::string& name,
                                                 const std::string& value,
                                                 std::uint64_t max_value);

    std::string to_string(TransportKind transport);

} // namespace wrapmcp::core::config
