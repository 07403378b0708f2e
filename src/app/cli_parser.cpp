#include "cli_parser.hpp"
#include <cstddef>
#include <limits>
#include <optional>
#include <vector>

namespace wrapmcp::app::cli {

    using namespace wrapmcp::core::errors;
    using wrapmcp::core::config::ProxyConfig;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> transport;
        std::optional<std::string> log_size;
        std::optional<std::string> protocol_version;
        std::optional<std::string> timeout;
        std::optional<std::string> log_level;
        std::optional<std::string> port;
        bool preserve_ansi = false;
        bool watch = false;
        bool help = false;
        std::vector<std::string> command_line;
    };

    std::string usage() {
        return "Usage: wrap-mcp [options] -- <command> [args...]\n"
               "\n"
               "Options:\n"
               "  --transport <stdio|http>     Client-facing transport (default: stdio)\n"
               "  --log-size <n>               Log entries kept in memory (default: 1000)\n"
               "  --protocol-version <v>       Version offered to the wrapped server\n"
               "  --timeout <seconds>          Timeout for forwarded tool calls (default: 30)\n"
               "  --log-level <level>          debug, info, warn or error (default: info)\n"
               "  --port <n>                   HTTP port (default: 8000)\n"
               "  --ansi                       Keep ANSI escape sequences in stderr logs\n"
               "  -w, --watch                  Restart when the wrapped binary changes\n"
               "  -h, --help                   Show this help\n";
    }

    Result<CliOptions> parse_and_validate(int argc, char* argv[], const ProxyConfig& base) {
        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Skip program name
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        auto read_value = [&args](size_t& i, std::optional<std::string>& slot) -> Status {
            if (i + 1 >= args.size()) {
                return ProxyError{ErrorCategory::Input, "Missing value for " + args[i], "missing_value"};
            }
            slot = args[++i];
            return ok();
        };

        for (size_t i = 0; i < args.size(); ++i) {
            Status taken = ok();
            if (args[i] == "--") {
                raw.command_line.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
                break;
            } else if (args[i] == "--transport") {
                taken = read_value(i, raw.transport);
            } else if (args[i] == "--log-size") {
                taken = read_value(i, raw.log_size);
            } else if (args[i] == "--protocol-version") {
                taken = read_value(i, raw.protocol_version);
            } else if (args[i] == "--timeout") {
                taken = read_value(i, raw.timeout);
            } else if (args[i] == "--log-level") {
                taken = read_value(i, raw.log_level);
            } else if (args[i] == "--port") {
                taken = read_value(i, raw.port);
            } else if (args[i] == "--ansi") {
                raw.preserve_ansi = true;
            } else if (args[i] == "-w" || args[i] == "--watch") {
                raw.watch = true;
            } else if (args[i] == "-h" || args[i] == "--help") {
                raw.help = true;
            } else {
                return ProxyError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument",
                                  "Put the wrapped command after '--'."};
            }
            if (is_error(taken)) {
                return get_error(taken);
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        CliOptions options;
        options.config = base;
        options.show_help = raw.help;
        if (raw.help) {
            return options;
        }

        ProxyConfig& config = options.config;
        config.preserve_ansi = raw.preserve_ansi;
        config.watch_binary = raw.watch;

        if (raw.transport) {
            auto parsed = core::config::parse_transport(*raw.transport);
            if (is_error(parsed)) return get_error(parsed);
            config.transport = get_value(parsed);
        }
        if (raw.log_size) {
            auto parsed = core::config::parse_positive("--log-size", *raw.log_size, 10'000'000);
            if (is_error(parsed)) return get_error(parsed);
            config.log_size = static_cast<std::size_t>(get_value(parsed));
        }
        if (raw.timeout) {
            auto parsed = core::config::parse_positive("--timeout", *raw.timeout, 86'400);
            if (is_error(parsed)) return get_error(parsed);
            config.tool_timeout_secs = static_cast<std::uint32_t>(get_value(parsed));
        }
        if (raw.port) {
            auto parsed = core::config::parse_positive("--port", *raw.port,
                                                       std::numeric_limits<std::uint16_t>::max());
            if (is_error(parsed)) return get_error(parsed);
            config.http_port = static_cast<std::uint16_t>(get_value(parsed));
        }
        if (raw.protocol_version) {
            if (raw.protocol_version->empty()) {
                return ProxyError{ErrorCategory::Input, "--protocol-version must not be empty", "invalid_protocol_version"};
            }
            config.protocol_version = *raw.protocol_version;
        }
        if (raw.log_level) {
            auto level = core::logging::parse_level(*raw.log_level);
            if (!level.has_value()) {
                return ProxyError{ErrorCategory::Input, "Unknown log level: " + *raw.log_level, "invalid_log_level",
                                  "Use debug, info, warn or error."};
            }
            config.log_level = *level;
        }

        // The wrapped command is mandatory
        if (raw.command_line.empty() || raw.command_line.front().empty()) {
            return ProxyError{ErrorCategory::Input, "No wrapped server command given.", "missing_command",
                              "Usage: wrap-mcp [options] -- <command> [args...]"};
        }
        config.command = raw.command_line.front();
        config.args.assign(raw.command_line.begin() + 1, raw.command_line.end());

        // Watching needs a stable absolute path to poll
        if (config.watch_binary && config.command.front() != '/') {
            return ProxyError{ErrorCategory::Input, "Watch mode needs an absolute command path: " + config.command,
                              "relative_watch_path", "Pass the full path to the binary after '--'."};
        }

        return options;
    }

} // namespace wrapmcp::app::cli
