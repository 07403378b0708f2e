#pragma once
#include <string>
#include "core/config/proxy_config.hpp"
#include "core/errors/proxy_errors.hpp"

namespace wrapmcp::app::cli {

    struct CliOptions {
        core::config::ProxyConfig config;
        bool show_help = false;
    };

    // Usage: wrap-mcp [options] -- <command> [args...]
    // Flags override the values already in `base` (defaults merged with WRAP_MCP_* env vars).
    core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[],
                                                        const core::config::ProxyConfig& base);

    std::string usage();
}
