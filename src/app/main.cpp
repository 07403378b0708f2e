#include <iostream>
#include <string>
#include "app/application.hpp"
#include "app/cli_parser.hpp"
#include "core/config/proxy_config.hpp"
#include "core/errors/proxy_errors.hpp"
#include "core/logging/logger.hpp"

int main(int argc, char* argv[]) {
    // 1. Environment first, then CLI flags on top
    auto env = wrapmcp::core::config::load_from_env();
    if (wrapmcp::core::errors::is_error(env)) {
        const auto& err = wrapmcp::core::errors::get_error(env);
        LOG_ERROR("Configuration error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    auto parsed = wrapmcp::app::cli::parse_and_validate(argc, argv,
                                                        wrapmcp::core::errors::get_value(env));
    if (wrapmcp::core::errors::is_error(parsed)) {
        const auto& err = wrapmcp::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        std::cerr << wrapmcp::app::cli::usage();
        return 2;
    }

    const auto& options = wrapmcp::core::errors::get_value(parsed);
    if (options.show_help) {
        std::cout << wrapmcp::app::cli::usage();
        return 0;
    }

    // 2. Logging goes to stderr; stdout carries the protocol
    wrapmcp::core::logging::Logger::get().set_min_level(options.config.log_level);

    // 3. Build the component graph and start the wrapped server
    wrapmcp::app::Application app(options.config);
    auto initialized = app.initialize();
    if (wrapmcp::core::errors::is_error(initialized)) {
        const auto& err = wrapmcp::core::errors::get_error(initialized);
        LOG_ERROR("Failed to start wrapped server [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 3;
    }

    // 4. Serve until the client disconnects or a signal arrives
    return app.run();
}
