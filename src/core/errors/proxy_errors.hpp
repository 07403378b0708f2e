#pragma once
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace wrapmcp::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,        // Bad CLI flag, env value or tool argument
        Spawn,        // The wrappee process could not be created
        Handshake,    // Protocol negotiation with the wrappee failed
        Timeout,      // A forwarded call exceeded its budget
        NotFound,     // Unknown tool name
        Forwarding,   // The wrappee answered with an error, or its pipe broke
        Unavailable,  // No running wrappee (restarting, failed, stopped)
        Discovery,    // tools/list refresh failed
        FileWatch,    // Binary watcher could not be set up
        Internal      // Logic bug or OS failure
    };

    // The standardized error payload
    struct ProxyError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";

            // Set when the wrappee replied with a JSON-RPC error; passed to the client untouched.
            std::optional<int> rpc_code;
            nlohmann::json rpc_data;
        };

    // 2. Propagation strategy: a Result holds either a value of type T, OR a ProxyError.
    template <typename T>
    using Result = std::variant<T, ProxyError>;

    // For operations that produce nothing but can fail.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ProxyError>(result);
    }

    template <typename T>
    const ProxyError& get_error(const Result<T>& result) {
        return std::get<ProxyError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T take_value(Result<T>& result) {
        return std::move(std::get<T>(result));
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Spawn: return "spawn";
            case ErrorCategory::Handshake: return "handshake";
            case ErrorCategory::Timeout: return "timeout";
            case ErrorCategory::NotFound: return "not_found";
            case ErrorCategory::Forwarding: return "forwarding";
            case ErrorCategory::Unavailable: return "unavailable";
            case ErrorCategory::Discovery: return "discovery";
            case ErrorCategory::FileWatch: return "file_watch";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace wrapmcp::core::errors
