#pragma once
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace wrapmcp::core::logging {

    // 1. Log levels, ordered by severity
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_level(const std::string& text) {
        if (text == "debug" || text == "trace") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn" || text == "warning") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Global logger. Writes to stderr: stdout belongs to the protocol stream.
    class Logger {
    public:
        // Singleton access so the whole app shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        bool enabled(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return level >= min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_); // Thread safety!
            if (level < min_level_) {
                return;
            }

            std::cerr << timestamp() << " [" << level_to_string(level) << "] "
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        LogLevel min_level_ = LogLevel::INFO;

        static std::string timestamp() {
            const auto now = std::chrono::system_clock::now();
            const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
            const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    now.time_since_epoch()) % 1000;
            std::tm utc{};
            gmtime_r(&seconds, &utc);
            std::ostringstream out;
            out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
                << std::setw(3) << std::setfill('0') << millis.count() << 'Z';
            return out.str();
        }

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros for clean syntax everywhere else in the code
    #define LOG_DEBUG(msg) do { auto& wrapmcp_logger_ = wrapmcp::core::logging::Logger::get(); if (wrapmcp_logger_.enabled(wrapmcp::core::logging::LogLevel::DEBUG)) wrapmcp_logger_.log(wrapmcp::core::logging::LogLevel::DEBUG, msg); } while (0)
    #define LOG_INFO(msg)  wrapmcp::core::logging::Logger::get().log(wrapmcp::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  wrapmcp::core::logging::Logger::get().log(wrapmcp::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) wrapmcp::core::logging::Logger::get().log(wrapmcp::core::logging::LogLevel::ERROR, msg)

} // namespace wrapmcp::core::logging
