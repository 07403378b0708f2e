#include <map>
#include <optional>
#include <string>
#include <gtest/gtest.h>
#include "core/config/proxy_config.hpp"

namespace {

using wrapmcp::core::config::EnvLookup;
using wrapmcp::core::config::load_from_env;
using wrapmcp::core::config::parse_positive;
using wrapmcp::core::config::TransportKind;
using wrapmcp::core::errors::get_error;
using wrapmcp::core::errors::get_value;
using wrapmcp::core::errors::is_error;
using wrapmcp::core::logging::LogLevel;

EnvLookup fake_env(std::map<std::string, std::string> values) {
    return [values](const std::string& name) -> std::optional<std::string> {
        const auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

TEST(ConfigTest, DefaultsWhenEnvironmentEmpty) {
    auto result = load_from_env(fake_env({}));
    ASSERT_FALSE(is_error(result));
    const auto& config = get_value(result);
    EXPECT_EQ(config.transport, TransportKind::Stdio);
    EXPECT_EQ(config.log_size, 1000u);
    EXPECT_EQ(config.tool_timeout_secs, 30u);
    EXPECT_EQ(config.protocol_version, "2025-03-26");
    EXPECT_EQ(config.log_level, LogLevel::INFO);
    EXPECT_EQ(config.http_port, 8000);
}

TEST(ConfigTest, ReadsEveryVariable) {
    auto result = load_from_env(fake_env({{"WRAP_MCP_TRANSPORT", "http"},
                                          {"WRAP_MCP_LOGSIZE", "25"},
                                          {"WRAP_MCP_TOOL_TIMEOUT", "3"},
                                          {"WRAP_MCP_PROTOCOL_VERSION", "2024-11-05"},
                                          {"WRAP_MCP_LOG_LEVEL", "warn"},
                                          {"WRAP_MCP_HTTP_PORT", "8123"}}));
    ASSERT_FALSE(is_error(result));
    const auto& config = get_value(result);
    EXPECT_EQ(config.transport, TransportKind::Http);
    EXPECT_EQ(config.log_size, 25u);
    EXPECT_EQ(config.tool_timeout_secs, 3u);
    EXPECT_EQ(config.protocol_version, "2024-11-05");
    EXPECT_EQ(config.log_level, LogLevel::WARN);
    EXPECT_EQ(config.http_port, 8123);
}

TEST(ConfigTest, AcceptsStreamableHttpAlias) {
    auto result = load_from_env(fake_env({{"WRAP_MCP_TRANSPORT", "streamable-http"}}));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).transport, TransportKind::Http);
}

TEST(ConfigTest, RejectsZeroLogSize) {
    auto result = load_from_env(fake_env({{"WRAP_MCP_LOGSIZE", "0"}}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(ConfigTest, RejectsNonNumericTimeout) {
    auto result = load_from_env(fake_env({{"WRAP_MCP_TOOL_TIMEOUT", "soon"}}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(ConfigTest, RejectsUnknownLogLevel) {
    auto result = load_from_env(fake_env({{"WRAP_MCP_LOG_LEVEL", "loud"}}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_log_level");
}

TEST(ConfigTest, RejectsPortAboveRange) {
    auto result = load_from_env(fake_env({{"WRAP_MCP_HTTP_PORT", "70000"}}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(ConfigTest, ParsePositiveRejectsNegative) {
    auto result = parse_positive("x", "-5", 10);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

}  // namespace
