#include <gtest/gtest.h>
#include "core/errors/proxy_errors.hpp"

using namespace wrapmcp::core::errors;

// A dummy function to simulate a forwarded call failing
Result<std::string> simulate_forward(bool should_fail) {
    if (should_fail) {
        ProxyError error{ErrorCategory::Forwarding, "tool failed", "wrappee_error"};
        error.rpc_code = -32050;
        error.rpc_data = nlohmann::json{{"reason", "requested"}};
        return error;
    }
    return std::string("tool output");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_forward(false);

    // Check that it is NOT an error
    EXPECT_FALSE(is_error(result));
    // Check that the value is correct
    EXPECT_EQ(get_value(result), "tool output");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_forward(true);

    // Check that it IS an error
    EXPECT_TRUE(is_error(result));

    // The wrappee's error travels with the proxy error untouched
    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Forwarding);
    EXPECT_EQ(error.message, "tool failed");
    ASSERT_TRUE(error.rpc_code.has_value());
    EXPECT_EQ(*error.rpc_code, -32050);
    EXPECT_EQ(error.rpc_data["reason"], "requested");
}

TEST(ErrorModelTest, StatusDefaultsToOk) {
    Status status = ok();
    EXPECT_FALSE(is_error(status));
}

TEST(ErrorModelTest, TakeValueMovesOut) {
    Result<std::string> result = std::string("moved");
    const std::string value = take_value(result);
    EXPECT_EQ(value, "moved");
}

TEST(ErrorModelTest, CategoryNamesAreStable) {
    EXPECT_EQ(to_string(ErrorCategory::Timeout), "timeout");
    EXPECT_EQ(to_string(ErrorCategory::NotFound), "not_found");
    EXPECT_EQ(to_string(ErrorCategory::Unavailable), "unavailable");
    EXPECT_EQ(to_string(ErrorCategory::FileWatch), "file_watch");
}
