#include <chrono>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "logstore/log_renderer.hpp"
#include "logstore/log_store.hpp"

namespace {

using wrapmcp::logstore::LogFilter;
using wrapmcp::logstore::LogStore;
using wrapmcp::logstore::parse_format;
using wrapmcp::logstore::render;
using wrapmcp::logstore::RenderFormat;
using wrapmcp::logstore::strip_log_prefix;
using wrapmcp::protocol::RequestId;
using wrapmcp::protocol::ToolName;
using nlohmann::json;

std::vector<wrapmcp::logstore::LogEntry> sample_entries(LogStore& store) {
    const auto request = store.record_request(ToolName("echo"), {{"text", "hi"}});
    store.record_response(ToolName("echo"), RequestId(request),
                          json{{"content", json::array({{{"type", "text"}, {"text", "hi"}}})}},
                          std::chrono::milliseconds(5));
    const auto failed = store.record_request(ToolName("fail"), json::object());
    store.record_error(ToolName("fail"), RequestId(failed), "tool failed",
                       std::chrono::milliseconds(2));
    store.record_stderr("warming up");
    LogFilter filter;
    filter.limit = 10;
    return store.query(filter);
}

TEST(LogRendererTest, UnknownFormatFallsBackToAi) {
    EXPECT_EQ(parse_format("json"), RenderFormat::Json);
    EXPECT_EQ(parse_format("text"), RenderFormat::Text);
    EXPECT_EQ(parse_format("ai"), RenderFormat::Ai);
    EXPECT_EQ(parse_format("yaml"), RenderFormat::Ai);
}

TEST(LogRendererTest, EmptyResultHasPlaceholder) {
    EXPECT_EQ(render({}, RenderFormat::Ai), "No log entries found.\n");
    EXPECT_EQ(render({}, RenderFormat::Json), "[]");
}

TEST(LogRendererTest, AiFormatIsCompact) {
    LogStore store(10);
    const std::string out = render(sample_entries(store), RenderFormat::Ai);
    EXPECT_NE(out.find("[REQUEST #1] echo(text: \"hi\")"), std::string::npos);
    EXPECT_NE(out.find("[RESPONSE #1] \"hi\""), std::string::npos);
    EXPECT_NE(out.find("[ERROR #3] tool failed"), std::string::npos);
    EXPECT_NE(out.find("[STDERR] warming up"), std::string::npos);
    // Most recent first
    EXPECT_LT(out.find("[STDERR]"), out.find("[REQUEST #1]"));
}

TEST(LogRendererTest, TextFormatShowsHeadersAndSeparators) {
    LogStore store(10);
    const std::string out = render(sample_entries(store), RenderFormat::Text);
    EXPECT_NE(out.find("[#2] "), std::string::npos);
    EXPECT_NE(out.find(" UTC | response | 5ms"), std::string::npos);
    EXPECT_NE(out.find("Tool: echo"), std::string::npos);
    EXPECT_NE(out.find(std::string(60, '-')), std::string::npos);
}

TEST(LogRendererTest, JsonFormatIsParseable) {
    LogStore store(10);
    const std::string out = render(sample_entries(store), RenderFormat::Json);
    const json parsed = json::parse(out);
    ASSERT_TRUE(parsed.is_array());
    ASSERT_EQ(parsed.size(), 5u);
    EXPECT_EQ(parsed[0]["type"], "stderr");
    EXPECT_EQ(parsed[1]["type"], "error");
    EXPECT_EQ(parsed[1]["request_id"], 3);
    EXPECT_EQ(parsed[3]["response"]["content"][0]["text"], "hi");
    EXPECT_EQ(parsed[4]["content"]["tool"], "echo");
}

TEST(LogRendererTest, StripsTracingPrefix) {
    EXPECT_EQ(strip_log_prefix("2025-08-08T16:15:53Z  INFO ThreadId(01) my_server: "
                               "src/main.rs:12: server ready"),
              "server ready");
    EXPECT_EQ(strip_log_prefix("plain message"), "plain message");
}

}  // namespace
