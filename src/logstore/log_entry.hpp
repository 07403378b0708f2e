#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "protocol/identifiers.hpp"

namespace wrapmcp::logstore {

enum class EntryKind {
    Request,
    Response,
    Error,
    Stderr
};

struct RequestContent {
    protocol::ToolName tool_name;
    nlohmann::json arguments;
};

struct ResponseContent {
    protocol::ToolName tool_name;
    protocol::RequestId request_id;
    nlohmann::json response;
};

struct ErrorContent {
    protocol::ToolName tool_name;
    protocol::RequestId request_id;
    std::string message;
};

struct StderrContent {
    std::string message;
};

// One case per entry kind; visitors must handle all four.
using LogContent = std::variant<RequestContent, ResponseContent, ErrorContent, StderrContent>;

struct LogEntry {
    std::uint64_t sequence_id = 0;
    std::chrono::system_clock::time_point timestamp;
    LogContent content;
    std::optional<std::chrono::milliseconds> elapsed;
};

EntryKind kind_of(const LogContent& content);
std::optional<protocol::ToolName> tool_name_of(const LogContent& content);

// For requests this is the entry's own sequence id; responses and errors point back at it.
std::optional<protocol::RequestId> correlation_of(const LogEntry& entry);

// Text the keyword filter runs against.
std::string searchable_text(const LogContent& content);

std::string to_string(EntryKind kind);
std::optional<EntryKind> parse_kind(const std::string& text);

std::string format_timestamp(std::chrono::system_clock::time_point timestamp,
                             const char* pattern = "%Y-%m-%dT%H:%M:%SZ");

nlohmann::json to_json(const LogEntry& entry);

}  // namespace wrapmcp::logstore
