#include "logstore/log_entry.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include "protocol/jsonrpc.hpp"

namespace wrapmcp::logstore {

using nlohmann::json;
using protocol::dump_safe;

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

EntryKind kind_of(const LogContent& content) {
    return std::visit(
        overloaded{
            [](const RequestContent&) { return EntryKind::Request; },
            [](const ResponseContent&) { return EntryKind::Response; },
            [](const ErrorContent&) { return EntryKind::Error; },
            [](const StderrContent&) { return EntryKind::Stderr; },
        },
        content);
}

std::optional<protocol::ToolName> tool_name_of(const LogContent& content) {
    return std::visit(
        overloaded{
            [](const RequestContent& c) -> std::optional<protocol::ToolName> { return c.tool_name; },
            [](const ResponseContent& c) -> std::optional<protocol::ToolName> { return c.tool_name; },
            [](const ErrorContent& c) -> std::optional<protocol::ToolName> { return c.tool_name; },
            [](const StderrContent&) -> std::optional<protocol::ToolName> { return std::nullopt; },
        },
        content);
}

std::optional<protocol::RequestId> correlation_of(const LogEntry& entry) {
    return std::visit(
        overloaded{
            [&entry](const RequestContent&) -> std::optional<protocol::RequestId> {
                return protocol::RequestId{entry.sequence_id};
            },
            [](const ResponseContent& c) -> std::optional<protocol::RequestId> {
                return c.request_id;
            },
            [](const ErrorContent& c) -> std::optional<protocol::RequestId> {
                return c.request_id;
            },
            [](const StderrContent&) -> std::optional<protocol::RequestId> {
                return std::nullopt;
            },
        },
        entry.content);
}

std::string searchable_text(const LogContent& content) {
    return std::visit(
        overloaded{
            [](const RequestContent& c) { return c.tool_name.str() + " " + dump_safe(c.arguments); },
            [](const ResponseContent& c) { return c.tool_name.str() + " " + dump_safe(c.response); },
            [](const ErrorContent& c) { return c.tool_name.str() + " " + c.message; },
            [](const StderrContent& c) { return c.message; },
        },
        content);
}

std::string to_string(const EntryKind kind) {
    switch (kind) {
        case EntryKind::Request:
            return "request";
        case EntryKind::Response:
            return "response";
        case EntryKind::Error:
            return "error";
        case EntryKind::Stderr:
            return "stderr";
        default:
            return "unknown";
    }
}

std::optional<EntryKind> parse_kind(const std::string& text) {
    if (text == "request") return EntryKind::Request;
    if (text == "response") return EntryKind::Response;
    if (text == "error") return EntryKind::Error;
    if (text == "stderr") return EntryKind::Stderr;
    return std::nullopt;
}

std::string format_timestamp(const std::chrono::system_clock::time_point timestamp,
                             const char* pattern) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(timestamp);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream out;
    out << std::put_time(&utc, pattern);
    return out.str();
}

json to_json(const LogEntry& entry) {
    json out;
    out["id"] = entry.sequence_id;
    out["timestamp"] = format_timestamp(entry.timestamp);
    out["type"] = to_string(kind_of(entry.content));
    std::visit(
        overloaded{
            [&out](const RequestContent& c) {
                out["tool_name"] = c.tool_name.str();
                out["content"] = json{{"tool", c.tool_name.str()}, {"arguments", c.arguments}};
            },
            [&out](const ResponseContent& c) {
                out["tool_name"] = c.tool_name.str();
                out["request_id"] = c.request_id.value();
                out["response"] = c.response;
            },
            [&out](const ErrorContent& c) {
                out["tool_name"] = c.tool_name.str();
                out["request_id"] = c.request_id.value();
                out["error"] = c.message;
            },
            [&out](const StderrContent& c) { out["message"] = c.message; },
        },
        entry.content);
    if (entry.elapsed.has_value()) {
        out["elapsed_ms"] = entry.elapsed->count();
    }
    return out;
}

}  // namespace wrapmcp::logstore
