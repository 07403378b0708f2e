#include "logstore/log_renderer.hpp"

#include <sstream>
#include "protocol/jsonrpc.hpp"

namespace wrapmcp::logstore {

using nlohmann::json;
using protocol::dump_safe;

namespace {

constexpr std::size_t kSeparatorWidth = 60;

std::string format_arguments(const json& arguments) {
    if (!arguments.is_object()) {
        return arguments.is_null() ? "" : dump_safe(arguments);
    }
    std::string out;
    for (auto it = arguments.begin(); it != arguments.end(); ++it) {
        if (!out.empty()) {
            out += ", ";
        }
        out += it.key() + ": ";
        out += it.value().is_string() ? "\"" + it.value().get<std::string>() + "\""
                                      : dump_safe(it.value());
    }
    return out;
}

void render_ai_entry(std::ostringstream& out, const LogEntry& entry) {
    if (const auto* request = std::get_if<RequestContent>(&entry.content)) {
        out << "[REQUEST #" << entry.sequence_id << "] " << request->tool_name.str() << "("
            << format_arguments(request->arguments) << ")\n";
    } else if (const auto* response = std::get_if<ResponseContent>(&entry.content)) {
        bool printed = false;
        const json& result = response->response;
        if (result.is_object() && result.contains("content") && result["content"].is_array()) {
            for (const auto& item : result["content"]) {
                if (item.is_object() && item.contains("text") && item["text"].is_string()) {
                    out << "[RESPONSE #" << response->request_id.value() << "] \""
                        << item["text"].get<std::string>() << "\"\n";
                    printed = true;
                }
            }
        }
        if (!printed) {
            out << "[RESPONSE #" << response->request_id.value() << "] " << dump_safe(result)
                << "\n";
        }
    } else if (const auto* error = std::get_if<ErrorContent>(&entry.content)) {
        out << "[ERROR #" << error->request_id.value() << "] " << error->message << "\n";
    } else if (const auto* stderr_line = std::get_if<StderrContent>(&entry.content)) {
        out << "[STDERR] " << strip_log_prefix(stderr_line->message) << "\n";
    }
    out << "\n";
}

std::string render_ai(const std::vector<LogEntry>& entries) {
    if (entries.empty()) {
        return "No log entries found.\n";
    }
    std::ostringstream out;
    for (const auto& entry : entries) {
        render_ai_entry(out, entry);
    }
    return out.str();
}

std::string render_text(const std::vector<LogEntry>& entries) {
    if (entries.empty()) {
        return "No log entries found.\n";
    }
    std::ostringstream out;
    for (const auto& entry : entries) {
        out << "[#" << entry.sequence_id << "] "
            << format_timestamp(entry.timestamp, "%Y-%m-%d %H:%M:%S UTC") << " | "
            << to_string(kind_of(entry.content));
        if (entry.elapsed.has_value()) {
            out << " | " << entry.elapsed->count() << "ms";
        }
        out << "\n";
        if (const auto name = tool_name_of(entry.content)) {
            out << "Tool: " << name->str() << "\n";
        }
        out << "Content: " << dump_safe(to_json(entry), 2) << "\n";
        out << std::string(kSeparatorWidth, '-') << "\n";
    }
    return out.str();
}

std::string render_json(const std::vector<LogEntry>& entries) {
    json out = json::array();
    for (const auto& entry : entries) {
        out.push_back(to_json(entry));
    }
    return dump_safe(out, 2);
}

}  // namespace

RenderFormat parse_format(const std::string& name) {
    if (name == "json") {
        return RenderFormat::Json;
    }
    if (name == "text") {
        return RenderFormat::Text;
    }
    return RenderFormat::Ai;
}

std::string render(const std::vector<LogEntry>& entries, const RenderFormat format) {
    switch (format) {
        case RenderFormat::Json:
            return render_json(entries);
        case RenderFormat::Text:
            return render_text(entries);
        case RenderFormat::Ai:
        default:
            return render_ai(entries);
    }
}

std::string strip_log_prefix(const std::string& message) {
    // "2025-08-08T16:15:53Z  INFO ThreadId(01) module: src/file.rs:12: text"
    if (const auto source = message.find(": src/"); source != std::string::npos) {
        const auto after = message.find(": ", source + 2);
        if (after != std::string::npos) {
            return message.substr(after + 2);
        }
        return message;
    }

    const bool has_level = message.find(" INFO ") != std::string::npos ||
                           message.find(" WARN ") != std::string::npos ||
                           message.find(" ERROR ") != std::string::npos ||
                           message.find(" DEBUG ") != std::string::npos;
    if (!has_level) {
        return message;
    }
    const auto thread = message.rfind(" ThreadId");
    if (thread == std::string::npos) {
        return message;
    }
    const auto first = message.find(": ", thread);
    if (first == std::string::npos) {
        return message;
    }
    const auto second = message.find(": ", first + 2);
    if (second == std::string::npos) {
        return message.substr(first + 2);
    }
    return message.substr(second + 2);
}

}  // namespace wrapmcp::logstore
