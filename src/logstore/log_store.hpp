#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <boost/regex.hpp>
#include "logstore/log_entry.hpp"

namespace wrapmcp::logstore {

struct LogFilter {
    std::size_t limit = 20;
    std::optional<protocol::ToolName> tool_name;
    std::optional<EntryKind> kind;
    // Regular expression; matched literally when it does not compile.
    std::optional<std::string> keyword;
    std::optional<std::chrono::system_clock::time_point> after;
    std::optional<std::chrono::system_clock::time_point> before;
};

// Boost.Regex matches without recursing per input character, so long entries cannot exhaust
// the stack. A pattern that exceeds its complexity limit on some text is matched literally.
class KeywordMatcher {
public:
    explicit KeywordMatcher(const std::string& pattern);

    bool matches(const std::string& text) const;
    bool is_regex() const { return regex_.has_value(); }

private:
    std::string literal_;
    std::optional<boost::regex> regex_;
};

// Bounded interaction log. Appends evict the oldest entry once capacity is reached.
class LogStore {
public:
    explicit LogStore(std::size_t capacity);

    LogStore(const LogStore&) = delete;
    LogStore& operator=(const LogStore&) = delete;

    // Assigns the sequence id and timestamp; returns the sequence id.
    std::uint64_t append(LogContent content,
                         std::optional<std::chrono::milliseconds> elapsed = std::nullopt);

    std::uint64_t record_request(const protocol::ToolName& tool_name,
                                 const nlohmann::json& arguments);
    std::uint64_t record_response(const protocol::ToolName& tool_name,
                                  protocol::RequestId request_id,
                                  const nlohmann::json& response,
                                  std::chrono::milliseconds elapsed);
    std::uint64_t record_error(const protocol::ToolName& tool_name,
                               protocol::RequestId request_id, const std::string& message,
                               std::chrono::milliseconds elapsed);
    std::uint64_t record_stderr(const std::string& line);

    // Most recent first, at most filter.limit entries.
    std::vector<LogEntry> query(const LogFilter& filter) const;

    // Returns how many entries were dropped. Sequence ids keep counting.
    std::size_t clear();

    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }

private:
    const std::size_t capacity_;

    mutable std::shared_mutex mutex_;
    std::vector<LogEntry> slots_;
    std::size_t head_ = 0;  // index of the oldest entry once slots_ is full
    std::uint64_t next_sequence_ = 1;
};

}  // namespace wrapmcp::logstore
