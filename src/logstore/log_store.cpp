#include "logstore/log_store.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <utility>
#include "core/logging/logger.hpp"

namespace wrapmcp::logstore {

KeywordMatcher::KeywordMatcher(const std::string& pattern) : literal_(pattern) {
    try {
        regex_.emplace(pattern, boost::regex::ECMAScript);
    } catch (const boost::regex_error& e) {
        LOG_DEBUG("LogStore: keyword '" + pattern +
                  "' is not a valid regex, matching literally (" + e.what() + ")");
        regex_.reset();
    }
}

bool KeywordMatcher::matches(const std::string& text) const {
    if (regex_.has_value()) {
        try {
            return boost::regex_search(text, *regex_);
        } catch (const std::runtime_error& e) {
            LOG_DEBUG("LogStore: keyword '" + literal_ + "' too complex for a " +
                      std::to_string(text.size()) + " byte entry, matching literally (" +
                      e.what() + ")");
        }
    }
    return text.find(literal_) != std::string::npos;
}

LogStore::LogStore(const std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {
    slots_.reserve(std::min<std::size_t>(capacity_, 4096));
    LOG_INFO("LogStore: initialized with capacity " + std::to_string(capacity_));
}

std::uint64_t LogStore::append(LogContent content,
                               std::optional<std::chrono::milliseconds> elapsed) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    LogEntry entry{next_sequence_++, std::chrono::system_clock::now(), std::move(content),
                   elapsed};

    const std::uint64_t id = entry.sequence_id;
    if (slots_.size() < capacity_) {
        slots_.push_back(std::move(entry));
    } else {
        slots_[head_] = std::move(entry);
        head_ = (head_ + 1) % capacity_;
    }
    return id;
}

std::uint64_t LogStore::record_request(const protocol::ToolName& tool_name,
                                       const nlohmann::json& arguments) {
    const auto id = append(RequestContent{tool_name, arguments});
    LOG_DEBUG("LogStore: request #" + std::to_string(id) + " " + tool_name.str());
    return id;
}

std::uint64_t LogStore::record_response(const protocol::ToolName& tool_name,
                                        const protocol::RequestId request_id,
                                        const nlohmann::json& response,
                                        const std::chrono::milliseconds elapsed) {
    const auto id = append(ResponseContent{tool_name, request_id, response}, elapsed);
    LOG_DEBUG("LogStore: response #" + std::to_string(id) + " for request #" +
              request_id.to_string());
    return id;
}

std::uint64_t LogStore::record_error(const protocol::ToolName& tool_name,
                                     const protocol::RequestId request_id,
                                     const std::string& message,
                                     const std::chrono::milliseconds elapsed) {
    const auto id = append(ErrorContent{tool_name, request_id, message}, elapsed);
    LOG_WARN("LogStore: error #" + std::to_string(id) + " for request #" +
             request_id.to_string() + ": " + message);
    return id;
}

std::uint64_t LogStore::record_stderr(const std::string& line) {
    return append(StderrContent{line});
}

std::vector<LogEntry> LogStore::query(const LogFilter& filter) const {
    std::vector<LogEntry> matches;
    if (filter.limit == 0) {
        return matches;
    }

    std::optional<KeywordMatcher> keyword;
    if (filter.keyword.has_value() && !filter.keyword->empty()) {
        keyword.emplace(*filter.keyword);
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    const std::size_t count = slots_.size();
    for (std::size_t offset = 0; offset < count && matches.size() < filter.limit; ++offset) {
        // Walk newest to oldest.
        const LogEntry& entry = slots_[(head_ + count - 1 - offset) % count];

        if (filter.kind.has_value() && kind_of(entry.content) != *filter.kind) {
            continue;
        }
        if (filter.tool_name.has_value()) {
            const auto name = tool_name_of(entry.content);
            if (!name.has_value() || *name != *filter.tool_name) {
                continue;
            }
        }
        if (filter.after.has_value() && entry.timestamp <= *filter.after) {
            continue;
        }
        if (filter.before.has_value() && entry.timestamp >= *filter.before) {
            continue;
        }
        if (keyword.has_value() && !keyword->matches(searchable_text(entry.content))) {
            continue;
        }
        matches.push_back(entry);
    }
    return matches;
}

std::size_t LogStore::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const std::size_t dropped = slots_.size();
    slots_.clear();
    head_ = 0;
    LOG_INFO("LogStore: cleared " + std::to_string(dropped) + " entries");
    return dropped;
}

std::size_t LogStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return slots_.size();
}

}  // namespace wrapmcp::logstore
