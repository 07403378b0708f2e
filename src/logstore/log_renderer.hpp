#pragma once

#include <string>
#include <vector>
#include "logstore/log_entry.hpp"

namespace wrapmcp::logstore {

enum class RenderFormat {
    Ai,    // compact, one line per interaction
    Text,  // human readable blocks with timestamps
    Json   // raw structured entries
};

// Unknown names fall back to Ai.
RenderFormat parse_format(const std::string& name);

// Read-only projection of query results.
std::string render(const std::vector<LogEntry>& entries, RenderFormat format);

// Drops the timestamp/level/location prefix tracing-style loggers put in front of a message.
std::string strip_log_prefix(const std::string& message);

}  // namespace wrapmcp::logstore
