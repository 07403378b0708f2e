#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace wrapmcp::protocol {

    // Correlation id of one proxied call. Never constructed from a tool name by accident.
    class RequestId {
    public:
        constexpr explicit RequestId(std::uint64_t value) : value_(value) {}

        constexpr std::uint64_t value() const { return value_; }
        std::string to_string() const { return std::to_string(value_); }

        friend constexpr bool operator==(RequestId a, RequestId b) { return a.value_ == b.value_; }
        friend constexpr bool operator!=(RequestId a, RequestId b) { return a.value_ != b.value_; }
        friend constexpr bool operator<(RequestId a, RequestId b) { return a.value_ < b.value_; }

    private:
        std::uint64_t value_;
    };

    class ToolName {
    public:
        explicit ToolName(std::string name) : name_(std::move(name)) {}

        const std::string& str() const { return name_; }

        friend bool operator==(const ToolName& a, const ToolName& b) { return a.name_ == b.name_; }
        friend bool operator!=(const ToolName& a, const ToolName& b) { return a.name_ != b.name_; }
        friend bool operator<(const ToolName& a, const ToolName& b) { return a.name_ < b.name_; }

    private:
        std::string name_;
    };

} // namespace wrapmcp::protocol

namespace std {

template <>
struct hash<wrapmcp::protocol::RequestId> {
    size_t operator()(const wrapmcp::protocol::RequestId& id) const noexcept {
        return hash<std::uint64_t>{}(id.value());
    }
};

template <>
struct hash<wrapmcp::protocol::ToolName> {
    size_t operator()(const wrapmcp::protocol::ToolName& name) const noexcept {
        return hash<std::string>{}(name.str());
    }
};

}  // namespace std
