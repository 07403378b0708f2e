#pragma once
#include <atomic>
#include <cstdint>
#include "protocol/identifiers.hpp"

namespace wrapmcp::wrappee {

    // Process-lifetime source of wrappee request ids. Shared by every client a controller
    // creates, so an id is never handed out twice, not even across restarts.
    class RequestIdAllocator {
    public:
        protocol::RequestId next() {
            return protocol::RequestId(next_.fetch_add(1, std::memory_order_relaxed));
        }

        std::uint64_t peek() const { return next_.load(std::memory_order_relaxed); }

    private:
        std::atomic<std::uint64_t> next_{1};
    };

} // namespace wrapmcp::wrappee
