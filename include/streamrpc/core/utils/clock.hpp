// ============================================================================
// MONOTONIC + WALL CLOCK HELPERS

#pragma once

#include <chrono>
#include <cstdint>

namespace StreamRpc {

class Clock {
public:
    // Monotonic nanoseconds, for measuring durations
    static inline uint64_t now_ns() {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            now.time_since_epoch()
        ).count();
    }

    static inline uint64_t now_us() {
        return now_ns() / 1000;
    }

    // Unix epoch milliseconds, stamped on messages and payment responses
    static inline int64_t wall_ms() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ).count();
    }
};

} // namespace StreamRpc
