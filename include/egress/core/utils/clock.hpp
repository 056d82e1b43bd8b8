// ============================================================================
// CLOCKS
// ============================================================================
// steady_clock for intervals and deadlines, system_clock for the wall-clock
// timestamps carried on EgressInfo.
// ============================================================================

#pragma once

#include <chrono>
#include <cstdint>

namespace Egress {

class Clock {
public:
    // Monotonic time in milliseconds
    static inline uint64_t now_ms() {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ).count();
    }

    // Unix epoch time in nanoseconds
    static inline int64_t epoch_ns() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            now.time_since_epoch()
        ).count();
    }

    // Unix epoch time in milliseconds
    static inline uint64_t epoch_ms() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ).count();
    }
};

} // namespace Egress
