#pragma once

#include <chrono>
#include <cstdint>

namespace ProcBridge {

class Clock {
public:
    // Monotonic milliseconds, used for cooldown arithmetic
    static inline uint64_t now_ms() {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ).count();
    }

    // Wall clock milliseconds since epoch, stamped into events
    static inline uint64_t wall_ms() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ).count();
    }
};

} // namespace ProcBridge
