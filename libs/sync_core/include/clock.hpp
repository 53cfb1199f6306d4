#pragma once

#include <chrono>
#include <cstdint>

namespace motium::sync {

/// Wall-clock source, milliseconds since the Unix epoch.
/// Injected everywhere so tests can drive time by hand.
class Clock {
public:
    virtual ~Clock() = default;
    virtual int64_t now_ms() const = 0;
};

class SystemClock : public Clock {
public:
    int64_t now_ms() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }
};

}  // namespace motium::sync
