#pragma once
#include <chrono>

// Monotonic time source, injectable so timers and error windows can be
// driven by a manual clock.
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration   = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() const override { return std::chrono::steady_clock::now(); }
};

// Process-wide steady clock
inline const Clock& steadyClock() {
    static SteadyClock clock;
    return clock;
}
