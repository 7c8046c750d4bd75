#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "pipeline/clock.hpp"
#include "pipeline/stage.hpp"

/// TimerService
/// In-memory deferred commands. A due timer is handed to the dispatcher
/// channel as a TimerFired event and removed from the active set; if the
/// channel is full it stays active and is retried on the next poll.
/// Runs as its own stage so the supervisor sees its liveness.
class TimerService : public Stage {
public:
    struct Timer {
        std::uint64_t id = 0;
        Clock::time_point fireAt{};
        std::string action;
    };

    TimerService(EventChannel& out, ErrorChannel& errors,
                 const Clock& clock = steadyClock(),
                 std::chrono::milliseconds pollInterval = std::chrono::milliseconds(200));
    ~TimerService() override;

    // Delays outside [0, kMaxTimerDelay] are clamped
    static constexpr std::chrono::hours kMaxTimerDelay{24 * 7};

    std::uint64_t schedule(std::chrono::seconds delay, const std::string& actionText);
    bool cancel(std::uint64_t id);
    void cancelAll();

    // Deliver every due timer; returns how many were delivered
    std::size_t poll();

    std::size_t pending() const;

protected:
    bool step() override;

private:
    EventChannel& out_;
    const Clock& clock_;
    std::chrono::milliseconds pollInterval_;

    mutable std::mutex mtx_;
    std::map<std::uint64_t, Timer> timers_;
    std::uint64_t nextId_ = 1;
};
