#include "commands/timer_service.hpp"
#include "logger.hpp"

#include <algorithm>
#include <vector>

TimerService::TimerService(EventChannel& out, ErrorChannel& errors,
                           const Clock& clock, std::chrono::milliseconds pollInterval)
    : Stage("TimerService", errors), out_(out), clock_(clock), pollInterval_(pollInterval) {}

TimerService::~TimerService() {
    stop();
}

std::uint64_t TimerService::schedule(std::chrono::seconds delay, const std::string& actionText) {
    delay = std::clamp(delay, std::chrono::seconds(0), std::chrono::seconds(kMaxTimerDelay));

    std::lock_guard<std::mutex> lock(mtx_);
    Timer t;
    t.id     = nextId_++;
    t.fireAt = clock_.now() + delay;
    t.action = actionText;
    timers_.emplace(t.id, t);

    LOG_INFO("Timer", "Timer " + std::to_string(t.id) + " set for " +
                      std::to_string(delay.count()) + "s: '" + actionText + "'");
    return t.id;
}

bool TimerService::cancel(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mtx_);
    bool removed = timers_.erase(id) > 0;
    if (removed) LOG_DEBUG("Timer", "Timer " + std::to_string(id) + " cancelled");
    return removed;
}

void TimerService::cancelAll() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!timers_.empty()) {
        LOG_INFO("Timer", "Cancelling " + std::to_string(timers_.size()) + " pending timer(s)");
    }
    timers_.clear();
}

std::size_t TimerService::poll() {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto now = clock_.now();
    std::size_t delivered = 0;

    auto it = timers_.begin();
    while (it != timers_.end()) {
        if (now < it->second.fireAt) {
            ++it;
            continue;
        }

        PipelineEvent ev = TimerFired{ it->second.id, it->second.action };
        if (!out_.tryPush(ev)) {
            LOG_WARN("Timer", "Dispatcher queue full, timer " + std::to_string(it->first) + " deferred");
            ++it;
            continue;
        }

        LOG_INFO("Timer", "Timer " + std::to_string(it->first) + " expired: '" + it->second.action + "'");
        it = timers_.erase(it);
        ++delivered;
    }
    return delivered;
}

std::size_t TimerService::pending() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return timers_.size();
}

bool TimerService::step() {
    poll();
    sleepFor(pollInterval_);
    return true;
}
