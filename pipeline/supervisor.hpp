#pragma once
#include <atomic>
#include <cstddef>
#include <deque>
#include <string>

#include "app_config.hpp"
#include "pipeline/clock.hpp"
#include "pipeline/pipeline.hpp"
#include "voice/feedback.hpp"

/// Supervisor
/// Polls the pipeline's error channel and stage health. Restarts the
/// whole pipeline when a stage crashed or stalled, or when more than
/// maxErrors escalated errors arrived within the rolling window.
/// A restart that fails throws FatalError.
class Supervisor {
public:
    Supervisor(const SupervisorConfig& config,
               PipelineControl& pipeline,
               Feedback& feedback,
               const Clock& clock = steadyClock());

    void start();
    void stop();

    // One supervision pass. Returns true if the pipeline was restarted.
    bool tick();

    // tick() every poll interval until `keepRunning` drops
    void run(const std::atomic<bool>& keepRunning);

    std::size_t restarts() const { return restarts_; }
    std::size_t errorsInWindow() const { return window_.size(); }

private:
    void pruneWindow(Clock::time_point now);
    void restart(const std::string& reason);

    const SupervisorConfig& config_;
    PipelineControl& pipeline_;
    Feedback& feedback_;
    const Clock& clock_;

    std::deque<Clock::time_point> window_;
    std::size_t restarts_ = 0;
};
