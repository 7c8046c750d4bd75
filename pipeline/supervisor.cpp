#include "pipeline/supervisor.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "response_manager.hpp"

#include <thread>

using std::chrono::milliseconds;
using std::chrono::seconds;

Supervisor::Supervisor(const SupervisorConfig& config,
                       PipelineControl& pipeline,
                       Feedback& feedback,
                       const Clock& clock)
    : config_(config), pipeline_(pipeline), feedback_(feedback), clock_(clock) {}

void Supervisor::start() {
    pipeline_.start();
    LOG_DEBUG("Supervisor", "Supervising (max " + std::to_string(config_.maxErrors) + " errors per " +
                            std::to_string(config_.errorWindowS) + "s)");
}

void Supervisor::stop() {
    pipeline_.stop();
    window_.clear();
}

void Supervisor::pruneWindow(Clock::time_point now) {
    const auto horizon = seconds(config_.errorWindowS);
    while (!window_.empty() && now - window_.front() > horizon) {
        window_.pop_front();
    }
}

bool Supervisor::tick() {
    const auto now = clock_.now();
    std::string reason;

    for (const auto& err : pipeline_.drainErrors()) {
        switch (policyFor(err.kind)) {
            case ErrorPolicy::Ignore:
            case ErrorPolicy::InvalidateCache:
                LOG_DEBUG("Supervisor", err.source + ": " + err.code + " (" + err.detail + ")");
                break;
            case ErrorPolicy::EscalateToSupervisor:
                LOG_WARN("Supervisor", err.source + " reported " + err.code + ": " + err.detail);
                window_.push_back(now);
                break;
            case ErrorPolicy::RestartPipeline:
                if (reason.empty()) reason = err.source + " failed: " + err.detail;
                break;
            case ErrorPolicy::Terminate:
                throw FatalError(err.code, err.source + ": " + err.detail);
        }
    }

    pruneWindow(now);
    if (reason.empty() && window_.size() > static_cast<std::size_t>(config_.maxErrors)) {
        reason = std::to_string(window_.size()) + " errors within " +
                 std::to_string(config_.errorWindowS) + "s";
    }

    if (reason.empty()) {
        for (const auto& st : pipeline_.health()) {
            if (st.crashed || !st.alive) {
                reason = st.name + " is not running";
                break;
            }
            if (now - st.lastHeartbeat > seconds(config_.stallTimeoutS)) {
                reason = st.name + " stalled";
                break;
            }
        }
    }

    if (reason.empty()) return false;

    restart(reason);
    return true;
}

void Supervisor::restart(const std::string& reason) {
    LOG_ERROR("Supervisor", "Restarting pipeline: " + reason);
    feedback_.cue(Cue::Error);
    feedback_.say(ResponseManager::get("recovering"));

    pipeline_.stop();
    window_.clear();

    if (config_.restartBackoffMs > 0) {
        std::this_thread::sleep_for(milliseconds(config_.restartBackoffMs));
    }

    try {
        pipeline_.start();
    } catch (const std::exception& e) {
        LOG_ERROR("Supervisor", std::string("Restart failed: ") + e.what());
        LOG_PHASE("Pipeline restart", false);
        feedback_.say(ResponseManager::get("recovery_failed"));
        throw FatalError("ERR_RESTART_FAILED", e.what());
    }

    ++restarts_;
    LOG_PHASE("Pipeline restart", true);
    feedback_.say(ResponseManager::get("recovered"));
}

void Supervisor::run(const std::atomic<bool>& keepRunning) {
    const auto interval = milliseconds(config_.pollIntervalMs > 0 ? config_.pollIntervalMs : 100);
    while (keepRunning.load()) {
        tick();

        // Sleep in slices so a shutdown request is noticed quickly
        auto until = std::chrono::steady_clock::now() + interval;
        while (keepRunning.load() && std::chrono::steady_clock::now() < until) {
            std::this_thread::sleep_for(milliseconds(20));
        }
    }
}
