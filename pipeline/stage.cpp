#include "pipeline/stage.hpp"
#include "logger.hpp"

#include <algorithm>

Stage::Stage(std::string name, ErrorChannel& errors, std::chrono::milliseconds idleBackoff)
    : name_(std::move(name)), errors_(errors), idleBackoff_(idleBackoff) {}

Stage::~Stage() {
    stop();
}

void Stage::start() {
    if (thread_.joinable()) {
        if (alive_.load()) {
            LOG_DEBUG(name_, "start() ignored, already running");
            return;
        }
        thread_.join();
    }

    crashed_ = false;
    running_ = true;
    alive_   = true;
    beat();
    thread_ = std::thread([this]() { run(); });
    LOG_DEBUG(name_, "Stage started");
}

void Stage::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
        LOG_DEBUG(name_, "Stage stopped");
    }
}

Stage::Status Stage::status() const {
    Status s;
    s.name    = name_;
    s.alive   = alive_.load();
    s.crashed = crashed_.load();
    s.lastHeartbeat = std::chrono::steady_clock::time_point(
        std::chrono::steady_clock::duration(heartbeat_.load()));
    return s;
}

void Stage::beat() {
    heartbeat_ = std::chrono::steady_clock::now().time_since_epoch().count();
}

void Stage::reportError(ErrorKind kind, const std::string& code, const std::string& detail) {
    PipelineError err;
    err.kind   = kind;
    err.code   = code;
    err.source = name_;
    err.detail = detail;
    err.at     = std::chrono::steady_clock::now();

    if (!errors_.tryPush(err)) {
        LOG_WARN(name_, "Error channel full, dropped " + code + ": " + detail);
    }
}

void Stage::sleepFor(std::chrono::milliseconds duration) const {
    const auto slice = std::chrono::milliseconds(10);
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (running_.load()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) break;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(slice, left));
    }
}

void Stage::run() {
    try {
        onStart();
        while (running_.load()) {
            beat();
            if (!step()) {
                std::this_thread::sleep_for(idleBackoff_);
            }
        }
        onStop();
    } catch (const std::exception& e) {
        crashed_ = true;
        LOG_ERROR(name_, std::string("Stage crashed: ") + e.what());
        reportError(ErrorKind::StageFailure, "ERR_STAGE_CRASHED", e.what());
    }
    alive_ = false;
}
