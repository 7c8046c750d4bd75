#pragma once
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

#include "pipeline/events.hpp"

/// Stage
/// One worker thread per pipeline stage. The thread calls step() until
/// stop() is requested; stop is cooperative and observed at the next
/// poll boundary. An exception escaping onStart()/step() marks the stage
/// as crashed and is reported on the error channel as a StageFailure.
/// Derived classes must call stop() in their own destructor.
class Stage {
public:
    struct Status {
        std::string name;
        bool alive = false;
        bool crashed = false;
        std::chrono::steady_clock::time_point lastHeartbeat{};
    };

    Stage(std::string name, ErrorChannel& errors,
          std::chrono::milliseconds idleBackoff = std::chrono::milliseconds(20));
    virtual ~Stage();

    Stage(const Stage&) = delete;
    Stage& operator=(const Stage&) = delete;

    void start();
    void stop();

    bool isAlive() const { return alive_.load(); }
    bool crashed() const { return crashed_.load(); }
    const std::string& name() const { return name_; }
    Status status() const;

protected:
    virtual void onStart() {}
    // One poll iteration. Return false when there was nothing to do.
    virtual bool step() = 0;
    virtual void onStop() {}

    bool running() const { return running_.load(); }
    const std::atomic<bool>& runningFlag() const { return running_; }

    // Push an error to the supervisor (dropped with a log line if full)
    void reportError(ErrorKind kind, const std::string& code, const std::string& detail);

    // Sleep in small slices so stop() stays responsive
    void sleepFor(std::chrono::milliseconds duration) const;

private:
    void run();
    void beat();

    std::string name_;
    ErrorChannel& errors_;
    std::chrono::milliseconds idleBackoff_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> alive_{false};
    std::atomic<bool> crashed_{false};
    std::atomic<std::chrono::steady_clock::rep> heartbeat_{0};
};
