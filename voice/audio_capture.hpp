#pragma once
#include <chrono>
#include <optional>

#include "app_config.hpp"
#include "pipeline/clock.hpp"
#include "pipeline/stage.hpp"
#include "voice/audio_source.hpp"

/// AudioCapture
/// Gated mode: idle until a WakeDetected event, then records one
/// utterance; reverts to idle when nothing completes inside the
/// activation window. Continuous mode: listens in a loop.
/// A CommandExecuted event starts the cooldown, during which nothing is
/// recorded and wake events are dropped.
class AudioCapture : public Stage {
public:
    enum class Mode { Gated, Continuous };

    AudioCapture(const CaptureConfig& config,
                 Mode mode,
                 UtteranceSource& source,
                 EventChannel& in,
                 EventChannel& out,
                 ErrorChannel& errors,
                 const Clock& clock = steadyClock());
    ~AudioCapture() override;

    Mode mode() const { return mode_; }
    bool armed() const { return armedAt_.has_value(); }
    bool coolingDown() const;

protected:
    bool step() override;

private:
    void drainEvents();
    bool captureOnce();

    const CaptureConfig& config_;
    Mode mode_;
    UtteranceSource& source_;
    EventChannel& in_;
    EventChannel& out_;
    const Clock& clock_;

    std::optional<Clock::time_point> armedAt_;
    Clock::time_point cooldownUntil_{};
    bool flushPending_ = true;
};
