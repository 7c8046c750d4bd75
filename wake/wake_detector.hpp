#pragma once
#include <atomic>
#include <cstdint>
#include <vector>

#include "pipeline/stage.hpp"
#include "voice/audio_source.hpp"
#include "voice/feedback.hpp"
#include "wake/wake.hpp"

/// WakeDetector
/// Pulls backend-sized frames from the microphone and emits WakeDetected
/// on every match. Emission never blocks: a full channel drops the event.
class WakeDetector : public Stage {
public:
    WakeDetector(Wake::Backend& backend,
                 FrameSource& frames,
                 Feedback& feedback,
                 EventChannel& out,
                 ErrorChannel& errors);
    ~WakeDetector() override;

    std::size_t detections() const { return detections_.load(); }

protected:
    void onStart() override;
    bool step() override;

private:
    Wake::Backend& backend_;
    FrameSource& frames_;
    Feedback& feedback_;
    EventChannel& out_;

    std::vector<int16_t> frame_;
    std::atomic<std::size_t> detections_{0};
};
