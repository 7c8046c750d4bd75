#pragma once
#include <memory>
#include <vector>

#include "app_config.hpp"
#include "commands/action_registry.hpp"
#include "commands/dispatcher.hpp"
#include "commands/timer_service.hpp"
#include "devices/device_bridge.hpp"
#include "pipeline/stage.hpp"
#include "voice/audio_capture.hpp"
#include "voice/audio_source.hpp"
#include "voice/feedback.hpp"
#include "voice/recognition_service.hpp"
#include "voice/recognizer.hpp"
#include "wake/wake.hpp"
#include "wake/wake_detector.hpp"

// What the supervisor needs from the thing it supervises
class PipelineControl {
public:
    virtual ~PipelineControl() = default;

    // Throws on failure; a failed start leaves nothing running
    virtual void start() = 0;
    virtual void stop() = 0;

    virtual std::vector<Stage::Status> health() const = 0;
    virtual std::vector<PipelineError> drainErrors() = 0;
};

// External collaborators. Wake backend and frame source are null in
// continuous mode.
struct PipelineDeps {
    Wake::Backend* wakeBackend = nullptr;
    FrameSource* frames = nullptr;
    UtteranceSource* utterances = nullptr;
    std::shared_ptr<RecognitionService> recognition;
    DeviceBridge* bridge = nullptr;
    Feedback* feedback = nullptr;
};

/// Pipeline
/// Builds fresh channels and stages on every start() and tears all of
/// them down on stop(). Stages are started consumer-first and stopped
/// producer-first.
class Pipeline : public PipelineControl {
public:
    static constexpr std::size_t kChannelCapacity = 16;

    Pipeline(const AppConfig& config, const ActionRegistry& registry, PipelineDeps deps);
    ~Pipeline() override;

    void start() override;
    void stop() override;

    std::vector<Stage::Status> health() const override;
    std::vector<PipelineError> drainErrors() override;

    bool running() const { return running_; }
    bool continuous() const { return deps_.wakeBackend == nullptr; }

    // Valid while running
    Dispatcher* dispatcher() { return dispatcher_.get(); }
    TimerService* timers() { return timers_.get(); }
    EventChannel* commandChannel() { return commands_.get(); }
    EventChannel* captureChannel() { return captureEvents_.get(); }

private:
    std::vector<Stage*> stagesInStartOrder() const;

    const AppConfig& config_;
    const ActionRegistry& registry_;
    PipelineDeps deps_;
    bool running_ = false;

    std::unique_ptr<ErrorChannel> errors_;
    std::unique_ptr<EventChannel> captureEvents_;   // wake + cooldown -> capture
    std::unique_ptr<EventChannel> audio_;           // capture -> recognizer
    std::unique_ptr<EventChannel> commands_;        // recognizer + timers -> dispatcher

    std::unique_ptr<TimerService> timers_;
    std::unique_ptr<Dispatcher> dispatcher_;
    std::unique_ptr<Recognizer> recognizer_;
    std::unique_ptr<AudioCapture> capture_;
    std::unique_ptr<WakeDetector> wake_;
};
