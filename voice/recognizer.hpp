#pragma once
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <thread>

#include "app_config.hpp"
#include "pipeline/stage.hpp"
#include "voice/confidence_gate.hpp"
#include "voice/feedback.hpp"
#include "voice/recognition_service.hpp"

/// Recognizer
/// AudioReady -> RecognitionService -> ConfidenceGate -> CommandReady.
/// Each call to the service runs on a worker thread; the stage waits at
/// most `timeout` and then abandons the attempt (its result is dropped).
/// At most one attempt is in flight: clips arriving while an abandoned
/// attempt still runs are dropped with ERR_RECOGNITION_BUSY.
/// Service failures are reported on the error channel, never thrown.
class Recognizer : public Stage {
public:
    Recognizer(const RecognitionConfig& config,
               std::shared_ptr<RecognitionService> service,
               Feedback& feedback,
               EventChannel& in,
               EventChannel& out,
               ErrorChannel& errors);
    ~Recognizer() override;

    // Recognize and gate one clip. Returns the accepted transcript, if any.
    std::optional<Transcript> handle(AudioClip clip);

    const ConfidenceGate& gate() const { return gate_; }

protected:
    bool step() override;

private:
    std::optional<RecognitionResult> recognizeBounded(AudioClip clip);
    void joinWorker();

    std::shared_ptr<RecognitionService> service_;
    Feedback& feedback_;
    EventChannel& in_;
    EventChannel& out_;
    std::chrono::milliseconds timeout_;
    ConfidenceGate gate_;

    std::thread worker_;
    std::future<RecognitionResult> inFlight_;
};
