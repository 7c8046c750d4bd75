#include "wake/wake_detector.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

WakeDetector::WakeDetector(Wake::Backend& backend,
                           FrameSource& frames,
                           Feedback& feedback,
                           EventChannel& out,
                           ErrorChannel& errors)
    : Stage("WakeDetector", errors),
      backend_(backend),
      frames_(frames),
      feedback_(feedback),
      out_(out) {}

WakeDetector::~WakeDetector() {
    stop();
}

void WakeDetector::onStart() {
    frame_.assign(static_cast<std::size_t>(backend_.frameLength()), 0);
    LOG_INFO("Wake", "Listening for wake word '" + backend_.keyword() + "'");
}

bool WakeDetector::step() {
    if (!frames_.readFrame(frame_, frame_.size(), std::chrono::milliseconds(100))) {
        return false;
    }

    std::optional<int> index;
    try {
        index = backend_.processFrame(frame_);
    } catch (const FatalError&) {
        throw;
    } catch (const LumenError& e) {
        LOG_WARN("Wake", std::string("Frame rejected: ") + e.what());
        reportError(ErrorKind::Service, e.code(), e.what());
        return true;
    }
    if (!index) return true;

    ++detections_;
    LOG_INFO("Wake", "Wake word '" + backend_.keyword() + "' detected");
    feedback_.cue(Cue::WakeWord);

    PipelineEvent ev = WakeDetected{ *index, std::chrono::steady_clock::now() };
    if (!out_.tryPush(ev)) {
        LOG_WARN("Wake", "Capture queue full, wake event dropped");
    }
    return true;
}
