#include "voice/audio_capture.hpp"
#include "logger.hpp"

using std::chrono::milliseconds;

AudioCapture::AudioCapture(const CaptureConfig& config,
                           Mode mode,
                           UtteranceSource& source,
                           EventChannel& in,
                           EventChannel& out,
                           ErrorChannel& errors,
                           const Clock& clock)
    : Stage("AudioCapture", errors),
      config_(config),
      mode_(mode),
      source_(source),
      in_(in),
      out_(out),
      clock_(clock) {}

AudioCapture::~AudioCapture() {
    stop();
}

bool AudioCapture::coolingDown() const {
    return clock_.now() < cooldownUntil_;
}

void AudioCapture::drainEvents() {
    while (auto ev = in_.tryPop()) {
        std::visit(overloaded{
            [this](WakeDetected&) {
                if (coolingDown()) {
                    LOG_DEBUG("Capture", "Wake event ignored during cooldown");
                    return;
                }
                if (mode_ == Mode::Continuous) return;
                armedAt_ = clock_.now();
                flushPending_ = true;
                LOG_DEBUG("Capture", "Activated, listening for a command");
            },
            [this](CommandExecuted&) {
                cooldownUntil_ = clock_.now() + milliseconds(config_.cooldownMs);
                armedAt_.reset();
                flushPending_ = true;
                LOG_DEBUG("Capture", "Cooldown for " + std::to_string(config_.cooldownMs) + " ms");
            },
            [](auto&) {
                LOG_DEBUG("Capture", "Ignoring unexpected event");
            }
        }, *ev);
    }
}

bool AudioCapture::step() {
    drainEvents();

    if (coolingDown()) return false;

    if (mode_ == Mode::Gated) {
        if (!armedAt_) return false;

        if (clock_.now() - *armedAt_ > milliseconds(config_.activationWindowMs)) {
            LOG_INFO("Capture", "No command heard, going back to idle");
            armedAt_.reset();
            return true;
        }
    }

    return captureOnce();
}

bool AudioCapture::captureOnce() {
    if (flushPending_) {
        source_.discardPending();
        flushPending_ = false;
    }

    ListenLimits limits;
    limits.waitTimeout = milliseconds(config_.commandTimeoutMs);
    limits.phraseLimit = milliseconds(config_.phraseTimeLimitMs);

    std::optional<AudioClip> clip = source_.listen(limits, runningFlag());
    if (!clip) {
        // Capture timeout: not an error, try again
        LOG_TRACE("Capture", "Listening timed out");
        return true;
    }

    armedAt_.reset();

    PipelineEvent ev = AudioReady{ std::move(*clip) };
    if (!out_.tryPush(ev)) {
        LOG_WARN("Capture", "Recognizer queue full, utterance dropped");
        return true;
    }
    LOG_DEBUG("Capture", "Utterance handed to recognizer");
    return true;
}
