#include "voice/recognizer.hpp"
#include "commands/command_parser.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "response_manager.hpp"

#include <future>
#include <thread>

Recognizer::Recognizer(const RecognitionConfig& config,
                       std::shared_ptr<RecognitionService> service,
                       Feedback& feedback,
                       EventChannel& in,
                       EventChannel& out,
                       ErrorChannel& errors)
    : Stage("Recognizer", errors),
      service_(std::move(service)),
      feedback_(feedback),
      in_(in),
      out_(out),
      timeout_(config.timeoutMs),
      gate_(config.confidenceThreshold,
            static_cast<std::size_t>(config.debounceWindow < 0 ? 0 : config.debounceWindow)) {}

Recognizer::~Recognizer() {
    stop();
    // An abandoned attempt may still hold the service
    joinWorker();
}

bool Recognizer::step() {
    auto ev = in_.tryPop();
    if (!ev) return false;

    if (auto* ready = std::get_if<AudioReady>(&*ev)) {
        auto transcript = handle(std::move(ready->clip));
        if (!transcript) return true;

        PipelineEvent cmd = CommandReady{ Command{ transcript->text, transcript->timestamp } };
        if (!out_.tryPush(cmd)) {
            LOG_WARN("Recognizer", "Dispatcher queue full, command '" + transcript->text + "' dropped");
            feedback_.cue(Cue::Error);
        }
    } else {
        LOG_DEBUG("Recognizer", "Ignoring unexpected event");
    }
    return true;
}

void Recognizer::joinWorker() {
    if (worker_.joinable()) worker_.join();
    inFlight_ = std::future<RecognitionResult>();
}

std::optional<RecognitionResult> Recognizer::recognizeBounded(AudioClip clip) {
    if (inFlight_.valid()) {
        if (inFlight_.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
            LOG_WARN("Recognizer", service_->name() + " still busy with an abandoned attempt, clip dropped");
            reportError(ErrorKind::Service, "ERR_RECOGNITION_BUSY", "Previous attempt still running");
            feedback_.cue(Cue::Error);
            return std::nullopt;
        }
        joinWorker();
    }

    std::packaged_task<RecognitionResult()> task(
        [service = service_, pcm = std::move(clip)]() { return service->recognize(pcm); });
    inFlight_ = task.get_future();
    worker_ = std::thread(std::move(task));

    if (inFlight_.wait_for(timeout_) != std::future_status::ready) {
        LOG_WARN("Recognizer", service_->name() + " did not answer within " +
                               std::to_string(timeout_.count()) + " ms, attempt abandoned");
        reportError(ErrorKind::Service, "ERR_RECOGNITION_TIMEOUT", "Recognition attempt abandoned");
        feedback_.cue(Cue::Error);
        return std::nullopt;
    }

    std::future<RecognitionResult> result = std::move(inFlight_);
    joinWorker();

    try {
        return result.get();
    } catch (const PerceptionError& e) {
        LOG_INFO("Recognizer", std::string("Could not understand audio: ") + e.what());
        feedback_.cue(Cue::Error);
        feedback_.say(ErrorManager::getUserMessage(e.code()));
    } catch (const LumenError& e) {
        LOG_ERROR("Recognizer", std::string("Recognition service error: ") + e.what());
        reportError(ErrorKind::Service, e.code(), e.what());
        feedback_.cue(Cue::Error);
        feedback_.say(ErrorManager::getUserMessage(e.code()));
    } catch (const std::exception& e) {
        LOG_ERROR("Recognizer", std::string("Recognition failed: ") + e.what());
        reportError(ErrorKind::Service, "ERR_RECOGNITION_FAILED", e.what());
        feedback_.cue(Cue::Error);
    }
    return std::nullopt;
}

std::optional<Transcript> Recognizer::handle(AudioClip clip) {
    LOG_DEBUG("Recognizer", "Recognizing " + std::to_string(clip.durationSeconds()) + "s of audio");

    auto result = recognizeBounded(std::move(clip));
    if (!result) return std::nullopt;

    if (result->alternatives.empty()) {
        LOG_INFO("Recognizer", "Could not understand audio");
        feedback_.cue(Cue::Error);
        return std::nullopt;
    }

    const RecognitionAlternative& best = result->alternatives.front();
    std::string text = command_parser::normalizeTranscript(best.text);
    if (text.empty()) {
        LOG_INFO("Recognizer", "Empty transcript");
        return std::nullopt;
    }

    Transcript transcript{ text, best.confidence, std::chrono::system_clock::now() };
    auto verdict = gate_.evaluate(transcript);
    if (verdict != ConfidenceGate::Verdict::Accepted) {
        LOG_INFO("Recognizer", "Rejected '" + text + "' (" + toString(verdict) + ", confidence " +
                               std::to_string(transcript.confidence) + ")");
        return std::nullopt;
    }

    LOG_INFO("Recognizer", ResponseManager::get("heard") + text);
    feedback_.cue(Cue::CommandRecognized);
    return transcript;
}
