#include "voice/utterance_recorder.hpp"
#include "logger.hpp"

#include <cmath>

UtteranceRecorder::UtteranceRecorder(Settings settings)
    : settings_(settings) {}

float UtteranceRecorder::rms(const int16_t* samples, std::size_t count) {
    if (!samples || count == 0) return 0.0f;

    double energy = 0.0;
    for (std::size_t i = 0; i < count; i++) {
        double s = samples[i] / 32768.0;
        energy += s * s;
    }
    return static_cast<float>(std::sqrt(energy / count));
}

int UtteranceRecorder::toMs(std::size_t samples) const {
    if (settings_.sampleRate <= 0) return 0;
    return static_cast<int>(samples * 1000 / static_cast<std::size_t>(settings_.sampleRate));
}

void UtteranceRecorder::pushPreRoll(const int16_t* samples, std::size_t count) {
    preRoll_.insert(preRoll_.end(), samples, samples + count);

    std::size_t keep = static_cast<std::size_t>(settings_.sampleRate) *
                       static_cast<std::size_t>(settings_.preRollMs) / 1000;
    if (preRoll_.size() > keep) {
        preRoll_.erase(preRoll_.begin(), preRoll_.end() - static_cast<std::ptrdiff_t>(keep));
    }
}

UtteranceRecorder::State UtteranceRecorder::feed(const int16_t* samples, std::size_t count) {
    if (state_ == State::Finished || count == 0) return state_;

    const bool voiced = rms(samples, count) >= settings_.silenceThreshold;
    const int chunkMs = toMs(count);

    if (state_ == State::Waiting) {
        if (!voiced) {
            pushPreRoll(samples, count);
            return state_;
        }
        utterance_ = std::move(preRoll_);
        preRoll_.clear();
        state_ = State::Recording;
        LOG_TRACE("Recorder", "Speech started");
    }

    utterance_.insert(utterance_.end(), samples, samples + count);

    if (voiced) {
        speechMs_ += chunkMs;
        silenceMs_ = 0;
    } else {
        silenceMs_ += chunkMs;
    }

    if (heardSpeech() && silenceMs_ >= settings_.minSilenceMs) {
        state_ = State::Finished;
        LOG_TRACE("Recorder", "Speech ended after silence");
    } else if (toMs(utterance_.size()) >= settings_.maxMs) {
        state_ = State::Finished;
        LOG_DEBUG("Recorder", "Phrase time limit reached");
    }
    return state_;
}

void UtteranceRecorder::reset() {
    state_ = State::Waiting;
    speechMs_ = 0;
    silenceMs_ = 0;
    preRoll_.clear();
    utterance_.clear();
}

std::vector<int16_t> UtteranceRecorder::take() {
    std::vector<int16_t> out = std::move(utterance_);
    reset();
    return out;
}
