#include "voice/audio_tap.hpp"
#include "logger.hpp"

#include <algorithm>

// ------------------------------------------------------------
// AudioTap
// ------------------------------------------------------------
AudioTap::AudioTap(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void AudioTap::write(const int16_t* samples, std::size_t count) {
    if (!samples || count == 0) return;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        samples_.insert(samples_.end(), samples, samples + count);
        if (samples_.size() > capacity_) {
            std::size_t excess = samples_.size() - capacity_;
            samples_.erase(samples_.begin(), samples_.begin() + static_cast<std::ptrdiff_t>(excess));
            dropped_ += excess;
        }
    }
    cv_.notify_all();
}

std::vector<int16_t> AudioTap::read(std::size_t max, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait_for(lock, timeout, [this]() { return !samples_.empty(); });

    std::size_t n = std::min(max, samples_.size());
    std::vector<int16_t> out(samples_.begin(), samples_.begin() + static_cast<std::ptrdiff_t>(n));
    samples_.erase(samples_.begin(), samples_.begin() + static_cast<std::ptrdiff_t>(n));
    return out;
}

bool AudioTap::readExact(std::vector<int16_t>& out, std::size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx_);
    if (!cv_.wait_for(lock, timeout, [this, count]() { return samples_.size() >= count; })) {
        return false;
    }

    out.assign(samples_.begin(), samples_.begin() + static_cast<std::ptrdiff_t>(count));
    samples_.erase(samples_.begin(), samples_.begin() + static_cast<std::ptrdiff_t>(count));
    return true;
}

void AudioTap::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    samples_.clear();
}

std::size_t AudioTap::available() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return samples_.size();
}

std::size_t AudioTap::dropped() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return dropped_;
}

// ------------------------------------------------------------
// TapFrameSource
// ------------------------------------------------------------
bool TapFrameSource::readFrame(std::vector<int16_t>& frame, std::size_t length,
                               std::chrono::milliseconds timeout) {
    return tap_.readExact(frame, length, timeout);
}

// ------------------------------------------------------------
// TapUtteranceSource
// ------------------------------------------------------------
TapUtteranceSource::TapUtteranceSource(AudioTap& tap, UtteranceRecorder::Settings settings)
    : tap_(tap), settings_(settings) {}

void TapUtteranceSource::discardPending() {
    tap_.clear();
}

std::optional<AudioClip> TapUtteranceSource::listen(const ListenLimits& limits,
                                                    const std::atomic<bool>& running) {
    UtteranceRecorder::Settings s = settings_;
    s.maxMs = static_cast<int>(limits.phraseLimit.count());
    UtteranceRecorder recorder(s);

    const std::size_t chunk = static_cast<std::size_t>(std::max(1, s.sampleRate / 20));   // 50 ms
    const auto started = std::chrono::steady_clock::now();
    const auto hardDeadline = started + limits.waitTimeout + limits.phraseLimit;
    std::size_t waitedSamples = 0;
    const std::size_t waitLimit = static_cast<std::size_t>(s.sampleRate) *
                                  static_cast<std::size_t>(limits.waitTimeout.count()) / 1000;

    while (running.load()) {
        std::vector<int16_t> pcm = tap_.read(chunk, std::chrono::milliseconds(100));
        auto state = recorder.feed(pcm.data(), pcm.size());

        if (state == UtteranceRecorder::State::Finished) {
            if (!recorder.heardSpeech()) {
                LOG_DEBUG("Capture", "Noise burst discarded");
                return std::nullopt;
            }
            AudioClip clip(recorder.take(), s.sampleRate, std::chrono::system_clock::now());
            LOG_DEBUG("Capture", "Utterance captured (" + std::to_string(clip.durationSeconds()) + "s)");
            return clip;
        }

        if (state == UtteranceRecorder::State::Waiting) {
            waitedSamples += pcm.size();
            if (waitedSamples >= waitLimit) {
                LOG_TRACE("Capture", "No speech before timeout");
                return std::nullopt;
            }
        }

        if (std::chrono::steady_clock::now() > hardDeadline) {
            LOG_DEBUG("Capture", "Microphone delivered too little audio, giving up");
            return std::nullopt;
        }
    }
    return std::nullopt;
}
