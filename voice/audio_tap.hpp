#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

#include "voice/audio_source.hpp"
#include "voice/utterance_recorder.hpp"

/// AudioTap
/// One consumer's view of the microphone. The capture callback writes
/// every block to each tap; the oldest samples are dropped once the tap
/// holds `capacity` samples.
class AudioTap {
public:
    explicit AudioTap(std::size_t capacity);

    void write(const int16_t* samples, std::size_t count);

    // Up to `max` samples, waiting at most `timeout` for the first one
    std::vector<int16_t> read(std::size_t max, std::chrono::milliseconds timeout);

    // Exactly `count` samples or nothing
    bool readExact(std::vector<int16_t>& out, std::size_t count, std::chrono::milliseconds timeout);

    void clear();
    std::size_t available() const;
    std::size_t dropped() const;

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<int16_t> samples_;
    std::size_t capacity_;
    std::size_t dropped_ = 0;
};

class TapFrameSource : public FrameSource {
public:
    explicit TapFrameSource(AudioTap& tap) : tap_(tap) {}

    bool readFrame(std::vector<int16_t>& frame, std::size_t length,
                   std::chrono::milliseconds timeout) override;

private:
    AudioTap& tap_;
};

// Segments utterances out of a tap with an UtteranceRecorder
class TapUtteranceSource : public UtteranceSource {
public:
    TapUtteranceSource(AudioTap& tap, UtteranceRecorder::Settings settings);

    std::optional<AudioClip> listen(const ListenLimits& limits,
                                    const std::atomic<bool>& running) override;
    void discardPending() override;

private:
    AudioTap& tap_;
    UtteranceRecorder::Settings settings_;
};
