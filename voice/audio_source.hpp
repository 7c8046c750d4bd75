#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

#include "pipeline/events.hpp"

// Fixed-size PCM frames (wake stage input)
class FrameSource {
public:
    virtual ~FrameSource() = default;

    // Fill `frame` with exactly `length` samples. False if not enough
    // audio arrived within `timeout`.
    virtual bool readFrame(std::vector<int16_t>& frame, std::size_t length,
                           std::chrono::milliseconds timeout) = 0;
};

struct ListenLimits {
    std::chrono::milliseconds waitTimeout{5000};   // no speech -> timeout
    std::chrono::milliseconds phraseLimit{5000};   // hard cap on one utterance
};

// Whole utterances (capture stage input)
class UtteranceSource {
public:
    virtual ~UtteranceSource() = default;

    // Blocks until one utterance is complete. nullopt on capture timeout
    // or when `running` drops.
    virtual std::optional<AudioClip> listen(const ListenLimits& limits,
                                            const std::atomic<bool>& running) = 0;

    // Drop audio buffered before now (wake word, our own feedback)
    virtual void discardPending() {}
};
