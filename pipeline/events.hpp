#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "pipeline/channel.hpp"
#include "error_manager.hpp"

// ------------------------------------------------------------
// Data handed between stages
// ------------------------------------------------------------

// PCM utterance. Move-only: exactly one stage owns a clip at a time.
struct AudioClip {
    std::vector<int16_t> samples;
    int sampleRate = 16000;
    std::chrono::system_clock::time_point capturedAt{};

    AudioClip() = default;
    AudioClip(std::vector<int16_t> pcm, int rate,
              std::chrono::system_clock::time_point at)
        : samples(std::move(pcm)), sampleRate(rate), capturedAt(at) {}

    AudioClip(const AudioClip&) = delete;
    AudioClip& operator=(const AudioClip&) = delete;
    AudioClip(AudioClip&&) = default;
    AudioClip& operator=(AudioClip&&) = default;

    double durationSeconds() const {
        return sampleRate > 0 ? static_cast<double>(samples.size()) / sampleRate : 0.0;
    }
};

struct Transcript {
    const std::string text;
    const float confidence = 0.0f;   // [0,1]
    const std::chrono::system_clock::time_point timestamp{};
};

struct Command {
    std::string rawText;
    std::chrono::system_clock::time_point receivedAt{};
};

// ------------------------------------------------------------
// Pipeline events (tagged union, dispatched with std::visit)
// ------------------------------------------------------------
struct WakeDetected {
    int keywordIndex = 0;
    std::chrono::steady_clock::time_point at{};
};

struct AudioReady {
    AudioClip clip;
};

struct CommandReady {
    Command command;
};

struct TimerFired {
    std::uint64_t timerId = 0;
    std::string action;
};

// Dispatcher -> AudioCapture, starts the post-command cooldown
struct CommandExecuted {
    std::chrono::steady_clock::time_point at{};
};

using PipelineEvent = std::variant<WakeDetected, AudioReady, CommandReady, TimerFired, CommandExecuted>;

using EventChannel = Channel<PipelineEvent>;
using ErrorChannel = Channel<PipelineError>;

// std::visit helper
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
