#include "voice/voice_speak.hpp"
#include "voice/speech_command.hpp"
#include "logger.hpp"

#include <SFML/Audio.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iostream>

namespace Voice {

// =========================================================
// Tones
// =========================================================
namespace {
    struct Tone {
        double frequency;
        int durationMs;
        int repeats;
    };

    constexpr unsigned kToneRate = 44100;
    constexpr double kPi = 3.14159265358979323846;

    Tone toneFor(Cue cue) {
        switch (cue) {
            case Cue::WakeWord:          return { 880.0, 120, 1 };
            case Cue::CommandRecognized: return { 660.0, 90, 1 };
            case Cue::CommandExecuted:   return { 990.0, 140, 1 };
            case Cue::Error:             return { 220.0, 300, 1 };
            case Cue::Timer:             return { 1320.0, 120, 3 };
        }
        return { 440.0, 100, 1 };
    }

    // Sine bursts with a short fade so they don't click
    std::vector<std::int16_t> synthesize(const Tone& tone, float volume) {
        const std::size_t burst = kToneRate * tone.durationMs / 1000;
        const std::size_t gap = kToneRate / 12;
        const std::size_t fade = kToneRate / 200;
        const double amplitude = 12000.0 * std::clamp(volume, 0.0f, 1.0f);

        std::vector<std::int16_t> out;
        out.reserve((burst + gap) * tone.repeats);
        for (int r = 0; r < tone.repeats; ++r) {
            for (std::size_t i = 0; i < burst; ++i) {
                double env = 1.0;
                if (i < fade) env = static_cast<double>(i) / fade;
                else if (burst - i < fade) env = static_cast<double>(burst - i) / fade;
                double s = std::sin(2.0 * kPi * tone.frequency * i / kToneRate);
                out.push_back(static_cast<std::int16_t>(amplitude * env * s));
            }
            if (r + 1 < tone.repeats) out.insert(out.end(), gap, 0);
        }
        return out;
    }
}

// =========================================================
// Init / Shutdown
// =========================================================
DesktopFeedback::DesktopFeedback(const FeedbackConfig& config)
    : config_(config) {
    for (Cue c : { Cue::WakeWord, Cue::CommandRecognized, Cue::CommandExecuted, Cue::Error, Cue::Timer }) {
        auto samples = synthesize(toneFor(c), config_.speechVolume);
        auto buffer = std::make_unique<sf::SoundBuffer>();
        if (!buffer->loadFromSamples(samples.data(), samples.size(), 1, kToneRate,
                                     { sf::SoundChannel::Mono })) {
            LOG_WARN("Voice/Audio", "Could not build tone buffer, cue disabled");
            continue;
        }
        tones_[c] = std::move(buffer);
    }

    speechThread_ = std::thread(&DesktopFeedback::speechLoop, this);
    LOG_PHASE("Feedback ready", true);
}

DesktopFeedback::~DesktopFeedback() {
    {
        std::lock_guard<std::mutex> lock(speechMutex_);
        quit_ = true;
    }
    speechCv_.notify_all();
    if (speechThread_.joinable()) speechThread_.join();

    std::lock_guard<std::mutex> lock(soundMutex_);
    for (auto& s : activeSounds_) s->stop();
    activeSounds_.clear();
}

// =========================================================
// Cues
// =========================================================
void DesktopFeedback::cleanupSounds() {
    activeSounds_.erase(
        std::remove_if(activeSounds_.begin(), activeSounds_.end(),
            [](const std::unique_ptr<sf::Sound>& s) {
                return s->getStatus() == sf::SoundSource::Status::Stopped;
            }),
        activeSounds_.end()
    );
}

void DesktopFeedback::cue(Cue cue) {
    std::lock_guard<std::mutex> lock(soundMutex_);
    auto it = tones_.find(cue);
    if (it == tones_.end()) return;

    cleanupSounds();
    auto sound = std::make_unique<sf::Sound>(*it->second);
    sound->setVolume(100.f);
    sound->play();
    activeSounds_.push_back(std::move(sound));
}

// =========================================================
// Speech
// =========================================================
void DesktopFeedback::say(const std::string& text) {
    if (text.empty()) return;
    LOG_INFO("Voice", text);
    if (config_.speechCommand.empty()) return;

    {
        std::lock_guard<std::mutex> lock(speechMutex_);
        speechQueue_.push_back(text);
    }
    speechCv_.notify_one();
}

void DesktopFeedback::speechLoop() {
    std::unique_lock<std::mutex> lock(speechMutex_);
    while (true) {
        speechCv_.wait(lock, [this] { return quit_ || !speechQueue_.empty(); });
        if (quit_ && speechQueue_.empty()) break;

        std::string text = std::move(speechQueue_.front());
        speechQueue_.pop_front();
        speaking_ = true;
        lock.unlock();

        std::string cmd = speechCommandLine(config_, text);

        int rc = std::system(cmd.c_str());
        if (rc != 0) {
            LOG_WARN("Voice", "Speech command failed (" + std::to_string(rc) + "): " + config_.speechCommand);
        }

        lock.lock();
        speaking_ = false;
        speechCv_.notify_all();
    }
}

void DesktopFeedback::flush() {
    std::unique_lock<std::mutex> lock(speechMutex_);
    speechCv_.wait(lock, [this] { return quit_ || (speechQueue_.empty() && !speaking_); });
}

// =========================================================
// Notifications
// =========================================================
void DesktopFeedback::notify(const std::string& title, const std::string& message) {
    std::lock_guard<std::mutex> lock(notifyMutex_);

    if (config_.notifications && !consoleNotifications_) {
        std::string cmd = "notify-send " + shellQuote(title) + " " + shellQuote(message) + " >/dev/null 2>&1";
        if (std::system(cmd.c_str()) == 0) return;

        LOG_WARN("Voice", "Desktop notifications unavailable, using console");
        consoleNotifications_ = true;
    }

    std::cout << "\n>>> " << title << ": " << message << " <<<\n" << std::endl;
}

} // namespace Voice
