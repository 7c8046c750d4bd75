#pragma once
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "app_config.hpp"
#include "voice/feedback.hpp"

namespace sf {
    class SoundBuffer;
    class Sound;
}

namespace Voice {

/// DesktopFeedback
/// Synthesized tones through SFML, speech through an external command
/// (spd-say by default) and desktop notifications via notify-send.
/// Speech is queued and spoken by one worker thread so stages never block.
class DesktopFeedback : public Feedback {
public:
    explicit DesktopFeedback(const FeedbackConfig& config);
    ~DesktopFeedback() override;

    DesktopFeedback(const DesktopFeedback&) = delete;
    DesktopFeedback& operator=(const DesktopFeedback&) = delete;

    void cue(Cue cue) override;
    void say(const std::string& text) override;
    void notify(const std::string& title, const std::string& message) override;

    // Blocks until the speech queue is empty (used before exit)
    void flush();

private:
    void speechLoop();
    void cleanupSounds();

    FeedbackConfig config_;

    std::mutex soundMutex_;
    std::map<Cue, std::unique_ptr<sf::SoundBuffer>> tones_;
    std::vector<std::unique_ptr<sf::Sound>> activeSounds_;

    std::mutex speechMutex_;
    std::condition_variable speechCv_;
    std::deque<std::string> speechQueue_;
    bool speaking_ = false;
    bool quit_ = false;
    std::thread speechThread_;

    std::mutex notifyMutex_;
    bool consoleNotifications_ = false;
};

} // namespace Voice
