#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

/// UtteranceRecorder
/// RMS voice-activity segmentation. Fed consecutive PCM chunks; starts
/// recording at the first chunk above the silence threshold (with a short
/// pre-roll), finishes after minSilenceMs of silence once minSpeechMs of
/// speech has been heard, or when maxMs of audio has been recorded.
class UtteranceRecorder {
public:
    struct Settings {
        int sampleRate = 16000;
        float silenceThreshold = 0.02f;   // RMS of samples normalized to [-1,1]
        int minSpeechMs = 300;
        int minSilenceMs = 800;
        int maxMs = 5000;
        int preRollMs = 200;
    };

    enum class State { Waiting, Recording, Finished };

    explicit UtteranceRecorder(Settings settings);

    State feed(const int16_t* samples, std::size_t count);
    void reset();

    State state() const { return state_; }
    bool heardSpeech() const { return speechMs_ >= settings_.minSpeechMs; }

    // Recorded samples; leaves the recorder empty
    std::vector<int16_t> take();

    static float rms(const int16_t* samples, std::size_t count);

private:
    int toMs(std::size_t samples) const;
    void pushPreRoll(const int16_t* samples, std::size_t count);

    Settings settings_;
    State state_ = State::Waiting;

    int speechMs_ = 0;
    int silenceMs_ = 0;

    std::vector<int16_t> preRoll_;
    std::vector<int16_t> utterance_;
};
