#pragma once
#include <memory>
#include <mutex>
#include <vector>

#include "app_config.hpp"
#include "voice/audio_tap.hpp"

typedef void PaStream;

/// Microphone
/// One PortAudio input stream (mono int16) copied into every tap.
/// open() throws ServiceError when no usable input device exists.
class Microphone {
public:
    explicit Microphone(const CaptureConfig& config);
    ~Microphone();

    Microphone(const Microphone&) = delete;
    Microphone& operator=(const Microphone&) = delete;

    void open();
    void close();
    bool isOpen() const { return stream_ != nullptr; }

    // New tap holding at most `seconds` of audio; valid until destruction
    AudioTap& addTap(int seconds);

    int sampleRate() const { return config_.sampleRate; }

    // Copy one block into every tap (PortAudio callback thread)
    void dispatch(const int16_t* samples, std::size_t count);

private:
    const CaptureConfig& config_;
    PaStream* stream_ = nullptr;
    bool initialized_ = false;

    std::mutex tapsMutex_;
    std::vector<std::unique_ptr<AudioTap>> taps_;
};
