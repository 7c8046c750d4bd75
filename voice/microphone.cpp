#include "voice/microphone.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <portaudio.h>

// ============================================================
// PortAudio callback
// ============================================================
static int recordCallback(const void* input,
                          void* /*output*/,
                          unsigned long frameCount,
                          const PaStreamCallbackTimeInfo*,
                          PaStreamCallbackFlags,
                          void* userData) {
    auto* mic = reinterpret_cast<Microphone*>(userData);
    const int16_t* in = reinterpret_cast<const int16_t*>(input);
    if (in) {
        mic->dispatch(in, static_cast<std::size_t>(frameCount));
    }
    return paContinue;
}

Microphone::Microphone(const CaptureConfig& config)
    : config_(config) {}

Microphone::~Microphone() {
    close();
}

AudioTap& Microphone::addTap(int seconds) {
    std::lock_guard<std::mutex> lock(tapsMutex_);
    std::size_t capacity = static_cast<std::size_t>(config_.sampleRate) *
                           static_cast<std::size_t>(seconds > 0 ? seconds : 1);
    taps_.push_back(std::make_unique<AudioTap>(capacity));
    return *taps_.back();
}

void Microphone::dispatch(const int16_t* samples, std::size_t count) {
    std::lock_guard<std::mutex> lock(tapsMutex_);
    for (auto& tap : taps_) {
        tap->write(samples, count);
    }
}

void Microphone::open() {
    if (stream_) return;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        throw ServiceError("ERR_MIC_UNAVAILABLE", std::string("PortAudio init failed: ") + Pa_GetErrorText(err));
    }
    initialized_ = true;

    int deviceIndex = (config_.inputDeviceIndex >= 0) ? config_.inputDeviceIndex
                                                      : Pa_GetDefaultInputDevice();
    if (deviceIndex == paNoDevice || deviceIndex < 0 || deviceIndex >= Pa_GetDeviceCount()) {
        close();
        throw ServiceError("ERR_MIC_UNAVAILABLE", "No valid input device found");
    }

    const PaDeviceInfo* devInfo = Pa_GetDeviceInfo(deviceIndex);
    if (devInfo) {
        LOG_DEBUG("Microphone", "Using input device: " + std::string(devInfo->name));
    }

    PaStreamParameters inputParams;
    inputParams.device = deviceIndex;
    inputParams.channelCount = 1;
    inputParams.sampleFormat = paInt16;
    inputParams.suggestedLatency = devInfo ? devInfo->defaultLowInputLatency : 0.05;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    PaStream* stream = nullptr;
    err = Pa_OpenStream(&stream, &inputParams, nullptr,
                        config_.sampleRate, 512, paNoFlag, recordCallback, this);
    if (err != paNoError || !stream) {
        close();
        throw ServiceError("ERR_MIC_UNAVAILABLE", std::string("Could not open mic stream: ") + Pa_GetErrorText(err));
    }

    err = Pa_StartStream(stream);
    if (err != paNoError) {
        Pa_CloseStream(stream);
        close();
        throw ServiceError("ERR_MIC_UNAVAILABLE", std::string("Could not start mic stream: ") + Pa_GetErrorText(err));
    }

    stream_ = stream;
    LOG_PHASE("Microphone open", true);
}

void Microphone::close() {
    if (stream_) {
        Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        LOG_DEBUG("Microphone", "Stream stopped");
    }
    if (initialized_) {
        Pa_Terminate();
        initialized_ = false;
    }
}
