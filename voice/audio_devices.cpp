#include "voice/audio_devices.hpp"
#include "logger.hpp"

#include <portaudio.h>

std::vector<InputDevice> getInputDevices() {
    std::vector<InputDevice> devices;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        LOG_ERROR("Audio", std::string("Pa_Initialize failed: ") + Pa_GetErrorText(err));
        return devices;
    }

    const PaDeviceIndex defaultIn = Pa_GetDefaultInputDevice();
    const int count = Pa_GetDeviceCount();
    for (int i = 0; i < count; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels <= 0) continue;

        InputDevice d;
        d.index = i;
        d.name = info->name ? info->name : "unknown";
        d.maxChannels = info->maxInputChannels;
        d.defaultSampleRate = info->defaultSampleRate;
        d.isDefault = (i == defaultIn);
        devices.push_back(d);
    }

    Pa_Terminate();
    return devices;
}

void logInputDevices(int configuredIndex) {
    auto devices = getInputDevices();
    if (devices.empty()) {
        LOG_WARN("Audio", "No input devices found");
        return;
    }

    bool found = (configuredIndex < 0);
    for (const auto& d : devices) {
        LOG_DEBUG("Audio", "  [" + std::to_string(d.index) + "] " + d.name +
                           " (" + std::to_string(d.maxChannels) + " ch, " +
                           std::to_string(static_cast<int>(d.defaultSampleRate)) + " Hz)" +
                           (d.isDefault ? " *default*" : ""));
        if (d.index == configuredIndex) found = true;
    }

    if (!found) {
        LOG_WARN("Audio", "input_device_index " + std::to_string(configuredIndex) +
                          " is not an input device, PortAudio will fail to open it");
    }
}
