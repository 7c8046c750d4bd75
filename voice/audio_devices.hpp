#pragma once
#include <string>
#include <vector>

struct InputDevice {
    int index = -1;
    std::string name;
    int maxChannels = 0;
    double defaultSampleRate = 0.0;
    bool isDefault = false;
};

// PortAudio capture devices (empty if PortAudio cannot start)
std::vector<InputDevice> getInputDevices();

// Logs the device list; warns if input_device_index is not one of them
void logInputDevices(int configuredIndex);
