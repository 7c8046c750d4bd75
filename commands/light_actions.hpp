#pragma once
#include <memory>
#include <vector>

#include "app_config.hpp"
#include "commands/command_parser.hpp"
#include "devices/device_bridge.hpp"

// ------------------------------------------------------------
// Light mutations. Every function acts on the whole target set and
// lets DeviceError propagate from the first failing device.
// ------------------------------------------------------------
namespace light_actions {

    using Lights = std::vector<std::shared_ptr<LightHandle>>;

    void turnOn(const Lights& lights);
    void turnOff(const Lights& lights);

    // Only lights that are on are dimmed. Unknown brightness counts as 254.
    void dim(const Lights& lights, int delta);

    // Lights that are on go up by delta (unknown brightness counts as 128).
    // Lights that are off are switched on at fromOffLevel.
    void brighten(const Lights& lights, int delta, int fromOffLevel);

    void maximum(const Lights& lights);
    void minimum(const Lights& lights);

    // Switch on and set an absolute level (clamped to [1,254])
    void setBrightness(const Lights& lights, int value);

    int deltaFor(command_parser::Magnitude magnitude, const BrightnessDeltas& deltas);
}
