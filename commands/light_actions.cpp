#include "commands/light_actions.hpp"
#include "logger.hpp"

#include <algorithm>

namespace light_actions {

static int clampBrightness(int value) {
    return std::clamp(value, kMinBrightness, kMaxBrightness);
}

void turnOn(const Lights& lights) {
    LOG_INFO("Lights", "Turning lights ON");
    for (const auto& light : lights) {
        light->setOn(true);
    }
}

void turnOff(const Lights& lights) {
    LOG_INFO("Lights", "Turning lights OFF");
    for (const auto& light : lights) {
        light->setOn(false);
    }
}

void dim(const Lights& lights, int delta) {
    LOG_INFO("Lights", "Dimming lights by " + std::to_string(delta));
    for (const auto& light : lights) {
        if (!light->on() || !light->capabilities().supportsBrightness) continue;

        int current = light->brightness().value_or(kMaxBrightness);
        light->setBrightness(clampBrightness(current - delta));
    }
}

void brighten(const Lights& lights, int delta, int fromOffLevel) {
    LOG_INFO("Lights", "Brightening lights by " + std::to_string(delta));
    for (const auto& light : lights) {
        bool dimmable = light->capabilities().supportsBrightness;

        if (!light->on()) {
            light->setOn(true);
            if (dimmable) light->setBrightness(clampBrightness(fromOffLevel));
            continue;
        }
        if (!dimmable) continue;

        int current = light->brightness().value_or(128);
        light->setBrightness(clampBrightness(current + delta));
    }
}

void maximum(const Lights& lights) {
    LOG_INFO("Lights", "Setting lights to maximum brightness");
    setBrightness(lights, kMaxBrightness);
}

void minimum(const Lights& lights) {
    LOG_INFO("Lights", "Setting lights to minimum brightness");
    setBrightness(lights, kMinBrightness);
}

void setBrightness(const Lights& lights, int value) {
    const int level = clampBrightness(value);
    LOG_DEBUG("Lights", "Brightness -> " + std::to_string(level));
    for (const auto& light : lights) {
        light->setOn(true);
        if (light->capabilities().supportsBrightness) {
            light->setBrightness(level);
        }
    }
}

int deltaFor(command_parser::Magnitude magnitude, const BrightnessDeltas& deltas) {
    switch (magnitude) {
        case command_parser::Magnitude::Small: return deltas.small;
        case command_parser::Magnitude::Large: return deltas.large;
        case command_parser::Magnitude::Default: break;
    }
    return deltas.normal;
}

} // namespace light_actions
