#pragma once
#include <string>

#include "app_config.hpp"

namespace Voice {
    // Single-quote a string for /bin/sh
    std::string shellQuote(const std::string& text);

    // speechVolume 0..1 mapped onto spd-say's -100..100 volume scale
    int spdSayVolume(float speechVolume);

    // Full /bin/sh line that speaks text with the configured command.
    // spd-say gets --wait and the configured volume.
    std::string speechCommandLine(const FeedbackConfig& config, const std::string& text);
}
