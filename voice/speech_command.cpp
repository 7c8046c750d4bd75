#include "voice/speech_command.hpp"

#include <algorithm>
#include <cmath>

namespace Voice {

std::string shellQuote(const std::string& text) {
    std::string out = "'";
    for (char c : text) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

int spdSayVolume(float speechVolume) {
    if (!std::isfinite(speechVolume)) return 0;
    const float v = std::clamp(speechVolume, 0.0f, 1.0f);
    return static_cast<int>(std::lround(v * 200.0f - 100.0f));
}

std::string speechCommandLine(const FeedbackConfig& config, const std::string& text) {
    std::string cmd = config.speechCommand;
    // spd-say returns immediately unless told to wait
    if (cmd == "spd-say") {
        cmd += " --wait -i " + std::to_string(spdSayVolume(config.speechVolume));
    }
    cmd += " " + shellQuote(text) + " >/dev/null 2>&1";
    return cmd;
}

} // namespace Voice
