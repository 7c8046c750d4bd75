#pragma once
#include <string>

namespace ResponseManager {
    // Random variant for a response key; unknown keys are returned as-is
    std::string get(const std::string& keyOrMessage);

    // True if the key exists in the response table
    bool has(const std::string& key);
}
