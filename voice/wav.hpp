#pragma once
#include <string>

#include "pipeline/events.hpp"

namespace Voice {
    // 16-bit mono PCM RIFF/WAVE file image of a clip
    std::string encodeWav(const AudioClip& clip);
}
