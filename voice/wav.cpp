#include "voice/wav.hpp"

#include <cstdint>

namespace Voice {

static void putLE(std::string& out, std::uint32_t value, int bytes) {
    for (int i = 0; i < bytes; i++) {
        out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
    }
}

std::string encodeWav(const AudioClip& clip) {
    const std::uint32_t channels   = 1;
    const std::uint32_t bits       = 16;
    const std::uint32_t rate       = static_cast<std::uint32_t>(clip.sampleRate);
    const std::uint32_t dataBytes  = static_cast<std::uint32_t>(clip.samples.size() * sizeof(int16_t));
    const std::uint32_t byteRate   = rate * channels * bits / 8;
    const std::uint32_t blockAlign = channels * bits / 8;

    std::string out;
    out.reserve(44 + dataBytes);

    out += "RIFF";
    putLE(out, 36 + dataBytes, 4);
    out += "WAVE";

    out += "fmt ";
    putLE(out, 16, 4);          // PCM header size
    putLE(out, 1, 2);           // PCM
    putLE(out, channels, 2);
    putLE(out, rate, 4);
    putLE(out, byteRate, 4);
    putLE(out, blockAlign, 2);
    putLE(out, bits, 2);

    out += "data";
    putLE(out, dataBytes, 4);
    for (int16_t s : clip.samples) {
        putLE(out, static_cast<std::uint16_t>(s), 2);
    }
    return out;
}

} // namespace Voice
