#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

// ------------------------------------------------------------
// Text-level parsing of recognized commands
// ------------------------------------------------------------
namespace command_parser {

    // Longest delay a directive can request; larger amounts are clamped
    inline constexpr std::chrono::hours kMaxDelay{24};

    struct DelayDirective {
        std::chrono::seconds delay{0};
        std::string action;   // remainder of the text, trimmed
    };

    enum class Magnitude { Small, Default, Large };

    // Lowercase, trim, drop trailing punctuation
    std::string normalizeTranscript(const std::string& text);

    // "dim and then brighten" -> {"dim", "brighten"}. Empty parts dropped.
    std::vector<std::string> splitChain(const std::string& text);

    // "(in|after) N (second|minute|hour)s? <action>", delay capped at kMaxDelay
    std::optional<DelayDirective> parseDelay(const std::string& text);

    // "N percent" -> N (unclamped, may be negative)
    std::optional<int> parsePercent(const std::string& text);

    // round(N/100 * 254), N clamped to [0,100], result clamped to [1,254]
    int percentToBrightness(int percent);

    Magnitude parseMagnitude(const std::string& text);

    // True if `phrase` occurs in `text` bounded by word edges
    bool containsPhrase(const std::string& text, const std::string& phrase);
}
