#include "commands/command_parser.hpp"
#include "devices/device_bridge.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>

namespace command_parser {

static std::string trim(const std::string& s) {
    const char* ws = " \n\r\t";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

static bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

std::string normalizeTranscript(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    out = trim(out);
    while (!out.empty() && std::string(".,!?;:").find(out.back()) != std::string::npos) {
        out.pop_back();
    }
    return trim(out);
}

std::vector<std::string> splitChain(const std::string& text) {
    static const std::regex separator(R"(\s+(and\s+then|and|then)\s+)", std::regex::icase);

    std::vector<std::string> parts;
    std::sregex_token_iterator it(text.begin(), text.end(), separator, -1);
    std::sregex_token_iterator end;
    for (; it != end; ++it) {
        std::string part = trim(it->str());
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}

std::optional<DelayDirective> parseDelay(const std::string& text) {
    static const std::regex pattern(R"(\b(in|after)\s+(\d+)\s+(second|minute|hour)s?\b)",
                                    std::regex::icase);

    std::smatch match;
    if (!std::regex_search(text, match, pattern)) return std::nullopt;

    const long long maxSeconds = std::chrono::seconds(kMaxDelay).count();
    long long amount = maxSeconds;
    try {
        amount = std::stoll(match[2].str());
    } catch (const std::out_of_range&) {
        // Too many digits for any unit: clamped below
    }

    std::string unit = match[3].str();
    std::transform(unit.begin(), unit.end(), unit.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });

    long long multiplier = 1;
    if (unit == "minute") multiplier = 60;
    else if (unit == "hour") multiplier = 3600;

    DelayDirective d;
    d.delay  = amount > maxSeconds / multiplier ? std::chrono::seconds(maxSeconds)
                                                : std::chrono::seconds(amount * multiplier);
    d.action = trim(match.prefix().str() + " " + match.suffix().str());
    return d;
}

std::optional<int> parsePercent(const std::string& text) {
    static const std::regex pattern(R"((-?\d+)\s*(percent|%))", std::regex::icase);

    std::smatch match;
    if (!std::regex_search(text, match, pattern)) return std::nullopt;

    try {
        long long value = std::stoll(match[1].str());
        value = std::clamp<long long>(value, -1000, 1000);
        return static_cast<int>(value);
    } catch (const std::out_of_range&) {
        return match[1].str().front() == '-' ? -1000 : 1000;
    }
}

int percentToBrightness(int percent) {
    int p = std::clamp(percent, 0, 100);
    int value = static_cast<int>(std::lround(p / 100.0 * kMaxBrightness));
    return std::clamp(value, kMinBrightness, kMaxBrightness);
}

Magnitude parseMagnitude(const std::string& text) {
    for (const char* w : {"little", "bit", "slightly"}) {
        if (containsPhrase(text, w)) return Magnitude::Small;
    }
    for (const char* w : {"lot", "much", "significantly"}) {
        if (containsPhrase(text, w)) return Magnitude::Large;
    }
    return Magnitude::Default;
}

bool containsPhrase(const std::string& text, const std::string& phrase) {
    if (phrase.empty()) return false;

    size_t pos = text.find(phrase);
    while (pos != std::string::npos) {
        bool leftOk  = pos == 0 || !isWordChar(text[pos - 1]);
        size_t after = pos + phrase.size();
        bool rightOk = after >= text.size() || !isWordChar(text[after]);
        if (leftOk && rightOk) return true;
        pos = text.find(phrase, pos + 1);
    }
    return false;
}

} // namespace command_parser
