#include "voice/server_recognizer.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "voice/wav.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

ServerRecognizer::ServerRecognizer(const RecognitionConfig& config)
    : url_(config.serverUrl), language_(config.language), timeoutMs_(config.timeoutMs) {}

RecognitionResult ServerRecognizer::parseResponse(const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw ServiceError("ERR_RECOGNITION_MALFORMED", std::string("Invalid JSON from server: ") + e.what());
    }

    if (j.contains("error")) {
        throw ServiceError("ERR_RECOGNITION_FAILED", "Server error: " + j["error"].dump());
    }
    if (!j.contains("text") || !j["text"].is_string()) {
        throw ServiceError("ERR_RECOGNITION_MALFORMED", "Response has no text field");
    }

    std::string text = j["text"].get<std::string>();
    if (text.find_first_not_of(" \t\n") == std::string::npos) {
        throw PerceptionError("ERR_AUDIO_UNINTELLIGIBLE", "Server returned an empty transcript");
    }

    RecognitionAlternative best;
    best.text = text;
    best.confidence = j.value("confidence", 1.0f);
    return RecognitionResult{ { best } };
}

RecognitionResult ServerRecognizer::recognize(const AudioClip& clip) {
    if (clip.samples.empty()) {
        throw PerceptionError("ERR_AUDIO_UNINTELLIGIBLE", "Empty audio clip");
    }

    const std::string wav = Voice::encodeWav(clip);

    auto resp = cpr::Post(
        cpr::Url{ url_ },
        cpr::Multipart{
            { "file", cpr::Buffer{ wav.begin(), wav.end(), "utterance.wav" } },
            { "response_format", "json" },
            { "language", language_ },
            { "temperature", "0.0" }
        },
        cpr::Timeout{ timeoutMs_ }
    );

    if (resp.error) {
        throw ServiceError("ERR_RECOGNITION_UNAVAILABLE", "Recognition server unreachable: " + resp.error.message);
    }
    if (resp.status_code != 200) {
        throw ServiceError("ERR_RECOGNITION_FAILED",
                           "Recognition server returned HTTP " + std::to_string(resp.status_code));
    }

    LOG_TRACE("Voice", "Server response: " + resp.text);
    return parseResponse(resp.text);
}
