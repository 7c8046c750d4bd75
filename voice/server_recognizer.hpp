#pragma once
#include <string>

#include "app_config.hpp"
#include "voice/recognition_service.hpp"

/// ServerRecognizer
/// Posts the clip as a WAV upload to a whisper.cpp server
/// (`/inference`) and reads the JSON "text" field.
class ServerRecognizer : public RecognitionService {
public:
    explicit ServerRecognizer(const RecognitionConfig& config);

    RecognitionResult recognize(const AudioClip& clip) override;
    std::string name() const override { return "whisper server"; }

    // Parse a server response body; throws ServiceError / PerceptionError
    static RecognitionResult parseResponse(const std::string& body);

private:
    std::string url_;
    std::string language_;
    int timeoutMs_;
};
