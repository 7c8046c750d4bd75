#pragma once
#include <mutex>
#include <string>

#include "app_config.hpp"
#include "voice/recognition_service.hpp"

struct whisper_context;

/// WhisperRecognizer
/// Local whisper.cpp transcription. The model is loaded in the
/// constructor (ServiceError if missing or unloadable); calls are
/// serialized on the single context.
class WhisperRecognizer : public RecognitionService {
public:
    WhisperRecognizer(const RecognitionConfig& config, const std::string& modelPath);
    ~WhisperRecognizer() override;

    WhisperRecognizer(const WhisperRecognizer&) = delete;
    WhisperRecognizer& operator=(const WhisperRecognizer&) = delete;

    RecognitionResult recognize(const AudioClip& clip) override;
    std::string name() const override { return "whisper.cpp"; }

private:
    std::string language_;
    whisper_context* ctx_ = nullptr;
    std::mutex mtx_;
};
