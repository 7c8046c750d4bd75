#include "voice/whisper_recognizer.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <whisper.h>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

WhisperRecognizer::WhisperRecognizer(const RecognitionConfig& config, const std::string& modelPath)
    : language_(config.language) {
    LOG_DEBUG("Voice", "Looking for Whisper model at: " + modelPath);

    if (!fs::exists(modelPath)) {
        throw ServiceError("ERR_RECOGNITION_UNAVAILABLE", "Whisper model missing: " + modelPath);
    }

    whisper_context_params wparams = whisper_context_default_params();
    ctx_ = whisper_init_from_file_with_params(modelPath.c_str(), wparams);
    if (!ctx_) {
        throw ServiceError("ERR_RECOGNITION_UNAVAILABLE", "Failed to load Whisper model: " + modelPath);
    }

    LOG_PHASE("Whisper model load", true);
}

WhisperRecognizer::~WhisperRecognizer() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

RecognitionResult WhisperRecognizer::recognize(const AudioClip& clip) {
    if (clip.samples.empty()) {
        throw PerceptionError("ERR_AUDIO_UNINTELLIGIBLE", "Empty audio clip");
    }

    std::vector<float> pcm;
    pcm.reserve(clip.samples.size());
    for (int16_t s : clip.samples) {
        pcm.push_back(static_cast<float>(s) / 32768.0f);
    }

    std::lock_guard<std::mutex> lock(mtx_);

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.no_timestamps    = true;
    params.print_progress   = false;
    params.print_realtime   = false;
    params.single_segment   = true;
    params.language         = language_.c_str();

    if (whisper_full(ctx_, params, pcm.data(), static_cast<int>(pcm.size())) != 0) {
        throw ServiceError("ERR_RECOGNITION_FAILED", "whisper_full() failed");
    }

    std::string transcript;
    double probSum = 0.0;
    int tokenCount = 0;
    const whisper_token eot = whisper_token_eot(ctx_);

    int n = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n; i++) {
        transcript += whisper_full_get_segment_text(ctx_, i);

        int tokens = whisper_full_n_tokens(ctx_, i);
        for (int j = 0; j < tokens; j++) {
            whisper_token_data data = whisper_full_get_token_data(ctx_, i, j);
            if (data.id >= eot) continue;   // special tokens
            probSum += data.p;
            ++tokenCount;
        }
    }

    if (transcript.find_first_not_of(" \t\n") == std::string::npos || tokenCount == 0) {
        throw PerceptionError("ERR_AUDIO_UNINTELLIGIBLE", "No speech recognized");
    }

    RecognitionAlternative best;
    best.text = transcript;
    best.confidence = static_cast<float>(probSum / tokenCount);

    LOG_DEBUG("Voice", "Whisper: \"" + transcript + "\" (" + std::to_string(best.confidence) + ")");
    return RecognitionResult{ { best } };
}
