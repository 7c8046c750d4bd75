#pragma once
#include <string>
#include <vector>

// ------------------------------------------------------------
// AppConfig
// Built once at startup by bootstrap_config::buildAppConfig() and
// passed by const reference to every stage. Never mutated afterwards.
// ------------------------------------------------------------

struct CaptureConfig {
    int commandTimeoutMs   = 5000;    // wait for speech to start
    int phraseTimeLimitMs  = 5000;    // hard cap on one utterance
    int activationWindowMs = 10000;   // gated mode: revert to idle after this
    int cooldownMs         = 5000;    // after a command executes
    float silenceThreshold = 0.02f;   // RMS, normalized
    int minSpeechMs        = 300;
    int minSilenceMs       = 800;
    int sampleRate         = 16000;
    int inputDeviceIndex   = -1;      // -1 = PortAudio default
};

struct RecognitionConfig {
    std::string backend      = "whisper_local";   // or "whisper_server"
    std::string whisperModel = "ggml-base.en.bin";
    std::string serverUrl    = "http://127.0.0.1:8080/inference";
    std::string language     = "en";
    int timeoutMs             = 5000;
    float confidenceThreshold = 0.7f;
    int debounceWindow        = 5;
};

struct WakeConfig {
    std::string keyword     = "philips";
    std::string keywordPath;                 // explicit .ppn, overrides keywordDir lookup
    std::vector<std::string> fallbackKeywords{ "jarvis", "computer", "porcupine" };
    std::string keywordDir  = "resources/wake";
    std::string modelPath;                   // empty = <keywordDir>/porcupine_params.pv
    float sensitivity       = 0.5f;
    std::string accessKey;
    bool autoFallback       = true;
};

struct BrightnessDeltas {
    int small  = 25;
    int normal = 64;
    int large  = 100;
};

struct AliasGroup {
    std::string action;
    std::vector<std::string> phrases;
};

struct DispatchConfig {
    int cacheTtlS          = 60;
    int maxStateHistory    = 5;
    int maxCommandHistory  = 10;
    int fuzzyThreshold     = 70;
    BrightnessDeltas deltas;
    std::vector<AliasGroup> aliases;   // empty = built-in table
};

struct SupervisorConfig {
    int maxErrors        = 5;
    int errorWindowS     = 30;
    int pollIntervalMs   = 500;
    int restartBackoffMs = 1000;
    int stallTimeoutS    = 30;
};

struct FeedbackConfig {
    float speechVolume        = 1.0f;
    std::string speechCommand = "spd-say";
    bool notifications        = true;
};

struct BridgeConfig {
    std::string address;
    std::string authToken;
};

struct AppConfig {
    CaptureConfig capture;
    RecognitionConfig recognition;
    WakeConfig wake;
    DispatchConfig dispatch;
    SupervisorConfig supervisor;
    FeedbackConfig feedback;
    BridgeConfig bridge;

    bool debugMode    = false;
    bool fallbackMode = false;   // --fallback: no wake stage, continuous capture
};
