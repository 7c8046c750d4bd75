#include "bootstrap_config.hpp"
#include "commands/action_registry.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace bootstrap_config {

// ----------------- helpers -----------------

// Integer vs float vs unsigned all count as "number"
static bool sameKind(const nlohmann::json& a, const nlohmann::json& b) {
    if (a.is_number() && b.is_number()) return true;
    return a.type() == b.type();
}

bool mergeDefaults(nlohmann::json& cfg, const nlohmann::json& defs, int* patchedCount) {
    bool patched = false;
    for (auto& [key, defVal] : defs.items()) {
        if (!cfg.contains(key) || cfg[key].is_null()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        } else if (defVal.is_object() && cfg[key].is_object()) {
            if (mergeDefaults(cfg[key], defVal, patchedCount))
                patched = true;
        } else if (!sameKind(cfg[key], defVal)) {
            LOG_WARN("Config", "Key '" + key + "' has the wrong type, reset to default");
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        }
    }
    return patched;
}

// ----------------- defaults -----------------
nlohmann::json defaultConfig() {
    nlohmann::json aliases = nlohmann::json::array();
    for (const auto& group : ActionRegistry::defaultAliases()) {
        aliases.push_back({ {"action", group.action}, {"phrases", group.phrases} });
    }

    return {
        {"capture", {
            {"command_timeout_ms", 5000},
            {"phrase_time_limit_ms", 5000},
            {"activation_window_ms", 10000},
            {"cooldown_ms", 5000},
            {"silence_threshold", 0.02},
            {"min_speech_ms", 300},
            {"min_silence_ms", 800},
            {"sample_rate", 16000},
            {"input_device_index", -1}
        }},

        {"recognition", {
            {"backend", "whisper_local"},
            {"whisper_model", "ggml-base.en.bin"},
            {"server_url", "http://127.0.0.1:8080/inference"},
            {"language", "en"},
            {"timeout_ms", 5000},
            {"confidence_threshold", 0.7},
            {"debounce_window", 5}
        }},

        {"wake", {
            {"keyword", "philips"},
            {"keyword_path", ""},
            {"fallback_keywords", {"jarvis", "computer", "porcupine"}},
            {"keyword_dir", "resources/wake"},
            {"model_path", ""},
            {"sensitivity", 0.5},
            {"access_key", ""},
            {"auto_fallback", true}
        }},

        {"dispatch", {
            {"cache_ttl_s", 60},
            {"max_state_history", 5},
            {"max_command_history", 10},
            {"fuzzy_threshold", 70},
            {"brightness_deltas", {
                {"small", 25},
                {"default", 64},
                {"large", 100}
            }},
            {"aliases", aliases}
        }},

        {"supervisor", {
            {"max_errors", 5},
            {"error_window_s", 30},
            {"poll_interval_ms", 500},
            {"restart_backoff_ms", 1000},
            {"stall_timeout_s", 30}
        }},

        {"feedback", {
            {"speech_volume", 1.0},
            {"speech_command", "spd-say"},
            {"notifications", true}
        }},

        {"debug_mode", false}
    };
}

nlohmann::json defaultErrors() {
    return {
        {"ERR_CONFIG_INVALID", {
            {"user", "[Config] Configuration invalid, using defaults."},
            {"debug", "lumen_config.json failed parsing or validation."}
        }},
        {"ERR_MIC_UNAVAILABLE", {
            {"user", "[Audio] I can't access the microphone."},
            {"debug", "PortAudio input stream could not be opened."}
        }},
        {"ERR_AUDIO_UNINTELLIGIBLE", {
            {"user", "Sorry, I didn't catch that."},
            {"debug", "Recognition produced no usable transcript."}
        }},
        {"ERR_RECOGNITION_TIMEOUT", {
            {"user", "Speech recognition is taking too long."},
            {"debug", "Recognition attempt exceeded its timeout and was abandoned."}
        }},
        {"ERR_RECOGNITION_FAILED", {
            {"user", "Speech recognition failed."},
            {"debug", "Recognition backend returned an error."}
        }},
        {"ERR_RECOGNITION_UNAVAILABLE", {
            {"user", "The speech recognition service is unavailable."},
            {"debug", "Recognition backend could not be reached or loaded."}
        }},
        {"ERR_RECOGNITION_BUSY", {
            {"user", "Speech recognition is still busy."},
            {"debug", "A clip arrived while an abandoned recognition attempt was still running."}
        }},
        {"ERR_RECOGNITION_MALFORMED", {
            {"user", "Speech recognition returned something unexpected."},
            {"debug", "Recognition response could not be parsed."}
        }},
        {"ERR_DEVICE_FETCH", {
            {"user", "I couldn't read the state of your lights."},
            {"debug", "Bridge light listing failed."}
        }},
        {"ERR_DEVICE_UPDATE", {
            {"user", "I couldn't change your lights."},
            {"debug", "Bridge rejected a light state update."}
        }},
        {"ERR_DEVICE_UNREACHABLE", {
            {"user", "I can't reach the Hue bridge."},
            {"debug", "HTTP request to the bridge failed."}
        }},
        {"ERR_NO_DEVICES", {
            {"user", "No lights found."},
            {"debug", "Bridge returned an empty light list."}
        }},
        {"ERR_COMMAND_FAILED", {
            {"user", "Sorry, that command failed."},
            {"debug", "Unexpected exception while executing a sub-command."}
        }},
        {"ERR_BRIDGE_PAIRING", {
            {"user", "Please press the link button on your Hue bridge and try again."},
            {"debug", "Bridge pairing failed (link button not pressed?)."}
        }},
        {"ERR_WAKE_INIT", {
            {"user", "[Wake] Wake word engine could not start."},
            {"debug", "Porcupine initialization failed."}
        }},
        {"ERR_WAKE_FRAME", {
            {"user", "[Wake] Wake word detection failed."},
            {"debug", "Porcupine rejected an audio frame."}
        }},
        {"ERR_WAKE_UNAVAILABLE", {
            {"user", "No wake word is available."},
            {"debug", "Configured and fallback wake keywords all failed."}
        }},
        {"ERR_STAGE_CRASHED", {
            {"user", "Something went wrong, restarting."},
            {"debug", "A pipeline stage terminated unexpectedly."}
        }},
        {"ERR_PIPELINE_INCOMPLETE", {
            {"user", "[Startup] Internal setup error."},
            {"debug", "Pipeline constructed without a required dependency."}
        }},
        {"ERR_RESTART_FAILED", {
            {"user", "Recovery failed, shutting down."},
            {"debug", "Pipeline restart threw during start()."}
        }}
    };
}

// ----------------- loader -----------------
bool loadConfig(const fs::path& path,
                const nlohmann::json& defaults,
                nlohmann::json& outConfig,
                const std::string& name,
                const std::string& errorCode) {
    if (!fs::exists(path)) {
        outConfig = defaults;
        std::ofstream(path) << outConfig.dump(2);

        LOG_PHASE(name + " created", true);
        return true;
    }

    try {
        std::ifstream f(path);
        f >> outConfig;

        int patchedCount = 0;
        if (mergeDefaults(outConfig, defaults, &patchedCount)) {
            std::ofstream(path) << outConfig.dump(2);
            LOG_PHASE(name + " patched", true);
            LOG_DEBUG("Config", name + " patched (" + std::to_string(patchedCount) + " keys)");
        } else {
            LOG_PHASE(name + " load", true);
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Config", name + " invalid → reset to defaults (" + e.what() + ")");
        LOG_PHASE(name + " load", false);

        if (!errorCode.empty())
            ErrorManager::report(errorCode, path.string());

        outConfig = defaults;
        std::ofstream(path) << outConfig.dump(2);
        return false;
    }
}

// ----------------- AppConfig -----------------
static std::vector<AliasGroup> parseAliases(const nlohmann::json& j) {
    std::vector<AliasGroup> out;
    for (const auto& item : j) {
        AliasGroup g;
        g.action  = item.at("action").get<std::string>();
        g.phrases = item.at("phrases").get<std::vector<std::string>>();
        if (g.action.empty()) continue;
        out.push_back(std::move(g));
    }
    return out;
}

AppConfig buildAppConfig(const nlohmann::json& cfg) {
    AppConfig c;
    try {
        const auto& cap = cfg.at("capture");
        c.capture.commandTimeoutMs   = cap.value("command_timeout_ms", c.capture.commandTimeoutMs);
        c.capture.phraseTimeLimitMs  = cap.value("phrase_time_limit_ms", c.capture.phraseTimeLimitMs);
        c.capture.activationWindowMs = cap.value("activation_window_ms", c.capture.activationWindowMs);
        c.capture.cooldownMs         = cap.value("cooldown_ms", c.capture.cooldownMs);
        c.capture.silenceThreshold   = cap.value("silence_threshold", c.capture.silenceThreshold);
        c.capture.minSpeechMs        = cap.value("min_speech_ms", c.capture.minSpeechMs);
        c.capture.minSilenceMs       = cap.value("min_silence_ms", c.capture.minSilenceMs);
        c.capture.sampleRate         = cap.value("sample_rate", c.capture.sampleRate);
        c.capture.inputDeviceIndex   = cap.value("input_device_index", c.capture.inputDeviceIndex);

        const auto& rec = cfg.at("recognition");
        c.recognition.backend             = rec.value("backend", c.recognition.backend);
        c.recognition.whisperModel        = rec.value("whisper_model", c.recognition.whisperModel);
        c.recognition.serverUrl           = rec.value("server_url", c.recognition.serverUrl);
        c.recognition.language            = rec.value("language", c.recognition.language);
        c.recognition.timeoutMs           = rec.value("timeout_ms", c.recognition.timeoutMs);
        c.recognition.confidenceThreshold = rec.value("confidence_threshold", c.recognition.confidenceThreshold);
        c.recognition.debounceWindow      = rec.value("debounce_window", c.recognition.debounceWindow);

        const auto& wake = cfg.at("wake");
        c.wake.keyword          = wake.value("keyword", c.wake.keyword);
        c.wake.keywordPath      = wake.value("keyword_path", c.wake.keywordPath);
        c.wake.fallbackKeywords = wake.value("fallback_keywords", c.wake.fallbackKeywords);
        c.wake.keywordDir       = wake.value("keyword_dir", c.wake.keywordDir);
        c.wake.modelPath        = wake.value("model_path", c.wake.modelPath);
        c.wake.sensitivity      = wake.value("sensitivity", c.wake.sensitivity);
        c.wake.accessKey        = wake.value("access_key", c.wake.accessKey);
        c.wake.autoFallback     = wake.value("auto_fallback", c.wake.autoFallback);

        const auto& disp = cfg.at("dispatch");
        c.dispatch.cacheTtlS         = disp.value("cache_ttl_s", c.dispatch.cacheTtlS);
        c.dispatch.maxStateHistory   = disp.value("max_state_history", c.dispatch.maxStateHistory);
        c.dispatch.maxCommandHistory = disp.value("max_command_history", c.dispatch.maxCommandHistory);
        c.dispatch.fuzzyThreshold    = disp.value("fuzzy_threshold", c.dispatch.fuzzyThreshold);
        if (disp.contains("brightness_deltas")) {
            const auto& d = disp["brightness_deltas"];
            c.dispatch.deltas.small  = d.value("small", c.dispatch.deltas.small);
            c.dispatch.deltas.normal = d.value("default", c.dispatch.deltas.normal);
            c.dispatch.deltas.large  = d.value("large", c.dispatch.deltas.large);
        }
        if (disp.contains("aliases") && disp["aliases"].is_array()) {
            c.dispatch.aliases = parseAliases(disp["aliases"]);
        }

        const auto& sup = cfg.at("supervisor");
        c.supervisor.maxErrors        = sup.value("max_errors", c.supervisor.maxErrors);
        c.supervisor.errorWindowS     = sup.value("error_window_s", c.supervisor.errorWindowS);
        c.supervisor.pollIntervalMs   = sup.value("poll_interval_ms", c.supervisor.pollIntervalMs);
        c.supervisor.restartBackoffMs = sup.value("restart_backoff_ms", c.supervisor.restartBackoffMs);
        c.supervisor.stallTimeoutS    = sup.value("stall_timeout_s", c.supervisor.stallTimeoutS);

        const auto& fb = cfg.at("feedback");
        c.feedback.speechVolume  = fb.value("speech_volume", c.feedback.speechVolume);
        c.feedback.speechCommand = fb.value("speech_command", c.feedback.speechCommand);
        c.feedback.notifications = fb.value("notifications", c.feedback.notifications);

        c.debugMode = cfg.value("debug_mode", false);
    } catch (const nlohmann::json::exception& e) {
        throw FatalError("ERR_CONFIG_INVALID", std::string("Config: ") + e.what());
    }

    // Range checks
    if (c.recognition.backend != "whisper_local" && c.recognition.backend != "whisper_server") {
        throw FatalError("ERR_CONFIG_INVALID", "Unknown recognition backend: " + c.recognition.backend);
    }
    if (c.capture.sampleRate <= 0 || c.capture.phraseTimeLimitMs <= 0 || c.capture.commandTimeoutMs <= 0) {
        throw FatalError("ERR_CONFIG_INVALID", "Capture timings and sample rate must be positive");
    }
    if (c.recognition.timeoutMs <= 0) {
        throw FatalError("ERR_CONFIG_INVALID", "recognition.timeout_ms must be positive");
    }

    c.recognition.confidenceThreshold = std::clamp(c.recognition.confidenceThreshold, 0.0f, 1.0f);
    c.recognition.debounceWindow      = std::max(1, c.recognition.debounceWindow);
    c.wake.sensitivity                = std::clamp(c.wake.sensitivity, 0.0f, 1.0f);
    c.dispatch.maxStateHistory        = std::max(1, c.dispatch.maxStateHistory);
    c.dispatch.maxCommandHistory      = std::max(1, c.dispatch.maxCommandHistory);
    c.dispatch.fuzzyThreshold         = std::clamp(c.dispatch.fuzzyThreshold, 0, 100);
    c.supervisor.maxErrors            = std::max(1, c.supervisor.maxErrors);
    c.supervisor.pollIntervalMs       = std::max(10, c.supervisor.pollIntervalMs);
    c.supervisor.restartBackoffMs     = std::max(0, c.supervisor.restartBackoffMs);
    return c;
}

void applyEnvironment(AppConfig& config) {
    if (const char* ip = std::getenv("HUE_BRIDGE_IP"); ip && *ip) {
        config.bridge.address = ip;
        LOG_DEBUG("Config", std::string("Bridge address from HUE_BRIDGE_IP: ") + ip);
    }

    if (const char* s = std::getenv("WAKE_WORD_SENSITIVITY"); s && *s) {
        try {
            const float value = std::stof(s);
            if (!std::isfinite(value)) throw std::invalid_argument("not finite");
            config.wake.sensitivity = std::clamp(value, 0.0f, 1.0f);
        } catch (const std::logic_error&) {
            LOG_WARN("Config", std::string("Ignoring WAKE_WORD_SENSITIVITY='") + s + "'");
        }
    }

    if (const char* key = std::getenv("PICOVOICE_ACCESS_KEY"); key && *key) {
        config.wake.accessKey = key;
    }
}

// ----------------- bridge credentials -----------------
BridgeConfig loadBridgeConfig(const fs::path& path) {
    BridgeConfig bridge;
    if (!fs::exists(path)) return bridge;

    try {
        std::ifstream f(path);
        nlohmann::json j;
        f >> j;
        bridge.address   = j.value("bridge_address", "");
        bridge.authToken = j.value("auth_token", "");
        LOG_PHASE("Bridge config load", true);
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Config", path.string() + " unreadable, pairing again (" + e.what() + ")");
        LOG_PHASE("Bridge config load", false);
        return BridgeConfig{};
    }
    return bridge;
}

bool saveBridgeConfig(const fs::path& path, const BridgeConfig& bridge) {
    std::ofstream out(path);
    if (!out) {
        LOG_ERROR("Config", "Could not write " + path.string());
        return false;
    }
    out << nlohmann::json{ {"bridge_address", bridge.address}, {"auth_token", bridge.authToken} }.dump(2);
    LOG_PHASE("Bridge config saved", true);
    return true;
}

// ----------------- entry -----------------
AppConfig initAll() {
    // errors.json first so later failures have messages
    fs::path errPath = resourceFile("errors.json");
    nlohmann::json errorsCfg;
    loadConfig(errPath, defaultErrors(), errorsCfg, "Errors config", "");
    ErrorManager::loadFromJson(errorsCfg);

    // lumen_config.json
    fs::path cfgPath = fs::current_path() / kConfigFile;
    nlohmann::json cfg;
    loadConfig(cfgPath, defaultConfig(), cfg, "Lumen config", "ERR_CONFIG_INVALID");

    AppConfig config = buildAppConfig(cfg);
    config.bridge = loadBridgeConfig(fs::current_path() / kBridgeFile);
    applyEnvironment(config);
    return config;
}

// ----------------- CLI -----------------

CliOptions parseArgs(int argc, const char* const* argv) {
    CliOptions opts;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--fallback")                opts.fallback = true;
        else if (arg == "--debug")              opts.debug = true;
        else if (arg == "--help" || arg == "-h") opts.help = true;
        else if (opts.unknown.empty())          opts.unknown = arg;
    }
    return opts;
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " [--fallback] [--debug] [--help]\n"
           "  --fallback  skip wake word detection, listen continuously\n"
           "  --debug     verbose logging\n"
           "  --help      show this message\n";
}

} // namespace bootstrap_config
