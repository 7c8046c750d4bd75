#include "bootstrap.hpp"
#include "bootstrap_config.hpp"
#include "commands/action_registry.hpp"
#include "devices/hue_bridge.hpp"
#include "error_manager.hpp"
#include "pipeline/pipeline.hpp"
#include "pipeline/supervisor.hpp"
#include "resources.hpp"
#include "response_manager.hpp"
#include "voice/audio_tap.hpp"
#include "voice/microphone.hpp"
#include "voice/server_recognizer.hpp"
#include "voice/voice_speak.hpp"
#include "voice/whisper_recognizer.hpp"
#include "wake/wake.hpp"
#include "wake/wake_porcupine.hpp"
#include "logger.hpp"

#include <atomic>
#include <csignal>
#include <iostream>

static std::atomic<bool> g_running{ true };

extern "C" void onSignal(int) {
    g_running = false;
}

// ============================================================
// Helpers
// ============================================================
static std::shared_ptr<RecognitionService> makeRecognizer(const RecognitionConfig& config) {
    if (config.backend == "whisper_server") {
        LOG_DEBUG("Voice", "Using whisper server at " + config.serverUrl);
        return std::make_shared<ServerRecognizer>(config);
    }
    return std::make_shared<WhisperRecognizer>(config, resourceFile("models/" + config.whisperModel));
}

static std::unique_ptr<Wake::Backend> makeWakeBackend(const WakeConfig& config, Feedback& feedback) {
    try {
        return Wake::createBackend(config, Wake::porcupineFactory(config));
    } catch (const FatalError& e) {
        if (!config.autoFallback) throw;

        LOG_ERROR("Wake", std::string(e.what()) + " → switching to continuous listening");
        LOG_PHASE("Wake word engine", false);
        feedback.notify("Lumen", ErrorManager::getUserMessage(e.code()));
        return nullptr;
    }
}

static int fail(Feedback& feedback, const LumenError& e) {
    LOG_ERROR("Main", e.code() + ": " + e.what());
    feedback.say(ErrorManager::getUserMessage(e.code()));
    return 1;
}

// ============================================================
// Run
// ============================================================
static int run(const bootstrap_config::CliOptions& cli) {
    AppConfig config = runBootstrapChecks(cli);
    Voice::DesktopFeedback feedback(config.feedback);

    std::unique_ptr<HueBridge> bridge;
    try {
        bridge = connectBridge(config.bridge, feedback);
    } catch (const DeviceError& e) {
        int rc = fail(feedback, e);
        feedback.flush();
        return rc;
    }

    // Frozen from here on
    const AppConfig& cfg = config;

    // ============================================================
    // Audio
    // ============================================================
    Microphone mic(cfg.capture);
    AudioTap& wakeTap   = mic.addTap(2);
    AudioTap& speechTap = mic.addTap(cfg.capture.phraseTimeLimitMs / 1000 + 2);

    std::unique_ptr<Wake::Backend> wake;
    std::shared_ptr<RecognitionService> recognition;
    try {
        mic.open();
        if (!cfg.fallbackMode) {
            wake = makeWakeBackend(cfg.wake, feedback);
        }
        recognition = makeRecognizer(cfg.recognition);
    } catch (const LumenError& e) {
        int rc = fail(feedback, e);
        feedback.flush();
        return rc;
    }

    if (wake && wake->sampleRate() != cfg.capture.sampleRate) {
        LOG_WARN("Wake", "Wake engine expects " + std::to_string(wake->sampleRate()) +
                         " Hz, capture runs at " + std::to_string(cfg.capture.sampleRate) + " Hz");
    }

    TapFrameSource frames(wakeTap);

    UtteranceRecorder::Settings vad;
    vad.sampleRate       = cfg.capture.sampleRate;
    vad.silenceThreshold = cfg.capture.silenceThreshold;
    vad.minSpeechMs      = cfg.capture.minSpeechMs;
    vad.minSilenceMs     = cfg.capture.minSilenceMs;
    vad.maxMs            = cfg.capture.phraseTimeLimitMs;
    TapUtteranceSource utterances(speechTap, vad);

    // ============================================================
    // Pipeline
    // ============================================================
    ActionRegistry registry(cfg.dispatch.aliases);

    PipelineDeps deps;
    deps.wakeBackend = wake.get();
    deps.frames      = wake ? &frames : nullptr;
    deps.utterances  = &utterances;
    deps.recognition = recognition;
    deps.bridge      = bridge.get();
    deps.feedback    = &feedback;

    Pipeline pipeline(cfg, registry, deps);
    Supervisor supervisor(cfg.supervisor, pipeline, feedback);

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    int rc = 0;
    try {
        supervisor.start();
        LOG_PHASE("Startup complete, entering supervision loop", true);
        feedback.say(ResponseManager::get(pipeline.continuous() ? "startup_fallback" : "startup"));

        supervisor.run(g_running);

        LOG_PHASE("Shutdown requested", true);
        feedback.say(ResponseManager::get("shutdown"));
    } catch (const FatalError& e) {
        rc = fail(feedback, e);
    }

    // ============================================================
    // Shutdown cleanup
    // ============================================================
    supervisor.stop();
    mic.close();
    feedback.flush();
    LOG_PHASE("Shutdown complete", true);
    return rc;
}

// ============================================================
// Main entry point
// ============================================================
int main(int argc, char* argv[]) {
    auto cli = bootstrap_config::parseArgs(argc, argv);
    if (cli.help) {
        std::cout << bootstrap_config::usage(argv[0]);
        return 0;
    }
    if (!cli.unknown.empty()) {
        std::cerr << "Unknown option: " << cli.unknown << "\n" << bootstrap_config::usage(argv[0]);
        return 1;
    }

    // Initialize logger (writes to lumen.log + console)
    initLogger("lumen.log");
    LOG_PHASE("Startup begin", true);

    int rc = 0;
    try {
        rc = run(cli);
    } catch (const LumenError& e) {
        LOG_ERROR("Main", e.code() + ": " + e.what());
        LOG_PHASE("Startup", false);
        rc = 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Main", std::string("Unhandled: ") + e.what());
        rc = 1;
    }

    shutdownLogger();
    return rc;
}
