#include "bootstrap.hpp"
#include "devices/hue_bridge.hpp"
#include "error_manager.hpp"
#include "response_manager.hpp"
#include "voice/audio_devices.hpp"
#include "voice/feedback.hpp"
#include "logger.hpp"

#include <chrono>
#include <thread>
#include <unistd.h>

namespace {
    constexpr int kPairingAttempts = 6;
    constexpr auto kPairingRetry = std::chrono::seconds(5);

    std::string hostName() {
        char buf[64] = {};
        if (gethostname(buf, sizeof(buf) - 1) != 0) return "host";
        return buf;
    }
}

AppConfig runBootstrapChecks(const bootstrap_config::CliOptions& cli) {
    // ============================================================
    // Bootstrap start
    // ============================================================
    LOG_PHASE("Bootstrap begin", true);

    // ============================================================
    // Centralized config bootstrap
    // ============================================================
    beginPhaseGroup();
    AppConfig config = bootstrap_config::initAll();
    endPhaseGroup();
    LOG_PHASE("Configs initialized", true);

    if (cli.debug) config.debugMode = true;
    if (cli.fallback) config.fallbackMode = true;
    setDebugLogging(config.debugMode || debugLoggingEnabled());

    LOG_DEBUG("Config", "Recognition backend: " + config.recognition.backend +
                        ", wake keyword: " + config.wake.keyword +
                        (config.fallbackMode ? " (fallback mode)" : ""));

    // ============================================================
    // Audio devices
    // ============================================================
    if (config.debugMode) {
        logInputDevices(config.capture.inputDeviceIndex);
    }

    LOG_PHASE("Bootstrap complete", true);
    return config;
}

std::unique_ptr<HueBridge> connectBridge(BridgeConfig& bridge, Feedback& feedback) {
    if (bridge.address.empty()) {
        throw DeviceError("ERR_DEVICE_UNREACHABLE",
                          "No bridge address. Set HUE_BRIDGE_IP or bridge_address in bridge_config.json");
    }

    if (bridge.authToken.empty()) {
        LOG_INFO("Hue", "No stored credentials for " + bridge.address + ", pairing");
        feedback.say(ErrorManager::getUserMessage("ERR_BRIDGE_PAIRING"));

        for (int attempt = 1; ; attempt++) {
            try {
                bridge.authToken = HueBridge::pair(bridge.address, "lumen#" + hostName());
                break;
            } catch (const DeviceError& e) {
                if (e.code() != "ERR_BRIDGE_PAIRING" || attempt == kPairingAttempts) throw;
                LOG_INFO("Hue", "Waiting for link button (" + std::to_string(attempt) + "/" +
                                std::to_string(kPairingAttempts) + ")");
                std::this_thread::sleep_for(kPairingRetry);
            }
        }

        bootstrap_config::saveBridgeConfig(bootstrap_config::kBridgeFile, bridge);
        LOG_PHASE("Bridge paired", true);
    }

    auto hue = std::make_unique<HueBridge>(bridge.address, bridge.authToken);

    // One listing up front so a dead bridge fails at startup
    LightMap lights = hue->listDevices();
    LOG_PHASE("Bridge connected", true);
    LOG_INFO("Hue", "Connected to " + bridge.address + ", " + std::to_string(lights.size()) + " light(s)");
    if (debugLoggingEnabled()) {
        describeDevices(*hue, lights);
    }
    return hue;
}
