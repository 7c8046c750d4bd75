#pragma once
#include <memory>

#include "app_config.hpp"
#include "bootstrap_config.hpp"

class Feedback;
class HueBridge;

// Config, error catalog, audio device listing. Applies CLI flags.
AppConfig runBootstrapChecks(const bootstrap_config::CliOptions& cli);

// Connects to the Hue bridge, pairing (and saving bridge_config.json)
// when no username is stored. Throws DeviceError on failure.
std::unique_ptr<HueBridge> connectBridge(BridgeConfig& bridge, Feedback& feedback);
