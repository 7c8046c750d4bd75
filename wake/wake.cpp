#include "wake/wake.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace Wake {

std::string keywordFile(const WakeConfig& config, const std::string& keyword) {
    if (keyword == config.keyword && !config.keywordPath.empty()) {
        return config.keywordPath;
    }
    return (fs::path(config.keywordDir) / (keyword + ".ppn")).string();
}

static std::unique_ptr<Backend> tryCreate(const WakeConfig& config,
                                          const BackendFactory& factory,
                                          const std::string& keyword) {
    const std::string path = keywordFile(config, keyword);
    try {
        auto backend = factory(keyword, path, config.sensitivity);
        if (backend) return backend;
        LOG_ERROR("Wake", "Backend for '" + keyword + "' returned nothing");
    } catch (const LumenError& e) {
        LOG_ERROR("Wake", "Failed to initialize wake word '" + keyword + "' (" + path + "): " + e.what());
    }
    return nullptr;
}

std::unique_ptr<Backend> createBackend(const WakeConfig& config, const BackendFactory& factory) {
    LOG_DEBUG("Wake", "Initializing wake word '" + config.keyword + "' with sensitivity " +
                      std::to_string(config.sensitivity));

    if (auto backend = tryCreate(config, factory, config.keyword)) {
        LOG_PHASE("Wake word backend init", true);
        return backend;
    }

    for (const auto& fallback : config.fallbackKeywords) {
        if (fallback == config.keyword) continue;

        if (auto backend = tryCreate(config, factory, fallback)) {
            LOG_WARN("Wake", "Using fallback wake word '" + fallback + "' instead of '" +
                             config.keyword + "'");
            LOG_PHASE("Wake word backend init (fallback)", true);
            return backend;
        }
    }

    LOG_PHASE("Wake word backend init", false);
    throw FatalError("ERR_WAKE_UNAVAILABLE",
                     "No wake word model could be initialized for '" + config.keyword + "'");
}

} // namespace Wake
