#include "wake/wake_porcupine.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <pv_porcupine.h>
#include <filesystem>

namespace fs = std::filesystem;

namespace Wake {

PorcupineBackend::PorcupineBackend(const std::string& accessKey,
                                   const std::string& modelPath,
                                   const std::string& keyword,
                                   const std::string& keywordPath,
                                   float sensitivity)
    : keyword_(keyword) {
    if (accessKey.empty()) {
        throw ServiceError("ERR_WAKE_INIT", "No Picovoice access key configured");
    }
    if (!fs::exists(keywordPath)) {
        throw ServiceError("ERR_WAKE_INIT", "Keyword file missing: " + keywordPath);
    }

    const char* keywordPaths[] = { keywordPath.c_str() };
    const float sensitivities[] = { sensitivity };

    pv_status_t status = pv_porcupine_init(accessKey.c_str(), modelPath.c_str(),
                                           1, keywordPaths, sensitivities, &handle_);
    if (status != PV_STATUS_SUCCESS) {
        handle_ = nullptr;
        throw ServiceError("ERR_WAKE_INIT",
                           std::string("pv_porcupine_init failed: ") + pv_status_to_string(status));
    }

    LOG_DEBUG("Wake", "Porcupine ready for '" + keyword + "' (frame " +
                      std::to_string(pv_porcupine_frame_length()) + ", " +
                      std::to_string(pv_sample_rate()) + " Hz)");
}

PorcupineBackend::~PorcupineBackend() {
    if (handle_) {
        pv_porcupine_delete(handle_);
        handle_ = nullptr;
    }
}

int PorcupineBackend::frameLength() const {
    return static_cast<int>(pv_porcupine_frame_length());
}

int PorcupineBackend::sampleRate() const {
    return static_cast<int>(pv_sample_rate());
}

std::optional<int> PorcupineBackend::processFrame(const std::vector<int16_t>& frame) {
    if (frame.size() != static_cast<std::size_t>(frameLength())) {
        throw ServiceError("ERR_WAKE_FRAME", "Frame of " + std::to_string(frame.size()) + " samples");
    }

    int32_t keywordIndex = -1;
    pv_status_t status = pv_porcupine_process(handle_, frame.data(), &keywordIndex);
    if (status != PV_STATUS_SUCCESS) {
        throw ServiceError("ERR_WAKE_FRAME",
                           std::string("pv_porcupine_process failed: ") + pv_status_to_string(status));
    }

    if (keywordIndex < 0) return std::nullopt;
    return static_cast<int>(keywordIndex);
}

BackendFactory porcupineFactory(const WakeConfig& config) {
    std::string accessKey = config.accessKey;
    std::string modelPath = config.modelPath.empty()
        ? (fs::path(config.keywordDir) / "porcupine_params.pv").string()
        : config.modelPath;

    return [accessKey, modelPath](const std::string& keyword,
                                  const std::string& keywordPath,
                                  float sensitivity) -> std::unique_ptr<Backend> {
        return std::make_unique<PorcupineBackend>(accessKey, modelPath, keyword, keywordPath, sensitivity);
    };
}

} // namespace Wake
