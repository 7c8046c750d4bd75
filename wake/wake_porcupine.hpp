#pragma once
#include <string>

#include "app_config.hpp"
#include "wake/wake.hpp"

struct pv_porcupine;

namespace Wake {

/// PorcupineBackend
/// Picovoice Porcupine (v3 C API), one keyword per instance.
/// Throws ServiceError when the engine cannot be created.
class PorcupineBackend : public Backend {
public:
    PorcupineBackend(const std::string& accessKey,
                     const std::string& modelPath,
                     const std::string& keyword,
                     const std::string& keywordPath,
                     float sensitivity);
    ~PorcupineBackend() override;

    PorcupineBackend(const PorcupineBackend&) = delete;
    PorcupineBackend& operator=(const PorcupineBackend&) = delete;

    int frameLength() const override;
    int sampleRate() const override;
    std::optional<int> processFrame(const std::vector<int16_t>& frame) override;
    const std::string& keyword() const override { return keyword_; }

private:
    std::string keyword_;
    pv_porcupine* handle_ = nullptr;
};

// Factory for createBackend() bound to the access key and model file
BackendFactory porcupineFactory(const WakeConfig& config);

} // namespace Wake
