#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "app_config.hpp"

namespace Wake {

// Wake-word model. processFrame() takes exactly frameLength() samples at
// sampleRate() and returns the matched keyword index, if any.
class Backend {
public:
    virtual ~Backend() = default;

    virtual int frameLength() const = 0;
    virtual int sampleRate() const = 0;
    virtual std::optional<int> processFrame(const std::vector<int16_t>& frame) = 0;
    virtual const std::string& keyword() const = 0;
};

// Builds a backend for one keyword model file; throws LumenError on failure
using BackendFactory =
    std::function<std::unique_ptr<Backend>(const std::string& keyword,
                                           const std::string& keywordPath,
                                           float sensitivity)>;

// Model file for a keyword: keywordPath for the configured keyword when
// set, otherwise <keywordDir>/<keyword>.ppn
std::string keywordFile(const WakeConfig& config, const std::string& keyword);

// Tries the configured keyword, then each fallback keyword in order.
// A substitution is logged. Throws FatalError if nothing can be built.
std::unique_ptr<Backend> createBackend(const WakeConfig& config, const BackendFactory& factory);

} // namespace Wake
