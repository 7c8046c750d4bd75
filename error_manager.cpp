#include "error_manager.hpp"
#include "logger.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>

// ------------------------------------------------------------
// Taxonomy
// ------------------------------------------------------------
ErrorPolicy policyFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Perception:   return ErrorPolicy::Ignore;
        case ErrorKind::Service:      return ErrorPolicy::EscalateToSupervisor;
        case ErrorKind::Device:       return ErrorPolicy::InvalidateCache;
        case ErrorKind::StageFailure: return ErrorPolicy::RestartPipeline;
        case ErrorKind::Fatal:        return ErrorPolicy::Terminate;
    }
    return ErrorPolicy::Terminate;
}

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Perception:   return "perception";
        case ErrorKind::Service:      return "service";
        case ErrorKind::Device:       return "device";
        case ErrorKind::StageFailure: return "stage_failure";
        case ErrorKind::Fatal:        return "fatal";
    }
    return "unknown";
}

// ------------------------------------------------------------
// ErrorManager implementation
// ------------------------------------------------------------
static nlohmann::json g_catalog = nlohmann::json::object();
static std::mutex g_catalogMutex;

void ErrorManager::loadFromJson(const nlohmann::json& catalog) {
    std::lock_guard<std::mutex> lock(g_catalogMutex);

    if (catalog.contains("errors") && catalog["errors"].is_object()) {
        g_catalog = catalog["errors"];
    } else if (catalog.is_object()) {
        g_catalog = catalog;
    } else {
        LOG_ERROR("ErrorManager", "Error catalog is not a JSON object, ignoring");
        return;
    }

    std::string codes;
    for (auto& [key, val] : g_catalog.items()) {
        codes += key + " ";
    }
    LOG_DEBUG("ErrorManager", "Available error codes: " + codes);
}

void ErrorManager::load(const std::string& path) {
    namespace fs = std::filesystem;

    std::ifstream in(path);
    if (!in) {
        LOG_ERROR("ErrorManager", "Could not open " + path);
        return;
    }

    try {
        nlohmann::json parsed;
        in >> parsed;
        loadFromJson(parsed);
        LOG_DEBUG("ErrorManager", "Loaded errors.json from: " + fs::absolute(path).string());
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("ErrorManager", "Failed to parse " + path + " -> " + e.what());
    }
}

std::string ErrorManager::getUserMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_catalogMutex);
    if (g_catalog.contains(code) && g_catalog[code].contains("user")) {
        return g_catalog[code]["user"].get<std::string>();
    }
    return "Something went wrong (" + code + ")";
}

std::string ErrorManager::getDebugMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_catalogMutex);
    if (g_catalog.contains(code) && g_catalog[code].contains("debug")) {
        return g_catalog[code]["debug"].get<std::string>();
    }
    return "No debug message for code: " + code;
}

CommandResult ErrorManager::report(const std::string& code, const std::string& detail) {
    std::string userMsg  = getUserMessage(code);
    std::string debugMsg = getDebugMessage(code);

    CommandResult result;
    result.success   = false;
    result.message   = userMsg;
    result.errorCode = code;
    result.voice     = userMsg;
    result.category  = "error";

    LOG_ERROR("ErrorManager", code + " -> " + debugMsg +
                              (detail.empty() ? "" : " (" + detail + ")"));
    return result;
}
