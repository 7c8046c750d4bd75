#include "resources.hpp"
#include "logger.hpp"

#include <filesystem>
#include <mutex>

namespace fs = std::filesystem;

// -------------------------------------------------------------
// Locate resource root (prefer repo/resources over build/resources)
// -------------------------------------------------------------
static std::string locateResourcePath() {
#if defined(LUMEN_PORTABLE_ONLY)
    fs::path portablePath = fs::current_path() / "resources";
    if (fs::exists(portablePath)) {
        LOG_DEBUG("Resources", "Using portable resource path: " + portablePath.string());
        return portablePath.string();
    }
    return fs::current_path().string();
#else
    fs::path buildPath   = fs::current_path() / "resources";
    fs::path projectPath = fs::current_path().parent_path() / "resources";

    // Prefer project resources first
    if (fs::exists(projectPath / "errors.json")) {
        LOG_DEBUG("Resources", "Using resource path: " + projectPath.string());
        return projectPath.string();
    }
    if (fs::exists(buildPath)) {
        LOG_DEBUG("Resources", "Using fallback resource path: " + buildPath.string());
        return buildPath.string();
    }

    // Nothing yet: create ./resources so defaults can be written there
    std::error_code ec;
    fs::create_directories(buildPath, ec);
    if (!ec) {
        LOG_DEBUG("Resources", "Created resource path: " + buildPath.string());
        return buildPath.string();
    }

    LOG_DEBUG("Resources", "Falling back to cwd: " + fs::current_path().string());
    return fs::current_path().string();
#endif
}

std::string getResourcePath() {
    static std::once_flag once;
    static std::string path;
    std::call_once(once, []() {
        path = locateResourcePath();
        LOG_PHASE("Resource path set", true);
    });
    return path;
}

std::string resourceFile(const std::string& relative) {
    return (fs::path(getResourcePath()) / relative).string();
}
