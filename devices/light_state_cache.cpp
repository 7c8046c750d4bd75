#include "devices/light_state_cache.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

LightStateCache::LightStateCache(DeviceBridge& bridge,
                                 std::chrono::seconds ttl,
                                 const Clock& clock)
    : bridge_(bridge), ttl_(ttl), clock_(clock) {}

bool LightStateCache::stale() const {
    if (!fetchedAt_ || handles_.empty()) return true;
    return clock_.now() - *fetchedAt_ > ttl_;
}

void LightStateCache::refresh() {
    ++fetchCount_;
    LightMap fresh = bridge_.listDevices();
    handles_   = std::move(fresh);
    fetchedAt_ = clock_.now();
    LOG_DEBUG("LightCache", "Refreshed, " + std::to_string(handles_.size()) + " light(s)");
}

std::vector<std::shared_ptr<LightHandle>> LightStateCache::lights(bool forceRefresh) {
    if (forceRefresh || stale()) {
        try {
            refresh();
        } catch (const DeviceError& e) {
            LOG_ERROR("LightCache", std::string("Error refreshing lights cache: ") + e.what());
            if (handles_.empty()) throw;
            fetchedAt_.reset();
            LOG_WARN("LightCache", "Using previous cache (" + std::to_string(handles_.size()) + " light(s))");
        }
    }

    std::vector<std::shared_ptr<LightHandle>> out;
    out.reserve(handles_.size());
    for (auto& [name, handle] : handles_) {
        out.push_back(handle);
    }
    return out;
}

std::shared_ptr<LightHandle> LightStateCache::find(const std::string& name) const {
    auto it = handles_.find(name);
    return it == handles_.end() ? nullptr : it->second;
}

void LightStateCache::invalidate() {
    handles_.clear();
    fetchedAt_.reset();
    LOG_DEBUG("LightCache", "Invalidated, next access refetches");
}
