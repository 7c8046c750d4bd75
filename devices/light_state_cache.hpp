#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

#include "devices/device_bridge.hpp"
#include "pipeline/clock.hpp"

/// LightStateCache
/// Time-boxed cache of device handles. Refetched when empty, older than
/// the TTL, or after invalidate() (called on any device error).
/// Single-writer: only the Dispatcher thread touches it.
class LightStateCache {
public:
    LightStateCache(DeviceBridge& bridge,
                    std::chrono::seconds ttl,
                    const Clock& clock = steadyClock());

    // All cached lights, refreshing first when stale. If a refresh fails
    // and older handles exist they are returned and the cache stays
    // stale; with nothing cached the DeviceError propagates.
    std::vector<std::shared_ptr<LightHandle>> lights(bool forceRefresh = false);

    std::shared_ptr<LightHandle> find(const std::string& name) const;

    void invalidate();

    bool empty() const { return handles_.empty(); }
    bool stale() const;
    std::size_t size() const { return handles_.size(); }
    std::size_t fetchCount() const { return fetchCount_; }

private:
    void refresh();

    DeviceBridge& bridge_;
    std::chrono::seconds ttl_;
    const Clock& clock_;

    LightMap handles_;
    std::optional<Clock::time_point> fetchedAt_;
    std::size_t fetchCount_ = 0;
};
