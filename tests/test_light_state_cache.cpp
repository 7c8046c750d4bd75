#include <gtest/gtest.h>

#include "devices/light_state_cache.hpp"
#include "fakes.hpp"

TEST(LightStateCache, FetchesOnFirstUse) {
    FakeBridge bridge;
    bridge.add("Kitchen", true, 100);
    ManualClock clock;
    LightStateCache cache(bridge, std::chrono::seconds(60), clock);

    EXPECT_TRUE(cache.stale());
    auto lights = cache.lights();
    EXPECT_EQ(lights.size(), 1u);
    EXPECT_EQ(bridge.listCalls, 1);
    EXPECT_NE(cache.find("Kitchen"), nullptr);
    EXPECT_EQ(cache.find("Garage"), nullptr);
}

TEST(LightStateCache, ServesFromCacheWithinTtl) {
    FakeBridge bridge;
    bridge.add("Kitchen", true, 100);
    ManualClock clock;
    LightStateCache cache(bridge, std::chrono::seconds(60), clock);

    cache.lights();
    clock.advance(std::chrono::seconds(59));
    cache.lights();
    EXPECT_EQ(bridge.listCalls, 1);

    clock.advance(std::chrono::seconds(2));
    cache.lights();
    EXPECT_EQ(bridge.listCalls, 2);
}

TEST(LightStateCache, InvalidateForcesRefetch) {
    FakeBridge bridge;
    bridge.add("Kitchen", true, 100);
    ManualClock clock;
    LightStateCache cache(bridge, std::chrono::seconds(60), clock);

    cache.lights();
    cache.invalidate();
    EXPECT_TRUE(cache.empty());
    cache.lights();
    EXPECT_EQ(bridge.listCalls, 2);
    EXPECT_EQ(cache.fetchCount(), 2u);
}

TEST(LightStateCache, ForceRefresh) {
    FakeBridge bridge;
    bridge.add("Kitchen", true, 100);
    ManualClock clock;
    LightStateCache cache(bridge, std::chrono::seconds(60), clock);

    cache.lights();
    bridge.add("Hall", false, 50);
    EXPECT_EQ(cache.lights(true).size(), 2u);
}

TEST(LightStateCache, FailedRefreshWithNothingCachedThrows) {
    FakeBridge bridge;
    bridge.failList = true;
    ManualClock clock;
    LightStateCache cache(bridge, std::chrono::seconds(60), clock);

    EXPECT_THROW(cache.lights(), DeviceError);
}

TEST(LightStateCache, FailedRefreshKeepsPreviousHandles) {
    FakeBridge bridge;
    bridge.add("Kitchen", true, 100);
    ManualClock clock;
    LightStateCache cache(bridge, std::chrono::seconds(60), clock);

    cache.lights();
    clock.advance(std::chrono::seconds(61));
    bridge.failList = true;

    auto lights = cache.lights();
    EXPECT_EQ(lights.size(), 1u);
    EXPECT_TRUE(cache.stale());
}
