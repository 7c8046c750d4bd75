#include <gtest/gtest.h>

#include "fakes.hpp"

TEST(DeviceBridge, DescribesEveryListedLight) {
    FakeBridge bridge;
    LightCapabilities color;
    color.supportsColor = true;
    bridge.add("Desk", true, 200, color);
    bridge.add("Hall", false, std::nullopt);

    auto details = describeDevices(bridge, bridge.listDevices());
    ASSERT_EQ(details.size(), 2u);
    EXPECT_EQ(details[0].name, "Desk");
    EXPECT_EQ(details[0].id, "id-Desk");
    EXPECT_TRUE(details[0].capabilities.supportsColor);
    EXPECT_EQ(details[1].name, "Hall");
    EXPECT_FALSE(details[1].capabilities.supportsColor);
}

TEST(DeviceBridge, SkipsLightsThatVanished) {
    FakeBridge bridge;
    bridge.add("Desk", true, 200);
    bridge.add("Hall", true, 100);

    LightMap lights = bridge.listDevices();
    bridge.remove("Hall");

    auto details = describeDevices(bridge, lights);
    ASSERT_EQ(details.size(), 1u);
    EXPECT_EQ(details[0].name, "Desk");
}
