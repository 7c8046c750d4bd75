#include <gtest/gtest.h>

#include "commands/light_actions.hpp"
#include "fakes.hpp"

using light_actions::Lights;

TEST(LightActions, TurnOnAndOff) {
    auto a = std::make_shared<FakeLight>("a", false, 100);
    auto b = std::make_shared<FakeLight>("b", true, 100);
    Lights lights{ a, b };

    light_actions::turnOn(lights);
    EXPECT_TRUE(a->on());
    EXPECT_TRUE(b->on());

    light_actions::turnOff(lights);
    EXPECT_FALSE(a->on());
    EXPECT_FALSE(b->on());
}

TEST(LightActions, DimSkipsLightsThatAreOff) {
    auto on = std::make_shared<FakeLight>("on", true, 200);
    auto off = std::make_shared<FakeLight>("off", false, 200);
    light_actions::dim({ on, off }, 64);

    EXPECT_EQ(on->brightness(), 136);
    EXPECT_EQ(off->brightness(), 200);
    EXPECT_TRUE(off->writes.empty());
}

TEST(LightActions, DimClampsAndAssumesFullWhenUnknown) {
    auto low = std::make_shared<FakeLight>("low", true, 10);
    auto unknown = std::make_shared<FakeLight>("unknown", true, std::nullopt);
    light_actions::dim({ low, unknown }, 64);

    EXPECT_EQ(low->brightness(), 1);
    EXPECT_EQ(unknown->brightness(), 190);
}

TEST(LightActions, BrightenOnLight) {
    auto high = std::make_shared<FakeLight>("high", true, 240);
    auto unknown = std::make_shared<FakeLight>("unknown", true, std::nullopt);
    light_actions::brighten({ high, unknown }, 64, 25);

    EXPECT_EQ(high->brightness(), 254);
    EXPECT_EQ(unknown->brightness(), 192);
}

TEST(LightActions, BrightenFromOffStartsLow) {
    auto off = std::make_shared<FakeLight>("off", false, 200);
    light_actions::brighten({ off }, 64, 25);

    EXPECT_TRUE(off->on());
    EXPECT_EQ(off->brightness(), 25);
}

TEST(LightActions, NonDimmableLightsOnlySwitch) {
    LightCapabilities plain;
    plain.supportsBrightness = false;
    auto plug = std::make_shared<FakeLight>("plug", false, std::nullopt, plain);

    light_actions::maximum({ plug });
    EXPECT_TRUE(plug->on());
    EXPECT_EQ(plug->writes, std::vector<std::string>{ "on" });
}

TEST(LightActions, MaximumAndMinimum) {
    auto a = std::make_shared<FakeLight>("a", false, 50);
    light_actions::maximum({ a });
    EXPECT_TRUE(a->on());
    EXPECT_EQ(a->brightness(), 254);

    light_actions::minimum({ a });
    EXPECT_EQ(a->brightness(), 1);
}

TEST(LightActions, DeltaForMagnitude) {
    BrightnessDeltas d;
    EXPECT_EQ(light_actions::deltaFor(command_parser::Magnitude::Small, d), 25);
    EXPECT_EQ(light_actions::deltaFor(command_parser::Magnitude::Default, d), 64);
    EXPECT_EQ(light_actions::deltaFor(command_parser::Magnitude::Large, d), 100);
}

TEST(LightActions, DeviceErrorPropagates) {
    auto a = std::make_shared<FakeLight>("a", true, 100);
    a->failWrites = true;
    EXPECT_THROW(light_actions::turnOff({ a }), DeviceError);
}
