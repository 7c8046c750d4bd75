#pragma once
#include <string>
#include <nlohmann/json.hpp>

#include "devices/device_bridge.hpp"

/// HueBridge
/// Philips Hue bridge over the v1 REST API (http://<ip>/api/<user>/...).
/// Every network or protocol failure surfaces as DeviceError.
class HueBridge : public DeviceBridge {
public:
    HueBridge(std::string address, std::string username, int timeoutMs = 3000);

    LightMap listDevices() override;
    DeviceDetails getDevice(const std::string& id) override;

    // PUT /lights/<id>/state
    void setState(const std::string& id, const nlohmann::json& state);

    const std::string& address() const { return address_; }

    // Press-the-link-button pairing. Returns the new username; throws
    // DeviceError (ERR_BRIDGE_PAIRING) when the button was not pressed.
    static std::string pair(const std::string& address, const std::string& deviceType,
                            int timeoutMs = 3000);

    static LightCapabilities capabilitiesOf(const nlohmann::json& light);

private:
    std::string url(const std::string& path) const;
    nlohmann::json getJson(const std::string& path);

    std::string address_;
    std::string username_;
    int timeoutMs_;
};

// One light as reported by the bridge. Reads come from the last fetch,
// writes go straight to the bridge and update the local copy.
class HueLight : public LightHandle {
public:
    HueLight(HueBridge& bridge, std::string id, std::string name,
             LightCapabilities caps, const nlohmann::json& state);

    const std::string& id() const override { return id_; }
    const std::string& name() const override { return name_; }
    LightCapabilities capabilities() const override { return caps_; }

    bool on() const override { return on_; }
    void setOn(bool on) override;

    std::optional<int> brightness() const override { return brightness_; }
    void setBrightness(int value) override;

    std::optional<ColorPoint> colorPoint() const override { return color_; }
    void setColorPoint(const ColorPoint& xy) override;

private:
    HueBridge& bridge_;
    std::string id_;
    std::string name_;
    LightCapabilities caps_;

    bool on_ = false;
    std::optional<int> brightness_;
    std::optional<ColorPoint> color_;
};
