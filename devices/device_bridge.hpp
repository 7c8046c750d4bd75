#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// ------------------------------------------------------------
// Device-bridge contract
// ------------------------------------------------------------
// Implementations throw DeviceError on any fetch or mutation failure.

struct LightCapabilities {
    bool supportsColor = false;
    bool supportsBrightness = true;
};

struct ColorPoint {
    double x = 0.0;   // [0,1]
    double y = 0.0;   // [0,1]
};

inline bool operator==(const ColorPoint& a, const ColorPoint& b) {
    return a.x == b.x && a.y == b.y;
}

constexpr int kMinBrightness = 1;
constexpr int kMaxBrightness = 254;

// Live handle to one controllable light
class LightHandle {
public:
    virtual ~LightHandle() = default;

    virtual const std::string& id() const = 0;
    virtual const std::string& name() const = 0;
    virtual LightCapabilities capabilities() const = 0;

    virtual bool on() const = 0;
    virtual void setOn(bool on) = 0;

    // nullopt when the device does not currently report a brightness
    virtual std::optional<int> brightness() const = 0;
    virtual void setBrightness(int value) = 0;

    // nullopt unless the device supports color
    virtual std::optional<ColorPoint> colorPoint() const = 0;
    virtual void setColorPoint(const ColorPoint& xy) = 0;
};

using LightMap = std::map<std::string, std::shared_ptr<LightHandle>>;

struct DeviceDetails {
    std::string id;
    std::string name;
    std::string type;
    LightCapabilities capabilities;
};

class DeviceBridge {
public:
    virtual ~DeviceBridge() = default;

    // name -> handle
    virtual LightMap listDevices() = 0;
    virtual DeviceDetails getDevice(const std::string& id) = 0;
};

// getDevice() for every listed light. Lights the bridge cannot describe
// are logged and skipped.
std::vector<DeviceDetails> describeDevices(DeviceBridge& bridge, const LightMap& lights);
