#include "devices/device_bridge.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

std::vector<DeviceDetails> describeDevices(DeviceBridge& bridge, const LightMap& lights) {
    std::vector<DeviceDetails> out;
    for (const auto& [name, light] : lights) {
        try {
            DeviceDetails d = bridge.getDevice(light->id());
            LOG_DEBUG("Devices", d.name + " [" + d.id + "] " + d.type +
                                 (d.capabilities.supportsBrightness ? ", dimmable" : "") +
                                 (d.capabilities.supportsColor ? ", color" : ""));
            out.push_back(std::move(d));
        } catch (const DeviceError& e) {
            LOG_WARN("Devices", "No details for '" + name + "': " + e.what());
        }
    }
    return out;
}
