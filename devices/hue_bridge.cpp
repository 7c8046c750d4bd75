#include "devices/hue_bridge.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cpr/cpr.h>

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------

// The bridge answers writes with [{"success":{...}}] / [{"error":{...}}]
static void throwOnHueError(const nlohmann::json& reply, const std::string& code) {
    if (!reply.is_array()) return;
    for (const auto& item : reply) {
        if (item.contains("error")) {
            const auto& err = item["error"];
            throw DeviceError(code, "Hue error " + std::to_string(err.value("type", 0)) + ": " +
                                    err.value("description", std::string("unknown")));
        }
    }
}

static nlohmann::json parseBody(const cpr::Response& resp, const std::string& what) {
    if (resp.error) {
        throw DeviceError("ERR_DEVICE_UNREACHABLE", what + ": " + resp.error.message);
    }
    if (resp.status_code != 200) {
        throw DeviceError("ERR_DEVICE_UNREACHABLE", what + ": HTTP " + std::to_string(resp.status_code));
    }
    try {
        return nlohmann::json::parse(resp.text);
    } catch (const nlohmann::json::parse_error& e) {
        throw DeviceError("ERR_DEVICE_FETCH", what + ": invalid JSON (" + e.what() + ")");
    }
}

// ------------------------------------------------------------
// HueBridge
// ------------------------------------------------------------
HueBridge::HueBridge(std::string address, std::string username, int timeoutMs)
    : address_(std::move(address)), username_(std::move(username)), timeoutMs_(timeoutMs) {}

std::string HueBridge::url(const std::string& path) const {
    return "http://" + address_ + "/api/" + username_ + path;
}

nlohmann::json HueBridge::getJson(const std::string& path) {
    auto resp = cpr::Get(cpr::Url{ url(path) }, cpr::Timeout{ timeoutMs_ });
    nlohmann::json body = parseBody(resp, "GET " + path);
    throwOnHueError(body, "ERR_DEVICE_FETCH");
    return body;
}

LightCapabilities HueBridge::capabilitiesOf(const nlohmann::json& light) {
    LightCapabilities caps;
    const auto state = light.value("state", nlohmann::json::object());
    caps.supportsBrightness = state.contains("bri");
    caps.supportsColor      = state.contains("xy");
    return caps;
}

LightMap HueBridge::listDevices() {
    nlohmann::json lights = getJson("/lights");
    if (!lights.is_object()) {
        throw DeviceError("ERR_DEVICE_FETCH", "Unexpected /lights payload");
    }

    LightMap out;
    for (auto& [id, light] : lights.items()) {
        std::string name = light.value("name", "Light " + id);
        out[name] = std::make_shared<HueLight>(*this, id, name, capabilitiesOf(light),
                                               light.value("state", nlohmann::json::object()));
    }
    LOG_DEBUG("Hue", "Bridge reports " + std::to_string(out.size()) + " light(s)");
    return out;
}

DeviceDetails HueBridge::getDevice(const std::string& id) {
    nlohmann::json light = getJson("/lights/" + id);

    DeviceDetails d;
    d.id           = id;
    d.name         = light.value("name", "Light " + id);
    d.type         = light.value("type", "unknown");
    d.capabilities = capabilitiesOf(light);
    return d;
}

void HueBridge::setState(const std::string& id, const nlohmann::json& state) {
    auto resp = cpr::Put(cpr::Url{ url("/lights/" + id + "/state") },
                         cpr::Header{ {"Content-Type", "application/json"} },
                         cpr::Body{ state.dump() },
                         cpr::Timeout{ timeoutMs_ });
    nlohmann::json body = parseBody(resp, "PUT light " + id);
    throwOnHueError(body, "ERR_DEVICE_UPDATE");
    LOG_TRACE("Hue", "Light " + id + " <- " + state.dump());
}

std::string HueBridge::pair(const std::string& address, const std::string& deviceType, int timeoutMs) {
    auto resp = cpr::Post(cpr::Url{ "http://" + address + "/api" },
                          cpr::Header{ {"Content-Type", "application/json"} },
                          cpr::Body{ nlohmann::json{ {"devicetype", deviceType} }.dump() },
                          cpr::Timeout{ timeoutMs });
    nlohmann::json body = parseBody(resp, "Pairing with " + address);
    throwOnHueError(body, "ERR_BRIDGE_PAIRING");

    if (body.is_array()) {
        for (const auto& item : body) {
            if (item.contains("success") && item["success"].contains("username")) {
                return item["success"]["username"].get<std::string>();
            }
        }
    }
    throw DeviceError("ERR_BRIDGE_PAIRING", "Bridge did not return a username");
}

// ------------------------------------------------------------
// HueLight
// ------------------------------------------------------------
HueLight::HueLight(HueBridge& bridge, std::string id, std::string name,
                   LightCapabilities caps, const nlohmann::json& state)
    : bridge_(bridge), id_(std::move(id)), name_(std::move(name)), caps_(caps) {
    on_ = state.value("on", false);
    if (caps_.supportsBrightness && state.contains("bri") && state["bri"].is_number()) {
        brightness_ = state["bri"].get<int>();
    }
    if (caps_.supportsColor && state.contains("xy") && state["xy"].is_array() && state["xy"].size() == 2) {
        color_ = ColorPoint{ state["xy"][0].get<double>(), state["xy"][1].get<double>() };
    }
}

void HueLight::setOn(bool on) {
    bridge_.setState(id_, { {"on", on} });
    on_ = on;
}

void HueLight::setBrightness(int value) {
    int bri = std::clamp(value, kMinBrightness, kMaxBrightness);
    bridge_.setState(id_, { {"bri", bri} });
    brightness_ = bri;
}

void HueLight::setColorPoint(const ColorPoint& xy) {
    ColorPoint p{ std::clamp(xy.x, 0.0, 1.0), std::clamp(xy.y, 0.0, 1.0) };
    bridge_.setState(id_, { {"xy", {p.x, p.y}} });
    color_ = p;
}
