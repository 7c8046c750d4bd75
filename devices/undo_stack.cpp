#include "devices/undo_stack.hpp"
#include "logger.hpp"

UndoStack::UndoStack(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void UndoStack::push(UndoEntry entry) {
    if (entries_.size() >= capacity_) {
        entries_.pop_front();
        LOG_DEBUG("Undo", "History full, oldest snapshot discarded");
    }
    entries_.push_back(std::move(entry));
}

std::optional<UndoEntry> UndoStack::pop() {
    if (entries_.empty()) return std::nullopt;
    UndoEntry entry = std::move(entries_.back());
    entries_.pop_back();
    return entry;
}

LightSnapshot UndoStack::capture(const LightHandle& light) {
    LightSnapshot snap;
    snap.on = light.on();

    LightCapabilities caps = light.capabilities();
    if (caps.supportsBrightness) {
        snap.brightness = light.brightness();
    }
    if (caps.supportsColor) {
        snap.colorPoint = light.colorPoint();
    }
    return snap;
}

void UndoStack::restore(LightHandle& light, const LightSnapshot& snapshot) {
    if (snapshot.on) {
        light.setOn(true);
        if (snapshot.brightness) light.setBrightness(*snapshot.brightness);
        if (snapshot.colorPoint) light.setColorPoint(*snapshot.colorPoint);
        return;
    }

    // A light that is off does not accept brightness/color writes
    if (light.on()) {
        if (snapshot.brightness) light.setBrightness(*snapshot.brightness);
        if (snapshot.colorPoint) light.setColorPoint(*snapshot.colorPoint);
    }
    light.setOn(false);
}
