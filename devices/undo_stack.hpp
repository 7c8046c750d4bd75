#pragma once
#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <string>

#include "devices/device_bridge.hpp"

// Per-device state captured before a mutation. Optional fields are
// omitted, not defaulted, when the device does not report them.
struct LightSnapshot {
    bool on = false;
    std::optional<int> brightness;
    std::optional<ColorPoint> colorPoint;
};

// device name -> snapshot
using UndoEntry = std::map<std::string, LightSnapshot>;

/// UndoStack
/// Bounded LIFO history of pre-mutation snapshots. When full, the oldest
/// entry is discarded.
class UndoStack {
public:
    explicit UndoStack(std::size_t capacity = 5);

    void push(UndoEntry entry);
    std::optional<UndoEntry> pop();

    bool empty() const { return entries_.empty(); }
    std::size_t size() const { return entries_.size(); }
    std::size_t capacity() const { return capacity_; }
    const UndoEntry& top() const { return entries_.back(); }

    void clear() { entries_.clear(); }

    static LightSnapshot capture(const LightHandle& light);
    static void restore(LightHandle& light, const LightSnapshot& snapshot);

private:
    std::size_t capacity_;
    std::deque<UndoEntry> entries_;
};
