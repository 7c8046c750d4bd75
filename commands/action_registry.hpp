#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "app_config.hpp"
#include "devices/device_bridge.hpp"

// Everything a handler needs to act on one SubCommand
struct ActionContext {
    const std::vector<std::shared_ptr<LightHandle>>& lights;
    const std::string& text;
    const BrightnessDeltas& deltas;
};

using ActionHandler = std::function<void(const ActionContext&)>;

struct ActionEntry {
    std::string action;                 // canonical name
    std::vector<std::string> phrases;   // canonical name first, then aliases
    ActionHandler handler;
};

struct ActionMatch {
    const ActionEntry* entry = nullptr;
    std::string phrase;
    int score = 0;   // 100 for exact matches
};

/// ActionRegistry
/// Immutable table of canonical actions, their alias phrases and their
/// handlers. Built once from the configured alias groups; groups named
/// "undo" feed undo detection, groups without a built-in handler are
/// kept for reference only.
class ActionRegistry {
public:
    explicit ActionRegistry(const std::vector<AliasGroup>& groups = {});

    // Whole-word substring match; the longest matching phrase wins, ties
    // go to the earlier table entry.
    std::optional<ActionMatch> matchExact(const std::string& text) const;

    // Highest-scoring phrase, accepted only if its score > threshold
    std::optional<ActionMatch> matchFuzzy(const std::string& text, int threshold) const;

    bool isUndo(const std::string& text) const;

    const std::vector<ActionEntry>& entries() const { return entries_; }
    const ActionEntry* find(const std::string& action) const;

    static std::vector<AliasGroup> defaultAliases();

private:
    std::vector<ActionEntry> entries_;
    std::vector<std::string> undoPhrases_;
};
