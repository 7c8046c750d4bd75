#include "commands/action_registry.hpp"
#include "commands/command_parser.hpp"
#include "commands/fuzzy.hpp"
#include "commands/light_actions.hpp"
#include "logger.hpp"

#include <unordered_map>

using command_parser::containsPhrase;

// ------------------------------------------------------------
// Built-in handlers
// ------------------------------------------------------------
static const std::unordered_map<std::string, ActionHandler>& builtinHandlers() {
    static const std::unordered_map<std::string, ActionHandler> handlers = {
        {"turn on",  [](const ActionContext& ctx) { light_actions::turnOn(ctx.lights); }},
        {"turn off", [](const ActionContext& ctx) { light_actions::turnOff(ctx.lights); }},
        {"dim", [](const ActionContext& ctx) {
            auto mag = command_parser::parseMagnitude(ctx.text);
            light_actions::dim(ctx.lights, light_actions::deltaFor(mag, ctx.deltas));
        }},
        {"brighten", [](const ActionContext& ctx) {
            auto mag = command_parser::parseMagnitude(ctx.text);
            light_actions::brighten(ctx.lights, light_actions::deltaFor(mag, ctx.deltas),
                                    ctx.deltas.small);
        }},
        {"maximum", [](const ActionContext& ctx) { light_actions::maximum(ctx.lights); }},
        {"minimum", [](const ActionContext& ctx) { light_actions::minimum(ctx.lights); }}
    };
    return handlers;
}

std::vector<AliasGroup> ActionRegistry::defaultAliases() {
    return {
        {"turn on",    {"lights on", "switch on", "power on", "on", "activate lights"}},
        {"turn off",   {"lights off", "switch off", "power off", "off", "deactivate lights"}},
        {"dim",        {"lower", "darker", "reduce brightness", "less bright", "dimmer"}},
        {"brighten",   {"brighter", "increase", "more light", "lighter", "more brightness"}},
        {"maximum",    {"brightest", "full", "hundred percent", "max brightness"}},
        {"minimum",    {"dimmest", "low", "lowest", "min brightness"}},
        {"undo",       {"revert", "go back", "previous", "cancel"}},
        {"brightness", {"set to", "percent", "level", "intensity"}}
    };
}

// ------------------------------------------------------------
// Construction
// ------------------------------------------------------------
ActionRegistry::ActionRegistry(const std::vector<AliasGroup>& groups) {
    const auto& source = groups.empty() ? defaultAliases() : groups;
    const auto& handlers = builtinHandlers();

    for (const auto& group : source) {
        std::vector<std::string> phrases;
        phrases.push_back(group.action);
        for (const auto& p : group.phrases) {
            std::string phrase = command_parser::normalizeTranscript(p);
            if (!phrase.empty()) phrases.push_back(phrase);
        }

        if (group.action == "undo") {
            undoPhrases_ = std::move(phrases);
            continue;
        }

        auto it = handlers.find(group.action);
        if (it == handlers.end()) {
            LOG_DEBUG("Actions", "No handler for '" + group.action + "', phrases not matched");
            continue;
        }

        entries_.push_back({group.action, std::move(phrases), it->second});
    }

    if (undoPhrases_.empty()) undoPhrases_.push_back("undo");

    LOG_DEBUG("Actions", "Registered " + std::to_string(entries_.size()) + " action(s)");
}

// ------------------------------------------------------------
// Lookup
// ------------------------------------------------------------
std::optional<ActionMatch> ActionRegistry::matchExact(const std::string& text) const {
    std::optional<ActionMatch> best;
    for (const auto& entry : entries_) {
        for (const auto& phrase : entry.phrases) {
            if (!containsPhrase(text, phrase)) continue;
            if (!best || phrase.size() > best->phrase.size()) {
                best = ActionMatch{ &entry, phrase, 100 };
            }
        }
    }
    return best;
}

std::optional<ActionMatch> ActionRegistry::matchFuzzy(const std::string& text, int threshold) const {
    std::optional<ActionMatch> best;
    for (const auto& entry : entries_) {
        for (const auto& phrase : entry.phrases) {
            int score = fuzzy::weightedRatio(text, phrase);
            if (!best || score > best->score) {
                best = ActionMatch{ &entry, phrase, score };
            }
        }
    }

    if (!best) return std::nullopt;

    LOG_DEBUG("Actions", "Best fuzzy match for '" + text + "': '" + best->phrase +
                         "' (" + std::to_string(best->score) + ")");
    if (best->score <= threshold) return std::nullopt;
    return best;
}

bool ActionRegistry::isUndo(const std::string& text) const {
    for (const auto& phrase : undoPhrases_) {
        if (containsPhrase(text, phrase)) return true;
    }
    return false;
}

const ActionEntry* ActionRegistry::find(const std::string& action) const {
    for (const auto& entry : entries_) {
        if (entry.action == action) return &entry;
    }
    return nullptr;
}
