#include "commands/dispatcher.hpp"
#include "commands/command_parser.hpp"
#include "commands/light_actions.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "response_manager.hpp"

const char* toString(Dispatcher::Outcome outcome) {
    switch (outcome) {
        case Dispatcher::Outcome::Scheduled:     return "scheduled";
        case Dispatcher::Outcome::Undone:        return "undone";
        case Dispatcher::Outcome::NothingToUndo: return "nothing to undo";
        case Dispatcher::Outcome::BrightnessSet: return "brightness set";
        case Dispatcher::Outcome::Executed:      return "executed";
        case Dispatcher::Outcome::NotRecognized: return "not recognized";
        case Dispatcher::Outcome::NoDevices:     return "no devices";
        case Dispatcher::Outcome::Failed:        return "failed";
    }
    return "unknown";
}

Dispatcher::Dispatcher(const AppConfig& config,
                       const ActionRegistry& registry,
                       DeviceBridge& bridge,
                       TimerService& timers,
                       Feedback& feedback,
                       EventChannel& in,
                       EventChannel* captureEvents,
                       ErrorChannel& errors,
                       const Clock& clock)
    : Stage("Dispatcher", errors),
      config_(config),
      registry_(registry),
      timers_(timers),
      feedback_(feedback),
      in_(in),
      captureEvents_(captureEvents),
      cache_(bridge, std::chrono::seconds(config.dispatch.cacheTtlS), clock),
      undo_(static_cast<std::size_t>(config.dispatch.maxStateHistory)) {}

Dispatcher::~Dispatcher() {
    stop();
}

// ------------------------------------------------------------
// Stage loop
// ------------------------------------------------------------
bool Dispatcher::step() {
    auto ev = in_.tryPop();
    if (!ev) return false;

    std::visit(overloaded{
        [this](CommandReady& e) {
            process(e.command);
            notifyCaptureStage();
        },
        [this](TimerFired& e) {
            LOG_INFO("Dispatcher", "Timer " + std::to_string(e.timerId) + " fired: '" + e.action + "'");
            feedback_.cue(Cue::Timer);
            feedback_.notify("Lumen Timer", ResponseManager::get("timer_expired") + e.action);
            process(Command{ e.action, std::chrono::system_clock::now() });
            notifyCaptureStage();
        },
        [](auto&) {
            LOG_DEBUG("Dispatcher", "Ignoring unexpected event");
        }
    }, *ev);
    return true;
}

void Dispatcher::notifyCaptureStage() {
    if (!captureEvents_) return;
    PipelineEvent done = CommandExecuted{ std::chrono::steady_clock::now() };
    if (!captureEvents_->tryPush(done)) {
        LOG_WARN("Dispatcher", "Capture queue full, cooldown not signalled");
    }
}

// ------------------------------------------------------------
// Command processing
// ------------------------------------------------------------
std::vector<Dispatcher::Outcome> Dispatcher::process(const Command& command) {
    const std::string text = command_parser::normalizeTranscript(command.rawText);
    recordHistory(text);

    std::vector<std::string> parts = command_parser::splitChain(text);
    if (parts.size() > 1) {
        LOG_INFO("Dispatcher", "Processing command chain of " + std::to_string(parts.size()) + " parts");
    }

    std::vector<Outcome> outcomes;
    outcomes.reserve(parts.size());
    for (const auto& part : parts) {
        outcomes.push_back(processSubCommand(part));
    }
    return outcomes;
}

Dispatcher::Outcome Dispatcher::processSubCommand(const std::string& text) {
    LOG_DEBUG("Dispatcher", "SubCommand: '" + text + "'");
    try {
        if (auto delay = command_parser::parseDelay(text); delay && !delay->action.empty()) {
            return scheduleDelayed(*delay);
        }
        if (registry_.isUndo(text)) {
            return undoLast();
        }
        return execute(text);
    } catch (const DeviceError& e) {
        LOG_ERROR("Dispatcher", "Device error on '" + text + "': " + e.what());
        cache_.invalidate();
        reportFailure(e.code(), e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Dispatcher", "Error processing '" + text + "': " + e.what());
        cache_.invalidate();
        reportFailure("ERR_COMMAND_FAILED", e.what());
    }
    return Outcome::Failed;
}

Dispatcher::Outcome Dispatcher::scheduleDelayed(const command_parser::DelayDirective& delay) {
    timers_.schedule(delay.delay, delay.action);

    std::string when = std::to_string(delay.delay.count()) + " seconds";
    feedback_.notify("Lumen Timer", "Timer set: '" + delay.action + "' in " + when);
    feedback_.say(ResponseManager::get("timer_set") + when);
    return Outcome::Scheduled;
}

Dispatcher::Outcome Dispatcher::undoLast() {
    auto entry = undo_.pop();
    if (!entry) {
        LOG_INFO("Dispatcher", "No previous state to restore");
        feedback_.cue(Cue::Error);
        feedback_.say(ResponseManager::get("undo_empty"));
        return Outcome::NothingToUndo;
    }

    // Make sure the handles referenced by the snapshot are loaded
    cache_.lights();

    for (const auto& [name, snapshot] : *entry) {
        auto light = cache_.find(name);
        if (!light) {
            LOG_WARN("Dispatcher", "Light '" + name + "' no longer available, not restored");
            continue;
        }
        UndoStack::restore(*light, snapshot);
    }

    LOG_INFO("Dispatcher", "Restored previous state of " + std::to_string(entry->size()) + " light(s)");
    feedback_.cue(Cue::CommandExecuted);
    feedback_.say(ResponseManager::get("undo"));
    return Outcome::Undone;
}

Dispatcher::Outcome Dispatcher::execute(const std::string& text) {
    std::optional<int> percent = command_parser::parsePercent(text);

    std::optional<ActionMatch> match;
    if (!percent) {
        match = registry_.matchExact(text);
        if (!match) match = registry_.matchFuzzy(text, config_.dispatch.fuzzyThreshold);
        if (!match) {
            LOG_INFO("Dispatcher", "Command '" + text + "' not recognized");
            feedback_.cue(Cue::Error);
            feedback_.say(ResponseManager::get("not_recognized"));
            return Outcome::NotRecognized;
        }
    }

    auto lights = cache_.lights();
    if (lights.empty()) {
        LOG_WARN("Dispatcher", "No lights available for '" + text + "'");
        reportFailure("ERR_NO_DEVICES", "Bridge returned no lights");
        return Outcome::NoDevices;
    }

    pushSnapshot(lights);

    if (percent) {
        int value = command_parser::percentToBrightness(*percent);
        LOG_INFO("Dispatcher", "Setting brightness to " + std::to_string(*percent) +
                               "% (" + std::to_string(value) + ")");
        light_actions::setBrightness(lights, value);
        feedback_.cue(Cue::CommandExecuted);
        feedback_.say(ResponseManager::get("brightness") + std::to_string(*percent) + " percent");
        return Outcome::BrightnessSet;
    }

    LOG_INFO("Dispatcher", "Matched '" + match->entry->action + "' via '" + match->phrase +
                           "' (" + std::to_string(match->score) + ")");
    match->entry->handler(ActionContext{ lights, text, config_.dispatch.deltas });
    feedback_.cue(Cue::CommandExecuted);
    feedback_.say(ResponseManager::get(match->entry->action));
    return Outcome::Executed;
}

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
void Dispatcher::pushSnapshot(const std::vector<std::shared_ptr<LightHandle>>& lights) {
    UndoEntry entry;
    for (const auto& light : lights) {
        entry[light->name()] = UndoStack::capture(*light);
    }
    undo_.push(std::move(entry));
    LOG_TRACE("Dispatcher", "Saved state of " + std::to_string(lights.size()) + " light(s)");
}

void Dispatcher::recordHistory(const std::string& text) {
    history_.push_back(text);
    while (history_.size() > static_cast<std::size_t>(config_.dispatch.maxCommandHistory)) {
        history_.pop_front();
    }
}

void Dispatcher::reportFailure(const std::string& code, const std::string& detail) {
    CommandResult res = ErrorManager::report(code, detail);
    feedback_.cue(Cue::Error);
    feedback_.say(res.voice);
}
