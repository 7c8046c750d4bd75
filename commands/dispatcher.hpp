#pragma once
#include <cstddef>
#include <deque>
#include <string>
#include <vector>

#include "app_config.hpp"
#include "commands/action_registry.hpp"
#include "commands/command_parser.hpp"
#include "commands/timer_service.hpp"
#include "devices/light_state_cache.hpp"
#include "devices/undo_stack.hpp"
#include "pipeline/stage.hpp"
#include "voice/feedback.hpp"

/// Dispatcher
/// Consumes CommandReady and TimerFired events, splits chained commands
/// and executes each SubCommand in order. Sole owner of the light cache
/// and the undo history.
class Dispatcher : public Stage {
public:
    enum class Outcome {
        Scheduled,       // delay directive handed to the TimerService
        Undone,
        NothingToUndo,
        BrightnessSet,   // "N percent"
        Executed,        // exact or fuzzy action
        NotRecognized,
        NoDevices,
        Failed           // exception while resolving or mutating
    };

    Dispatcher(const AppConfig& config,
               const ActionRegistry& registry,
               DeviceBridge& bridge,
               TimerService& timers,
               Feedback& feedback,
               EventChannel& in,
               EventChannel* captureEvents,
               ErrorChannel& errors,
               const Clock& clock = steadyClock());
    ~Dispatcher() override;

    // Synchronous entry points (the stage loop calls these too)
    std::vector<Outcome> process(const Command& command);
    Outcome processSubCommand(const std::string& text);

    const UndoStack& undoStack() const { return undo_; }
    const std::deque<std::string>& history() const { return history_; }

protected:
    bool step() override;

private:
    Outcome scheduleDelayed(const command_parser::DelayDirective& delay);
    Outcome undoLast();
    Outcome execute(const std::string& text);

    void pushSnapshot(const std::vector<std::shared_ptr<LightHandle>>& lights);
    void recordHistory(const std::string& text);
    void notifyCaptureStage();
    void reportFailure(const std::string& code, const std::string& detail);

    const AppConfig& config_;
    const ActionRegistry& registry_;
    TimerService& timers_;
    Feedback& feedback_;
    EventChannel& in_;
    EventChannel* captureEvents_;

    LightStateCache cache_;
    UndoStack undo_;
    std::deque<std::string> history_;
};

const char* toString(Dispatcher::Outcome outcome);
