#include "response_manager.hpp"

#include <mutex>
#include <random>
#include <unordered_map>
#include <vector>

// Simple random picker
static std::string pickRandom(const std::vector<std::string>& options) {
    static std::mutex rngMutex;
    static std::mt19937 gen{std::random_device{}()};
    std::lock_guard<std::mutex> lock(rngMutex);
    std::uniform_int_distribution<> dist(0, static_cast<int>(options.size()) - 1);
    return options[dist(gen)];
}

// Response database
static const std::unordered_map<std::string, std::vector<std::string>> responses = {
    // --- Startup ---
    { "startup", {
        "Lumen voice control is ready.",
        "Lights are listening.",
        "Voice control online."
    }},
    { "startup_fallback", {
        "Lumen voice control is ready. You can speak commands directly.",
        "Continuous listening is active. Go ahead and speak."
    }},

    // --- Recognition ---
    { "heard", {
        "I heard: ",
        "Got it: ",
        "You said: "
    }},
    { "not_recognized", {
        "Sorry, I did not recognize that command.",
        "That does not match any light command.",
        "I am not sure what to do with that."
    }},

    // --- Light actions ---
    { "turn on", {
        "Turning the lights on.",
        "Lights on."
    }},
    { "turn off", {
        "Turning the lights off.",
        "Lights off."
    }},
    { "dim", {
        "Dimming the lights.",
        "Bringing the lights down."
    }},
    { "brighten", {
        "Brightening the lights.",
        "Bringing the lights up."
    }},
    { "maximum", {
        "Setting lights to maximum brightness.",
        "Full brightness."
    }},
    { "minimum", {
        "Setting lights to minimum brightness.",
        "Lowest brightness."
    }},
    { "brightness", {
        "Setting brightness to ",
        "Brightness at "
    }},

    // --- Undo ---
    { "undo", {
        "Undoing the previous command.",
        "Reverting the lights."
    }},
    { "undo_empty", {
        "Sorry, I do not have any previous state to restore.",
        "There is nothing to undo."
    }},

    // --- Timers ---
    { "timer_set", {
        "Timer set for ",
        "Alright, I will wait ",
        "Got it, timer started for "
    }},
    { "timer_expired", {
        "Timer expired. ",
        "Time is up. "
    }},

    // --- Supervisor ---
    { "recovering", {
        "System is having issues. Attempting to recover.",
        "Something went wrong. Restarting the listeners."
    }},
    { "recovered", {
        "System recovered successfully.",
        "Back online."
    }},
    { "recovery_failed", {
        "Recovery failed. Please restart the application.",
        "I could not recover. Please restart me."
    }},
    { "shutdown", {
        "Goodbye.",
        "Voice control stopped."
    }},
};

bool ResponseManager::has(const std::string& key) {
    return responses.find(key) != responses.end();
}

std::string ResponseManager::get(const std::string& keyOrMessage) {
    auto it = responses.find(keyOrMessage);
    if (it != responses.end() && !it->second.empty()) {
        return pickRandom(it->second);
    }

    // Already a full message
    return keyOrMessage;
}
