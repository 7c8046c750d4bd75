#pragma once
#include <string>

// ------------------------------------------------------------
// CommandResult: unified return type for every handled command
// ------------------------------------------------------------
struct CommandResult {
    std::string message;              // user-facing text
    bool success = false;             // true if command succeeded
    std::string errorCode = "ERR_NONE";
    std::string voice;                // spoken acknowledgment, empty = silent
    std::string category = "routine"; // routine, error, timer, system
};
