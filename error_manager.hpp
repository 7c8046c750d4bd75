#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

#include "commands/commands_core.hpp"

// Undefine Windows ERROR macro if it leaks in
#ifdef ERROR
#undef ERROR
#endif

// ------------------------------------------------------------
// Error taxonomy
// ------------------------------------------------------------
// Perception   - unintelligible audio, capture timeout
// Service      - recognition service unreachable or erroring
// Device       - bridge fetch/mutate failure
// StageFailure - a pipeline worker crashed or stalled
// Fatal        - unrecoverable, ends the process
enum class ErrorKind {
    Perception,
    Service,
    Device,
    StageFailure,
    Fatal
};

enum class ErrorPolicy {
    Ignore,               // log only
    InvalidateCache,      // drop device cache, abort current sub-command
    EscalateToSupervisor, // counted by the supervisor error window
    RestartPipeline,      // supervisor restarts every stage
    Terminate             // propagate to process exit
};

ErrorPolicy policyFor(ErrorKind kind);
const char* toString(ErrorKind kind);

// Base for every error raised inside the pipeline
class LumenError : public std::runtime_error {
public:
    LumenError(ErrorKind kind, std::string code, const std::string& detail)
        : std::runtime_error(detail), kind_(kind), code_(std::move(code)) {}

    ErrorKind kind() const { return kind_; }
    const std::string& code() const { return code_; }

private:
    ErrorKind kind_;
    std::string code_;
};

class PerceptionError : public LumenError {
public:
    PerceptionError(std::string code, const std::string& detail)
        : LumenError(ErrorKind::Perception, std::move(code), detail) {}
};

class ServiceError : public LumenError {
public:
    ServiceError(std::string code, const std::string& detail)
        : LumenError(ErrorKind::Service, std::move(code), detail) {}
};

class DeviceError : public LumenError {
public:
    DeviceError(std::string code, const std::string& detail)
        : LumenError(ErrorKind::Device, std::move(code), detail) {}
};

class FatalError : public LumenError {
public:
    FatalError(std::string code, const std::string& detail)
        : LumenError(ErrorKind::Fatal, std::move(code), detail) {}
};

// Message type of the supervisor's error channel
struct PipelineError {
    ErrorKind kind = ErrorKind::Service;
    std::string code;
    std::string source;   // stage name
    std::string detail;
    std::chrono::steady_clock::time_point at{};
};

// ------------------------------------------------------------
// ErrorManager: error catalog (errors.json)
// ------------------------------------------------------------
namespace ErrorManager {
    // Load error codes from JSON (errors.json)
    void load(const std::string& path);
    void loadFromJson(const nlohmann::json& catalog);

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);

    // Report an error (logs debug text, returns failed CommandResult)
    CommandResult report(const std::string& code, const std::string& detail = "");
}
