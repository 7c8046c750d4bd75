#pragma once
#include <string>

// Short audio cues played on pipeline events
enum class Cue {
    WakeWord,
    CommandRecognized,
    CommandExecuted,
    Error,
    Timer
};

// Side-channel feedback to the user. Implementations must be callable
// from any stage thread and must not throw.
class Feedback {
public:
    virtual ~Feedback() = default;

    virtual void cue(Cue cue) = 0;
    virtual void say(const std::string& text) = 0;
    virtual void notify(const std::string& title, const std::string& message) = 0;
};

// Discards everything (tests, headless runs)
class NullFeedback : public Feedback {
public:
    void cue(Cue) override {}
    void say(const std::string&) override {}
    void notify(const std::string&, const std::string&) override {}
};
