#pragma once
#include <cstddef>
#include <deque>
#include <string>

#include "pipeline/events.hpp"

/// ConfidenceGate
/// Accepts a transcript iff confidence > threshold and its text is not
/// among the last `window` accepted texts (oldest evicted first).
/// Rejections only affect the window when accepted.
class ConfidenceGate {
public:
    enum class Verdict { Accepted, LowConfidence, Duplicate };

    explicit ConfidenceGate(float threshold = 0.7f, std::size_t window = 5);

    Verdict evaluate(const Transcript& transcript);

    const std::deque<std::string>& recent() const { return recent_; }
    void clear() { recent_.clear(); }

private:
    float threshold_;
    std::size_t window_;
    std::deque<std::string> recent_;
};

const char* toString(ConfidenceGate::Verdict verdict);
