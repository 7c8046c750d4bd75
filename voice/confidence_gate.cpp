#include "voice/confidence_gate.hpp"

#include <algorithm>

ConfidenceGate::ConfidenceGate(float threshold, std::size_t window)
    : threshold_(threshold), window_(window) {}

ConfidenceGate::Verdict ConfidenceGate::evaluate(const Transcript& transcript) {
    if (!(transcript.confidence > threshold_)) {
        return Verdict::LowConfidence;
    }

    if (std::find(recent_.begin(), recent_.end(), transcript.text) != recent_.end()) {
        return Verdict::Duplicate;
    }

    if (window_ > 0) {
        recent_.push_back(transcript.text);
        while (recent_.size() > window_) recent_.pop_front();
    }
    return Verdict::Accepted;
}

const char* toString(ConfidenceGate::Verdict verdict) {
    switch (verdict) {
        case ConfidenceGate::Verdict::Accepted:      return "accepted";
        case ConfidenceGate::Verdict::LowConfidence: return "low confidence";
        case ConfidenceGate::Verdict::Duplicate:     return "duplicate";
    }
    return "unknown";
}
