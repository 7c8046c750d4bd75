#pragma once
#include <string>
#include <vector>

#include "pipeline/events.hpp"

struct RecognitionAlternative {
    std::string text;
    float confidence = 0.0f;
};

// Best alternative first
struct RecognitionResult {
    std::vector<RecognitionAlternative> alternatives;
};

// Speech-to-text backend. recognize() may block for seconds and is
// called off the recognizer's stage loop. Throws ServiceError when the
// service is unreachable or returns garbage, PerceptionError when the
// audio held no intelligible speech.
class RecognitionService {
public:
    virtual ~RecognitionService() = default;

    virtual RecognitionResult recognize(const AudioClip& clip) = 0;
    virtual std::string name() const = 0;
};
