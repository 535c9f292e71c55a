#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace meetscribe {
namespace core {

/**
 * Audio of one sealed segment as handed to an inference backend. Both
 * backends receive identical requests for a segment.
 */
struct SpeechRequest {
    std::string sessionId;
    uint64_t segmentId = 0;
    int sampleRate = 16000;
    std::vector<float> audio;
    int64_t startMs = 0;
    int64_t endMs = 0;
};

} // namespace core
} // namespace meetscribe
