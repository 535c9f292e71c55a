#pragma once

#include "core/backend_result.hpp"
#include "core/cancellation.hpp"
#include "core/speech_request.hpp"
#include <string>

namespace meetscribe {
namespace diarization {

struct SpeakerPayload {
    std::string speakerLabel;
    float confidence = 0.0f;
};

/**
 * Speaker-recognition backend interface. Labels are stable within a session;
 * the engine keeps whatever per-session speaker state it needs, keyed by
 * request.sessionId.
 */
class SpeakerRecognitionEngine {
public:
    virtual ~SpeakerRecognitionEngine() = default;

    virtual core::BackendResult<SpeakerPayload> identifySpeaker(
        const core::SpeechRequest& request, const core::CancellationToken& token) = 0;

    virtual std::string getEngineName() const = 0;
};

} // namespace diarization
} // namespace meetscribe
