#pragma once

#include "core/backend_result.hpp"
#include "core/cancellation.hpp"
#include "core/speech_request.hpp"
#include "core/transcript_types.hpp"
#include <string>
#include <vector>

namespace meetscribe {
namespace stt {

/**
 * What a speech-to-text backend returns for one segment
 */
struct TranscriptionPayload {
    std::string text;
    float confidence = 0.0f;
    std::vector<core::WordTiming> words;  // Optional, empty when the backend has no word timing
};

/**
 * Speech-to-text backend interface. Implementations may block for the
 * duration of the inference call; they should poll the token and return
 * BackendResult::cancelled() when it fires.
 */
class SpeechToTextEngine {
public:
    virtual ~SpeechToTextEngine() = default;

    virtual core::BackendResult<TranscriptionPayload> transcribe(
        const core::SpeechRequest& request, const core::CancellationToken& token) = 0;

    virtual std::string getEngineName() const = 0;
};

} // namespace stt
} // namespace meetscribe
