#include "stt/transcription_worker.hpp"

namespace meetscribe {
namespace stt {

TranscriptionWorker::TranscriptionWorker(std::shared_ptr<SpeechToTextEngine> engine, const Config& config)
    : SegmentWorker(config)
    , engine_(std::move(engine)) {
    if (!engine_) {
        throw utils::ConfigException("TranscriptionWorker requires a speech-to-text engine");
    }
}

TranscriptionWorker::~TranscriptionWorker() {
    stop();
}

core::BackendResult<TranscriptionPayload> TranscriptionWorker::invoke(const core::SpeechRequest& request,
                                                                      const core::CancellationToken& token) {
    return engine_->transcribe(request, token);
}

core::TranscriptionResult TranscriptionWorker::makeResult(uint64_t segment_id, TranscriptionPayload payload) {
    core::TranscriptionResult result;
    result.segment_id = segment_id;
    result.text = std::move(payload.text);
    result.confidence = payload.confidence;
    result.words = std::move(payload.words);
    return result;
}

core::TranscriptionResult TranscriptionWorker::makeDegraded(uint64_t segment_id, const std::string& reason) {
    core::TranscriptionResult result;
    result.segment_id = segment_id;
    result.confidence = 0.0f;
    result.degraded = true;
    result.error_message = reason;
    return result;
}

} // namespace stt
} // namespace meetscribe
