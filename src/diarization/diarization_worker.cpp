#include "diarization/diarization_worker.hpp"

namespace meetscribe {
namespace diarization {

DiarizationWorker::DiarizationWorker(std::shared_ptr<SpeakerRecognitionEngine> engine, const Config& config)
    : SegmentWorker(config)
    , engine_(std::move(engine)) {
    if (!engine_) {
        throw utils::ConfigException("DiarizationWorker requires a speaker-recognition engine");
    }
}

DiarizationWorker::~DiarizationWorker() {
    stop();
}

core::BackendResult<SpeakerPayload> DiarizationWorker::invoke(const core::SpeechRequest& request,
                                                              const core::CancellationToken& token) {
    return engine_->identifySpeaker(request, token);
}

core::DiarizationResult DiarizationWorker::makeResult(uint64_t segment_id, SpeakerPayload payload) {
    core::DiarizationResult result;
    result.segment_id = segment_id;
    result.speaker_label = payload.speakerLabel.empty() ? core::UNKNOWN_SPEAKER_LABEL
                                                        : std::move(payload.speakerLabel);
    result.confidence = payload.confidence;
    return result;
}

core::DiarizationResult DiarizationWorker::makeDegraded(uint64_t segment_id, const std::string& reason) {
    core::DiarizationResult result;
    result.segment_id = segment_id;
    result.speaker_label = core::UNKNOWN_SPEAKER_LABEL;
    result.confidence = 0.0f;
    result.degraded = true;
    result.error_message = reason;
    return result;
}

} // namespace diarization
} // namespace meetscribe
