#pragma once

#include "core/segment_worker.hpp"
#include "core/transcript_types.hpp"
#include "diarization/speaker_recognition_engine.hpp"
#include <memory>

namespace meetscribe {
namespace diarization {

/**
 * Attributes sealed segments to speakers. Failed segments get the
 * "unknown" label with zero confidence.
 */
class DiarizationWorker : public core::SegmentWorker<SpeakerPayload, core::DiarizationResult> {
public:
    DiarizationWorker(std::shared_ptr<SpeakerRecognitionEngine> engine, const Config& config);
    ~DiarizationWorker() override;

protected:
    core::BackendResult<SpeakerPayload> invoke(const core::SpeechRequest& request,
                                               const core::CancellationToken& token) override;
    core::DiarizationResult makeResult(uint64_t segment_id, SpeakerPayload payload) override;
    core::DiarizationResult makeDegraded(uint64_t segment_id, const std::string& reason) override;

private:
    std::shared_ptr<SpeakerRecognitionEngine> engine_;
};

} // namespace diarization
} // namespace meetscribe
