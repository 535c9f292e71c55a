#pragma once

#include "core/segment_worker.hpp"
#include "core/transcript_types.hpp"
#include "stt/speech_to_text_engine.hpp"
#include <memory>

namespace meetscribe {
namespace stt {

/**
 * Transcribes sealed segments on a bounded pool. Failed segments are answered
 * with empty text and zero confidence, flagged degraded.
 */
class TranscriptionWorker : public core::SegmentWorker<TranscriptionPayload, core::TranscriptionResult> {
public:
    TranscriptionWorker(std::shared_ptr<SpeechToTextEngine> engine, const Config& config);
    ~TranscriptionWorker() override;

protected:
    core::BackendResult<TranscriptionPayload> invoke(const core::SpeechRequest& request,
                                                     const core::CancellationToken& token) override;
    core::TranscriptionResult makeResult(uint64_t segment_id, TranscriptionPayload payload) override;
    core::TranscriptionResult makeDegraded(uint64_t segment_id, const std::string& reason) override;

private:
    std::shared_ptr<SpeechToTextEngine> engine_;
};

} // namespace stt
} // namespace meetscribe
