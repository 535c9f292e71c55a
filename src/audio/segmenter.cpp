#include "audio/segmenter.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <memory>
#include <utility>

namespace meetscribe {
namespace audio {

std::vector<float> Segment::samples() const {
    size_t total = 0;
    for (const auto& frame : frames) {
        total += frame->samples.size();
    }

    std::vector<float> out;
    out.reserve(total);
    for (const auto& frame : frames) {
        out.insert(out.end(), frame->samples.begin(), frame->samples.end());
    }
    return out;
}

std::string sealReasonToString(SealReason reason) {
    switch (reason) {
        case SealReason::SILENCE_GAP: return "silence_gap";
        case SealReason::TIMESTAMP_GAP: return "timestamp_gap";
        case SealReason::MAX_DURATION: return "max_duration";
        case SealReason::STREAM_CLOSED: return "stream_closed";
        case SealReason::DISCONNECTED: return "disconnected";
    }
    return "unknown";
}

Segmenter::Segmenter(const Config& config, SegmentCallback callback)
    : config_(config)
    , callback_(std::move(callback))
    , vad_(config.vad)
    , trailingSilenceMs_(0)
    , lastFrameEndMs_(0)
    , lastVoicedEndMs_(0)
    , nextId_(1)
    , lastSealedEndMs_(0)
    , highWaterMs_(0)
    , timelineOffsetMs_(0)
    , rebasePending_(false) {
}

void Segmenter::setSegmentCallback(SegmentCallback callback) {
    callback_ = std::move(callback);
}

void Segmenter::processFrame(const AudioFramePtr& frame) {
    if (!frame) {
        return;
    }
    stats_.framesProcessed++;

    int64_t startMs = frame->captureTimestampMs + timelineOffsetMs_;
    if (rebasePending_) {
        if (startMs < highWaterMs_) {
            timelineOffsetMs_ += highWaterMs_ - startMs;
            startMs = highWaterMs_;
        }
        rebasePending_ = false;
    }
    const int64_t endMs = startMs + frame->durationMs;
    const bool speech = vad_.isSpeech(frame->samples);

    if (open_ && startMs - lastFrameEndMs_ > config_.silenceGapMs) {
        seal(SealReason::TIMESTAMP_GAP);
    }

    if (!open_) {
        if (!speech) {
            stats_.silentFramesSkipped++;
            highWaterMs_ = std::max(highWaterMs_, endMs);
            return;
        }
        openSegment(startMs, frame->sampleRate);
    }

    open_->frames.push_back(frame);
    open_->accumulatedMs += frame->durationMs;
    lastFrameEndMs_ = std::max(lastFrameEndMs_, endMs);
    highWaterMs_ = std::max(highWaterMs_, endMs);

    if (speech) {
        open_->voicedMs += frame->durationMs;
        trailingSilenceMs_ = 0;
        lastVoicedEndMs_ = std::max(lastVoicedEndMs_, endMs);
    } else {
        trailingSilenceMs_ += frame->durationMs;
    }

    if (open_->accumulatedMs >= config_.maxSegmentMs) {
        seal(SealReason::MAX_DURATION);
    } else if (trailingSilenceMs_ >= config_.silenceGapMs) {
        seal(SealReason::SILENCE_GAP);
    }
}

SegmentPtr Segmenter::flush(SealReason reason) {
    if (!open_) {
        return nullptr;
    }
    return seal(reason);
}

void Segmenter::markDiscontinuity() {
    rebasePending_ = true;
}

uint64_t Segmenter::reserveId() {
    return nextId_++;
}

void Segmenter::openSegment(int64_t startMs, int sampleRate) {
    open_ = std::make_unique<Segment>();
    open_->id = nextId_++;
    // Never start before the previous segment ended, so ids follow start order
    open_->startMs = std::max(startMs, lastSealedEndMs_);
    open_->endMs = open_->startMs;
    open_->sampleRate = sampleRate;
    trailingSilenceMs_ = 0;
    lastFrameEndMs_ = startMs;
    lastVoicedEndMs_ = open_->startMs;
}

SegmentPtr Segmenter::seal(SealReason reason) {
    std::unique_ptr<Segment> sealed = std::move(open_);

    sealed->endMs = std::max(sealed->startMs, lastVoicedEndMs_);
    sealed->state = SegmentState::SEALED;
    sealed->sealReason = reason;
    sealed->discardable = sealed->voicedMs < config_.minSegmentMs;

    lastSealedEndMs_ = std::max(lastSealedEndMs_, sealed->endMs);
    trailingSilenceMs_ = 0;

    stats_.segmentsSealed++;
    if (sealed->discardable) {
        stats_.segmentsDiscardable++;
    }

    utils::Logger::debug("Segment " + std::to_string(sealed->id) + " sealed (" +
                         sealReasonToString(reason) + ") [" + std::to_string(sealed->startMs) +
                         "ms, " + std::to_string(sealed->endMs) + "ms] voiced=" +
                         std::to_string(sealed->voicedMs) + "ms" +
                         (sealed->discardable ? " discardable" : ""));

    SegmentPtr result(std::move(sealed));
    if (callback_) {
        callback_(result);
    }
    return result;
}

} // namespace audio
} // namespace meetscribe
