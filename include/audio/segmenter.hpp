#pragma once

#include "audio/audio_frame.hpp"
#include "audio/segment.hpp"
#include "audio/voice_activity_detector.hpp"
#include <cstdint>
#include <functional>
#include <memory>

namespace meetscribe {
namespace audio {

/**
 * Segmenter - slices the frame stream into utterance-candidate segments.
 *
 * Keeps at most one open segment. Speech frames open a segment; leading silence
 * with no open segment is skipped. A segment is sealed when its trailing silence
 * reaches silenceGapMs, when capture timestamps jump by more than silenceGapMs,
 * when its accumulated duration reaches maxSegmentMs, or on flush(). Sealed
 * segments whose voiced duration is below minSegmentMs are flagged discardable.
 *
 * Not thread-safe: owned by the coordinator's segmentation thread.
 */
class Segmenter {
public:
    struct Config {
        int64_t silenceGapMs = 600;
        int64_t maxSegmentMs = 15000;
        int64_t minSegmentMs = 250;
        VadConfig vad;
    };

    struct Statistics {
        uint64_t framesProcessed = 0;
        uint64_t silentFramesSkipped = 0;
        uint64_t segmentsSealed = 0;
        uint64_t segmentsDiscardable = 0;
    };

    using SegmentCallback = std::function<void(const SegmentPtr& segment)>;

    explicit Segmenter(const Config& config, SegmentCallback callback = nullptr);

    void setSegmentCallback(SegmentCallback callback);

    /**
     * Classify and append one frame, sealing segments as boundaries are met.
     * Sealed segments go to the callback before this returns.
     */
    void processFrame(const AudioFramePtr& frame);

    /**
     * Seal the open segment regardless of its length.
     * @return the sealed segment, or nullptr if none was open
     */
    SegmentPtr flush(SealReason reason = SealReason::STREAM_CLOSED);

    /**
     * The next frame follows a stream discontinuity; if its clock went
     * backwards it is shifted onto the session timeline.
     */
    void markDiscontinuity();

    /**
     * Take an id from the segment sequence without opening a segment
     */
    uint64_t reserveId();

    bool hasOpenSegment() const { return open_ != nullptr; }

    /**
     * Latest frame end seen on the session timeline
     */
    int64_t timelineHighWaterMs() const { return highWaterMs_; }

    Statistics getStatistics() const { return stats_; }
    const Config& getConfig() const { return config_; }

private:
    void openSegment(int64_t startMs, int sampleRate);
    SegmentPtr seal(SealReason reason);

    Config config_;
    SegmentCallback callback_;
    VoiceActivityDetector vad_;

    std::unique_ptr<Segment> open_;
    int64_t trailingSilenceMs_;
    int64_t lastFrameEndMs_;
    int64_t lastVoicedEndMs_;

    uint64_t nextId_;
    int64_t lastSealedEndMs_;
    int64_t highWaterMs_;
    int64_t timelineOffsetMs_;
    bool rebasePending_;

    Statistics stats_;
};

} // namespace audio
} // namespace meetscribe
