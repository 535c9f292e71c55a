#pragma once

#include "audio/audio_frame.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace meetscribe {
namespace audio {

enum class SegmentState {
    OPEN,
    SEALED
};

enum class SealReason {
    SILENCE_GAP,      // Trailing silence reached the configured gap
    TIMESTAMP_GAP,    // Capture timestamps jumped by more than the gap
    MAX_DURATION,
    STREAM_CLOSED,
    DISCONNECTED
};

/**
 * A bounded span of audio, the unit of diarization and transcription work.
 * The segmenter builds it while OPEN; sealed segments are shared as
 * SegmentPtr and never change again.
 */
struct Segment {
    uint64_t id = 0;
    int64_t startMs = 0;
    int64_t endMs = 0;
    int sampleRate = 16000;
    std::vector<AudioFramePtr> frames;
    int64_t accumulatedMs = 0;  // Sum of frame durations, silence included
    int64_t voicedMs = 0;       // Duration of frames classified as speech
    SegmentState state = SegmentState::OPEN;
    SealReason sealReason = SealReason::STREAM_CLOSED;
    bool discardable = false;

    int64_t durationMs() const { return endMs - startMs; }
    bool isSealed() const { return state == SegmentState::SEALED; }

    /**
     * Concatenated samples of all frames, as sent to the inference backends
     */
    std::vector<float> samples() const;
};

using SegmentPtr = std::shared_ptr<const Segment>;

std::string sealReasonToString(SealReason reason);

} // namespace audio
} // namespace meetscribe
