#pragma once

#include <cstdint>
#include <memory>
#include <vector>

namespace meetscribe {
namespace audio {

/**
 * One chunk of meeting audio as delivered by the connector.
 * Immutable once created; shared by the frame buffer and the segments that
 * reference it.
 */
struct AudioFrame {
    const uint64_t sequenceNumber;     // Monotonic, assigned at arrival
    const std::vector<float> samples;  // Mono PCM in [-1, 1]
    const int sampleRate;
    const int64_t captureTimestampMs;  // Connector clock
    const int64_t durationMs;

    AudioFrame(uint64_t sequence, std::vector<float> data, int rate,
               int64_t captureMs, int64_t durMs)
        : sequenceNumber(sequence)
        , samples(std::move(data))
        , sampleRate(rate)
        , captureTimestampMs(captureMs)
        , durationMs(durMs) {}

    int64_t endTimestampMs() const { return captureTimestampMs + durationMs; }
};

using AudioFramePtr = std::shared_ptr<const AudioFrame>;

/**
 * Audio as produced by a connector, before the pipeline stamps it
 */
struct RawAudioChunk {
    std::vector<float> samples;
    int sampleRate = 16000;
    int64_t captureTimestampMs = 0;
    int64_t durationMs = 0;  // Derived from samples/sampleRate when 0
};

} // namespace audio
} // namespace meetscribe
