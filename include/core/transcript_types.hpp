#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace meetscribe {
namespace core {

/**
 * Label used whenever speaker recognition could not attribute a segment
 */
constexpr const char* UNKNOWN_SPEAKER_LABEL = "unknown";

// Word-level timing and confidence information
struct WordTiming {
    std::string word;
    int64_t start_ms = 0;
    int64_t end_ms = 0;
    float confidence = 0.0f;

    WordTiming() = default;
    WordTiming(const std::string& w, int64_t start, int64_t end, float conf)
        : word(w), start_ms(start), end_ms(end), confidence(conf) {}
};

/**
 * Speaker attribution for one sealed segment
 */
struct DiarizationResult {
    uint64_t segment_id = 0;
    std::string speaker_label;
    float confidence = 0.0f;
    bool degraded = false;
    std::string error_message;  // Set on degraded results
};

/**
 * Recognized speech for one sealed segment
 */
struct TranscriptionResult {
    uint64_t segment_id = 0;
    std::string text;
    float confidence = 0.0f;
    std::vector<WordTiming> words;
    bool degraded = false;
    std::string error_message;
};

enum class EntryKind {
    UTTERANCE,
    GAP_MARKER
};

/**
 * One transcript line: an utterance (joined diarization + transcription of a
 * segment) or a gap marker for a stream discontinuity. Immutable once
 * inserted.
 */
struct TranscriptEntry {
    EntryKind kind = EntryKind::UTTERANCE;
    uint64_t segment_id = 0;
    int64_t start_ms = 0;
    int64_t end_ms = 0;

    std::string speaker_label;
    float speaker_confidence = 0.0f;
    std::string text;
    float confidence = 0.0f;
    std::vector<WordTiming> words;

    bool speaker_degraded = false;
    bool text_degraded = false;
    bool forced = false;            // Finalized by timeout or drain with placeholders
    int64_t gap_duration_ms = 0;    // Gap markers only: wall-clock outage length

    bool isGapMarker() const { return kind == EntryKind::GAP_MARKER; }
};

/**
 * Transcript order: start timestamp, ties broken by segment id
 */
inline bool entryPrecedes(const TranscriptEntry& a, const TranscriptEntry& b) {
    if (a.start_ms != b.start_ms) {
        return a.start_ms < b.start_ms;
    }
    return a.segment_id < b.segment_id;
}

} // namespace core
} // namespace meetscribe
