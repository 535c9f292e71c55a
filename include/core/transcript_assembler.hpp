#pragma once

#include "audio/segment.hpp"
#include "core/transcript.hpp"
#include "core/transcript_types.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace meetscribe {
namespace core {

/**
 * Per-segment join state
 */
enum class JoinState {
    WAITING_BOTH,
    HAS_DIARIZATION,
    HAS_TRANSCRIPTION,
    JOINED,
    APPENDED,   // Terminal
    DROPPED     // Terminal: discardable segment
};

std::string joinStateToString(JoinState state);

/**
 * Joins diarization and transcription results by segment id and inserts the
 * resulting utterances into the session transcript.
 *
 * Results arrive from two worker pools in any order. Every mutation happens
 * under one mutex, so the assembler is the single writer of the transcript.
 * Entry callbacks are invoked after the lock is released.
 */
class TranscriptAssembler {
public:
    struct Config {
        std::chrono::milliseconds completion_timeout{30000};
        std::string session_id;
    };

    struct Statistics {
        size_t registered = 0;
        size_t appended = 0;
        size_t dropped = 0;
        size_t forced = 0;
        size_t duplicates = 0;
        size_t unknown = 0;
        size_t gap_markers = 0;
        size_t pending = 0;
    };

    using Clock = std::chrono::steady_clock;
    using EntryCallback = std::function<void(const TranscriptEntry& entry)>;

    TranscriptAssembler(std::shared_ptr<Transcript> transcript, const Config& config);

    TranscriptAssembler(const TranscriptAssembler&) = delete;
    TranscriptAssembler& operator=(const TranscriptAssembler&) = delete;

    /**
     * Record a sealed segment. Discardable segments go straight to DROPPED.
     * @return false if the id was already registered
     */
    bool registerSegment(const audio::SegmentPtr& segment, Clock::time_point now = Clock::now());

    void onDiarizationResult(const DiarizationResult& result);
    void onTranscriptionResult(const TranscriptionResult& result);

    /**
     * Add a gap marker for a stream discontinuity. The id must come from the
     * segmenter's sequence.
     */
    bool insertGapMarker(uint64_t id, int64_t timestamp_ms, int64_t gap_duration_ms);

    /**
     * Force-finalize every pending segment registered before now - timeout.
     * @return number of segments finalized
     */
    size_t expireStale(Clock::time_point now = Clock::now());

    /**
     * Force-finalize everything still pending (drain)
     */
    size_t forceFinalizeAll(const std::string& reason);

    size_t pendingCount() const;
    std::optional<JoinState> getState(uint64_t segment_id) const;
    Statistics getStatistics() const;

    void setEntryCallback(EntryCallback callback);

    std::shared_ptr<Transcript> getTranscript() const { return transcript_; }

private:
    struct PendingSegment {
        uint64_t segment_id = 0;
        int64_t start_ms = 0;
        int64_t end_ms = 0;
        JoinState state = JoinState::WAITING_BOTH;
        Clock::time_point registered_at;
        std::optional<DiarizationResult> diarization;
        std::optional<TranscriptionResult> transcription;
    };

    /**
     * Build the utterance, insert it and mark the segment APPENDED.
     * Caller holds mutex_ and erases the pending entry afterwards.
     */
    TranscriptEntry appendLocked(PendingSegment& pending, bool forced);

    bool acceptResultLocked(uint64_t segment_id, const char* source, PendingSegment*& pending);
    size_t finalizeLocked(std::vector<TranscriptEntry>& appended,
                          const std::function<bool(const PendingSegment&)>& predicate);
    void notifyEntries(const std::vector<TranscriptEntry>& entries);

    std::shared_ptr<Transcript> transcript_;
    Config config_;

    mutable std::mutex mutex_;
    std::map<uint64_t, PendingSegment> pending_;
    std::unordered_map<uint64_t, JoinState> terminal_;
    Statistics stats_;

    std::mutex callback_mutex_;
    EntryCallback entry_callback_;
};

} // namespace core
} // namespace meetscribe
