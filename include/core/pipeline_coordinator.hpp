#pragma once

#include "audio/frame_buffer.hpp"
#include "audio/meeting_connector.hpp"
#include "audio/segmenter.hpp"
#include "core/archive_store.hpp"
#include "core/summarizer.hpp"
#include "core/transcript.hpp"
#include "core/transcript_assembler.hpp"
#include "diarization/diarization_worker.hpp"
#include "stt/transcription_worker.hpp"
#include "utils/config.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace meetscribe {
namespace core {

/**
 * Session lifecycle. RECONNECTING is a sub-state of STREAMING.
 */
enum class SessionState {
    IDLE,
    JOINING,
    STREAMING,
    RECONNECTING,
    DRAINING,
    CLOSED
};

enum class SessionOutcome {
    COMPLETED,
    COMPLETED_WITH_FAILURE,   // Fatal connector error after audio was captured
    EMPTY_SESSION_FAILURE     // Fatal connector error before any speech segment
};

std::string sessionStateToString(SessionState state);
std::string sessionOutcomeToString(SessionOutcome outcome);

struct PipelineStatistics {
    size_t frames_received = 0;
    size_t frames_rejected = 0;     // Arrived outside JOINING/STREAMING
    size_t frames_dropped = 0;      // Overwritten in the frame buffer
    size_t segments_sealed = 0;
    size_t segments_discarded = 0;
    size_t segments_submitted = 0;
    size_t utterances = 0;
    size_t forced_finalizations = 0;
    size_t gap_markers = 0;
    size_t disconnects = 0;
    size_t reconnects = 0;
    size_t checkpoints_written = 0;
    size_t diarization_degraded = 0;
    size_t transcription_degraded = 0;
    size_t backend_retries = 0;
};

/**
 * What a session hands back once it is CLOSED
 */
struct SessionReport {
    std::string session_id;
    SessionOutcome outcome = SessionOutcome::COMPLETED;
    std::string failure_reason;
    std::vector<TranscriptEntry> transcript;
    bool has_summary = false;
    MeetingSummary summary;
    PipelineStatistics stats;
    std::chrono::milliseconds duration{0};
};

/**
 * Runs one meeting session: joins through the connector, feeds frames
 * through buffer, segmenter and the two workers into the assembler, and on
 * stop or meeting end drains, archives and summarizes the transcript.
 *
 * Threads owned per session: segmentation (sole reader of the frame buffer
 * and sole user of the segmenter), sweeper (segment timeouts, reconnect
 * grace, checkpoints) and the drain thread. Coordinators share nothing, so
 * several sessions can run side by side.
 */
class PipelineCoordinator : public audio::ConnectorListener {
public:
    using StateChangeCallback = std::function<void(SessionState from, SessionState to)>;

    PipelineCoordinator(const utils::PipelineConfig& config,
                        std::shared_ptr<audio::MeetingConnector> connector,
                        std::shared_ptr<stt::SpeechToTextEngine> stt_engine,
                        std::shared_ptr<diarization::SpeakerRecognitionEngine> speaker_engine,
                        std::shared_ptr<ArchiveStore> archive = nullptr,
                        std::shared_ptr<Summarizer> summarizer = nullptr,
                        std::string session_id = "");
    ~PipelineCoordinator() override;

    PipelineCoordinator(const PipelineCoordinator&) = delete;
    PipelineCoordinator& operator=(const PipelineCoordinator&) = delete;

    /**
     * Join the meeting and start streaming. A fatal join error drains the
     * session immediately; the report then carries EMPTY_SESSION_FAILURE.
     * @return false if the session was already started or the join failed
     */
    bool start(const audio::MeetingInfo& meeting);

    /**
     * Drain and close the session. Must not be called from a connector
     * callback.
     */
    SessionReport stop();

    /**
     * Block until the session reaches CLOSED (meeting end, fatal error or
     * another thread's stop())
     */
    SessionReport waitUntilClosed();

    bool waitForState(SessionState state, std::chrono::milliseconds timeout);

    SessionState getState() const;
    const std::string& getSessionId() const { return session_id_; }

    std::vector<TranscriptEntry> getTranscriptSnapshot() const;
    PipelineStatistics getStatistics() const;

    void setStateChangeCallback(StateChangeCallback callback);

    /**
     * Live feed of entries as they are inserted into the transcript
     */
    void setEntryCallback(TranscriptAssembler::EntryCallback callback);

    // ConnectorListener
    void onAudioFrame(const audio::RawAudioChunk& chunk) override;
    void onDisconnected(const std::string& reason) override;
    void onReconnected() override;
    void onStreamEnded() override;
    void onFatalError(const std::string& message) override;

private:
    bool transitionState(std::initializer_list<SessionState> from, SessionState to);
    void queueStateChange(SessionState from, SessionState to);  // state_mutex_ held
    void deliverStateChanges();
    void requestDrain(const std::string& reason);
    void markFatal(const std::string& reason);

    void segmentationLoop();
    void suspendForReconnect(uint64_t boundary, audio::AudioFramePtr resumed = nullptr);
    void insertPendingGapMarker(std::chrono::steady_clock::time_point resumed_at);
    void handleSealedSegment(const audio::SegmentPtr& segment);

    void sweeperLoop();
    void writeCheckpoint();

    void drainSequence(std::string reason);
    bool waitUntil(std::chrono::steady_clock::time_point deadline, const std::function<bool()>& done);
    SessionOutcome determineOutcome() const;
    void closeSession(SessionReport report);

    const utils::PipelineConfig config_;
    const std::string session_id_;

    std::shared_ptr<audio::MeetingConnector> connector_;
    std::shared_ptr<ArchiveStore> archive_;
    std::shared_ptr<Summarizer> summarizer_;

    audio::FrameBuffer frame_buffer_;
    audio::Segmenter segmenter_;
    std::shared_ptr<Transcript> transcript_;
    std::unique_ptr<TranscriptAssembler> assembler_;
    std::unique_ptr<diarization::DiarizationWorker> diarization_;
    std::unique_ptr<stt::TranscriptionWorker> transcription_;

    // Session state
    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    SessionState state_;
    bool drain_requested_;
    bool fatal_;
    uint64_t disconnect_epoch_;     // Bumped on every STREAMING -> RECONNECTING
    uint64_t disconnect_sequence_;  // First frame sequence after the latest disconnect
    bool closed_;                   // CLOSED reached and its callback delivered
    std::string failure_reason_;
    std::chrono::steady_clock::time_point started_at_;
    std::chrono::steady_clock::time_point disconnected_at_;
    std::chrono::steady_clock::time_point reconnected_at_;
    SessionReport report_;

    std::mutex callback_mutex_;
    StateChangeCallback state_callback_;
    // Transitions are delivered in the order they happened, one at a time
    std::deque<std::pair<SessionState, SessionState>> pending_transitions_;
    std::recursive_mutex delivery_mutex_;

    // Segmentation thread only
    bool gap_pending_;
    uint64_t gap_marker_id_;
    int64_t gap_timestamp_ms_;
    std::chrono::steady_clock::time_point gap_started_at_;
    uint64_t handled_epoch_;

    std::thread segmentation_thread_;
    std::thread sweeper_thread_;
    std::thread drain_thread_;

    std::atomic<bool> segmentation_done_;
    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    bool sweeper_stop_;
    std::chrono::steady_clock::time_point last_checkpoint_;

    std::atomic<uint64_t> next_sequence_;
    std::atomic<size_t> frames_received_;
    std::atomic<size_t> frames_rejected_;
    std::atomic<size_t> segments_sealed_;
    std::atomic<size_t> segments_discarded_;
    std::atomic<size_t> segments_submitted_;
    std::atomic<size_t> disconnects_;
    std::atomic<size_t> reconnects_;
    std::atomic<size_t> checkpoints_written_;
};

} // namespace core
} // namespace meetscribe
