#include "core/pipeline_coordinator.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <random>
#include <sstream>

namespace meetscribe {
namespace core {

namespace {

constexpr std::chrono::milliseconds kFramePollInterval{50};
constexpr std::chrono::milliseconds kDrainPollInterval{10};
constexpr std::chrono::milliseconds kCancelSettleTimeout{500};

std::string generateSessionId() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << "session_";
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    return ss.str();
}

const utils::PipelineConfig& validated(const utils::PipelineConfig& config) {
    auto validation = utils::ConfigLoader::validate(config);
    if (!validation.isValid) {
        std::string joined;
        for (const auto& error : validation.errors) {
            joined += (joined.empty() ? "" : "; ") + error;
        }
        throw utils::ConfigException("Invalid pipeline configuration", joined);
    }
    return config;
}

audio::Segmenter::Config segmenterConfigFrom(const utils::PipelineConfig& config) {
    audio::Segmenter::Config segmenter;
    segmenter.silenceGapMs = config.silenceGapMs;
    segmenter.maxSegmentMs = config.maxSegmentMs;
    segmenter.minSegmentMs = config.minSegmentMs;
    segmenter.vad.energyThreshold = config.vadEnergyThreshold;
    segmenter.vad.useAdaptiveThreshold = config.adaptiveVad;
    return segmenter;
}

SegmentWorkerConfig workerConfigFrom(const utils::PipelineConfig& config, const std::string& name,
                                     const std::string& session_id, size_t parallelism) {
    SegmentWorkerConfig worker;
    worker.name = name;
    worker.session_id = session_id;
    worker.parallelism = parallelism;
    worker.max_pending = config.maxPendingSegments;
    worker.retry = config.retry;
    return worker;
}

} // namespace

std::string sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::IDLE: return "idle";
        case SessionState::JOINING: return "joining";
        case SessionState::STREAMING: return "streaming";
        case SessionState::RECONNECTING: return "reconnecting";
        case SessionState::DRAINING: return "draining";
        case SessionState::CLOSED: return "closed";
    }
    return "unknown";
}

std::string sessionOutcomeToString(SessionOutcome outcome) {
    switch (outcome) {
        case SessionOutcome::COMPLETED: return "completed";
        case SessionOutcome::COMPLETED_WITH_FAILURE: return "completed_with_failure";
        case SessionOutcome::EMPTY_SESSION_FAILURE: return "empty_session_failure";
    }
    return "unknown";
}

PipelineCoordinator::PipelineCoordinator(const utils::PipelineConfig& config,
                                         std::shared_ptr<audio::MeetingConnector> connector,
                                         std::shared_ptr<stt::SpeechToTextEngine> stt_engine,
                                         std::shared_ptr<diarization::SpeakerRecognitionEngine> speaker_engine,
                                         std::shared_ptr<ArchiveStore> archive,
                                         std::shared_ptr<Summarizer> summarizer,
                                         std::string session_id)
    : config_(validated(config))
    , session_id_(session_id.empty() ? generateSessionId() : std::move(session_id))
    , connector_(std::move(connector))
    , archive_(std::move(archive))
    , summarizer_(std::move(summarizer))
    , frame_buffer_(config.frameBufferCapacity)
    , segmenter_(segmenterConfigFrom(config))
    , transcript_(std::make_shared<Transcript>(session_id_))
    , state_(SessionState::IDLE)
    , drain_requested_(false)
    , fatal_(false)
    , disconnect_epoch_(0)
    , disconnect_sequence_(0)
    , closed_(false)
    , gap_pending_(false)
    , gap_marker_id_(0)
    , gap_timestamp_ms_(0)
    , handled_epoch_(0)
    , segmentation_done_(false)
    , sweeper_stop_(false)
    , next_sequence_(1)
    , frames_received_(0)
    , frames_rejected_(0)
    , segments_sealed_(0)
    , segments_discarded_(0)
    , segments_submitted_(0)
    , disconnects_(0)
    , reconnects_(0)
    , checkpoints_written_(0) {
    if (!connector_) {
        throw utils::ConfigException("PipelineCoordinator requires a meeting connector");
    }

    TranscriptAssembler::Config assembler_config;
    assembler_config.completion_timeout = config_.segmentCompletionTimeout;
    assembler_config.session_id = session_id_;
    assembler_ = std::make_unique<TranscriptAssembler>(transcript_, assembler_config);

    diarization_ = std::make_unique<diarization::DiarizationWorker>(
        std::move(speaker_engine),
        workerConfigFrom(
            config_, "diarization", session_id_, config_.diarizationParallelism));
    transcription_ = std::make_unique<stt::TranscriptionWorker>(
        std::move(stt_engine),
        workerConfigFrom(
            config_, "transcription", session_id_, config_.transcriptionParallelism));

    diarization_->setResultCallback([this](const DiarizationResult& result) {
        assembler_->onDiarizationResult(result);
    });
    transcription_->setResultCallback([this](const TranscriptionResult& result) {
        assembler_->onTranscriptionResult(result);
    });

    segmenter_.setSegmentCallback([this](const audio::SegmentPtr& segment) {
        handleSealedSegment(segment);
    });

    const std::string sid = session_id_;
    frame_buffer_.setDropCallback([sid](const audio::FrameDroppedEvent& event) {
        utils::Logger::warn("Session " + sid + ": frame " + std::to_string(event.sequenceNumber) +
                            " (t=" + std::to_string(event.captureTimestampMs) + "ms) dropped, buffer full");
    });
}

PipelineCoordinator::~PipelineCoordinator() {
    const SessionState state = getState();
    if (state != SessionState::IDLE && state != SessionState::CLOSED) {
        stop();
    }

    std::thread drain;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        drain = std::move(drain_thread_);
    }
    if (drain.joinable()) {
        drain.join();
    }
    if (segmentation_thread_.joinable()) {
        segmentation_thread_.join();
    }
    if (sweeper_thread_.joinable()) {
        sweeper_thread_.join();
    }
}

bool PipelineCoordinator::start(const audio::MeetingInfo& meeting) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != SessionState::IDLE) {
            utils::Logger::warn("Session " + session_id_ + " already started");
            return false;
        }
        state_ = SessionState::JOINING;
        started_at_ = std::chrono::steady_clock::now();
        queueStateChange(SessionState::IDLE, SessionState::JOINING);
    }
    deliverStateChanges();

    utils::Logger::info("Session " + session_id_ + " joining " + meeting.meetingUrl + " on " +
                        meeting.platform + " via " + connector_->getPlatformName());

    diarization_->start();
    transcription_->start();
    last_checkpoint_ = std::chrono::steady_clock::now();
    segmentation_thread_ = std::thread(&PipelineCoordinator::segmentationLoop, this);
    sweeper_thread_ = std::thread(&PipelineCoordinator::sweeperLoop, this);

    try {
        connector_->join(meeting, *this);
    } catch (const utils::FatalConnectorException& e) {
        markFatal(std::string("join rejected: ") + e.what());
        requestDrain("join failed");
        return false;
    } catch (const std::exception& e) {
        markFatal(std::string("join failed: ") + e.what());
        requestDrain("join failed");
        return false;
    }

    transitionState({SessionState::JOINING}, SessionState::STREAMING);
    return true;
}

SessionReport PipelineCoordinator::stop() {
    requestDrain("stop requested");
    return waitUntilClosed();
}

SessionReport PipelineCoordinator::waitUntilClosed() {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait(lock, [this] { return closed_; });
    return report_;
}

bool PipelineCoordinator::waitForState(SessionState state, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return state_cv_.wait_for(lock, timeout, [this, state] {
        return state_ == state && (state != SessionState::CLOSED || closed_);
    });
}

SessionState PipelineCoordinator::getState() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::vector<TranscriptEntry> PipelineCoordinator::getTranscriptSnapshot() const {
    return transcript_->snapshot();
}

PipelineStatistics PipelineCoordinator::getStatistics() const {
    PipelineStatistics stats;
    stats.frames_received = frames_received_.load();
    stats.frames_rejected = frames_rejected_.load();
    stats.frames_dropped = frame_buffer_.getStatistics().dropped;
    stats.segments_sealed = segments_sealed_.load();
    stats.segments_discarded = segments_discarded_.load();
    stats.segments_submitted = segments_submitted_.load();

    const auto assembler = assembler_->getStatistics();
    stats.utterances = assembler.appended;
    stats.forced_finalizations = assembler.forced;
    stats.gap_markers = assembler.gap_markers;

    stats.disconnects = disconnects_.load();
    stats.reconnects = reconnects_.load();
    stats.checkpoints_written = checkpoints_written_.load();

    const auto diarization = diarization_->getStatistics();
    const auto transcription = transcription_->getStatistics();
    stats.diarization_degraded = diarization.degraded;
    stats.transcription_degraded = transcription.degraded;
    stats.backend_retries = diarization.retries + transcription.retries;
    return stats;
}

void PipelineCoordinator::setStateChangeCallback(StateChangeCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    state_callback_ = std::move(callback);
}

void PipelineCoordinator::setEntryCallback(TranscriptAssembler::EntryCallback callback) {
    assembler_->setEntryCallback(std::move(callback));
}

// Connector events

void PipelineCoordinator::onAudioFrame(const audio::RawAudioChunk& chunk) {
    if (chunk.samples.empty()) {
        return;
    }

    const int rate = chunk.sampleRate > 0 ? chunk.sampleRate : config_.sampleRate;
    int64_t duration = chunk.durationMs;
    if (duration <= 0) {
        duration = static_cast<int64_t>(chunk.samples.size()) * 1000 / rate;
    }

    // Pushed under the state lock so no frame slips in after a transition
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != SessionState::JOINING && state_ != SessionState::STREAMING) {
        frames_rejected_++;
        return;
    }

    auto frame = std::make_shared<const audio::AudioFrame>(
        next_sequence_++, chunk.samples, rate, chunk.captureTimestampMs, duration);
    frames_received_++;
    frame_buffer_.push(std::move(frame));
}

void PipelineCoordinator::onDisconnected(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != SessionState::STREAMING) {
            utils::Logger::debug("Session " + session_id_ + ": disconnect ignored in state " +
                                 sessionStateToString(state_));
            return;
        }
        state_ = SessionState::RECONNECTING;
        disconnected_at_ = std::chrono::steady_clock::now();
        disconnect_epoch_++;
        disconnect_sequence_ = next_sequence_.load();
        queueStateChange(SessionState::STREAMING, SessionState::RECONNECTING);
    }
    state_cv_.notify_all();
    disconnects_++;

    utils::ErrorInfo error(utils::ErrorCategory::STREAM_DISCONNECT, utils::ErrorSeverity::WARNING,
                           "Audio stream disconnected", reason, "PipelineCoordinator", session_id_);
    utils::ErrorHandler::getInstance().reportError(error);
    deliverStateChanges();
}

void PipelineCoordinator::onReconnected() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != SessionState::RECONNECTING) {
            utils::Logger::debug("Session " + session_id_ + ": reconnect ignored in state " +
                                 sessionStateToString(state_));
            return;
        }
        state_ = SessionState::STREAMING;
        reconnected_at_ = std::chrono::steady_clock::now();
        queueStateChange(SessionState::RECONNECTING, SessionState::STREAMING);
    }
    state_cv_.notify_all();
    reconnects_++;
    deliverStateChanges();
}

void PipelineCoordinator::onStreamEnded() {
    utils::Logger::info("Session " + session_id_ + ": meeting ended");
    requestDrain("meeting ended");
}

void PipelineCoordinator::onFatalError(const std::string& message) {
    markFatal(message);
    requestDrain("fatal connector error");
}

// State handling

bool PipelineCoordinator::transitionState(std::initializer_list<SessionState> from, SessionState to) {
    SessionState previous;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        bool allowed = false;
        for (auto candidate : from) {
            if (state_ == candidate) {
                allowed = true;
                break;
            }
        }
        if (!allowed) {
            return false;
        }
        previous = state_;
        state_ = to;
        queueStateChange(previous, to);
    }
    state_cv_.notify_all();
    deliverStateChanges();
    return true;
}

void PipelineCoordinator::queueStateChange(SessionState from, SessionState to) {
    pending_transitions_.emplace_back(from, to);
}

void PipelineCoordinator::deliverStateChanges() {
    std::lock_guard<std::recursive_mutex> delivery(delivery_mutex_);
    while (true) {
        std::pair<SessionState, SessionState> transition;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (pending_transitions_.empty()) {
                return;
            }
            transition = pending_transitions_.front();
            pending_transitions_.pop_front();
        }

        utils::Logger::info("Session " + session_id_ + ": " + sessionStateToString(transition.first) +
                            " -> " + sessionStateToString(transition.second));

        StateChangeCallback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = state_callback_;
        }
        if (callback) {
            try {
                callback(transition.first, transition.second);
            } catch (const std::exception& e) {
                utils::Logger::error("State change callback failed: " + std::string(e.what()));
            }
        }
    }
}

void PipelineCoordinator::markFatal(const std::string& reason) {
    utils::ErrorInfo error(utils::ErrorCategory::FATAL_CONNECTOR, utils::ErrorSeverity::ERROR,
                           "Fatal connector error", reason, "PipelineCoordinator", session_id_);
    utils::ErrorHandler::getInstance().reportError(error);

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!fatal_) {
        fatal_ = true;
        failure_reason_ = reason;
    }
}

void PipelineCoordinator::requestDrain(const std::string& reason) {
    bool closed_directly = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (drain_requested_ || state_ == SessionState::CLOSED) {
            return;
        }
        drain_requested_ = true;

        if (state_ == SessionState::IDLE) {
            // Never started: nothing to drain
            state_ = SessionState::CLOSED;
            report_.session_id = session_id_;
            report_.outcome = SessionOutcome::COMPLETED;
            queueStateChange(SessionState::IDLE, SessionState::CLOSED);
            closed_directly = true;
        } else {
            // Queued before the drain thread exists, so DRAINING is delivered before CLOSED
            queueStateChange(state_, SessionState::DRAINING);
            state_ = SessionState::DRAINING;
            drain_thread_ = std::thread(&PipelineCoordinator::drainSequence, this, reason);
        }
    }
    state_cv_.notify_all();
    deliverStateChanges();

    if (closed_directly) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            closed_ = true;
        }
        state_cv_.notify_all();
    }
}

// Segmentation thread

void PipelineCoordinator::segmentationLoop() {
    while (true) {
        SessionState state;
        uint64_t epoch;
        uint64_t boundary;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state = state_;
            epoch = disconnect_epoch_;
            boundary = disconnect_sequence_;
        }

        if (epoch != handled_epoch_) {
            handled_epoch_ = epoch;
            suspendForReconnect(boundary);
        }

        if (state == SessionState::DRAINING || state == SessionState::CLOSED) {
            break;
        }

        if (state == SessionState::RECONNECTING) {
            std::unique_lock<std::mutex> lock(state_mutex_);
            state_cv_.wait_for(lock, kFramePollInterval,
                               [this] { return state_ != SessionState::RECONNECTING; });
            continue;
        }

        if (gap_pending_) {
            std::chrono::steady_clock::time_point resumed_at;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                resumed_at = reconnected_at_;
            }
            insertPendingGapMarker(resumed_at);
        }

        auto frame = frame_buffer_.pop(kFramePollInterval);
        if (!frame) {
            continue;
        }

        // Disconnect and reconnect can both happen while pop() waits
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            epoch = disconnect_epoch_;
            boundary = disconnect_sequence_;
        }
        if (epoch != handled_epoch_ && frame->sequenceNumber >= boundary) {
            handled_epoch_ = epoch;
            suspendForReconnect(boundary, frame);
            continue;
        }
        segmenter_.processFrame(frame);
    }

    // Draining: the buffer is closed once the connector has left
    while (true) {
        auto frame = frame_buffer_.pop(kFramePollInterval);
        if (frame) {
            segmenter_.processFrame(frame);
            continue;
        }
        if (frame_buffer_.isClosed() && frame_buffer_.empty()) {
            break;
        }
    }

    segmenter_.flush(audio::SealReason::STREAM_CLOSED);
    if (gap_pending_) {
        // Session ended while reconnecting: the outage lasted until now
        insertPendingGapMarker(std::chrono::steady_clock::now());
    }

    const auto stats = segmenter_.getStatistics();
    utils::Logger::info("Session " + session_id_ + ": segmentation finished, " +
                        std::to_string(stats.framesProcessed) + " frames, " +
                        std::to_string(stats.segmentsSealed) + " segments");
    segmentation_done_ = true;
}

void PipelineCoordinator::suspendForReconnect(uint64_t boundary, audio::AudioFramePtr resumed) {
    // Frames that arrived before the disconnect still belong to the open segment
    while (!resumed) {
        auto frame = frame_buffer_.tryPop();
        if (!frame) {
            break;
        }
        if (frame->sequenceNumber >= boundary) {
            resumed = frame;
            break;
        }
        segmenter_.processFrame(frame);
    }
    segmenter_.flush(audio::SealReason::DISCONNECTED);

    if (!gap_pending_) {
        gap_marker_id_ = segmenter_.reserveId();
        gap_timestamp_ms_ = segmenter_.timelineHighWaterMs();
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            gap_started_at_ = disconnected_at_;
        }
        gap_pending_ = true;
    }
    segmenter_.markDiscontinuity();

    // Already reconnected before this thread caught up
    if (resumed) {
        segmenter_.processFrame(resumed);
    }
}

void PipelineCoordinator::insertPendingGapMarker(std::chrono::steady_clock::time_point resumed_at) {
    auto gap = std::chrono::duration_cast<std::chrono::milliseconds>(resumed_at - gap_started_at_);
    assembler_->insertGapMarker(gap_marker_id_, gap_timestamp_ms_, std::max<int64_t>(0, gap.count()));
    gap_pending_ = false;
}

void PipelineCoordinator::handleSealedSegment(const audio::SegmentPtr& segment) {
    segments_sealed_++;
    assembler_->registerSegment(segment);

    if (segment->discardable) {
        segments_discarded_++;
        return;
    }

    segments_submitted_++;
    diarization_->submit(segment);
    transcription_->submit(segment);
}

// Sweeper thread

void PipelineCoordinator::sweeperLoop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(sweeper_mutex_);
            sweeper_cv_.wait_for(lock, config_.sweepInterval, [this] { return sweeper_stop_; });
            if (sweeper_stop_) {
                break;
            }
        }

        const auto now = std::chrono::steady_clock::now();
        assembler_->expireStale(now);

        bool grace_expired = false;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            grace_expired = state_ == SessionState::RECONNECTING &&
                            now - disconnected_at_ >= config_.reconnectGrace;
        }
        if (grace_expired) {
            utils::Logger::warn("Session " + session_id_ + ": no reconnect within " +
                                std::to_string(config_.reconnectGrace.count()) + "ms, closing session");
            requestDrain("reconnect grace period expired");
        }

        if (archive_ && config_.checkpointInterval.count() > 0 &&
            now - last_checkpoint_ >= config_.checkpointInterval) {
            writeCheckpoint();
            last_checkpoint_ = now;
        }
    }
}

void PipelineCoordinator::writeCheckpoint() {
    try {
        archive_->writeTranscript(session_id_, transcript_->snapshot(), false);
        checkpoints_written_++;
    } catch (const std::exception& e) {
        utils::ErrorInfo error(utils::ErrorCategory::ARCHIVE, utils::ErrorSeverity::WARNING,
                               "Checkpoint write failed", e.what(), "PipelineCoordinator::writeCheckpoint",
                               session_id_);
        utils::ErrorHandler::getInstance().reportError(error);
    }
}

// Drain thread

bool PipelineCoordinator::waitUntil(std::chrono::steady_clock::time_point deadline,
                                    const std::function<bool()>& done) {
    while (!done()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return done();
        }
        std::this_thread::sleep_for(kDrainPollInterval);
    }
    return true;
}

void PipelineCoordinator::drainSequence(std::string reason) {
    utils::Logger::info("Session " + session_id_ + " draining: " + reason);

    const auto deadline = std::chrono::steady_clock::now() + config_.drainTimeout;

    try {
        connector_->leave();
    } catch (const std::exception& e) {
        utils::Logger::warn("Session " + session_id_ + ": connector leave failed: " + e.what());
    }
    frame_buffer_.close();

    // Segmentation can be held up by a full worker queue
    if (!waitUntil(deadline, [this] { return segmentation_done_.load(); })) {
        utils::Logger::warn("Session " + session_id_ + ": segmentation still busy at drain timeout, "
                            "cancelling backend calls");
        diarization_->cancel();
        transcription_->cancel();
    }
    if (segmentation_thread_.joinable()) {
        segmentation_thread_.join();
    }

    auto settled = [this] {
        return assembler_->pendingCount() == 0 && diarization_->outstanding() == 0 &&
               transcription_->outstanding() == 0;
    };

    bool done = waitUntil(deadline, settled);
    if (!done) {
        utils::Logger::warn("Session " + session_id_ + ": " + std::to_string(assembler_->pendingCount()) +
                            " segments pending at drain timeout, allowing " +
                            std::to_string(config_.cancelGrace.count()) + "ms for in-flight calls");
        done = waitUntil(std::chrono::steady_clock::now() + config_.cancelGrace, settled);
    }
    if (!done) {
        diarization_->cancel();
        transcription_->cancel();
        waitUntil(std::chrono::steady_clock::now() + kCancelSettleTimeout, settled);
    }

    assembler_->forceFinalizeAll("session drain");

    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        sweeper_stop_ = true;
    }
    sweeper_cv_.notify_all();
    if (sweeper_thread_.joinable()) {
        sweeper_thread_.join();
    }

    diarization_->stop();
    transcription_->stop();

    SessionReport report;
    report.session_id = session_id_;
    report.transcript = transcript_->snapshot();
    report.outcome = determineOutcome();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        report.failure_reason = failure_reason_;
        report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at_);
    }

    if (archive_) {
        try {
            archive_->writeTranscript(session_id_, report.transcript, true);
        } catch (const std::exception& e) {
            utils::ErrorInfo error(utils::ErrorCategory::ARCHIVE, utils::ErrorSeverity::ERROR,
                                   "Final transcript write failed", e.what(),
                                   "PipelineCoordinator::drainSequence", session_id_);
            utils::ErrorHandler::getInstance().reportError(error);
        }
    }

    if (summarizer_ && report.outcome != SessionOutcome::EMPTY_SESSION_FAILURE) {
        try {
            report.summary = summarizer_->summarize(session_id_, report.transcript);
            report.has_summary = true;
        } catch (const std::exception& e) {
            utils::ErrorInfo error(utils::ErrorCategory::SUMMARIZER, utils::ErrorSeverity::ERROR,
                                   "Summarizer failed", e.what(), "PipelineCoordinator::drainSequence",
                                   session_id_);
            utils::ErrorHandler::getInstance().reportError(error);
        }
    }

    report.stats = getStatistics();
    utils::Logger::info("Session " + session_id_ + " closed: " + sessionOutcomeToString(report.outcome) +
                        ", " + std::to_string(report.transcript.size()) + " transcript entries");
    closeSession(std::move(report));
}

SessionOutcome PipelineCoordinator::determineOutcome() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!fatal_) {
        return SessionOutcome::COMPLETED;
    }
    return segments_sealed_.load() == 0 ? SessionOutcome::EMPTY_SESSION_FAILURE
                                        : SessionOutcome::COMPLETED_WITH_FAILURE;
}

void PipelineCoordinator::closeSession(SessionReport report) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        report_ = std::move(report);
        queueStateChange(state_, SessionState::CLOSED);
        state_ = SessionState::CLOSED;
    }
    state_cv_.notify_all();

    // Waiters are released only after observers have seen CLOSED
    deliverStateChanges();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        closed_ = true;
    }
    state_cv_.notify_all();
}

} // namespace core
} // namespace meetscribe
