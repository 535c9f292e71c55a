#include "core/transcript_assembler.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace meetscribe {
namespace core {

std::string joinStateToString(JoinState state) {
    switch (state) {
        case JoinState::WAITING_BOTH: return "waiting_both";
        case JoinState::HAS_DIARIZATION: return "has_diarization";
        case JoinState::HAS_TRANSCRIPTION: return "has_transcription";
        case JoinState::JOINED: return "joined";
        case JoinState::APPENDED: return "appended";
        case JoinState::DROPPED: return "dropped";
    }
    return "unknown";
}

TranscriptAssembler::TranscriptAssembler(std::shared_ptr<Transcript> transcript, const Config& config)
    : transcript_(std::move(transcript))
    , config_(config) {
}

bool TranscriptAssembler::registerSegment(const audio::SegmentPtr& segment, Clock::time_point now) {
    if (!segment) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.count(segment->id) > 0 || terminal_.count(segment->id) > 0) {
        utils::Logger::warn("Segment " + std::to_string(segment->id) + " registered twice, ignoring");
        return false;
    }

    stats_.registered++;

    if (segment->discardable) {
        terminal_[segment->id] = JoinState::DROPPED;
        stats_.dropped++;
        utils::Logger::debug("Segment " + std::to_string(segment->id) + " dropped (voiced " +
                             std::to_string(segment->voicedMs) + "ms)");
        return true;
    }

    PendingSegment pending;
    pending.segment_id = segment->id;
    pending.start_ms = segment->startMs;
    pending.end_ms = segment->endMs;
    pending.registered_at = now;
    pending_.emplace(segment->id, std::move(pending));
    return true;
}

bool TranscriptAssembler::acceptResultLocked(uint64_t segment_id, const char* source,
                                             PendingSegment*& pending) {
    auto it = pending_.find(segment_id);
    if (it != pending_.end()) {
        pending = &it->second;
        return true;
    }

    if (terminal_.count(segment_id) > 0) {
        stats_.duplicates++;
        utils::Logger::debug(std::string("Ignoring late ") + source + " result for segment " +
                             std::to_string(segment_id));
    } else {
        stats_.unknown++;
        utils::Logger::warn(std::string("Ignoring ") + source + " result for unknown segment " +
                            std::to_string(segment_id));
    }
    return false;
}

void TranscriptAssembler::onDiarizationResult(const DiarizationResult& result) {
    std::vector<TranscriptEntry> appended;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        PendingSegment* pending = nullptr;
        if (!acceptResultLocked(result.segment_id, "diarization", pending)) {
            return;
        }
        if (pending->diarization) {
            stats_.duplicates++;
            return;
        }

        pending->diarization = result;
        if (pending->state == JoinState::HAS_TRANSCRIPTION) {
            pending->state = JoinState::JOINED;
            appended.push_back(appendLocked(*pending, false));
            pending_.erase(result.segment_id);
        } else {
            pending->state = JoinState::HAS_DIARIZATION;
        }
    }
    notifyEntries(appended);
}

void TranscriptAssembler::onTranscriptionResult(const TranscriptionResult& result) {
    std::vector<TranscriptEntry> appended;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        PendingSegment* pending = nullptr;
        if (!acceptResultLocked(result.segment_id, "transcription", pending)) {
            return;
        }
        if (pending->transcription) {
            stats_.duplicates++;
            return;
        }

        pending->transcription = result;
        if (pending->state == JoinState::HAS_DIARIZATION) {
            pending->state = JoinState::JOINED;
            appended.push_back(appendLocked(*pending, false));
            pending_.erase(result.segment_id);
        } else {
            pending->state = JoinState::HAS_TRANSCRIPTION;
        }
    }
    notifyEntries(appended);
}

TranscriptEntry TranscriptAssembler::appendLocked(PendingSegment& pending, bool forced) {
    TranscriptEntry entry;
    entry.kind = EntryKind::UTTERANCE;
    entry.segment_id = pending.segment_id;
    entry.start_ms = pending.start_ms;
    entry.end_ms = pending.end_ms;
    entry.forced = forced;

    if (pending.diarization) {
        entry.speaker_label = pending.diarization->speaker_label;
        entry.speaker_confidence = pending.diarization->confidence;
        entry.speaker_degraded = pending.diarization->degraded;
    } else {
        entry.speaker_label = UNKNOWN_SPEAKER_LABEL;
        entry.speaker_confidence = 0.0f;
        entry.speaker_degraded = true;
    }

    if (pending.transcription) {
        entry.text = pending.transcription->text;
        entry.confidence = pending.transcription->confidence;
        entry.words = pending.transcription->words;
        entry.text_degraded = pending.transcription->degraded;
    } else {
        entry.confidence = 0.0f;
        entry.text_degraded = true;
    }

    if (!transcript_->insert(entry)) {
        // Id already present means a gap marker or an earlier append took it
        utils::Logger::warn("Transcript already holds segment " + std::to_string(entry.segment_id));
    }

    pending.state = JoinState::APPENDED;
    terminal_[pending.segment_id] = JoinState::APPENDED;
    stats_.appended++;
    if (forced) {
        stats_.forced++;
    }
    return entry;
}

bool TranscriptAssembler::insertGapMarker(uint64_t id, int64_t timestamp_ms, int64_t gap_duration_ms) {
    TranscriptEntry marker;
    marker.kind = EntryKind::GAP_MARKER;
    marker.segment_id = id;
    marker.start_ms = timestamp_ms;
    marker.end_ms = timestamp_ms;
    marker.gap_duration_ms = gap_duration_ms;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_.count(id) > 0 || terminal_.count(id) > 0) {
            return false;
        }
        if (!transcript_->insert(marker)) {
            return false;
        }
        terminal_[id] = JoinState::APPENDED;
        stats_.gap_markers++;
    }

    utils::Logger::info("Inserted gap marker " + std::to_string(id) + " at " +
                        std::to_string(timestamp_ms) + "ms (" + std::to_string(gap_duration_ms) +
                        "ms outage)");
    notifyEntries({marker});
    return true;
}

size_t TranscriptAssembler::finalizeLocked(std::vector<TranscriptEntry>& appended,
                                           const std::function<bool(const PendingSegment&)>& predicate) {
    size_t count = 0;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (!predicate(it->second)) {
            ++it;
            continue;
        }
        appended.push_back(appendLocked(it->second, true));
        it = pending_.erase(it);
        count++;
    }
    return count;
}

size_t TranscriptAssembler::expireStale(Clock::time_point now) {
    std::vector<TranscriptEntry> appended;
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto cutoff = config_.completion_timeout;
        count = finalizeLocked(appended, [now, cutoff](const PendingSegment& pending) {
            return now - pending.registered_at >= cutoff;
        });
    }

    for (const auto& entry : appended) {
        utils::ErrorInfo error(utils::ErrorCategory::SEGMENT_TIMEOUT, utils::ErrorSeverity::WARNING,
                               "Segment " + std::to_string(entry.segment_id) + " timed out",
                               std::string("speaker_missing=") + (entry.speaker_degraded ? "true" : "false") +
                               " text_missing=" + (entry.text_degraded ? "true" : "false"),
                               "TranscriptAssembler::expireStale", config_.session_id);
        utils::ErrorHandler::getInstance().reportError(error);
    }

    notifyEntries(appended);
    return count;
}

size_t TranscriptAssembler::forceFinalizeAll(const std::string& reason) {
    std::vector<TranscriptEntry> appended;
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        count = finalizeLocked(appended, [](const PendingSegment&) { return true; });
    }

    if (count > 0) {
        utils::Logger::warn("Force-finalized " + std::to_string(count) + " pending segments (" + reason + ")");
    }
    notifyEntries(appended);
    return count;
}

size_t TranscriptAssembler::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::optional<JoinState> TranscriptAssembler::getState(uint64_t segment_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(segment_id);
    if (it != pending_.end()) {
        return it->second.state;
    }
    auto terminal = terminal_.find(segment_id);
    if (terminal != terminal_.end()) {
        return terminal->second;
    }
    return std::nullopt;
}

TranscriptAssembler::Statistics TranscriptAssembler::getStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statistics stats = stats_;
    stats.pending = pending_.size();
    return stats;
}

void TranscriptAssembler::setEntryCallback(EntryCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    entry_callback_ = std::move(callback);
}

void TranscriptAssembler::notifyEntries(const std::vector<TranscriptEntry>& entries) {
    if (entries.empty()) {
        return;
    }

    EntryCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = entry_callback_;
    }
    if (!callback) {
        return;
    }

    for (const auto& entry : entries) {
        try {
            callback(entry);
        } catch (const std::exception& e) {
            utils::Logger::error("Transcript entry callback failed: " + std::string(e.what()));
        }
    }
}

} // namespace core
} // namespace meetscribe
