#pragma once

#include "audio/meeting_connector.hpp"
#include "core/summarizer.hpp"
#include "diarization/speaker_recognition_engine.hpp"
#include "stt/speech_to_text_engine.hpp"
#include "utils/error_handler.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fixtures {

/**
 * How a scripted backend answers one segment id
 */
struct ScriptedBehavior {
    int transientFailures = 0;      // Fail this many attempts, then succeed
    bool alwaysFail = false;        // Transient failure on every attempt
    bool permanentFailure = false;
    bool throwInsteadOfReturn = false;
    bool ignoreCancellation = false;
    std::chrono::milliseconds delay{0};
};

/**
 * Per-segment behavior table plus call bookkeeping shared by the scripted
 * engines
 */
class ScriptedBehaviorTable {
public:
    void setBehavior(uint64_t segment_id, const ScriptedBehavior& behavior) {
        std::lock_guard<std::mutex> lock(mutex_);
        behaviors_[segment_id] = behavior;
    }

    void setDefaultBehavior(const ScriptedBehavior& behavior) {
        std::lock_guard<std::mutex> lock(mutex_);
        default_ = behavior;
    }

    int attempts(uint64_t segment_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = attempts_.find(segment_id);
        return it == attempts_.end() ? 0 : it->second;
    }

    size_t totalCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_calls_;
    }

    std::vector<uint64_t> completionOrder() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return completions_;
    }

    std::vector<size_t> audioSizes(uint64_t segment_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = audio_sizes_.find(segment_id);
        return it == audio_sizes_.end() ? std::vector<size_t>{} : it->second;
    }

protected:
    /**
     * Apply the scripted behavior for one call.
     * @return the failure to report, or OK to proceed with a success payload
     */
    meetscribe::core::BackendStatus runScript(const meetscribe::core::SpeechRequest& request,
                                              const meetscribe::core::CancellationToken& token,
                                              std::string& error) {
        ScriptedBehavior behavior;
        int attempt = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = behaviors_.find(request.segmentId);
            behavior = it == behaviors_.end() ? default_ : it->second;
            attempt = ++attempts_[request.segmentId];
            total_calls_++;
            audio_sizes_[request.segmentId].push_back(request.audio.size());
        }

        if (behavior.delay.count() > 0) {
            if (behavior.ignoreCancellation) {
                std::this_thread::sleep_for(behavior.delay);
            } else if (token.waitFor(behavior.delay)) {
                return meetscribe::core::BackendStatus::CANCELLED;
            }
        }

        meetscribe::core::BackendStatus status = meetscribe::core::BackendStatus::OK;
        if (behavior.permanentFailure) {
            status = meetscribe::core::BackendStatus::PERMANENT_FAILURE;
            error = "rejected segment " + std::to_string(request.segmentId);
        } else if (behavior.alwaysFail || attempt <= behavior.transientFailures) {
            status = meetscribe::core::BackendStatus::TRANSIENT_FAILURE;
            error = "backend unavailable (attempt " + std::to_string(attempt) + ")";
        }

        if (status != meetscribe::core::BackendStatus::OK && behavior.throwInsteadOfReturn) {
            throw meetscribe::utils::BackendException(
                error, status == meetscribe::core::BackendStatus::PERMANENT_FAILURE);
        }

        if (status == meetscribe::core::BackendStatus::OK) {
            std::lock_guard<std::mutex> lock(mutex_);
            completions_.push_back(request.segmentId);
        }
        return status;
    }

    template <typename T>
    static meetscribe::core::BackendResult<T> failure(meetscribe::core::BackendStatus status,
                                                      const std::string& error) {
        switch (status) {
            case meetscribe::core::BackendStatus::CANCELLED:
                return meetscribe::core::BackendResult<T>::cancelled();
            case meetscribe::core::BackendStatus::PERMANENT_FAILURE:
                return meetscribe::core::BackendResult<T>::permanentFailure(error);
            default:
                return meetscribe::core::BackendResult<T>::transientFailure(error);
        }
    }

private:
    mutable std::mutex mutex_;
    ScriptedBehavior default_;
    std::map<uint64_t, ScriptedBehavior> behaviors_;
    std::map<uint64_t, int> attempts_;
    std::map<uint64_t, std::vector<size_t>> audio_sizes_;
    std::vector<uint64_t> completions_;
    size_t total_calls_ = 0;
};

class ScriptedSpeechEngine : public meetscribe::stt::SpeechToTextEngine, public ScriptedBehaviorTable {
public:
    meetscribe::core::BackendResult<meetscribe::stt::TranscriptionPayload> transcribe(
        const meetscribe::core::SpeechRequest& request,
        const meetscribe::core::CancellationToken& token) override {
        std::string error;
        auto status = runScript(request, token, error);
        if (status != meetscribe::core::BackendStatus::OK) {
            return failure<meetscribe::stt::TranscriptionPayload>(status, error);
        }

        meetscribe::stt::TranscriptionPayload payload;
        payload.text = textFor(request.segmentId);
        payload.confidence = 0.9f;
        payload.words.emplace_back("utterance", request.startMs, request.endMs, 0.9f);
        return meetscribe::core::BackendResult<meetscribe::stt::TranscriptionPayload>::success(payload);
    }

    std::string getEngineName() const override { return "scripted-stt"; }

    static std::string textFor(uint64_t segment_id) {
        return "utterance " + std::to_string(segment_id);
    }
};

class ScriptedSpeakerEngine : public meetscribe::diarization::SpeakerRecognitionEngine,
                              public ScriptedBehaviorTable {
public:
    meetscribe::core::BackendResult<meetscribe::diarization::SpeakerPayload> identifySpeaker(
        const meetscribe::core::SpeechRequest& request,
        const meetscribe::core::CancellationToken& token) override {
        std::string error;
        auto status = runScript(request, token, error);
        if (status != meetscribe::core::BackendStatus::OK) {
            return failure<meetscribe::diarization::SpeakerPayload>(status, error);
        }

        meetscribe::diarization::SpeakerPayload payload;
        payload.speakerLabel = labelFor(request.segmentId);
        payload.confidence = 0.8f;
        return meetscribe::core::BackendResult<meetscribe::diarization::SpeakerPayload>::success(payload);
    }

    std::string getEngineName() const override { return "scripted-speaker"; }

    static std::string labelFor(uint64_t segment_id) {
        return segment_id % 2 == 1 ? "speaker_A" : "speaker_B";
    }
};

/**
 * Connector driven by the test thread. Listener calls are serialized with
 * leave(), so nothing reaches the pipeline after it has left.
 */
class ScriptedConnector : public meetscribe::audio::MeetingConnector {
public:
    void failJoinWith(const std::string& message) { join_error_ = message; }

    void join(const meetscribe::audio::MeetingInfo& meeting,
              meetscribe::audio::ConnectorListener& listener) override {
        joins_++;
        if (!join_error_.empty()) {
            throw meetscribe::utils::FatalConnectorException(join_error_);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        meeting_ = meeting;
        listener_ = &listener;
    }

    void leave() override {
        std::lock_guard<std::mutex> lock(mutex_);
        listener_ = nullptr;
        leaves_++;
    }

    std::string getPlatformName() const override { return "scripted"; }

    bool deliver(const meetscribe::audio::RawAudioChunk& chunk) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!listener_) {
            return false;
        }
        listener_->onAudioFrame(chunk);
        return true;
    }

    size_t deliverAll(const std::vector<meetscribe::audio::RawAudioChunk>& chunks) {
        size_t delivered = 0;
        for (const auto& chunk : chunks) {
            if (deliver(chunk)) {
                delivered++;
            }
        }
        return delivered;
    }

    void disconnect(const std::string& reason = "network lost") {
        std::lock_guard<std::mutex> lock(mutex_);
        if (listener_) {
            listener_->onDisconnected(reason);
        }
    }

    void reconnect() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (listener_) {
            listener_->onReconnected();
        }
    }

    void endStream() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (listener_) {
            listener_->onStreamEnded();
        }
    }

    void fail(const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (listener_) {
            listener_->onFatalError(message);
        }
    }

    int joins() const { return joins_.load(); }
    int leaves() const { return leaves_.load(); }

private:
    std::mutex mutex_;
    meetscribe::audio::ConnectorListener* listener_ = nullptr;
    meetscribe::audio::MeetingInfo meeting_;
    std::string join_error_;
    std::atomic<int> joins_{0};
    std::atomic<int> leaves_{0};
};

/**
 * Counts utterances per speaker
 */
class CountingSummarizer : public meetscribe::core::Summarizer {
public:
    meetscribe::core::MeetingSummary summarize(
        const std::string& session_id,
        const std::vector<meetscribe::core::TranscriptEntry>& transcript) override {
        calls_++;
        meetscribe::core::MeetingSummary summary;
        size_t utterances = 0;
        for (const auto& entry : transcript) {
            if (!entry.isGapMarker()) {
                utterances++;
            }
        }
        summary.notes = session_id + ": " + std::to_string(utterances) + " utterances";
        summary.action_items.push_back("review " + session_id);
        return summary;
    }

    int calls() const { return calls_.load(); }

private:
    std::atomic<int> calls_{0};
};

} // namespace fixtures
