#pragma once

#include "audio/segment.hpp"
#include "core/backend_result.hpp"
#include "core/cancellation.hpp"
#include "core/retry_policy.hpp"
#include "core/speech_request.hpp"
#include "core/task_queue.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace meetscribe {
namespace core {

/**
 * Settings shared by every segment worker, whatever its backend
 */
struct SegmentWorkerConfig {
    std::string name = "worker";
    std::string session_id;
    size_t parallelism = 2;
    size_t max_pending = 64;
    utils::RetrySettings retry;
};

/**
 * Common machinery of the diarization and transcription workers: a bounded
 * pending queue, a fixed pool of backend callers, retry with backoff and
 * substitution of a degraded result when a segment cannot be processed.
 *
 * Every submitted segment produces exactly one result through the result
 * callback, whatever happens to the backend call.
 *
 * Derived classes must call stop() in their destructor so no task reaches
 * the pure virtual hooks during destruction.
 */
template <typename PayloadT, typename ResultT>
class SegmentWorker {
public:
    using Config = SegmentWorkerConfig;

    struct Statistics {
        size_t submitted = 0;
        size_t succeeded = 0;
        size_t retries = 0;
        size_t degraded = 0;
        size_t cancelled = 0;
    };

    using ResultCallback = std::function<void(const ResultT& result)>;

    explicit SegmentWorker(const Config& config)
        : config_(config)
        , retry_policy_(config.retry)
        , queue_(std::make_shared<TaskQueue>(config.max_pending))
        , pool_(config.parallelism == 0 ? 1 : config.parallelism, config.name)
        , cancel_(std::make_shared<CancellationSource>())
        , outstanding_(0)
        , submitted_(0)
        , succeeded_(0)
        , retries_(0)
        , degraded_(0)
        , cancelled_(0) {
    }

    virtual ~SegmentWorker() {
        stop();
    }

    SegmentWorker(const SegmentWorker&) = delete;
    SegmentWorker& operator=(const SegmentWorker&) = delete;

    void setResultCallback(ResultCallback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        result_callback_ = std::move(callback);
    }

    void start() {
        if (!pool_.isRunning()) {
            pool_.start(queue_);
        }
    }

    /**
     * Queue a sealed segment. Blocks while max_pending segments are waiting.
     * After stop() the segment is answered immediately with a degraded result.
     */
    void submit(const audio::SegmentPtr& segment) {
        if (!segment) {
            return;
        }

        submitted_++;
        outstanding_++;

        auto request = std::make_shared<SpeechRequest>();
        request->sessionId = config_.session_id;
        request->segmentId = segment->id;
        request->sampleRate = segment->sampleRate;
        request->audio = segment->samples();
        request->startMs = segment->startMs;
        request->endMs = segment->endMs;

        bool queued = queue_->enqueue([this, request]() { process(*request); });
        if (!queued) {
            utils::Logger::warn(config_.name + " is stopped, degrading segment " +
                                std::to_string(segment->id));
            degraded_++;
            emit(makeDegraded(segment->id, config_.name + " stopped"));
        }
    }

    /**
     * Cancel in-flight backend calls and backoff waits. Queued and in-flight
     * segments complete with degraded results.
     */
    void cancel() {
        if (!cancel_->isCancelled()) {
            utils::Logger::info("Cancelling " + config_.name + " with " +
                                std::to_string(outstanding_.load()) + " outstanding segments");
        }
        cancel_->cancel();
    }

    bool isCancelled() const { return cancel_->isCancelled(); }

    /**
     * Stop accepting segments, finish the queued ones and join the pool
     */
    void stop() {
        if (pool_.isRunning()) {
            pool_.stop();
            return;
        }

        // Never started: answer whatever was queued on the calling thread
        queue_->shutdown();
        while (auto task = queue_->tryDequeue()) {
            task->execute();
        }
    }

    /**
     * Segments submitted but not yet answered
     */
    size_t outstanding() const { return outstanding_.load(); }

    Statistics getStatistics() const {
        Statistics stats;
        stats.submitted = submitted_.load();
        stats.succeeded = succeeded_.load();
        stats.retries = retries_.load();
        stats.degraded = degraded_.load();
        stats.cancelled = cancelled_.load();
        return stats;
    }

    const Config& getConfig() const { return config_; }

protected:
    /**
     * One backend call. May throw; exceptions are classified as transient
     * failures unless they are permanent BackendExceptions.
     */
    virtual BackendResult<PayloadT> invoke(const SpeechRequest& request,
                                           const CancellationToken& token) = 0;

    virtual ResultT makeResult(uint64_t segment_id, PayloadT payload) = 0;
    virtual ResultT makeDegraded(uint64_t segment_id, const std::string& reason) = 0;

private:
    void process(const SpeechRequest& request) {
        const CancellationToken token(cancel_);
        std::string last_error;

        for (int attempt = 1; attempt <= retry_policy_.maxAttempts(); ++attempt) {
            if (token.isCancelled()) {
                finishCancelled(request.segmentId);
                return;
            }

            BackendResult<PayloadT> result;
            try {
                result = invoke(request, token);
            } catch (const utils::BackendException& e) {
                result = e.isPermanent() ? BackendResult<PayloadT>::permanentFailure(e.what())
                                         : BackendResult<PayloadT>::transientFailure(e.what());
            } catch (const std::exception& e) {
                result = BackendResult<PayloadT>::transientFailure(e.what());
            }

            if (result.ok()) {
                succeeded_++;
                emit(makeResult(request.segmentId, std::move(result.value)));
                return;
            }

            last_error = result.errorMessage;

            if (result.status == BackendStatus::CANCELLED) {
                finishCancelled(request.segmentId);
                return;
            }

            if (!result.isRetryable()) {
                finishDegraded(request, "permanent failure: " + last_error, attempt);
                return;
            }

            if (!retry_policy_.shouldRetry(attempt)) {
                break;
            }

            retries_++;
            auto delay = retry_policy_.backoffAfter(attempt);
            utils::Logger::debug(config_.name + " attempt " + std::to_string(attempt) + " for segment " +
                                 std::to_string(request.segmentId) + " failed (" +
                                 backendStatusToString(result.status) + ": " + last_error +
                                 "), retrying in " + std::to_string(delay.count()) + "ms");
            if (token.waitFor(delay)) {
                finishCancelled(request.segmentId);
                return;
            }
        }

        finishDegraded(request, "retries exhausted: " + last_error, retry_policy_.maxAttempts());
    }

    void finishCancelled(uint64_t segment_id) {
        cancelled_++;
        degraded_++;
        utils::Logger::warn(config_.name + " cancelled segment " + std::to_string(segment_id));
        emit(makeDegraded(segment_id, "cancelled"));
    }

    void finishDegraded(const SpeechRequest& request, const std::string& reason, int attempts) {
        degraded_++;
        utils::ErrorInfo error(utils::ErrorCategory::EXHAUSTED_RETRY, utils::ErrorSeverity::WARNING,
                               config_.name + " degraded segment " + std::to_string(request.segmentId),
                               reason + " after " + std::to_string(attempts) + " attempts",
                               config_.name, request.sessionId);
        utils::ErrorHandler::getInstance().reportError(error);
        emit(makeDegraded(request.segmentId, reason));
    }

    void emit(const ResultT& result) {
        ResultCallback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = result_callback_;
        }

        if (callback) {
            try {
                callback(result);
            } catch (const std::exception& e) {
                utils::Logger::error(config_.name + " result callback failed: " + std::string(e.what()));
            }
        }
        outstanding_--;
    }

    Config config_;
    RetryPolicy retry_policy_;
    std::shared_ptr<TaskQueue> queue_;
    ThreadPool pool_;
    std::shared_ptr<CancellationSource> cancel_;

    std::mutex callback_mutex_;
    ResultCallback result_callback_;

    std::atomic<size_t> outstanding_;
    std::atomic<size_t> submitted_;
    std::atomic<size_t> succeeded_;
    std::atomic<size_t> retries_;
    std::atomic<size_t> degraded_;
    std::atomic<size_t> cancelled_;
};

} // namespace core
} // namespace meetscribe
