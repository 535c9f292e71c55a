#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace meetscribe {
namespace core {

/**
 * Shared cancellation flag. Backend calls poll isCancelled(); backoff waits use
 * waitFor() so that cancellation interrupts them immediately.
 */
class CancellationSource {
public:
    CancellationSource() : cancelled_(false) {}

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool isCancelled() const { return cancelled_.load(); }

    /**
     * Sleep for up to the given duration.
     * @return true if cancellation interrupted the wait
     */
    bool waitFor(std::chrono::milliseconds duration) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

/**
 * Read-only view handed to engines
 */
class CancellationToken {
public:
    CancellationToken() = default;
    explicit CancellationToken(std::shared_ptr<CancellationSource> source)
        : source_(std::move(source)) {}

    bool isCancelled() const { return source_ && source_->isCancelled(); }

    bool waitFor(std::chrono::milliseconds duration) const {
        if (!source_) {
            return false;
        }
        return source_->waitFor(duration);
    }

private:
    std::shared_ptr<CancellationSource> source_;
};

} // namespace core
} // namespace meetscribe
