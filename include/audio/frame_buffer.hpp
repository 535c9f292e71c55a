#pragma once

#include "audio/audio_frame.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace meetscribe {
namespace audio {

/**
 * Recorded whenever a full buffer discards its oldest frame
 */
struct FrameDroppedEvent {
    uint64_t sequenceNumber;
    int64_t captureTimestampMs;
    std::chrono::steady_clock::time_point droppedAt;
};

/**
 * FrameBuffer - fixed-capacity ring buffer between the connector and the
 * segmenter.
 *
 * push() never waits for the consumer: when the ring is full the oldest
 * unconsumed frame is overwritten and a FrameDroppedEvent is recorded. pop() is
 * meant for a single reader and returns frames in arrival order.
 */
class FrameBuffer {
public:
    using DropCallback = std::function<void(const FrameDroppedEvent&)>;

    struct Statistics {
        uint64_t pushed = 0;
        uint64_t popped = 0;
        uint64_t dropped = 0;
        uint64_t rejected = 0;  // Pushes after close()
        size_t highWaterMark = 0;
    };

    explicit FrameBuffer(size_t capacity, size_t maxDropHistory = 1024);

    FrameBuffer(const FrameBuffer&) = delete;
    FrameBuffer& operator=(const FrameBuffer&) = delete;

    /**
     * @return false only if the buffer has been closed
     */
    bool push(AudioFramePtr frame);

    /**
     * Wait up to timeout for the next frame. Returns nullptr on timeout, or
     * when closed and empty.
     */
    AudioFramePtr pop(std::chrono::milliseconds timeout);
    AudioFramePtr tryPop();

    /**
     * Reject further pushes and wake the reader. Buffered frames stay poppable.
     */
    void close();
    bool isClosed() const;

    size_t size() const;
    bool empty() const;
    size_t capacity() const { return capacity_; }

    Statistics getStatistics() const;
    std::vector<FrameDroppedEvent> getDropHistory() const;

    /**
     * Called under no lock after each drop
     */
    void setDropCallback(DropCallback callback);

private:
    AudioFramePtr takeFrontLocked();

    const size_t capacity_;
    const size_t maxDropHistory_;

    std::vector<AudioFramePtr> ring_;
    size_t head_;   // Next slot to read
    size_t count_;
    bool closed_;

    Statistics stats_;
    std::vector<FrameDroppedEvent> dropHistory_;
    DropCallback dropCallback_;

    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
};

} // namespace audio
} // namespace meetscribe
