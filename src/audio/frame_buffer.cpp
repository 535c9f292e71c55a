#include "audio/frame_buffer.hpp"
#include "utils/logging.hpp"

namespace meetscribe {
namespace audio {

FrameBuffer::FrameBuffer(size_t capacity, size_t maxDropHistory)
    : capacity_(capacity == 0 ? 1 : capacity)
    , maxDropHistory_(maxDropHistory)
    , ring_(capacity_)
    , head_(0)
    , count_(0)
    , closed_(false) {
}

bool FrameBuffer::push(AudioFramePtr frame) {
    if (!frame) {
        return true;
    }

    bool droppedOne = false;
    FrameDroppedEvent dropEvent{};
    DropCallback callback;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            stats_.rejected++;
            return false;
        }

        if (count_ == capacity_) {
            AudioFramePtr oldest = takeFrontLocked();
            dropEvent = FrameDroppedEvent{oldest->sequenceNumber, oldest->captureTimestampMs,
                                          std::chrono::steady_clock::now()};
            droppedOne = true;
            stats_.dropped++;
            if (maxDropHistory_ > 0) {
                if (dropHistory_.size() >= maxDropHistory_) {
                    dropHistory_.erase(dropHistory_.begin());
                }
                dropHistory_.push_back(dropEvent);
            }
            callback = dropCallback_;
        }

        ring_[(head_ + count_) % capacity_] = std::move(frame);
        count_++;
        stats_.pushed++;
        if (count_ > stats_.highWaterMark) {
            stats_.highWaterMark = count_;
        }
    }
    notEmpty_.notify_one();

    if (droppedOne) {
        utils::Logger::debug("FrameBuffer full, dropped frame #" + std::to_string(dropEvent.sequenceNumber));
        if (callback) {
            callback(dropEvent);
        }
    }
    return true;
}

AudioFramePtr FrameBuffer::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    notEmpty_.wait_for(lock, timeout, [this] { return count_ > 0 || closed_; });
    if (count_ == 0) {
        return nullptr;
    }
    stats_.popped++;
    return takeFrontLocked();
}

AudioFramePtr FrameBuffer::tryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (count_ == 0) {
        return nullptr;
    }
    stats_.popped++;
    return takeFrontLocked();
}

void FrameBuffer::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    notEmpty_.notify_all();
}

bool FrameBuffer::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t FrameBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

bool FrameBuffer::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_ == 0;
}

FrameBuffer::Statistics FrameBuffer::getStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::vector<FrameDroppedEvent> FrameBuffer::getDropHistory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropHistory_;
}

void FrameBuffer::setDropCallback(DropCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    dropCallback_ = std::move(callback);
}

AudioFramePtr FrameBuffer::takeFrontLocked() {
    AudioFramePtr frame = std::move(ring_[head_]);
    ring_[head_].reset();
    head_ = (head_ + 1) % capacity_;
    count_--;
    return frame;
}

} // namespace audio
} // namespace meetscribe
