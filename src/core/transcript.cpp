#include "core/transcript.hpp"
#include <algorithm>

namespace meetscribe {
namespace core {

Transcript::Transcript(std::string session_id)
    : session_id_(std::move(session_id))
    , out_of_order_insertions_(0) {
}

bool Transcript::insert(TranscriptEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!segment_ids_.insert(entry.segment_id).second) {
        return false;
    }

    auto position = std::upper_bound(entries_.begin(), entries_.end(), entry, entryPrecedes);
    if (position != entries_.end()) {
        out_of_order_insertions_++;
    }
    entries_.insert(position, std::move(entry));
    return true;
}

std::vector<TranscriptEntry> Transcript::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

size_t Transcript::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool Transcript::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.empty();
}

bool Transcript::containsSegment(uint64_t segment_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return segment_ids_.count(segment_id) > 0;
}

size_t Transcript::outOfOrderInsertions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return out_of_order_insertions_;
}

void Transcript::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    segment_ids_.clear();
    out_of_order_insertions_ = 0;
}

} // namespace core
} // namespace meetscribe
