#pragma once

#include "core/transcript_types.hpp"
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace meetscribe {
namespace core {

/**
 * Session-owned, append-only transcript kept in (start, segment id) order.
 *
 * Entries may be inserted ahead of later ones when segments complete out of
 * order, but nothing is ever removed or changed while the session runs.
 * Readers only get copies.
 */
class Transcript {
public:
    explicit Transcript(std::string session_id);

    Transcript(const Transcript&) = delete;
    Transcript& operator=(const Transcript&) = delete;

    /**
     * Insert at the ordered position.
     * @return false if an entry with this segment id already exists
     */
    bool insert(TranscriptEntry entry);

    std::vector<TranscriptEntry> snapshot() const;
    size_t size() const;
    bool empty() const;
    bool containsSegment(uint64_t segment_id) const;

    /**
     * Number of insertions that landed before an existing entry
     */
    size_t outOfOrderInsertions() const;

    /**
     * Teardown only: drop every entry after the session was handed off
     */
    void clear();

    const std::string& getSessionId() const { return session_id_; }

private:
    const std::string session_id_;

    mutable std::mutex mutex_;
    std::vector<TranscriptEntry> entries_;
    std::unordered_set<uint64_t> segment_ids_;
    size_t out_of_order_insertions_;
};

} // namespace core
} // namespace meetscribe
