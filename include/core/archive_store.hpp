#pragma once

#include "core/transcript_types.hpp"
#include <string>
#include <vector>

namespace meetscribe {
namespace core {

/**
 * Persistence for transcripts. Checkpoints (final == false) may be written
 * any number of times during a session; the final write happens once, at
 * Closed. Failures are reported by throwing ArchiveException.
 */
class ArchiveStore {
public:
    virtual ~ArchiveStore() = default;

    virtual void writeTranscript(const std::string& session_id,
                                 const std::vector<TranscriptEntry>& snapshot,
                                 bool final) = 0;
};

} // namespace core
} // namespace meetscribe
