#pragma once

#include "core/archive_store.hpp"
#include <mutex>
#include <string>

namespace meetscribe {
namespace core {

/**
 * Writes each session's transcript to <directory>/<session id>.json.
 * Every write replaces the previous file atomically (temp file + rename), so
 * a crash mid-checkpoint leaves the last complete snapshot in place.
 */
class FileArchiveStore : public ArchiveStore {
public:
    explicit FileArchiveStore(std::string directory);

    void writeTranscript(const std::string& session_id,
                         const std::vector<TranscriptEntry>& snapshot,
                         bool final) override;

    std::string pathFor(const std::string& session_id) const;
    const std::string& getDirectory() const { return directory_; }

    size_t getWriteCount() const;

private:
    std::string directory_;
    mutable std::mutex mutex_;
    size_t write_count_;
};

} // namespace core
} // namespace meetscribe
