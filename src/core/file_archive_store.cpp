#include "core/file_archive_store.hpp"
#include "core/transcript_json.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <filesystem>
#include <fstream>

namespace meetscribe {
namespace core {

FileArchiveStore::FileArchiveStore(std::string directory)
    : directory_(std::move(directory))
    , write_count_(0) {
}

std::string FileArchiveStore::pathFor(const std::string& session_id) const {
    return (std::filesystem::path(directory_) / (session_id + ".json")).string();
}

void FileArchiveStore::writeTranscript(const std::string& session_id,
                                       const std::vector<TranscriptEntry>& snapshot,
                                       bool final) {
    if (session_id.empty()) {
        throw utils::ArchiveException("Cannot archive a transcript without a session id");
    }

    const std::string path = pathFor(session_id);
    const std::string tmp_path = path + ".tmp";
    // Engines can cut a multibyte character at a token boundary; such bytes become U+FFFD
    const std::string body = transcriptToJson(session_id, snapshot, final)
                                 .dump(2, ' ', false, nlohmann::json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw utils::ArchiveException("Cannot create archive directory: " + ec.message(), directory_);
    }

    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            throw utils::ArchiveException("Cannot open archive file for writing", tmp_path);
        }
        out << body << "\n";
        if (!out) {
            throw utils::ArchiveException("Failed writing archive file", tmp_path);
        }
    }

    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        throw utils::ArchiveException("Cannot replace archive file: " + ec.message(), path);
    }

    write_count_++;
    utils::Logger::debug("Archived " + std::to_string(snapshot.size()) + " entries to " + path +
                         (final ? " (final)" : " (checkpoint)"));
}

size_t FileArchiveStore::getWriteCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_count_;
}

} // namespace core
} // namespace meetscribe
