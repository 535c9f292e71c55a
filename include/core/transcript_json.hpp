#pragma once

#include "core/summarizer.hpp"
#include "core/transcript_types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace meetscribe {
namespace core {

void to_json(nlohmann::json& j, const WordTiming& word);
void from_json(const nlohmann::json& j, WordTiming& word);

void to_json(nlohmann::json& j, const TranscriptEntry& entry);
void from_json(const nlohmann::json& j, TranscriptEntry& entry);

void to_json(nlohmann::json& j, const MeetingSummary& summary);
void from_json(const nlohmann::json& j, MeetingSummary& summary);

/**
 * Archive document: {"session_id", "final", "entry_count", "entries": [...]}
 */
nlohmann::json transcriptToJson(const std::string& session_id,
                                const std::vector<TranscriptEntry>& entries,
                                bool final);

/**
 * Parse the "entries" array of an archive document.
 * Throws ArchiveException on malformed input.
 */
std::vector<TranscriptEntry> transcriptFromJson(const nlohmann::json& document);

/**
 * Plain-text rendering, one line per entry: "[mm:ss] speaker: text"
 */
std::string formatTranscriptText(const std::vector<TranscriptEntry>& entries);

} // namespace core
} // namespace meetscribe
