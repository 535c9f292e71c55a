#include "core/transcript_json.hpp"
#include "utils/error_handler.hpp"
#include <iomanip>
#include <sstream>

namespace meetscribe {
namespace core {

using json = nlohmann::json;

void to_json(json& j, const WordTiming& word) {
    j = json{
        {"word", word.word},
        {"start_ms", word.start_ms},
        {"end_ms", word.end_ms},
        {"confidence", word.confidence}
    };
}

void from_json(const json& j, WordTiming& word) {
    j.at("word").get_to(word.word);
    j.at("start_ms").get_to(word.start_ms);
    j.at("end_ms").get_to(word.end_ms);
    word.confidence = j.value("confidence", 0.0f);
}

void to_json(json& j, const TranscriptEntry& entry) {
    j = json{
        {"segment_id", entry.segment_id},
        {"start_ms", entry.start_ms},
        {"end_ms", entry.end_ms}
    };

    if (entry.isGapMarker()) {
        j["type"] = "gap";
        j["gap_duration_ms"] = entry.gap_duration_ms;
        return;
    }

    j["type"] = "utterance";
    j["speaker"] = entry.speaker_label;
    j["speaker_confidence"] = entry.speaker_confidence;
    j["text"] = entry.text;
    j["confidence"] = entry.confidence;
    if (!entry.words.empty()) {
        j["words"] = entry.words;
    }
    j["speaker_degraded"] = entry.speaker_degraded;
    j["text_degraded"] = entry.text_degraded;
    j["forced"] = entry.forced;
}

void from_json(const json& j, TranscriptEntry& entry) {
    entry = TranscriptEntry{};
    j.at("segment_id").get_to(entry.segment_id);
    j.at("start_ms").get_to(entry.start_ms);
    j.at("end_ms").get_to(entry.end_ms);

    if (j.value("type", std::string("utterance")) == "gap") {
        entry.kind = EntryKind::GAP_MARKER;
        entry.gap_duration_ms = j.value("gap_duration_ms", int64_t{0});
        return;
    }

    entry.kind = EntryKind::UTTERANCE;
    entry.speaker_label = j.value("speaker", std::string(UNKNOWN_SPEAKER_LABEL));
    entry.speaker_confidence = j.value("speaker_confidence", 0.0f);
    entry.text = j.value("text", std::string());
    entry.confidence = j.value("confidence", 0.0f);
    if (j.contains("words")) {
        j.at("words").get_to(entry.words);
    }
    entry.speaker_degraded = j.value("speaker_degraded", false);
    entry.text_degraded = j.value("text_degraded", false);
    entry.forced = j.value("forced", false);
}

void to_json(json& j, const MeetingSummary& summary) {
    j = json{{"notes", summary.notes}, {"action_items", summary.action_items}};
}

void from_json(const json& j, MeetingSummary& summary) {
    summary.notes = j.value("notes", std::string());
    summary.action_items = j.value("action_items", std::vector<std::string>{});
}

json transcriptToJson(const std::string& session_id,
                      const std::vector<TranscriptEntry>& entries,
                      bool final) {
    json document;
    document["session_id"] = session_id;
    document["final"] = final;
    document["entry_count"] = entries.size();
    document["entries"] = entries;
    return document;
}

std::vector<TranscriptEntry> transcriptFromJson(const json& document) {
    if (!document.is_object() || !document.contains("entries") || !document.at("entries").is_array()) {
        throw utils::ArchiveException("Transcript document has no entries array");
    }

    try {
        return document.at("entries").get<std::vector<TranscriptEntry>>();
    } catch (const json::exception& e) {
        throw utils::ArchiveException("Malformed transcript entry: " + std::string(e.what()));
    }
}

std::string formatTranscriptText(const std::vector<TranscriptEntry>& entries) {
    std::ostringstream out;
    for (const auto& entry : entries) {
        const int64_t seconds = entry.start_ms / 1000;
        out << "[" << std::setw(2) << std::setfill('0') << seconds / 60 << ":"
            << std::setw(2) << std::setfill('0') << seconds % 60 << "] ";

        if (entry.isGapMarker()) {
            out << "--- audio gap (" << entry.gap_duration_ms << "ms) ---\n";
            continue;
        }

        out << entry.speaker_label << ": ";
        if (entry.text_degraded && entry.text.empty()) {
            out << "[inaudible]";
        } else {
            out << entry.text;
        }
        out << "\n";
    }
    return out.str();
}

} // namespace core
} // namespace meetscribe
