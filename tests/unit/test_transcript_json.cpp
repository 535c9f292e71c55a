#include <gtest/gtest.h>
#include "core/transcript_json.hpp"
#include "utils/error_handler.hpp"

using namespace meetscribe::core;
using json = nlohmann::json;

namespace {

TranscriptEntry utterance(uint64_t id, int64_t start, const std::string& speaker, const std::string& text) {
    TranscriptEntry entry;
    entry.segment_id = id;
    entry.start_ms = start;
    entry.end_ms = start + 1500;
    entry.speaker_label = speaker;
    entry.speaker_confidence = 0.75f;
    entry.text = text;
    entry.confidence = 0.5f;
    return entry;
}

TranscriptEntry gapMarker(uint64_t id, int64_t at, int64_t duration) {
    TranscriptEntry entry;
    entry.kind = EntryKind::GAP_MARKER;
    entry.segment_id = id;
    entry.start_ms = at;
    entry.end_ms = at;
    entry.gap_duration_ms = duration;
    return entry;
}

} // namespace

TEST(TranscriptJsonTest, UtteranceFields) {
    auto entry = utterance(3, 61000, "speaker_A", "let's start");
    entry.words.emplace_back("let's", 61000, 61300, 0.9f);
    entry.forced = true;

    json j = entry;
    EXPECT_EQ(j["type"], "utterance");
    EXPECT_EQ(j["segment_id"], 3);
    EXPECT_EQ(j["start_ms"], 61000);
    EXPECT_EQ(j["end_ms"], 62500);
    EXPECT_EQ(j["speaker"], "speaker_A");
    EXPECT_EQ(j["text"], "let's start");
    EXPECT_FLOAT_EQ(j["confidence"].get<float>(), 0.5f);
    EXPECT_TRUE(j["forced"].get<bool>());
    EXPECT_FALSE(j["text_degraded"].get<bool>());
    ASSERT_TRUE(j.contains("words"));
    EXPECT_EQ(j["words"][0]["word"], "let's");
    EXPECT_EQ(j["words"][0]["end_ms"], 61300);
}

TEST(TranscriptJsonTest, WordsOmittedWhenEmpty) {
    json j = utterance(1, 0, "speaker_A", "hi");
    EXPECT_FALSE(j.contains("words"));
}

TEST(TranscriptJsonTest, GapMarkerFields) {
    json j = gapMarker(4, 5000, 12000);
    EXPECT_EQ(j["type"], "gap");
    EXPECT_EQ(j["gap_duration_ms"], 12000);
    EXPECT_FALSE(j.contains("speaker"));
    EXPECT_FALSE(j.contains("text"));
}

TEST(TranscriptJsonTest, DocumentParsesBack) {
    std::vector<TranscriptEntry> entries = {
        utterance(1, 0, "speaker_A", "first"),
        gapMarker(2, 1500, 3000),
        utterance(3, 1500, "unknown", "")
    };
    entries[2].speaker_degraded = true;
    entries[2].text_degraded = true;

    json document = transcriptToJson("session_json", entries, true);
    EXPECT_EQ(document["session_id"], "session_json");
    EXPECT_TRUE(document["final"].get<bool>());
    EXPECT_EQ(document["entry_count"], 3);

    auto parsed = transcriptFromJson(json::parse(document.dump()));
    ASSERT_EQ(parsed.size(), 3u);
    EXPECT_EQ(parsed[0].text, "first");
    EXPECT_FLOAT_EQ(parsed[0].speaker_confidence, 0.75f);
    EXPECT_TRUE(parsed[1].isGapMarker());
    EXPECT_EQ(parsed[1].gap_duration_ms, 3000);
    EXPECT_EQ(parsed[2].speaker_label, "unknown");
    EXPECT_TRUE(parsed[2].speaker_degraded);
    EXPECT_TRUE(parsed[2].text_degraded);
}

TEST(TranscriptJsonTest, MissingOptionalFieldsGetDefaults) {
    auto document = json::parse(R"({"entries": [{"segment_id": 7, "start_ms": 100, "end_ms": 900}]})");
    auto parsed = transcriptFromJson(document);

    ASSERT_EQ(parsed.size(), 1u);
    EXPECT_FALSE(parsed[0].isGapMarker());
    EXPECT_EQ(parsed[0].speaker_label, "unknown");
    EXPECT_TRUE(parsed[0].text.empty());
    EXPECT_FALSE(parsed[0].forced);
}

TEST(TranscriptJsonTest, MalformedDocumentsThrow) {
    using meetscribe::utils::ArchiveException;

    EXPECT_THROW(transcriptFromJson(json::array()), ArchiveException);
    EXPECT_THROW(transcriptFromJson(json{{"session_id", "x"}}), ArchiveException);
    EXPECT_THROW(transcriptFromJson(json{{"entries", "not a list"}}), ArchiveException);
    EXPECT_THROW(transcriptFromJson(json::parse(R"({"entries": [{"start_ms": 1}]})")), ArchiveException);
    EXPECT_THROW(transcriptFromJson(json::parse(R"({"entries": [{"segment_id": "one", "start_ms": 0, "end_ms": 1}]})")),
                 ArchiveException);
}

TEST(TranscriptJsonTest, SummaryFields) {
    MeetingSummary summary;
    summary.notes = "Budget approved";
    summary.action_items = {"send minutes", "book room"};

    json j = summary;
    EXPECT_EQ(j["notes"], "Budget approved");
    ASSERT_EQ(j["action_items"].size(), 2u);

    auto parsed = j.get<MeetingSummary>();
    EXPECT_EQ(parsed.action_items[1], "book room");
}

TEST(TranscriptJsonTest, PlainTextRendering) {
    std::vector<TranscriptEntry> entries = {
        utterance(1, 5000, "speaker_A", "Good morning."),
        gapMarker(2, 6500, 4200),
        utterance(3, 125000, "unknown", "")
    };
    entries[2].text_degraded = true;

    EXPECT_EQ(formatTranscriptText(entries),
              "[00:05] speaker_A: Good morning.\n"
              "[00:06] --- audio gap (4200ms) ---\n"
              "[02:05] unknown: [inaudible]\n");
}

TEST(TranscriptJsonTest, PlainTextOfEmptyTranscript) {
    EXPECT_TRUE(formatTranscriptText({}).empty());
}
