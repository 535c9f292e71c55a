#include <gtest/gtest.h>
#include "core/transcript.hpp"
#include <thread>

using namespace meetscribe::core;

namespace {

TranscriptEntry utterance(uint64_t id, int64_t start, int64_t end, const std::string& text = "") {
    TranscriptEntry entry;
    entry.segment_id = id;
    entry.start_ms = start;
    entry.end_ms = end;
    entry.speaker_label = "speaker_A";
    entry.text = text.empty() ? "segment " + std::to_string(id) : text;
    return entry;
}

} // namespace

class TranscriptTest : public ::testing::Test {
protected:
    Transcript transcript_{"session_test"};
};

TEST_F(TranscriptTest, StartsEmpty) {
    EXPECT_TRUE(transcript_.empty());
    EXPECT_EQ(transcript_.size(), 0u);
    EXPECT_EQ(transcript_.getSessionId(), "session_test");
    EXPECT_TRUE(transcript_.snapshot().empty());
}

TEST_F(TranscriptTest, InOrderInsertionsAppend) {
    EXPECT_TRUE(transcript_.insert(utterance(1, 0, 1000)));
    EXPECT_TRUE(transcript_.insert(utterance(2, 1500, 2000)));
    EXPECT_TRUE(transcript_.insert(utterance(3, 2500, 3000)));

    auto entries = transcript_.snapshot();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].segment_id, 1u);
    EXPECT_EQ(entries[2].segment_id, 3u);
    EXPECT_EQ(transcript_.outOfOrderInsertions(), 0u);
}

TEST_F(TranscriptTest, LateEntryIsPlacedByStartTime) {
    transcript_.insert(utterance(1, 0, 1000));
    transcript_.insert(utterance(3, 2500, 3000));
    transcript_.insert(utterance(2, 1500, 2000));

    auto entries = transcript_.snapshot();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].segment_id, 1u);
    EXPECT_EQ(entries[1].segment_id, 2u);
    EXPECT_EQ(entries[2].segment_id, 3u);
    EXPECT_EQ(transcript_.outOfOrderInsertions(), 1u);
}

TEST_F(TranscriptTest, EqualStartsOrderedBySegmentId) {
    transcript_.insert(utterance(7, 1000, 1200));
    transcript_.insert(utterance(4, 1000, 1500));

    auto entries = transcript_.snapshot();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].segment_id, 4u);
    EXPECT_EQ(entries[1].segment_id, 7u);
}

TEST_F(TranscriptTest, DuplicateSegmentIdIsRejected) {
    EXPECT_TRUE(transcript_.insert(utterance(1, 0, 1000, "first")));
    EXPECT_FALSE(transcript_.insert(utterance(1, 0, 1000, "second")));

    auto entries = transcript_.snapshot();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].text, "first");
    EXPECT_TRUE(transcript_.containsSegment(1));
    EXPECT_FALSE(transcript_.containsSegment(2));
}

TEST_F(TranscriptTest, GapMarkersShareTheTimeline) {
    transcript_.insert(utterance(1, 0, 1000));
    transcript_.insert(utterance(3, 1000, 1800));

    TranscriptEntry gap;
    gap.kind = EntryKind::GAP_MARKER;
    gap.segment_id = 2;
    gap.start_ms = 1000;
    gap.end_ms = 1000;
    gap.gap_duration_ms = 4000;
    EXPECT_TRUE(transcript_.insert(gap));

    auto entries = transcript_.snapshot();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_TRUE(entries[1].isGapMarker());
    EXPECT_EQ(entries[1].gap_duration_ms, 4000);
    EXPECT_EQ(entries[2].segment_id, 3u);
}

TEST_F(TranscriptTest, SnapshotIsIndependentCopy) {
    transcript_.insert(utterance(1, 0, 1000));
    auto before = transcript_.snapshot();

    transcript_.insert(utterance(2, 2000, 3000));

    EXPECT_EQ(before.size(), 1u);
    EXPECT_EQ(transcript_.size(), 2u);
}

TEST_F(TranscriptTest, ClearResetsEverything) {
    transcript_.insert(utterance(2, 2000, 3000));
    transcript_.insert(utterance(1, 0, 1000));
    transcript_.clear();

    EXPECT_TRUE(transcript_.empty());
    EXPECT_EQ(transcript_.outOfOrderInsertions(), 0u);
    EXPECT_TRUE(transcript_.insert(utterance(1, 0, 1000)));
}

TEST_F(TranscriptTest, ConcurrentInsertsStaySorted) {
    const int threads = 4;
    const int per_thread = 50;
    std::vector<std::thread> writers;

    for (int t = 0; t < threads; ++t) {
        writers.emplace_back([this, t]() {
            for (int i = 0; i < per_thread; ++i) {
                uint64_t id = static_cast<uint64_t>(i * threads + t + 1);
                transcript_.insert(utterance(id, static_cast<int64_t>(id) * 100, static_cast<int64_t>(id) * 100 + 50));
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    auto entries = transcript_.snapshot();
    ASSERT_EQ(entries.size(), static_cast<size_t>(threads * per_thread));
    for (size_t i = 1; i < entries.size(); ++i) {
        EXPECT_TRUE(entryPrecedes(entries[i - 1], entries[i]));
    }
}
