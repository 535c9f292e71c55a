#include <gtest/gtest.h>
#include "audio/file_replay_connector.hpp"
#include "utils/error_handler.hpp"
#include "fixtures/test_data_generator.hpp"
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <thread>

using namespace meetscribe::audio;
namespace fs = std::filesystem;

namespace {

class RecordingListener : public ConnectorListener {
public:
    void onAudioFrame(const RawAudioChunk& chunk) override {
        std::lock_guard<std::mutex> lock(mutex_);
        chunks.push_back(chunk);
    }

    void onDisconnected(const std::string&) override {}
    void onReconnected() override {}

    void onStreamEnded() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ended++;
        }
        cv_.notify_all();
    }

    void onFatalError(const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        fatal = message;
    }

    bool waitForEnd(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return ended > 0; });
    }

    size_t chunkCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        return chunks.size();
    }

    std::vector<RawAudioChunk> chunks;
    int ended = 0;
    std::string fatal;

private:
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace

class FileReplayConnectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = (fs::temp_directory_path() / ("meetscribe_replay_" + std::string(info->name()) + ".wav")).string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    void writeSpeech(int64_t durationMs, int channels = 1) {
        samples_ = generator_.generateSpeechAudio(durationMs);
        ASSERT_TRUE(fixtures::TestDataGenerator::writeWav(path_, samples_, 16000, channels));
    }

    fixtures::TestDataGenerator generator_;
    std::vector<float> samples_;
    std::string path_;
    MeetingInfo meeting_;
};

TEST_F(FileReplayConnectorTest, LoadsMonoPcm16) {
    writeSpeech(1000);

    WavAudio wav;
    ASSERT_TRUE(FileReplayConnector::loadWav(path_, wav));
    EXPECT_EQ(wav.sampleRate, 16000);
    EXPECT_EQ(wav.channels, 1);
    EXPECT_EQ(wav.bitsPerSample, 16);
    ASSERT_EQ(wav.samples.size(), 16000u);
    EXPECT_DOUBLE_EQ(wav.durationSeconds(), 1.0);
    for (size_t i = 0; i < wav.samples.size(); i += 997) {
        EXPECT_NEAR(wav.samples[i], samples_[i], 1e-3f);
    }
}

TEST_F(FileReplayConnectorTest, DownmixesStereo) {
    writeSpeech(500, 2);

    WavAudio wav;
    ASSERT_TRUE(FileReplayConnector::loadWav(path_, wav));
    EXPECT_EQ(wav.channels, 2);
    ASSERT_EQ(wav.samples.size(), 8000u);
    EXPECT_NEAR(wav.samples[100], samples_[100], 1e-3f);
}

TEST_F(FileReplayConnectorTest, SkipsOddSizedChunkWithPadByte) {
    const std::vector<int16_t> pcm = {0, 8192, -8192, 16384, -16384, 32767, -32768, 4096};
    const std::string info = "ISFTlavf";  // 8 bytes of payload plus "\0" makes it odd
    const uint32_t listSize = static_cast<uint32_t>(info.size() + 1);
    const uint32_t dataSize = static_cast<uint32_t>(pcm.size() * sizeof(int16_t));

    {
        std::ofstream out(path_, std::ios::binary);
        auto put32 = [&out](uint32_t value) { out.write(reinterpret_cast<const char*>(&value), 4); };
        auto put16 = [&out](uint16_t value) { out.write(reinterpret_cast<const char*>(&value), 2); };

        out.write("RIFF", 4);
        put32(4 + (8 + 16) + (8 + listSize + 1) + (8 + dataSize));
        out.write("WAVE", 4);
        out.write("fmt ", 4);
        put32(16);
        put16(1);       // PCM
        put16(1);       // mono
        put32(16000);
        put32(16000 * 2);
        put16(2);
        put16(16);
        out.write("LIST", 4);
        put32(listSize);
        out.write(info.c_str(), listSize);
        out.put('\0');  // pad byte, not counted in the chunk size
        out.write("data", 4);
        put32(dataSize);
        out.write(reinterpret_cast<const char*>(pcm.data()), dataSize);
    }

    WavAudio wav;
    ASSERT_TRUE(FileReplayConnector::loadWav(path_, wav));
    ASSERT_EQ(wav.samples.size(), pcm.size());
    EXPECT_FLOAT_EQ(wav.samples[1], 0.25f);
    EXPECT_FLOAT_EQ(wav.samples[2], -0.25f);
    EXPECT_FLOAT_EQ(wav.samples[6], -1.0f);
}

TEST_F(FileReplayConnectorTest, RejectsMissingAndMalformedFiles) {
    WavAudio wav;
    EXPECT_FALSE(FileReplayConnector::loadWav(path_ + ".missing", wav));

    {
        std::ofstream garbage(path_, std::ios::binary);
        garbage << "this is not a wav file at all, just text padding it out";
    }
    EXPECT_FALSE(FileReplayConnector::loadWav(path_, wav));
}

TEST_F(FileReplayConnectorTest, ReplaysWholeFileInChunks) {
    writeSpeech(1000);
    FileReplayConnector::Options options;
    options.chunkMs = 20;
    options.realtime = false;
    FileReplayConnector connector(path_, options);
    RecordingListener listener;

    connector.join(meeting_, listener);
    ASSERT_TRUE(listener.waitForEnd(std::chrono::seconds(5)));
    connector.leave();

    ASSERT_EQ(listener.chunks.size(), 50u);
    EXPECT_EQ(connector.chunksDelivered(), 50u);
    EXPECT_EQ(listener.ended, 1);
    EXPECT_TRUE(listener.fatal.empty());
    for (size_t i = 0; i < listener.chunks.size(); ++i) {
        EXPECT_EQ(listener.chunks[i].captureTimestampMs, static_cast<int64_t>(i) * 20);
        EXPECT_EQ(listener.chunks[i].durationMs, 20);
        EXPECT_EQ(listener.chunks[i].samples.size(), 320u);
        EXPECT_EQ(listener.chunks[i].sampleRate, 16000);
    }
    EXPECT_FALSE(connector.isStreaming());
}

TEST_F(FileReplayConnectorTest, StartTimestampOffsetsChunks) {
    writeSpeech(100);
    FileReplayConnector::Options options;
    options.realtime = false;
    options.startTimestampMs = 90000;
    FileReplayConnector connector(path_, options);
    RecordingListener listener;

    connector.join(meeting_, listener);
    ASSERT_TRUE(listener.waitForEnd(std::chrono::seconds(5)));
    connector.leave();

    ASSERT_FALSE(listener.chunks.empty());
    EXPECT_EQ(listener.chunks.front().captureTimestampMs, 90000);
    EXPECT_EQ(listener.chunks.back().captureTimestampMs, 90080);
}

TEST_F(FileReplayConnectorTest, JoinFailsForUnreadableRecording) {
    FileReplayConnector connector(path_ + ".missing");
    RecordingListener listener;

    EXPECT_THROW(connector.join(meeting_, listener), meetscribe::utils::FatalConnectorException);
    EXPECT_FALSE(connector.isStreaming());
}

TEST_F(FileReplayConnectorTest, LeaveStopsRealtimeReplay) {
    writeSpeech(10000);
    FileReplayConnector connector(path_);
    RecordingListener listener;

    connector.join(meeting_, listener);
    EXPECT_TRUE(connector.isStreaming());
    EXPECT_THROW(connector.join(meeting_, listener), meetscribe::utils::ConnectorException);

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    connector.leave();
    const size_t delivered = listener.chunkCount();

    EXPECT_FALSE(connector.isStreaming());
    EXPECT_GT(delivered, 0u);
    EXPECT_LT(delivered, 500u);
    EXPECT_EQ(listener.ended, 0);

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(listener.chunkCount(), delivered);
}

TEST_F(FileReplayConnectorTest, CanReplayAgainAfterFinishing) {
    writeSpeech(200);
    FileReplayConnector::Options options;
    options.realtime = false;
    FileReplayConnector connector(path_, options);

    RecordingListener first;
    connector.join(meeting_, first);
    ASSERT_TRUE(first.waitForEnd(std::chrono::seconds(5)));
    while (connector.isStreaming()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    RecordingListener second;
    connector.join(meeting_, second);
    ASSERT_TRUE(second.waitForEnd(std::chrono::seconds(5)));
    connector.leave();

    EXPECT_EQ(first.chunkCount(), 10u);
    EXPECT_EQ(second.chunkCount(), 10u);
}
