#pragma once

#include "audio/meeting_connector.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace meetscribe {
namespace audio {

/**
 * Decoded mono WAV contents
 */
struct WavAudio {
    std::vector<float> samples;  // Downmixed to mono, [-1, 1]
    int sampleRate = 0;
    int channels = 0;
    int bitsPerSample = 0;

    double durationSeconds() const {
        return sampleRate > 0 ? static_cast<double>(samples.size()) / sampleRate : 0.0;
    }
};

/**
 * Connector that "attends" a meeting by replaying a WAV recording, in
 * chunkMs pieces, optionally paced at real time. Used for offline runs and
 * demos. The meeting URL is ignored.
 */
class FileReplayConnector : public MeetingConnector {
public:
    struct Options {
        int chunkMs = 20;
        bool realtime = true;
        int64_t startTimestampMs = 0;
    };

    FileReplayConnector(std::string wavPath, const Options& options);
    explicit FileReplayConnector(std::string wavPath);
    ~FileReplayConnector() override;

    FileReplayConnector(const FileReplayConnector&) = delete;
    FileReplayConnector& operator=(const FileReplayConnector&) = delete;

    void join(const MeetingInfo& meeting, ConnectorListener& listener) override;
    void leave() override;
    std::string getPlatformName() const override { return "file-replay"; }

    bool isStreaming() const { return streaming_.load(); }
    size_t chunksDelivered() const { return chunks_delivered_.load(); }

    /**
     * Load a PCM16 or float32 WAV file and downmix it to mono.
     * @return false if the file is missing, malformed or in another format
     */
    static bool loadWav(const std::string& path, WavAudio& out);

private:
    void replayLoop(ConnectorListener* listener);

    std::string wav_path_;
    Options options_;
    WavAudio audio_;

    std::unique_ptr<std::thread> replay_thread_;
    std::atomic<bool> should_stop_;
    std::atomic<bool> streaming_;
    std::atomic<size_t> chunks_delivered_;
};

} // namespace audio
} // namespace meetscribe
