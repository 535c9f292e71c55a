#include "audio/file_replay_connector.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <fstream>

namespace meetscribe {
namespace audio {

namespace {
struct WavHeader {
    char riff[4];
    uint32_t chunkSize;
    char wave[4];
    char fmt[4];
    uint32_t subchunk1Size;
    uint16_t audioFormat;  // 1=PCM, 3=float
    uint16_t numChannels;
    uint32_t sampleRate;
    uint32_t byteRate;
    uint16_t blockAlign;
    uint16_t bitsPerSample;
};
} // namespace

FileReplayConnector::FileReplayConnector(std::string wavPath, const Options& options)
    : wav_path_(std::move(wavPath))
    , options_(options)
    , should_stop_(false)
    , streaming_(false)
    , chunks_delivered_(0) {
    if (options_.chunkMs <= 0) {
        options_.chunkMs = 20;
    }
}

FileReplayConnector::FileReplayConnector(std::string wavPath)
    : FileReplayConnector(std::move(wavPath), Options{}) {
}

FileReplayConnector::~FileReplayConnector() {
    leave();
}

bool FileReplayConnector::loadWav(const std::string& path, WavAudio& out) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        return false;
    }

    WavHeader hdr{};
    if (!f.read(reinterpret_cast<char*>(&hdr), sizeof(hdr))) {
        return false;
    }
    if (std::strncmp(hdr.riff, "RIFF", 4) != 0 || std::strncmp(hdr.wave, "WAVE", 4) != 0) {
        return false;
    }
    if (hdr.numChannels == 0 || hdr.sampleRate == 0) {
        return false;
    }

    // Skip the fmt extension, then scan for the data chunk
    uint32_t fmtExtra = hdr.subchunk1Size > 16 ? hdr.subchunk1Size - 16 : 0;
    if (fmtExtra) {
        f.seekg(fmtExtra, std::ios::cur);
    }

    char chunkId[4];
    uint32_t chunkSize = 0;
    bool found = false;
    while (f.read(chunkId, 4)) {
        if (!f.read(reinterpret_cast<char*>(&chunkSize), 4)) {
            return false;
        }
        if (std::strncmp(chunkId, "data", 4) == 0) {
            found = true;
            break;
        }
        // RIFF chunks are word aligned; odd sizes carry one pad byte
        f.seekg(static_cast<std::streamoff>(chunkSize) + (chunkSize & 1), std::ios::cur);
    }
    if (!found) {
        return false;
    }

    const size_t channels = hdr.numChannels;
    const size_t bytesPerSample = hdr.bitsPerSample / 8;
    if (bytesPerSample == 0) {
        return false;
    }
    const size_t frameCount = chunkSize / (bytesPerSample * channels);

    out.samples.assign(frameCount, 0.0f);

    if (hdr.audioFormat == 1 && hdr.bitsPerSample == 16) {
        std::vector<int16_t> buf(frameCount * channels);
        if (!f.read(reinterpret_cast<char*>(buf.data()), buf.size() * sizeof(int16_t))) {
            return false;
        }
        for (size_t i = 0; i < frameCount; ++i) {
            int sum = 0;
            for (size_t c = 0; c < channels; ++c) {
                sum += buf[i * channels + c];
            }
            out.samples[i] = static_cast<float>(sum) / static_cast<float>(channels) / 32768.0f;
        }
    } else if (hdr.audioFormat == 3 && hdr.bitsPerSample == 32) {
        std::vector<float> buf(frameCount * channels);
        if (!f.read(reinterpret_cast<char*>(buf.data()), buf.size() * sizeof(float))) {
            return false;
        }
        for (size_t i = 0; i < frameCount; ++i) {
            float sum = 0.0f;
            for (size_t c = 0; c < channels; ++c) {
                sum += buf[i * channels + c];
            }
            out.samples[i] = std::clamp(sum / static_cast<float>(channels), -1.0f, 1.0f);
        }
    } else {
        return false;
    }

    out.sampleRate = static_cast<int>(hdr.sampleRate);
    out.channels = hdr.numChannels;
    out.bitsPerSample = hdr.bitsPerSample;
    return true;
}

void FileReplayConnector::join(const MeetingInfo& meeting, ConnectorListener& listener) {
    if (streaming_.load()) {
        throw utils::ConnectorException("Replay already running for " + wav_path_);
    }

    // A previous replay that ran to the end still owns a joinable thread
    if (replay_thread_) {
        if (replay_thread_->joinable()) {
            replay_thread_->join();
        }
        replay_thread_.reset();
    }

    audio_ = WavAudio{};
    if (!loadWav(wav_path_, audio_)) {
        throw utils::FatalConnectorException("Cannot load WAV recording: " + wav_path_);
    }

    utils::Logger::info("Replaying " + wav_path_ + " (" + std::to_string(audio_.durationSeconds()) +
                        "s, " + std::to_string(audio_.sampleRate) + "Hz) as '" +
                        meeting.botDisplayName + "'");

    should_stop_ = false;
    streaming_ = true;
    chunks_delivered_ = 0;
    replay_thread_ = std::make_unique<std::thread>(&FileReplayConnector::replayLoop, this, &listener);
}

void FileReplayConnector::leave() {
    should_stop_ = true;
    if (replay_thread_ && replay_thread_->joinable()) {
        if (replay_thread_->get_id() == std::this_thread::get_id()) {
            // leave() from inside a listener callback: the loop exits on its own
            replay_thread_->detach();
        } else {
            replay_thread_->join();
        }
    }
    replay_thread_.reset();
    streaming_ = false;
}

void FileReplayConnector::replayLoop(ConnectorListener* listener) {
    const size_t samplesPerChunk = std::max<size_t>(
        1, static_cast<size_t>(audio_.sampleRate) * static_cast<size_t>(options_.chunkMs) / 1000);
    size_t cursor = 0;
    auto nextDelivery = std::chrono::steady_clock::now();

    while (!should_stop_.load() && cursor < audio_.samples.size()) {
        const size_t n = std::min(samplesPerChunk, audio_.samples.size() - cursor);

        RawAudioChunk chunk;
        chunk.samples.assign(audio_.samples.begin() + cursor, audio_.samples.begin() + cursor + n);
        chunk.sampleRate = audio_.sampleRate;
        chunk.captureTimestampMs = options_.startTimestampMs +
            static_cast<int64_t>(cursor) * 1000 / audio_.sampleRate;
        chunk.durationMs = static_cast<int64_t>(n) * 1000 / audio_.sampleRate;
        cursor += n;

        listener->onAudioFrame(chunk);
        chunks_delivered_++;

        if (options_.realtime) {
            nextDelivery += std::chrono::microseconds(static_cast<int64_t>(n) * 1000000 / audio_.sampleRate);
            std::this_thread::sleep_until(nextDelivery);
        }
    }

    if (!should_stop_.load()) {
        utils::Logger::info("Replay of " + wav_path_ + " finished after " +
                            std::to_string(chunks_delivered_.load()) + " chunks");
        listener->onStreamEnded();
    }
    streaming_ = false;
}

} // namespace audio
} // namespace meetscribe
