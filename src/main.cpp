#include <iostream>
#include <string>
#include <memory>
#include <map>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include "audio/file_replay_connector.hpp"
#include "core/file_archive_store.hpp"
#include "core/pipeline_coordinator.hpp"
#include "core/transcript_json.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

using namespace meetscribe;

namespace {

/**
 * Stand-in speaker recognition for offline runs: splits voices on
 * zero-crossing rate, which roughly tracks pitch.
 */
class ZeroCrossingSpeakerEngine : public diarization::SpeakerRecognitionEngine {
public:
    core::BackendResult<diarization::SpeakerPayload> identifySpeaker(
        const core::SpeechRequest& request, const core::CancellationToken& token) override {
        if (token.isCancelled()) {
            return core::BackendResult<diarization::SpeakerPayload>::cancelled();
        }
        if (request.audio.size() < 2) {
            return core::BackendResult<diarization::SpeakerPayload>::permanentFailure("segment too short");
        }

        size_t crossings = 0;
        for (size_t i = 1; i < request.audio.size(); ++i) {
            if ((request.audio[i - 1] < 0.0f) != (request.audio[i] < 0.0f)) {
                crossings++;
            }
        }
        const float rate = static_cast<float>(crossings) * request.sampleRate /
                           static_cast<float>(request.audio.size());

        diarization::SpeakerPayload payload;
        payload.speakerLabel = rate < 2000.0f ? "speaker_1" : "speaker_2";
        payload.confidence = std::min(1.0f, std::fabs(rate - 2000.0f) / 2000.0f);
        return core::BackendResult<diarization::SpeakerPayload>::success(payload);
    }

    std::string getEngineName() const override { return "zero-crossing"; }
};

/**
 * Stand-in speech-to-text for offline runs: reports the speech length
 */
class DurationTranscriber : public stt::SpeechToTextEngine {
public:
    core::BackendResult<stt::TranscriptionPayload> transcribe(
        const core::SpeechRequest& request, const core::CancellationToken& token) override {
        if (token.isCancelled()) {
            return core::BackendResult<stt::TranscriptionPayload>::cancelled();
        }

        const double seconds = request.sampleRate > 0
            ? static_cast<double>(request.audio.size()) / request.sampleRate : 0.0;
        char text[64];
        std::snprintf(text, sizeof(text), "[speech %.1fs]", seconds);

        stt::TranscriptionPayload payload;
        payload.text = text;
        payload.confidence = 0.5f;
        return core::BackendResult<stt::TranscriptionPayload>::success(payload);
    }

    std::string getEngineName() const override { return "duration"; }
};

/**
 * Talk time per speaker; flags inaudible segments for review
 */
class TalkTimeSummarizer : public core::Summarizer {
public:
    core::MeetingSummary summarize(const std::string& session_id,
                                   const std::vector<core::TranscriptEntry>& transcript) override {
        std::map<std::string, int64_t> talk_ms;
        size_t inaudible = 0;
        size_t gaps = 0;
        for (const auto& entry : transcript) {
            if (entry.isGapMarker()) {
                gaps++;
                continue;
            }
            talk_ms[entry.speaker_label] += entry.end_ms - entry.start_ms;
            if (entry.text_degraded) {
                inaudible++;
            }
        }

        core::MeetingSummary summary;
        summary.notes = "Session " + session_id + ":";
        for (const auto& speaker : talk_ms) {
            summary.notes += " " + speaker.first + " spoke " +
                             std::to_string(speaker.second / 1000) + "s;";
        }
        if (inaudible > 0) {
            summary.action_items.push_back("Review " + std::to_string(inaudible) + " inaudible segments");
        }
        if (gaps > 0) {
            summary.action_items.push_back("Recover audio for " + std::to_string(gaps) + " connection gaps");
        }
        return summary;
    }
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " --wav <recording.wav> [options]\n"
              << "Options:\n"
              << "  --wav <path>       WAV recording to replay as meeting audio (required)\n"
              << "  --config <path>    Pipeline configuration JSON\n"
              << "  --archive <dir>    Transcript archive directory (default: transcripts)\n"
              << "  --session <id>     Session id (default: generated)\n"
              << "  --fast             Replay as fast as possible instead of in real time\n"
              << "  --help, -h         Show this help message\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string wav_path;
    std::string config_path;
    std::string archive_dir = "transcripts";
    std::string session_id;
    bool realtime = true;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--wav" && i + 1 < argc) {
            wav_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--archive" && i + 1 < argc) {
            archive_dir = argv[++i];
        } else if (arg == "--session" && i + 1 < argc) {
            session_id = argv[++i];
        } else if (arg == "--fast") {
            realtime = false;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
    }

    if (wav_path.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    try {
        utils::PipelineConfig config;
        if (!config_path.empty()) {
            config = utils::ConfigLoader::loadFromFile(config_path);
        }
        utils::Logger::initialize(config.logLevel);

        audio::FileReplayConnector::Options replay;
        replay.realtime = realtime;
        auto connector = std::make_shared<audio::FileReplayConnector>(wav_path, replay);

        core::PipelineCoordinator coordinator(config, connector,
                                              std::make_shared<DurationTranscriber>(),
                                              std::make_shared<ZeroCrossingSpeakerEngine>(),
                                              std::make_shared<core::FileArchiveStore>(archive_dir),
                                              std::make_shared<TalkTimeSummarizer>(),
                                              session_id);

        coordinator.setEntryCallback([](const core::TranscriptEntry& entry) {
            std::cout << core::formatTranscriptText({entry}) << std::flush;
        });

        audio::MeetingInfo meeting;
        meeting.meetingUrl = "file://" + wav_path;
        meeting.platform = connector->getPlatformName();

        std::cout << "Starting MeetScribe session " << coordinator.getSessionId() << std::endl;
        coordinator.start(meeting);
        auto report = coordinator.waitUntilClosed();

        std::cout << "\n=== Transcript (" << core::sessionOutcomeToString(report.outcome) << ") ===\n"
                  << core::formatTranscriptText(report.transcript);
        if (report.has_summary) {
            std::cout << "\n=== Notes ===\n" << report.summary.notes << "\n";
            for (const auto& item : report.summary.action_items) {
                std::cout << "  - " << item << "\n";
            }
        }
        std::cout << "\nSegments: " << report.stats.segments_submitted << " transcribed, "
                  << report.stats.segments_discarded << " discarded; frames dropped: "
                  << report.stats.frames_dropped << std::endl;

        if (report.outcome == core::SessionOutcome::EMPTY_SESSION_FAILURE) {
            std::cerr << "Error: " << report.failure_reason << std::endl;
            return 1;
        }

    } catch (const utils::MeetScribeException& e) {
        utils::ErrorHandler::getInstance().reportError(e, "main");
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
