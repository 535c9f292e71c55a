#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace meetscribe {
namespace utils {

namespace {

using json = nlohmann::json;

template <typename T>
void readValue(const json& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = section.at(key).get<T>();
    }
}

// Counts arrive as signed JSON numbers; -1 must not wrap to SIZE_MAX
void readCount(const json& section, const char* section_name, const char* key, size_t& target) {
    if (!section.contains(key)) {
        return;
    }
    const int64_t value = section.at(key).get<int64_t>();
    if (value < 1) {
        throw ConfigException(std::string(section_name) + "." + key + " must be at least 1",
                              std::to_string(value));
    }
    target = static_cast<size_t>(value);
}

void readMillis(const json& section, const char* key, std::chrono::milliseconds& target) {
    if (section.contains(key)) {
        target = std::chrono::milliseconds(section.at(key).get<int64_t>());
    }
}

void parseInto(const json& j, PipelineConfig& config) {
    if (!j.is_object()) {
        throw ConfigException("Configuration root must be a JSON object");
    }

    if (j.contains("audio")) {
        const auto& audio = j.at("audio");
        readValue(audio, "sampleRate", config.sampleRate);
        readCount(audio, "audio", "frameBufferCapacity", config.frameBufferCapacity);
    }

    if (j.contains("segmentation")) {
        const auto& seg = j.at("segmentation");
        readValue(seg, "silenceGapMs", config.silenceGapMs);
        readValue(seg, "maxSegmentMs", config.maxSegmentMs);
        readValue(seg, "minSegmentMs", config.minSegmentMs);
        readValue(seg, "vadEnergyThreshold", config.vadEnergyThreshold);
        readValue(seg, "adaptiveVad", config.adaptiveVad);
    }

    if (j.contains("workers")) {
        const auto& workers = j.at("workers");
        readCount(workers, "workers", "diarizationParallelism", config.diarizationParallelism);
        readCount(workers, "workers", "transcriptionParallelism", config.transcriptionParallelism);
        readCount(workers, "workers", "maxPendingSegments", config.maxPendingSegments);
    }

    if (j.contains("retry")) {
        const auto& retry = j.at("retry");
        readValue(retry, "maxAttempts", config.retry.maxAttempts);
        readMillis(retry, "initialBackoffMs", config.retry.initialBackoff);
        readMillis(retry, "maxBackoffMs", config.retry.maxBackoff);
        readValue(retry, "multiplier", config.retry.multiplier);
        readValue(retry, "jitter", config.retry.jitter);
    }

    if (j.contains("assembler")) {
        readMillis(j.at("assembler"), "segmentCompletionTimeoutMs", config.segmentCompletionTimeout);
    }

    if (j.contains("session")) {
        const auto& session = j.at("session");
        readMillis(session, "reconnectGraceMs", config.reconnectGrace);
        readMillis(session, "drainTimeoutMs", config.drainTimeout);
        readMillis(session, "cancelGraceMs", config.cancelGrace);
        readMillis(session, "checkpointIntervalMs", config.checkpointInterval);
        readMillis(session, "sweepIntervalMs", config.sweepInterval);
    }

    if (j.contains("logging")) {
        std::string level;
        readValue(j.at("logging"), "level", level);
        if (!level.empty() && !Logger::parseLevel(level, config.logLevel)) {
            throw ConfigException("Unknown logging.level", level);
        }
    }
}

} // namespace

PipelineConfig ConfigLoader::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigException("Cannot open configuration file", path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    Logger::info("Loading pipeline configuration from " + path);
    return loadFromString(buffer.str());
}

PipelineConfig ConfigLoader::loadFromString(const std::string& jsonStr) {
    PipelineConfig config;

    try {
        parseInto(json::parse(jsonStr), config);
    } catch (const json::exception& e) {
        throw ConfigException("Invalid configuration JSON", e.what());
    }

    auto validation = validate(config);
    for (const auto& warning : validation.warnings) {
        Logger::warn("Configuration: " + warning);
    }
    if (!validation.isValid) {
        std::string joined;
        for (const auto& error : validation.errors) {
            joined += (joined.empty() ? "" : "; ") + error;
        }
        throw ConfigException("Configuration validation failed", joined);
    }

    return config;
}

ConfigValidationResult ConfigLoader::validate(const PipelineConfig& config) {
    ConfigValidationResult result;

    if (config.sampleRate <= 0) {
        result.addError("audio.sampleRate must be greater than 0");
    }
    if (config.frameBufferCapacity == 0) {
        result.addError("audio.frameBufferCapacity must be greater than 0");
    }

    if (config.silenceGapMs <= 0) {
        result.addError("segmentation.silenceGapMs must be greater than 0");
    }
    if (config.maxSegmentMs <= 0) {
        result.addError("segmentation.maxSegmentMs must be greater than 0");
    }
    if (config.minSegmentMs < 0) {
        result.addError("segmentation.minSegmentMs must not be negative");
    }
    if (config.minSegmentMs >= config.maxSegmentMs) {
        result.addError("segmentation.minSegmentMs must be below segmentation.maxSegmentMs");
    }
    if (config.silenceGapMs >= config.maxSegmentMs) {
        result.addWarning("segmentation.silenceGapMs is not below maxSegmentMs; silence will rarely seal segments");
    }
    if (config.vadEnergyThreshold <= 0.0f || config.vadEnergyThreshold >= 1.0f) {
        result.addError("segmentation.vadEnergyThreshold must be between 0.0 and 1.0 (exclusive)");
    }

    if (config.diarizationParallelism == 0) {
        result.addError("workers.diarizationParallelism must be greater than 0");
    }
    if (config.transcriptionParallelism == 0) {
        result.addError("workers.transcriptionParallelism must be greater than 0");
    }
    if (config.maxPendingSegments == 0) {
        result.addError("workers.maxPendingSegments must be greater than 0");
    }

    if (config.retry.maxAttempts < 1) {
        result.addError("retry.maxAttempts must be at least 1");
    }
    if (config.retry.initialBackoff.count() < 0 || config.retry.maxBackoff.count() < 0) {
        result.addError("retry backoff values must not be negative");
    }
    if (config.retry.maxBackoff < config.retry.initialBackoff) {
        result.addError("retry.maxBackoffMs must not be below retry.initialBackoffMs");
    }
    if (config.retry.multiplier < 1.0) {
        result.addError("retry.multiplier must be at least 1.0");
    }

    if (config.segmentCompletionTimeout.count() <= 0) {
        result.addError("assembler.segmentCompletionTimeoutMs must be greater than 0");
    }

    if (config.reconnectGrace.count() < 0 || config.drainTimeout.count() < 0 ||
        config.cancelGrace.count() < 0 || config.checkpointInterval.count() < 0) {
        result.addError("session timing values must not be negative");
    }
    if (config.sweepInterval.count() <= 0) {
        result.addError("session.sweepIntervalMs must be greater than 0");
    }
    if (config.checkpointInterval.count() > 0 && config.checkpointInterval < config.sweepInterval) {
        result.addWarning("session.checkpointIntervalMs is below sweepIntervalMs; checkpoints follow the sweep cadence");
    }

    return result;
}

std::string ConfigLoader::toJson(const PipelineConfig& config) {
    json j;

    j["audio"] = {
        {"sampleRate", config.sampleRate},
        {"frameBufferCapacity", config.frameBufferCapacity}
    };

    j["segmentation"] = {
        {"silenceGapMs", config.silenceGapMs},
        {"maxSegmentMs", config.maxSegmentMs},
        {"minSegmentMs", config.minSegmentMs},
        {"vadEnergyThreshold", config.vadEnergyThreshold},
        {"adaptiveVad", config.adaptiveVad}
    };

    j["workers"] = {
        {"diarizationParallelism", config.diarizationParallelism},
        {"transcriptionParallelism", config.transcriptionParallelism},
        {"maxPendingSegments", config.maxPendingSegments}
    };

    j["retry"] = {
        {"maxAttempts", config.retry.maxAttempts},
        {"initialBackoffMs", config.retry.initialBackoff.count()},
        {"maxBackoffMs", config.retry.maxBackoff.count()},
        {"multiplier", config.retry.multiplier},
        {"jitter", config.retry.jitter}
    };

    j["assembler"] = {
        {"segmentCompletionTimeoutMs", config.segmentCompletionTimeout.count()}
    };

    j["session"] = {
        {"reconnectGraceMs", config.reconnectGrace.count()},
        {"drainTimeoutMs", config.drainTimeout.count()},
        {"cancelGraceMs", config.cancelGrace.count()},
        {"checkpointIntervalMs", config.checkpointInterval.count()},
        {"sweepIntervalMs", config.sweepInterval.count()}
    };

    j["logging"] = {
        {"level", Logger::levelToString(config.logLevel)}
    };

    return j.dump(2);
}

} // namespace utils
} // namespace meetscribe
