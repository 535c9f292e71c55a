#pragma once

#include "utils/logging.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace meetscribe {
namespace utils {

/**
 * Bounded exponential backoff parameters shared by both inference workers
 */
struct RetrySettings {
    int maxAttempts = 3;
    std::chrono::milliseconds initialBackoff{100};
    std::chrono::milliseconds maxBackoff{2000};
    double multiplier = 2.0;
    bool jitter = true;
};

/**
 * Every option the pipeline recognizes. Defaults are usable as-is.
 */
struct PipelineConfig {
    // Audio
    int sampleRate = 16000;
    size_t frameBufferCapacity = 500;

    // Segmentation
    int64_t silenceGapMs = 600;
    int64_t maxSegmentMs = 15000;
    int64_t minSegmentMs = 250;
    float vadEnergyThreshold = 0.01f;
    bool adaptiveVad = false;

    // Workers
    size_t diarizationParallelism = 2;
    size_t transcriptionParallelism = 2;
    size_t maxPendingSegments = 64;
    RetrySettings retry;

    // Assembler
    std::chrono::milliseconds segmentCompletionTimeout{30000};

    // Session lifecycle
    std::chrono::milliseconds reconnectGrace{60000};
    std::chrono::milliseconds drainTimeout{10000};
    std::chrono::milliseconds cancelGrace{2000};
    std::chrono::milliseconds checkpointInterval{0};
    std::chrono::milliseconds sweepInterval{200};

    LogLevel logLevel = LogLevel::INFO;
};

/**
 * Configuration validation result
 */
struct ConfigValidationResult {
    bool isValid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void addError(const std::string& error) {
        errors.push_back(error);
        isValid = false;
    }

    void addWarning(const std::string& warning) {
        warnings.push_back(warning);
    }

    bool hasErrors() const { return !errors.empty(); }
    bool hasWarnings() const { return !warnings.empty(); }
};

/**
 * Loads PipelineConfig from JSON documents of the form
 *
 *   { "audio": {...}, "segmentation": {...}, "workers": {...}, "retry": {...},
 *     "assembler": {...}, "session": {...}, "logging": {"level": "INFO"} }
 *
 * Missing sections and keys keep their defaults. Malformed JSON, wrongly typed
 * values and failed validation throw ConfigException.
 */
class ConfigLoader {
public:
    static PipelineConfig loadFromFile(const std::string& path);
    static PipelineConfig loadFromString(const std::string& json);

    static ConfigValidationResult validate(const PipelineConfig& config);
    static std::string toJson(const PipelineConfig& config);
};

} // namespace utils
} // namespace meetscribe
