#pragma once

#include <cstddef>
#include <deque>
#include <vector>

namespace meetscribe {
namespace audio {

/**
 * VAD configuration parameters
 */
struct VadConfig {
    float energyThreshold = 0.01f;   // RMS level separating speech from silence
    bool useAdaptiveThreshold = false;
    float adaptiveFactor = 1.5f;     // Threshold = max(energyThreshold, background * factor)
    size_t historySize = 50;         // Frames tracked for the background estimate
    float speechProbability = 0.5f;  // Probability at which a frame counts as speech

    bool isValid() const {
        return energyThreshold > 0.0f && energyThreshold < 1.0f &&
               adaptiveFactor >= 1.0f && historySize > 0 &&
               speechProbability > 0.0f && speechProbability <= 1.0f;
    }
};

/**
 * Energy-based voice activity detector. Classifies one frame at a time; the
 * segmenter turns the per-frame decisions into boundaries.
 */
class VoiceActivityDetector {
public:
    explicit VoiceActivityDetector(const VadConfig& config = VadConfig{});

    void setConfig(const VadConfig& config);
    const VadConfig& getConfig() const { return config_; }

    /**
     * Speech probability in [0, 1] for one frame of samples
     */
    float detectVoiceActivity(const std::vector<float>& samples);

    bool isSpeech(const std::vector<float>& samples) {
        return detectVoiceActivity(samples) >= config_.speechProbability;
    }

    void reset();

    float currentThreshold() const { return threshold_; }

    static float calculateRmsEnergy(const std::vector<float>& samples);

private:
    void updateAdaptiveThreshold(float energy);

    VadConfig config_;
    float threshold_;
    std::deque<float> silenceHistory_;
};

} // namespace audio
} // namespace meetscribe
