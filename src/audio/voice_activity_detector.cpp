#include "audio/voice_activity_detector.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace meetscribe {
namespace audio {

VoiceActivityDetector::VoiceActivityDetector(const VadConfig& config)
    : config_(config), threshold_(config.energyThreshold) {
}

void VoiceActivityDetector::setConfig(const VadConfig& config) {
    config_ = config;
    reset();
}

float VoiceActivityDetector::detectVoiceActivity(const std::vector<float>& samples) {
    if (samples.empty()) {
        return 0.0f;
    }

    float energy = calculateRmsEnergy(samples);
    float threshold = config_.useAdaptiveThreshold ? threshold_ : config_.energyThreshold;

    // Energy at the threshold maps to 0.5, twice the threshold to 1.0
    float probability = std::min(1.0f, energy / (2.0f * threshold));

    if (config_.useAdaptiveThreshold && probability < config_.speechProbability) {
        updateAdaptiveThreshold(energy);
    }

    return std::max(0.0f, probability);
}

void VoiceActivityDetector::reset() {
    silenceHistory_.clear();
    threshold_ = config_.energyThreshold;
}

float VoiceActivityDetector::calculateRmsEnergy(const std::vector<float>& samples) {
    if (samples.empty()) {
        return 0.0f;
    }

    double energy = 0.0;
    for (float sample : samples) {
        energy += static_cast<double>(sample) * sample;
    }

    return static_cast<float>(std::sqrt(energy / samples.size()));
}

void VoiceActivityDetector::updateAdaptiveThreshold(float energy) {
    silenceHistory_.push_back(energy);
    if (silenceHistory_.size() > config_.historySize) {
        silenceHistory_.pop_front();
    }

    if (silenceHistory_.size() >= 3) {
        float background = std::accumulate(silenceHistory_.begin(), silenceHistory_.end(), 0.0f) /
                           static_cast<float>(silenceHistory_.size());
        threshold_ = std::max(config_.energyThreshold, background * config_.adaptiveFactor);
    }
}

} // namespace audio
} // namespace meetscribe
