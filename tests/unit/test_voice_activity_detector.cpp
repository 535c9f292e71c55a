#include <gtest/gtest.h>
#include "audio/voice_activity_detector.hpp"
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

using namespace meetscribe::audio;

class VoiceActivityDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = VadConfig{};
        config_.energyThreshold = 0.02f;
        vad_ = std::make_unique<VoiceActivityDetector>(config_);
    }

    // Helper methods
    std::vector<float> generateSilence(size_t samples) {
        return std::vector<float>(samples, 0.0f);
    }

    std::vector<float> generateSpeech(size_t samples, float amplitude = 0.1f) {
        std::vector<float> speech(samples);
        for (size_t i = 0; i < samples; ++i) {
            speech[i] = amplitude * static_cast<float>(std::sin(2.0 * M_PI * 440.0 * i / 16000.0));
        }
        return speech;
    }

    std::vector<float> generateConstant(size_t samples, float level) {
        return std::vector<float>(samples, level);
    }

    VadConfig config_;
    std::unique_ptr<VoiceActivityDetector> vad_;
};

TEST_F(VoiceActivityDetectorTest, DefaultConfigIsValid) {
    EXPECT_TRUE(VadConfig{}.isValid());

    VadConfig bad;
    bad.energyThreshold = 0.0f;
    EXPECT_FALSE(bad.isValid());

    bad = VadConfig{};
    bad.adaptiveFactor = 0.5f;
    EXPECT_FALSE(bad.isValid());
}

TEST_F(VoiceActivityDetectorTest, RmsEnergyOfKnownSignals) {
    EXPECT_FLOAT_EQ(VoiceActivityDetector::calculateRmsEnergy({}), 0.0f);
    EXPECT_FLOAT_EQ(VoiceActivityDetector::calculateRmsEnergy(generateConstant(100, 0.5f)), 0.5f);
    EXPECT_FLOAT_EQ(VoiceActivityDetector::calculateRmsEnergy(generateConstant(100, -0.5f)), 0.5f);

    // Sine RMS is amplitude / sqrt(2)
    float rms = VoiceActivityDetector::calculateRmsEnergy(generateSpeech(16000, 0.1f));
    EXPECT_NEAR(rms, 0.1f / std::sqrt(2.0f), 1e-3f);
}

TEST_F(VoiceActivityDetectorTest, SilenceIsNotSpeech) {
    EXPECT_FLOAT_EQ(vad_->detectVoiceActivity(generateSilence(320)), 0.0f);
    EXPECT_FALSE(vad_->isSpeech(generateSilence(320)));
}

TEST_F(VoiceActivityDetectorTest, EmptyFrameIsNotSpeech) {
    EXPECT_FLOAT_EQ(vad_->detectVoiceActivity({}), 0.0f);
    EXPECT_FALSE(vad_->isSpeech({}));
}

TEST_F(VoiceActivityDetectorTest, LoudFrameIsSpeech) {
    float probability = vad_->detectVoiceActivity(generateSpeech(320, 0.3f));
    EXPECT_FLOAT_EQ(probability, 1.0f);
    EXPECT_TRUE(vad_->isSpeech(generateSpeech(320, 0.3f)));
}

TEST_F(VoiceActivityDetectorTest, ProbabilityScalesWithEnergy) {
    // Energy at the threshold sits exactly on the decision boundary
    EXPECT_NEAR(vad_->detectVoiceActivity(generateConstant(320, 0.02f)), 0.5f, 1e-5f);
    EXPECT_NEAR(vad_->detectVoiceActivity(generateConstant(320, 0.01f)), 0.25f, 1e-5f);
    EXPECT_NEAR(vad_->detectVoiceActivity(generateConstant(320, 0.03f)), 0.75f, 1e-5f);
}

TEST_F(VoiceActivityDetectorTest, QuietNoiseBelowThresholdIsSilence) {
    EXPECT_FALSE(vad_->isSpeech(generateConstant(320, 0.005f)));
}

TEST_F(VoiceActivityDetectorTest, AdaptiveThresholdTracksBackgroundNoise) {
    config_.useAdaptiveThreshold = true;
    config_.adaptiveFactor = 3.0f;
    vad_->setConfig(config_);

    EXPECT_FLOAT_EQ(vad_->currentThreshold(), 0.02f);

    // Steady background just under the decision boundary
    for (int i = 0; i < 20; ++i) {
        EXPECT_FALSE(vad_->isSpeech(generateConstant(320, 0.015f)));
    }

    EXPECT_NEAR(vad_->currentThreshold(), 0.045f, 1e-4f);

    // A level that used to count as speech is now background
    EXPECT_FALSE(vad_->isSpeech(generateConstant(320, 0.03f)));
    EXPECT_TRUE(vad_->isSpeech(generateSpeech(320, 0.3f)));
}

TEST_F(VoiceActivityDetectorTest, AdaptiveThresholdNeverDropsBelowFloor) {
    config_.useAdaptiveThreshold = true;
    vad_->setConfig(config_);

    for (int i = 0; i < 20; ++i) {
        vad_->isSpeech(generateSilence(320));
    }

    EXPECT_FLOAT_EQ(vad_->currentThreshold(), config_.energyThreshold);
}

TEST_F(VoiceActivityDetectorTest, ResetRestoresConfiguredThreshold) {
    config_.useAdaptiveThreshold = true;
    config_.adaptiveFactor = 3.0f;
    vad_->setConfig(config_);

    for (int i = 0; i < 10; ++i) {
        vad_->isSpeech(generateConstant(320, 0.015f));
    }
    EXPECT_GT(vad_->currentThreshold(), config_.energyThreshold);

    vad_->reset();
    EXPECT_FLOAT_EQ(vad_->currentThreshold(), config_.energyThreshold);
}
