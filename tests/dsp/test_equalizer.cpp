/**
 * @file test_equalizer.cpp
 * @brief Unit tests for the biquad filters and the equalizer chain
 */

#include <gtest/gtest.h>

#include "dsp/Biquad.hpp"
#include "dsp/Equalizer.hpp"

#include "utils/TestHelpers.hpp"

#include <cmath>

using namespace EigenPlayer;
using namespace EigenPlayer::Test;

namespace {

constexpr float kSampleRate = 44100.0f;
constexpr size_t kSettle = 4410;

float DbToGain(float db) {
    return std::pow(10.0f, db / 20.0f);
}

/**
 * @brief Steady-state gain of a single band for a sine at frequency
 */
float MeasureGain(const EqBand& band, float frequency) {
    auto input = MakeSine(frequency, kSampleRate, 44100);
    Biquad filter(BiquadCoefficients::Design(band, kSampleRate));
    std::vector<float> output(input.size());
    for (size_t i = 0; i < input.size(); ++i) {
        output[i] = filter.Process(input[i]);
    }
    return Rms(output, kSettle) / Rms(input, kSettle);
}

} // namespace

// =============================================================================
// Coefficient Design Tests
// =============================================================================

TEST(BiquadDesignTest, DefaultCoefficientsAreIdentity) {
    BiquadCoefficients c;
    EXPECT_FLOAT_EQ(1.0f, c.b0);
    EXPECT_FLOAT_EQ(0.0f, c.b1);
    EXPECT_FLOAT_EQ(0.0f, c.b2);
    EXPECT_FLOAT_EQ(0.0f, c.a1);
    EXPECT_FLOAT_EQ(0.0f, c.a2);
}

TEST(BiquadDesignTest, UnknownTypeIsIdentity) {
    auto c = BiquadCoefficients::Design(EqBand{1000.0f, 1.0f, 12.0f, 7}, kSampleRate);
    EXPECT_FLOAT_EQ(1.0f, c.b0);
    EXPECT_FLOAT_EQ(0.0f, c.b1);
    EXPECT_FLOAT_EQ(0.0f, c.b2);
    EXPECT_FLOAT_EQ(0.0f, c.a1);
    EXPECT_FLOAT_EQ(0.0f, c.a2);
}

TEST(BiquadDesignTest, PeakingAtZeroGainMatchesNumeratorAndDenominator) {
    auto c = BiquadCoefficients::Design(EqBand{1000.0f, 0.5f, 0.0f, 1}, kSampleRate);
    EXPECT_NEAR(1.0f, c.b0, 1e-6f);
    EXPECT_FLOAT_EQ(c.a1, c.b1);
    EXPECT_FLOAT_EQ(c.a2, c.b2);
}

TEST(BiquadDesignTest, PeakingCutAtCenterFrequency) {
    const float gain = MeasureGain(EqBand{1000.0f, 0.5f, -20.0f, 1}, 1000.0f);
    EXPECT_NEAR(DbToGain(-20.0f), gain, 0.01f);
}

TEST(BiquadDesignTest, PeakingBoostLeavesDistantFrequencies) {
    const float gain = MeasureGain(EqBand{1000.0f, 2.0f, 6.0f, 1}, 15000.0f);
    EXPECT_NEAR(1.0f, gain, 0.05f);
}

TEST(BiquadDesignTest, LowShelfAppliesGainBelowCorner) {
    const float gain = MeasureGain(EqBand{1000.0f, 0.707f, 6.0f, 0}, 40.0f);
    EXPECT_NEAR(DbToGain(6.0f), gain, 0.05f);
}

TEST(BiquadDesignTest, HighShelfAppliesGainAboveCorner) {
    const float gain = MeasureGain(EqBand{1000.0f, 0.707f, -6.0f, 2}, 16000.0f);
    EXPECT_NEAR(DbToGain(-6.0f), gain, 0.03f);
}

// =============================================================================
// Biquad State Tests
// =============================================================================

TEST(BiquadTest, ChannelsKeepSeparateState) {
    auto coeffs = BiquadCoefficients::Design(EqBand{500.0f, 1.0f, 9.0f, 1}, kSampleRate);
    Biquad stereo(coeffs, 2);
    Biquad mono(coeffs, 1);

    auto left = RandomSignal(256, 1);
    for (size_t i = 0; i < left.size(); ++i) {
        const float expected = mono.Process(left[i]);
        const float actual = stereo.Process(left[i], 0);
        stereo.Process(0.0f, 1);
        EXPECT_FLOAT_EQ(expected, actual);
    }
}

TEST(BiquadTest, ResetClearsHistory) {
    auto coeffs = BiquadCoefficients::Design(EqBand{500.0f, 1.0f, 9.0f, 1}, kSampleRate);
    Biquad a(coeffs);
    Biquad b(coeffs);

    for (float s : RandomSignal(128)) {
        a.Process(s);
    }
    a.Reset();

    for (float s : RandomSignal(64, 7)) {
        EXPECT_FLOAT_EQ(b.Process(s), a.Process(s));
    }
}

TEST(BiquadTest, ZeroChannelsFallsBackToOne) {
    Biquad filter({}, 0);
    EXPECT_EQ(1, filter.GetChannels());
}

// =============================================================================
// Equalizer Tests
// =============================================================================

TEST(EqualizerTest, DisabledIsIdentity) {
    EqBandList bands = {{1000.0f, 0.5f, -20.0f, 1}, {100.0f, 0.7f, 12.0f, 0}};
    auto eq = Equalizer::FromConfig(bands, false, kSampleRate);

    for (float s : RandomSignal(512)) {
        EXPECT_EQ(s, eq.Process(s));
    }
}

TEST(EqualizerTest, ZeroGainPeakingChainIsIdentity) {
    EqBandList bands = {{1000.0f, 0.5f, 0.0f, 1}, {2000.0f, 0.5f, 0.0f, 1}, {3000.0f, 0.5f, 0.0f, 1}};
    auto eq = Equalizer::FromConfig(bands, true, kSampleRate);

    for (float s : RandomSignal(1024)) {
        EXPECT_NEAR(s, eq.Process(s), 1e-5f);
    }
}

TEST(EqualizerTest, EmptyChainIsIdentity) {
    auto eq = Equalizer::FromConfig({}, true, kSampleRate);
    EXPECT_EQ(0u, eq.GetBandCount());
    EXPECT_FLOAT_EQ(0.25f, eq.Process(0.25f));
}

TEST(EqualizerTest, BandsApplyInSeries) {
    EqBandList bands = {{1000.0f, 0.5f, -10.0f, 1}, {1000.0f, 0.5f, -10.0f, 1}};
    auto eq = Equalizer::FromConfig(bands, true, kSampleRate);

    auto input = MakeSine(1000.0f, kSampleRate, 44100);
    std::vector<float> output;
    output.reserve(input.size());
    for (float s : input) {
        output.push_back(eq.Process(s));
    }
    EXPECT_NEAR(DbToGain(-20.0f), Rms(output, kSettle) / Rms(input, kSettle), 0.01f);
}

TEST(EqualizerTest, ProcessInterleavedMatchesPerChannelProcessing) {
    EqBandList bands = {{800.0f, 1.0f, 6.0f, 1}};
    auto interleaved = Equalizer::FromConfig(bands, true, kSampleRate, 2);
    auto reference = Equalizer::FromConfig(bands, true, kSampleRate, 2);

    auto buffer = RandomSignal(2 * 300);
    auto expected = buffer;
    for (size_t i = 0; i < expected.size(); ++i) {
        expected[i] = reference.Process(expected[i], static_cast<int>(i % 2));
    }

    interleaved.ProcessInterleaved(buffer.data(), 300);
    for (size_t i = 0; i < buffer.size(); ++i) {
        EXPECT_FLOAT_EQ(expected[i], buffer[i]);
    }
}

TEST(EqualizerTest, UpdateBandsReplacesChain) {
    auto eq = Equalizer::FromConfig({{1000.0f, 0.5f, -20.0f, 1}}, true, kSampleRate);
    EXPECT_EQ(1u, eq.GetBandCount());

    EqBandList bands = {{100.0f, 0.7f, 3.0f, 0}, {8000.0f, 0.7f, -3.0f, 2}};
    eq.UpdateBands(bands);
    EXPECT_EQ(bands, eq.GetBands());
    EXPECT_EQ(2u, eq.GetBandCount());
}

TEST(EqualizerTest, SetSampleRateRecomputesCoefficients) {
    auto eq = Equalizer::FromConfig({{1000.0f, 0.5f, -20.0f, 1}}, true, 44100.0f);
    const auto before = eq.GetFilter(0).GetCoefficients();

    eq.SetSampleRate(48000.0f);
    const auto after = eq.GetFilter(0).GetCoefficients();

    EXPECT_FLOAT_EQ(48000.0f, eq.GetSampleRate());
    EXPECT_NE(before.a1, after.a1);
}

TEST(EqualizerTest, EnableToggle) {
    auto eq = Equalizer::FromConfig({{1000.0f, 0.5f, -20.0f, 1}}, false, kSampleRate);
    EXPECT_FALSE(eq.IsEnabled());
    eq.SetEnabled(true);
    EXPECT_TRUE(eq.IsEnabled());
}
