#include <gtest/gtest.h>
#include "fx/ReverbProcessor.hpp"
#include <cmath>
#include <vector>

using namespace handtone;

class ReverbProcessorTest : public ::testing::Test {
protected:
    const int sample_rate = 16000;
    const size_t block_size = 1024;

    std::vector<float> sine(float freq, float amplitude, size_t frames) const {
        std::vector<float> out(frames);
        for (size_t i = 0; i < frames; ++i) {
            out[i] = amplitude * static_cast<float>(std::sin(2.0 * M_PI * freq * i / sample_rate));
        }
        return out;
    }
};

TEST_F(ReverbProcessorTest, ImpulseWithEchoesPastBlockEndIsUnchanged) {
    ReverbProcessor reverb(sample_rate);
    const std::vector<float> impulse = {1, 0, 0, 0, 0, 0, 0, 0};

    // delay = floor((0.25 / 5) * 16000) = 800, beyond an 8-sample block
    EXPECT_EQ(reverb.delay_samples(0.25f, 5), 800u);
    auto out = reverb.apply(impulse, 0.25f, 0.6f, 5);

    ASSERT_EQ(out.size(), impulse.size());
    for (size_t i = 0; i < impulse.size(); ++i) {
        EXPECT_FLOAT_EQ(out[i], impulse[i]) << "index " << i;
    }
}

TEST_F(ReverbProcessorTest, EchoesLandAtMultiplesOfDelay) {
    // 8 Hz keeps the arithmetic exact: delay = floor((1.0 / 4) * 8) = 2
    ReverbProcessor reverb(8);
    std::vector<float> impulse(8, 0.0f);
    impulse[0] = 1.0f;

    auto out = reverb.apply(impulse, 1.0f, 0.5f, 4);

    const std::vector<float> expected = {1.0f, 0.0f, 0.5f, 0.0f, 0.25f, 0.0f, 0.125f, 0.0f};
    ASSERT_EQ(out.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_NEAR(out[i], expected[i], 1e-6f) << "index " << i;
    }
}

TEST_F(ReverbProcessorTest, EchoesReadTheDrySignalOnly) {
    ReverbProcessor reverb(8);
    std::vector<float> signal = {0.1f, 0.2f, 0.0f, 0.0f};

    // delay 1, two echoes: out[j] = s[j] + 0.5 s[j-1] + 0.25 s[j-2]
    auto out = reverb.apply(signal, 0.25f, 0.5f, 2);

    EXPECT_NEAR(out[0], 0.1f, 1e-6f);
    EXPECT_NEAR(out[1], 0.2f + 0.05f, 1e-6f);
    EXPECT_NEAR(out[2], 0.1f + 0.025f, 1e-6f);
    EXPECT_NEAR(out[3], 0.05f, 1e-6f);
}

TEST_F(ReverbProcessorTest, OutputKeepsLengthAndRange) {
    ReverbProcessor reverb(sample_rate);
    for (float freq : {55.0f, 440.0f, 1760.0f, 7000.0f}) {
        for (float amp : {0.0f, 0.2f, 0.5f, 1.0f}) {
            for (float room : {0.0f, 0.01f, 0.1f, 0.3f, 1.0f, 5.0f}) {
                const auto signal = sine(freq, amp, block_size);
                const auto out = reverb.apply(signal, room);
                ASSERT_EQ(out.size(), signal.size());
                for (float s : out) {
                    ASSERT_GE(s, -1.0f);
                    ASSERT_LE(s, 1.0f);
                }
            }
        }
    }
}

TEST_F(ReverbProcessorTest, IsDeterministic) {
    ReverbProcessor reverb(sample_rate);
    const auto signal = sine(330.0f, 0.4f, block_size);

    const auto first = reverb.apply(signal, 0.02f, 0.6f, 5);
    const auto second = reverb.apply(signal, 0.02f, 0.6f, 5);
    EXPECT_EQ(first, second);
}

TEST_F(ReverbProcessorTest, ZeroReverbTimeStacksEchoesOnTheDrySample) {
    ReverbProcessor reverb(sample_rate);
    EXPECT_EQ(reverb.delay_samples(0.0f, 5), 0u);

    // 1 + 0.6 + 0.36 + 0.216 + 0.1296 + 0.07776 = 2.38336
    const std::vector<float> quiet(16, 0.1f);
    auto out = reverb.apply(quiet, 0.0f);
    for (float s : out) {
        EXPECT_NEAR(s, 0.238336f, 1e-5f);
    }

    const std::vector<float> loud(16, 0.5f);
    out = reverb.apply(loud, 0.0f);
    for (float s : out) {
        EXPECT_FLOAT_EQ(s, 1.0f);
    }

    const std::vector<float> negative(16, -0.5f);
    out = reverb.apply(negative, 0.0f);
    for (float s : out) {
        EXPECT_FLOAT_EQ(s, -1.0f);
    }
}

TEST_F(ReverbProcessorTest, ZeroEchoesOnlyClamps) {
    ReverbProcessor reverb(sample_rate);
    EXPECT_EQ(reverb.delay_samples(0.3f, 0), 0u);

    const std::vector<float> signal = {0.5f, 1.5f, -2.0f, 0.25f};
    auto out = reverb.apply(signal, 0.3f, 0.6f, 0);
    EXPECT_FLOAT_EQ(out[0], 0.5f);
    EXPECT_FLOAT_EQ(out[1], 1.0f);
    EXPECT_FLOAT_EQ(out[2], -1.0f);
    EXPECT_FLOAT_EQ(out[3], 0.25f);
}

TEST_F(ReverbProcessorTest, NegativeOrNonFiniteReverbTimeActsAsZero) {
    ReverbProcessor reverb(sample_rate);
    EXPECT_EQ(reverb.delay_samples(-1.0f, 5), 0u);
    EXPECT_EQ(reverb.delay_samples(std::nanf(""), 5), 0u);

    const std::vector<float> signal(8, 0.1f);
    EXPECT_EQ(reverb.apply(signal, -1.0f), reverb.apply(signal, 0.0f));
}

TEST_F(ReverbProcessorTest, HugeReverbTimeDropsEveryEcho) {
    ReverbProcessor reverb(sample_rate);
    const auto signal = sine(440.0f, 0.5f, block_size);
    const auto out = reverb.apply(signal, 1e30f);
    for (size_t i = 0; i < signal.size(); ++i) {
        EXPECT_FLOAT_EQ(out[i], signal[i]);
    }
}

TEST_F(ReverbProcessorTest, PullMatchesApply) {
    ReverbProcessor reverb(sample_rate, 0.02f, 0.6f, 5);
    const auto signal = sine(440.0f, 0.3f, block_size);

    std::vector<float> block = signal;
    reverb.pull(std::span<float>(block));

    EXPECT_EQ(block, reverb.apply(signal, 0.02f, 0.6f, 5));
}
