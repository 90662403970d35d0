#include <gtest/gtest.h>
#include "ParameterStore.hpp"
#include <atomic>
#include <cmath>
#include <thread>

using namespace handtone;

TEST(ParameterStoreTest, DirectSettersOverwriteOneField) {
    ParameterStore store({440.0f, 0.2f, 0.3f});

    store.set_frequency(523.25f);
    auto p = store.snapshot();
    EXPECT_FLOAT_EQ(p.frequency, 523.25f);
    EXPECT_FLOAT_EQ(p.amplitude, 0.2f);
    EXPECT_FLOAT_EQ(p.room_size, 0.3f);

    store.set_amplitude(0.7f);
    store.set_room_size(1.5f);
    p = store.snapshot();
    EXPECT_FLOAT_EQ(p.frequency, 523.25f);
    EXPECT_FLOAT_EQ(p.amplitude, 0.7f);
    EXPECT_FLOAT_EQ(p.room_size, 1.5f);
}

TEST(ParameterStoreTest, SettersDoNotValidate) {
    ParameterStore store;
    store.set_amplitude(3.0f);
    store.set_frequency(-10.0f);
    auto p = store.snapshot();
    EXPECT_FLOAT_EQ(p.amplitude, 3.0f);
    EXPECT_FLOAT_EQ(p.frequency, -10.0f);
}

TEST(ParameterStoreTest, SmoothedUpdateBlendsTowardsTarget) {
    ParameterStore store({440.0f, 0.2f, 0.3f});
    store.set_smoothed(540.0f, 0.4f, 0.8f);

    auto p = store.snapshot();
    EXPECT_NEAR(p.frequency, 460.0f, 1e-3f);
    EXPECT_NEAR(p.amplitude, 0.24f, 1e-6f);
    EXPECT_NEAR(p.room_size, 0.4f, 1e-6f);
}

TEST(ParameterStoreTest, SmoothingConvergesMonotonicallyWithoutOvershoot) {
    for (float alpha : {0.05f, 0.2f, 0.5f, 0.9f, 1.0f}) {
        ParameterStore store({220.0f, 0.9f, 0.1f});
        const float f_target = 880.0f;
        const float a_target = 0.1f;
        const float r_target = 1.0f;

        auto prev = store.snapshot();
        for (int i = 0; i < 300; ++i) {
            store.set_smoothed(f_target, a_target, r_target, alpha);
            auto p = store.snapshot();

            // Rising fields never fall back or pass the target
            EXPECT_GE(p.frequency, prev.frequency);
            EXPECT_LE(p.frequency, f_target);
            EXPECT_GE(p.room_size, prev.room_size);
            EXPECT_LE(p.room_size, r_target);
            // Falling field never rises or drops below the target
            EXPECT_LE(p.amplitude, prev.amplitude);
            EXPECT_GE(p.amplitude, a_target);

            prev = p;
        }
        EXPECT_NEAR(prev.frequency, f_target, 1e-2f) << "alpha " << alpha;
        EXPECT_NEAR(prev.amplitude, a_target, 1e-5f) << "alpha " << alpha;
        EXPECT_NEAR(prev.room_size, r_target, 1e-5f) << "alpha " << alpha;
    }
}

TEST(ParameterStoreTest, AlphaOfOneJumpsToTarget) {
    ParameterStore store({440.0f, 0.2f, 0.3f});
    store.set_smoothed(330.0f, 0.5f, 0.9f, 1.0f);
    auto p = store.snapshot();
    EXPECT_FLOAT_EQ(p.frequency, 330.0f);
    EXPECT_FLOAT_EQ(p.amplitude, 0.5f);
    EXPECT_FLOAT_EQ(p.room_size, 0.9f);
}

TEST(ParameterStoreTest, StartStopToggleActive) {
    ParameterStore store;
    EXPECT_FALSE(store.is_active());
    store.start();
    EXPECT_TRUE(store.is_active());
    store.start();
    EXPECT_TRUE(store.is_active());
    store.stop();
    EXPECT_FALSE(store.is_active());
}

TEST(ParameterStoreTest, ConcurrentReadsNeverSeeTornRecord) {
    // The writer always stores three equal values; any mix of old and new
    // fields in a snapshot would show up as unequal values.
    ParameterStore store({1.0f, 1.0f, 1.0f});
    std::atomic<bool> running{true};
    std::atomic<int> torn{0};

    std::thread writer([&]() {
        for (int i = 0; i < 20000; ++i) {
            const float v = static_cast<float>(i % 1000);
            store.set_smoothed(v, v, v, 1.0f);
        }
        running = false;
    });

    std::thread reader([&]() {
        while (running) {
            auto p = store.snapshot();
            if (p.frequency != p.amplitude || p.amplitude != p.room_size) {
                ++torn;
            }
        }
    });

    writer.join();
    reader.join();
    EXPECT_EQ(torn.load(), 0);
}
