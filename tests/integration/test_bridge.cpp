#include <gtest/gtest.h>
#include "CInterface.h"
#include <cmath>
#include <filesystem>
#include <fstream>

// No sound card is assumed: the engines here point at a device name ALSA
// cannot resolve, so start() fails the same way everywhere.
class BridgeTest : public ::testing::Test {
protected:
    const unsigned int sample_rate = 16000;
    const unsigned int block_size = 1024;
    const char* missing_device = "handtone_no_such_device";
};

TEST_F(BridgeTest, LifecycleAndParameters) {
    EngineHandle engine = engine_create(sample_rate, block_size, missing_device);
    ASSERT_NE(engine, nullptr);

    float freq = 0.0f, amp = 0.0f, room = 0.0f;
    ASSERT_EQ(engine_get_parameters(engine, &freq, &amp, &room), HANDTONE_OK);
    EXPECT_FLOAT_EQ(freq, 440.0f);
    EXPECT_FLOAT_EQ(amp, 0.2f);
    EXPECT_FLOAT_EQ(room, 0.3f);

    EXPECT_EQ(engine_update_targets(engine, 540.0f, 0.4f, 0.8f), HANDTONE_OK);
    ASSERT_EQ(engine_get_parameters(engine, &freq, &amp, &room), HANDTONE_OK);
    EXPECT_NEAR(freq, 460.0f, 1e-3f);
    EXPECT_NEAR(amp, 0.24f, 1e-6f);
    EXPECT_NEAR(room, 0.4f, 1e-6f);

    EXPECT_EQ(engine_set_frequency(engine, 330.0f), HANDTONE_OK);
    EXPECT_EQ(engine_set_amplitude(engine, 0.5f), HANDTONE_OK);
    EXPECT_EQ(engine_set_room_size(engine, 0.9f), HANDTONE_OK);
    ASSERT_EQ(engine_get_parameters(engine, &freq, &amp, &room), HANDTONE_OK);
    EXPECT_FLOAT_EQ(freq, 330.0f);
    EXPECT_FLOAT_EQ(amp, 0.5f);
    EXPECT_FLOAT_EQ(room, 0.9f);

    engine_destroy(engine);
}

TEST_F(BridgeTest, StartOnMissingDeviceReportsUnavailable) {
    EngineHandle engine = engine_create(sample_rate, block_size, missing_device);
    ASSERT_NE(engine, nullptr);

    EXPECT_EQ(engine_start(engine), HANDTONE_ERR_DEVICE_UNAVAILABLE);
    EXPECT_EQ(engine_is_running(engine), 0);

    // Store is unaffected by the failed open
    float freq = 0.0f;
    ASSERT_EQ(engine_get_parameters(engine, &freq, nullptr, nullptr), HANDTONE_OK);
    EXPECT_FLOAT_EQ(freq, 440.0f);

    EXPECT_EQ(engine_stop(engine), HANDTONE_OK);
    engine_destroy(engine);
}

TEST_F(BridgeTest, NullHandleIsRejected) {
    EXPECT_EQ(engine_start(nullptr), HANDTONE_ERR_INVALID_HANDLE);
    EXPECT_EQ(engine_stop(nullptr), HANDTONE_ERR_INVALID_HANDLE);
    EXPECT_EQ(engine_update_targets(nullptr, 440.0f, 0.2f, 0.3f), HANDTONE_ERR_INVALID_HANDLE);
    EXPECT_EQ(engine_set_frequency(nullptr, 440.0f), HANDTONE_ERR_INVALID_HANDLE);
    EXPECT_EQ(engine_get_parameters(nullptr, nullptr, nullptr, nullptr), HANDTONE_ERR_INVALID_HANDLE);
    EXPECT_EQ(engine_is_running(nullptr), 0);
    engine_destroy(nullptr);
}

TEST_F(BridgeTest, InvalidSettingsReturnNull) {
    EXPECT_EQ(engine_create(0, block_size, nullptr), nullptr);
    EXPECT_EQ(engine_create(sample_rate, 0, nullptr), nullptr);
    EXPECT_EQ(engine_create_from_config(nullptr), nullptr);
    EXPECT_EQ(engine_create_from_config("/nonexistent/handtone.json"), nullptr);
}

TEST_F(BridgeTest, CreateFromConfigFile) {
    const auto path = std::filesystem::temp_directory_path() / "handtone_bridge_config.json";
    {
        std::ofstream file(path);
        file << R"({"device": "handtone_no_such_device", "initial_frequency": 261.5})";
    }

    EngineHandle engine = engine_create_from_config(path.string().c_str());
    ASSERT_NE(engine, nullptr);

    float freq = 0.0f;
    ASSERT_EQ(engine_get_parameters(engine, &freq, nullptr, nullptr), HANDTONE_OK);
    EXPECT_FLOAT_EQ(freq, 261.5f);
    EXPECT_EQ(engine_start(engine), HANDTONE_ERR_DEVICE_UNAVAILABLE);

    engine_destroy(engine);
    std::filesystem::remove(path);
}
