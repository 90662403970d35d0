/**
 * @file AudioBridge.cpp
 * @brief C-compatible API bridge for the synthesis engine.
 */

#include "CInterface.h"
#include "EngineConfig.hpp"
#include "EngineError.hpp"
#include "Logger.hpp"
#include "SynthesisEngine.hpp"
#include <exception>
#include <iostream>
#include <memory>

// Internal handle structure (hidden from C API)
struct EngineHandleImpl {
    std::unique_ptr<handtone::SynthesisEngine> engine;

    explicit EngineHandleImpl(const handtone::EngineConfig& config)
        : engine(std::make_unique<handtone::SynthesisEngine>(config))
    {
    }
};

namespace {

handtone::SynthesisEngine* engine_from(EngineHandle handle) {
    if (!handle) return nullptr;
    return static_cast<EngineHandleImpl*>(handle)->engine.get();
}

int status_from(const handtone::EngineError& e) {
    switch (e.kind()) {
        case handtone::ErrorKind::DeviceUnavailable: return HANDTONE_ERR_DEVICE_UNAVAILABLE;
        case handtone::ErrorKind::StreamFault: return HANDTONE_ERR_STREAM_FAULT;
        case handtone::ErrorKind::InvalidParameter: return HANDTONE_ERR_INTERNAL;
    }
    return HANDTONE_ERR_INTERNAL;
}

} // namespace

extern "C" {

EngineHandle engine_create(unsigned int sample_rate, unsigned int block_size, const char* device) {
    try {
        handtone::EngineConfig config;
        config.sample_rate = static_cast<int>(sample_rate);
        config.block_size = static_cast<int>(block_size);
        if (device) config.device = device;

        const auto problems = config.validate();
        if (!problems.empty()) {
            std::cerr << "[AudioBridge] Invalid engine settings: " << problems.front() << std::endl;
            return nullptr;
        }
        return static_cast<EngineHandle>(new EngineHandleImpl(config));
    } catch (const std::exception& e) {
        std::cerr << "[AudioBridge] engine_create failed: " << e.what() << std::endl;
        return nullptr;
    }
}

EngineHandle engine_create_from_config(const char* config_path) {
    if (!config_path) return nullptr;
    try {
        handtone::EngineConfig config;
        if (!handtone::ConfigStore::load_from_file(config, config_path)) {
            return nullptr;
        }
        return static_cast<EngineHandle>(new EngineHandleImpl(config));
    } catch (const std::exception& e) {
        std::cerr << "[AudioBridge] engine_create_from_config failed: " << e.what() << std::endl;
        return nullptr;
    }
}

void engine_destroy(EngineHandle handle) {
    delete static_cast<EngineHandleImpl*>(handle);
}

int engine_start(EngineHandle handle) {
    auto* engine = engine_from(handle);
    if (!engine) return HANDTONE_ERR_INVALID_HANDLE;
    try {
        engine->start();
        return HANDTONE_OK;
    } catch (const handtone::EngineError& e) {
        return status_from(e);
    } catch (const std::exception& e) {
        std::cerr << "[AudioBridge] engine_start failed: " << e.what() << std::endl;
        return HANDTONE_ERR_INTERNAL;
    }
}

int engine_stop(EngineHandle handle) {
    auto* engine = engine_from(handle);
    if (!engine) return HANDTONE_ERR_INVALID_HANDLE;
    try {
        engine->stop();
        return HANDTONE_OK;
    } catch (const handtone::EngineError& e) {
        return status_from(e);
    } catch (const std::exception& e) {
        std::cerr << "[AudioBridge] engine_stop failed: " << e.what() << std::endl;
        return HANDTONE_ERR_INTERNAL;
    }
}

int engine_is_running(EngineHandle handle) {
    auto* engine = engine_from(handle);
    if (!engine) return 0;
    try { return engine->is_running() ? 1 : 0; } catch (const std::exception&) { return 0; }
}

int engine_update_targets(EngineHandle handle, float frequency_hz, float amplitude, float room_size_seconds) {
    auto* engine = engine_from(handle);
    if (!engine) return HANDTONE_ERR_INVALID_HANDLE;
    try { engine->update_targets(frequency_hz, amplitude, room_size_seconds); return HANDTONE_OK; } catch (const std::exception&) { return HANDTONE_ERR_INTERNAL; }
}

int engine_set_frequency(EngineHandle handle, float frequency_hz) {
    auto* engine = engine_from(handle);
    if (!engine) return HANDTONE_ERR_INVALID_HANDLE;
    try { engine->parameters().set_frequency(frequency_hz); return HANDTONE_OK; } catch (const std::exception&) { return HANDTONE_ERR_INTERNAL; }
}

int engine_set_amplitude(EngineHandle handle, float amplitude) {
    auto* engine = engine_from(handle);
    if (!engine) return HANDTONE_ERR_INVALID_HANDLE;
    try { engine->parameters().set_amplitude(amplitude); return HANDTONE_OK; } catch (const std::exception&) { return HANDTONE_ERR_INTERNAL; }
}

int engine_set_room_size(EngineHandle handle, float room_size_seconds) {
    auto* engine = engine_from(handle);
    if (!engine) return HANDTONE_ERR_INVALID_HANDLE;
    try { engine->parameters().set_room_size(room_size_seconds); return HANDTONE_OK; } catch (const std::exception&) { return HANDTONE_ERR_INTERNAL; }
}

int engine_get_parameters(EngineHandle handle, float* frequency_hz, float* amplitude, float* room_size_seconds) {
    auto* engine = engine_from(handle);
    if (!engine) return HANDTONE_ERR_INVALID_HANDLE;
    try {
        const auto params = engine->parameters().snapshot();
        if (frequency_hz) *frequency_hz = params.frequency;
        if (amplitude) *amplitude = params.amplitude;
        if (room_size_seconds) *room_size_seconds = params.room_size;
        return HANDTONE_OK;
    } catch (const std::exception&) {
        return HANDTONE_ERR_INTERNAL;
    }
}

size_t engine_flush_log(void) {
    return handtone::AudioLogger::instance().flush(std::cerr);
}

} // extern "C"
