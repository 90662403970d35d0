/**
 * @file CInterface.h
 * @brief C-compatible API over the synthesis engine.
 *
 * Lets the camera/gesture front end (or any non-C++ host) drive the tone
 * generator: create an engine, push targets, start and stop it.
 */

#ifndef HANDTONE_C_INTERFACE_H
#define HANDTONE_C_INTERFACE_H

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Status codes returned by the int-valued functions
enum HandtoneStatus {
    HANDTONE_OK = 0,
    HANDTONE_ERR_DEVICE_UNAVAILABLE = -1,
    HANDTONE_ERR_STREAM_FAULT = -2,
    HANDTONE_ERR_INVALID_HANDLE = -3,
    HANDTONE_ERR_INTERNAL = -4
};

// Opaque handle type
typedef void* EngineHandle;

// Lifecycle
// device may be NULL for the system default output.
EngineHandle engine_create(unsigned int sample_rate, unsigned int block_size, const char* device);
// Returns NULL if the file cannot be read or holds an invalid config.
EngineHandle engine_create_from_config(const char* config_path);
void engine_destroy(EngineHandle handle);

// Stream control
int engine_start(EngineHandle handle);
int engine_stop(EngineHandle handle);
int engine_is_running(EngineHandle handle);

// Parameters
int engine_update_targets(EngineHandle handle, float frequency_hz, float amplitude, float room_size_seconds);
int engine_set_frequency(EngineHandle handle, float frequency_hz);
int engine_set_amplitude(EngineHandle handle, float amplitude);
int engine_set_room_size(EngineHandle handle, float room_size_seconds);
int engine_get_parameters(EngineHandle handle, float* frequency_hz, float* amplitude, float* room_size_seconds);

// Drains audio-thread telemetry to stderr. Returns the number of entries written.
size_t engine_flush_log(void);

#ifdef __cplusplus
}
#endif

#endif // HANDTONE_C_INTERFACE_H
