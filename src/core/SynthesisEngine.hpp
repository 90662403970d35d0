/**
 * @file SynthesisEngine.hpp
 * @brief Owns the output stream and renders the controlled sine tone.
 */

#ifndef HANDTONE_SYNTHESIS_ENGINE_HPP
#define HANDTONE_SYNTHESIS_ENGINE_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <span>
#include "AudioDriver.hpp"
#include "EngineConfig.hpp"
#include "EngineError.hpp"
#include "ParameterStore.hpp"
#include "fx/ReverbProcessor.hpp"
#include "oscillator/SineOscillatorProcessor.hpp"

namespace handtone {

enum class EngineState {
    Stopped,
    Running
};

/**
 * @brief Sine tone with block reverb, driven by a ParameterStore.
 *
 * start(), stop(), update_targets() and state() belong to the controller
 * thread. render_block() runs on the driver's audio thread and only shares
 * the ParameterStore with the controller.
 *
 * The engine stops itself when it sees the store inactive at the start of a
 * callback, so a stop() is observed within one block period.
 */
class SynthesisEngine {
public:
    /**
     * @brief Engine playing through the ALSA device named in the config.
     */
    explicit SynthesisEngine(const EngineConfig& config = EngineConfig{});

    /**
     * @brief Engine playing through a caller-supplied driver.
     */
    SynthesisEngine(const EngineConfig& config, std::unique_ptr<hal::AudioDriver> driver);

    ~SynthesisEngine();

    SynthesisEngine(const SynthesisEngine&) = delete;
    SynthesisEngine& operator=(const SynthesisEngine&) = delete;

    /**
     * @brief Open the stream and begin rendering. No-op while Running.
     *
     * @throws DeviceUnavailable if the device cannot be opened; the engine
     *         stays Stopped and the parameters are untouched.
     * @throws StreamFault if the previous stream died mid-block. The dead
     *         stream is released first, so the next start() can succeed.
     */
    void start();

    /**
     * @brief Stop rendering and close the stream. No-op while Stopped.
     *
     * Returns after the in-flight callback, if any, has completed.
     *
     * @throws StreamFault if the stream had already died mid-block. The
     *         engine is Stopped either way.
     */
    void stop();

    EngineState state() const;
    bool is_running() const { return state() == EngineState::Running; }

    /**
     * @brief Smooth the stored parameters towards new targets.
     *
     * Updates with a non-finite component are dropped so gesture noise
     * cannot poison the store.
     */
    void update_targets(float frequency_hz, float amplitude, float room_size_seconds);

    ParameterStore& parameters() { return store_; }
    const ParameterStore& parameters() const { return store_; }

    const EngineConfig& config() const { return config_; }

    /**
     * @brief Audio callback body: fill one device buffer.
     *
     * Returns Complete without touching the output if the store is
     * inactive, Abort if rendering failed.
     */
    hal::CallbackResult render_block(std::span<float> output);

    /**
     * @brief Clamp a snapshot into the range the synthesiser can play.
     */
    SynthesisParameters playable(const SynthesisParameters& params, int sample_rate) const;

    /**
     * @brief Running sample counter. Only stable while no stream is running.
     */
    int64_t phase() const { return oscillator_.phase(); }

    uint64_t blocks_rendered() const { return blocks_rendered_.load(std::memory_order_relaxed); }

private:
    void release_stream();

    EngineConfig config_;
    ParameterStore store_;
    std::unique_ptr<hal::AudioDriver> driver_;

    // Audio thread only while streaming
    SineOscillatorProcessor oscillator_;
    ReverbProcessor reverb_;

    // Controller thread only: a driver stream was started and not yet released
    bool stream_open_;
    std::atomic<uint64_t> blocks_rendered_;
};

} // namespace handtone

#endif // HANDTONE_SYNTHESIS_ENGINE_HPP
