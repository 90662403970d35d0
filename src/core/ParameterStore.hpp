/**
 * @file ParameterStore.hpp
 * @brief Thread-safe holder of the current synthesis parameters.
 */

#ifndef HANDTONE_PARAMETER_STORE_HPP
#define HANDTONE_PARAMETER_STORE_HPP

#include <mutex>

namespace handtone {

/**
 * @brief One consistent set of synthesis parameters.
 */
struct SynthesisParameters {
    float frequency;  // Hz
    float amplitude;  // 0..1 nominal
    float room_size;  // Reverb time in seconds
};

/**
 * @brief Shared between the controller thread and the audio callback.
 *
 * Every read and write takes the same mutex, and only for the duration of
 * the field access, so no caller ever sees a partially updated record.
 * Values are stored as given; clamping is the synthesis side's job.
 */
class ParameterStore {
public:
    static constexpr float kDefaultAlpha = 0.2f;

    explicit ParameterStore(const SynthesisParameters& initial = {440.0f, 0.2f, 0.3f})
        : params_(initial)
        , active_(false)
    {
    }

    ParameterStore(const ParameterStore&) = delete;
    ParameterStore& operator=(const ParameterStore&) = delete;

    void set_frequency(float frequency);
    void set_amplitude(float amplitude);
    void set_room_size(float room_size);

    /**
     * @brief Exponential smoothing towards a target.
     *
     * Each field becomes current * (1 - alpha) + target * alpha. Alpha is
     * clamped to [0, 1] so repeated identical targets always converge
     * without overshoot.
     */
    void set_smoothed(float frequency_target, float amplitude_target, float room_target,
                      float alpha = kDefaultAlpha);

    SynthesisParameters snapshot() const;

    void start();
    void stop();
    bool is_active() const;

private:
    mutable std::mutex mutex_;
    SynthesisParameters params_;
    bool active_;
};

} // namespace handtone

#endif // HANDTONE_PARAMETER_STORE_HPP
