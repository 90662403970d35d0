/**
 * @file AudioDriver.hpp
 * @brief Abstract base class for platform-specific audio output drivers.
 *
 * Hardware/OS audio code lives behind this interface and never reaches
 * into the DSP layer.
 */

#ifndef HANDTONE_AUDIO_DRIVER_HPP
#define HANDTONE_AUDIO_DRIVER_HPP

#include <functional>
#include <span>
#include <string>

namespace handtone::hal {

/**
 * @brief What the driver does after a callback returns.
 */
enum class CallbackResult {
    Continue, // Write the block and schedule the next callback
    Complete, // Write the block, drain, and stop delivering callbacks
    Abort     // Discard pending output and stop; the stream is faulted
};

/**
 * @brief Abstract base class for audio output drivers.
 *
 * A driver owns one output stream. start() opens the device and begins
 * delivering callbacks on a dedicated thread; stop() waits for the
 * in-flight callback, then closes the device. Both are called from the
 * controller thread only.
 */
class AudioDriver {
public:
    /**
     * @brief Mono block callback, invoked on the driver's audio thread.
     *
     * Must not block or allocate.
     */
    using AudioCallback = std::function<CallbackResult(std::span<float> output)>;

    virtual ~AudioDriver() = default;

    /**
     * @brief Open the device and start callback delivery.
     *
     * @return true if the stream is running, false if the device could not
     *         be opened (see last_error()).
     */
    virtual bool start() = 0;

    /**
     * @brief Stop callback delivery and close the device. Safe to call repeatedly.
     */
    virtual void stop() = 0;

    virtual void set_callback(AudioCallback callback) = 0;

    /**
     * @brief True while callbacks are being delivered.
     *
     * Goes false on its own once a callback returns Complete or Abort, or
     * the device fails; the device stays open until stop().
     */
    virtual bool is_streaming() const = 0;

    /**
     * @brief True if the last stream ended because of a device or callback failure.
     */
    virtual bool has_faulted() const = 0;

    /**
     * @brief Description of the most recent open failure or fault.
     */
    virtual std::string last_error() const = 0;

    /**
     * @brief Negotiated sample rate in Hz.
     */
    virtual int sample_rate() const = 0;

    /**
     * @brief Negotiated number of frames per callback.
     */
    virtual int block_size() const = 0;
};

} // namespace handtone::hal

#endif // HANDTONE_AUDIO_DRIVER_HPP
