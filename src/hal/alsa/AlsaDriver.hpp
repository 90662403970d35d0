/**
 * @file AlsaDriver.hpp
 * @brief Linux ALSA implementation of the AudioDriver interface.
 */

#ifndef HANDTONE_HAL_ALSA_DRIVER_HPP
#define HANDTONE_HAL_ALSA_DRIVER_HPP

#include "AudioDriver.hpp"
#include <alsa/asoundlib.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace handtone::hal {

constexpr int kMaxResumeAttempts = 1000;

/**
 * @brief Retry a suspended-stream resume while it reports -EAGAIN.
 *
 * Gives up after `max_attempts` tries, or as soon as `cancelled` is set.
 *
 * @return The last result of `resume`: 0 on success, negative errno otherwise.
 */
template<typename Resume>
int resume_suspended(Resume&& resume, const std::atomic<bool>& cancelled,
                     int max_attempts = kMaxResumeAttempts,
                     std::chrono::milliseconds backoff = std::chrono::milliseconds(1)) {
    int err = resume();
    for (int attempt = 1; err == -EAGAIN && attempt < max_attempts && !cancelled; ++attempt) {
        std::this_thread::sleep_for(backoff);
        err = resume();
    }
    return err;
}

/**
 * @brief ALSA playback driver.
 *
 * The callback always produces mono. If the hardware only offers stereo the
 * block is duplicated to both channels while interleaving. Float output is
 * preferred; S32_LE and S16_LE are used when the device has no float format.
 */
class AlsaDriver : public AudioDriver {
public:
    /**
     * @param sample_rate Requested sample rate.
     * @param block_size Requested period size (frames per interrupt).
     * @param num_channels Requested hardware channels (1 for mono, 2 for stereo).
     * @param device ALSA device name.
     * @param periods Requested number of periods in the ring buffer.
     * @param realtime_priority SCHED_FIFO priority for the audio thread, 0 to skip.
     */
    AlsaDriver(int sample_rate = 16000, int block_size = 1024, int num_channels = 1,
               const std::string& device = "default", int periods = 4, int realtime_priority = 80);
    ~AlsaDriver() override;

    AlsaDriver(const AlsaDriver&) = delete;
    AlsaDriver& operator=(const AlsaDriver&) = delete;

    bool start() override;
    void stop() override;
    void set_callback(AudioCallback callback) override;
    bool is_streaming() const override { return streaming_.load(); }
    bool has_faulted() const override { return faulted_.load(); }
    std::string last_error() const override;
    int sample_rate() const override { return sample_rate_; }
    int block_size() const override { return block_size_; }
    int channels() const { return num_channels_; }

private:
    void thread_loop();
    bool setup_pcm();
    void close_pcm();
    bool write_block();
    int recover_pcm(int err);
    void set_error(const std::string& message);
    void fault(const char* reason);

    snd_pcm_t* pcm_handle_;
    snd_pcm_format_t format_;
    std::string device_name_;
    int sample_rate_;
    int block_size_;
    int num_channels_;
    int periods_;
    int realtime_priority_;
    AudioCallback callback_;

    std::atomic<bool> streaming_;
    std::atomic<bool> stop_requested_;
    std::atomic<bool> faulted_;
    std::thread processing_thread_;

    mutable std::mutex error_mutex_;
    std::string last_error_;

    // Sized in setup_pcm(), never resized while streaming
    std::vector<float> mono_buffer_;
    std::vector<uint8_t> interleaved_buffer_;
};

} // namespace handtone::hal

#endif // HANDTONE_HAL_ALSA_DRIVER_HPP
