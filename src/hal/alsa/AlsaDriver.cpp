/**
 * @file AlsaDriver.cpp
 * @brief Linux ALSA implementation of the AudioDriver interface.
 */

#include "AlsaDriver.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <pthread.h>

namespace handtone::hal {

namespace {

using HwParamsPtr = std::unique_ptr<snd_pcm_hw_params_t, decltype(&snd_pcm_hw_params_free)>;

size_t bytes_per_sample(snd_pcm_format_t format) {
    return format == SND_PCM_FORMAT_S16_LE ? 2 : 4;
}

} // namespace

AlsaDriver::AlsaDriver(int sample_rate, int block_size, int num_channels,
                       const std::string& device, int periods, int realtime_priority)
    : pcm_handle_(nullptr)
    , format_(SND_PCM_FORMAT_FLOAT_LE)
    , device_name_(device)
    , sample_rate_(sample_rate)
    , block_size_(block_size)
    , num_channels_(num_channels)
    , periods_(periods)
    , realtime_priority_(realtime_priority)
    , streaming_(false)
    , stop_requested_(false)
    , faulted_(false)
{
    // Buffers will be resized after PCM setup
}

AlsaDriver::~AlsaDriver() {
    stop();
}

void AlsaDriver::set_callback(AudioCallback callback) {
    callback_ = std::move(callback);
}

std::string AlsaDriver::last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

void AlsaDriver::set_error(const std::string& message) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = message;
}

bool AlsaDriver::start() {
    if (streaming_) return true;

    // A stream that ended on its own still holds the device until joined.
    stop();

    faulted_ = false;
    set_error("");

    if (!setup_pcm()) {
        close_pcm();
        return false;
    }

    stop_requested_ = false;
    streaming_ = true;
    processing_thread_ = std::thread(&AlsaDriver::thread_loop, this);

    return true;
}

void AlsaDriver::stop() {
    stop_requested_ = true;
    if (processing_thread_.joinable()) {
        processing_thread_.join();
    }
    streaming_ = false;
    close_pcm();
}

void AlsaDriver::close_pcm() {
    if (pcm_handle_) {
        snd_pcm_drop(pcm_handle_);
        snd_pcm_close(pcm_handle_);
        pcm_handle_ = nullptr;
    }
}

bool AlsaDriver::setup_pcm() {
    int err;

    if ((err = snd_pcm_open(&pcm_handle_, device_name_.c_str(), SND_PCM_STREAM_PLAYBACK, 0)) < 0) {
        pcm_handle_ = nullptr;
        set_error("Cannot open audio device " + device_name_ + " (" + snd_strerror(err) + ")");
        std::cerr << "ALSA: " << last_error() << std::endl;
        return false;
    }

    snd_pcm_hw_params_t* raw_params = nullptr;
    if ((err = snd_pcm_hw_params_malloc(&raw_params)) < 0) {
        set_error(std::string("Cannot allocate hardware parameter structure (") + snd_strerror(err) + ")");
        std::cerr << "ALSA: " << last_error() << std::endl;
        return false;
    }
    HwParamsPtr hw_params(raw_params, &snd_pcm_hw_params_free);

    if ((err = snd_pcm_hw_params_any(pcm_handle_, hw_params.get())) < 0) {
        set_error(std::string("Cannot initialize hardware parameter structure (") + snd_strerror(err) + ")");
        std::cerr << "ALSA: " << last_error() << std::endl;
        return false;
    }

    if ((err = snd_pcm_hw_params_set_access(pcm_handle_, hw_params.get(), SND_PCM_ACCESS_RW_INTERLEAVED)) < 0) {
        set_error(std::string("Cannot set access type (") + snd_strerror(err) + ")");
        std::cerr << "ALSA: " << last_error() << std::endl;
        return false;
    }

    // Native float first, then integer formats with conversion
    const snd_pcm_format_t formats[] = {SND_PCM_FORMAT_FLOAT_LE, SND_PCM_FORMAT_S32_LE, SND_PCM_FORMAT_S16_LE};
    err = -EINVAL;
    for (snd_pcm_format_t format : formats) {
        if ((err = snd_pcm_hw_params_set_format(pcm_handle_, hw_params.get(), format)) == 0) {
            format_ = format;
            break;
        }
        std::cerr << "ALSA: Cannot set " << snd_pcm_format_name(format) << ", trying next format" << std::endl;
    }
    if (err < 0) {
        set_error(std::string("Cannot set sample format (") + snd_strerror(err) + ")");
        std::cerr << "ALSA: " << last_error() << std::endl;
        return false;
    }

    unsigned int rate = static_cast<unsigned int>(sample_rate_);
    if ((err = snd_pcm_hw_params_set_rate_near(pcm_handle_, hw_params.get(), &rate, 0)) < 0) {
        set_error(std::string("Cannot set sample rate (") + snd_strerror(err) + ")");
        std::cerr << "ALSA: " << last_error() << std::endl;
        return false;
    }
    sample_rate_ = static_cast<int>(rate);

    unsigned int channels = static_cast<unsigned int>(num_channels_);
    if ((err = snd_pcm_hw_params_set_channels_near(pcm_handle_, hw_params.get(), &channels)) < 0) {
        set_error(std::string("Cannot set channel count (") + snd_strerror(err) + ")");
        std::cerr << "ALSA: " << last_error() << std::endl;
        return false;
    }
    num_channels_ = static_cast<int>(channels);

    snd_pcm_uframes_t frames = static_cast<snd_pcm_uframes_t>(block_size_);
    if ((err = snd_pcm_hw_params_set_period_size_near(pcm_handle_, hw_params.get(), &frames, 0)) < 0) {
        set_error(std::string("Cannot set period size (") + snd_strerror(err) + ")");
        std::cerr << "ALSA: " << last_error() << std::endl;
        return false;
    }
    block_size_ = static_cast<int>(frames);

    unsigned int periods = static_cast<unsigned int>(periods_);
    if ((err = snd_pcm_hw_params_set_periods_near(pcm_handle_, hw_params.get(), &periods, 0)) < 0) {
        std::cerr << "ALSA: Cannot set period count, using device default (" << snd_strerror(err) << ")" << std::endl;
    }

    if ((err = snd_pcm_hw_params(pcm_handle_, hw_params.get())) < 0) {
        set_error(std::string("Cannot set parameters (") + snd_strerror(err) + ")");
        std::cerr << "ALSA: " << last_error() << std::endl;
        return false;
    }

    mono_buffer_.assign(static_cast<size_t>(block_size_), 0.0f);
    interleaved_buffer_.assign(static_cast<size_t>(block_size_) * num_channels_ * bytes_per_sample(format_), 0);

    if ((err = snd_pcm_prepare(pcm_handle_)) < 0) {
        set_error(std::string("Cannot prepare audio interface for use (") + snd_strerror(err) + ")");
        std::cerr << "ALSA: " << last_error() << std::endl;
        return false;
    }

    std::cout << "ALSA: Opened " << device_name_ << " at " << sample_rate_ << " Hz, "
              << block_size_ << " frames, " << num_channels_ << " channel(s), "
              << snd_pcm_format_name(format_) << std::endl;
    return true;
}

void AlsaDriver::fault(const char* reason) {
    set_error(reason);
    faulted_ = true;
    AudioLogger::instance().log_error("ALSA", reason);
}

void AlsaDriver::thread_loop() {
    auto& logger = AudioLogger::instance();

    if (realtime_priority_ > 0) {
        struct sched_param param;
        param.sched_priority = realtime_priority_;
        int res = pthread_setschedparam(pthread_self(), SCHED_FIFO, &param);
        if (res != 0) {
            if (res == EPERM) {
                logger.log_message("ALSA", "Priority Failed: EPERM (Need ulimit -r)");
            } else {
                logger.log_message("ALSA", "Priority Failed: Unknown Error");
            }
        } else {
            logger.log_event("RT_PRIORITY", static_cast<float>(realtime_priority_));
        }
    }

    const auto budget = std::chrono::microseconds(
        static_cast<long long>(block_size_) * 1000000LL / std::max(sample_rate_, 1));

    while (!stop_requested_) {
        // A callback that writes nothing leaves silence
        std::fill(mono_buffer_.begin(), mono_buffer_.end(), 0.0f);

        CallbackResult result = CallbackResult::Continue;
        auto start_time = std::chrono::steady_clock::now();

        if (callback_) {
            try {
                result = callback_(std::span<float>(mono_buffer_));
            } catch (const std::exception& e) {
                fault(e.what());
                result = CallbackResult::Abort;
            } catch (...) {
                fault("Unknown exception in audio callback");
                result = CallbackResult::Abort;
            }
        }

        auto end_time = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);
        logger.log_event("PROC_US", static_cast<float>(duration.count()));
        if (duration > budget) {
            logger.log_event("OVER_BUDGET_US", static_cast<float>(duration.count()));
        }

        if (result == CallbackResult::Abort) {
            if (!faulted_) {
                fault("Audio callback aborted the stream");
            }
            snd_pcm_drop(pcm_handle_);
            break;
        }

        if (!write_block()) {
            break;
        }

        if (result == CallbackResult::Complete) {
            snd_pcm_drain(pcm_handle_);
            break;
        }
    }

    streaming_ = false;
}

bool AlsaDriver::write_block() {
    const size_t frames_total = mono_buffer_.size();
    const size_t channels = static_cast<size_t>(num_channels_);

    // Interleave and convert; mono is copied into every channel
    if (format_ == SND_PCM_FORMAT_FLOAT_LE) {
        float* out = reinterpret_cast<float*>(interleaved_buffer_.data());
        for (size_t i = 0; i < frames_total; ++i) {
            const float sample = std::clamp(mono_buffer_[i], -1.0f, 1.0f);
            for (size_t c = 0; c < channels; ++c) out[i * channels + c] = sample;
        }
    } else if (format_ == SND_PCM_FORMAT_S32_LE) {
        int32_t* out = reinterpret_cast<int32_t*>(interleaved_buffer_.data());
        for (size_t i = 0; i < frames_total; ++i) {
            const float sample = std::clamp(mono_buffer_[i], -1.0f, 1.0f);
            const int32_t value = static_cast<int32_t>(static_cast<double>(sample) * 2147483647.0);
            for (size_t c = 0; c < channels; ++c) out[i * channels + c] = value;
        }
    } else {
        int16_t* out = reinterpret_cast<int16_t*>(interleaved_buffer_.data());
        for (size_t i = 0; i < frames_total; ++i) {
            const float sample = std::clamp(mono_buffer_[i], -1.0f, 1.0f);
            const int16_t value = static_cast<int16_t>(sample * 32767.0f);
            for (size_t c = 0; c < channels; ++c) out[i * channels + c] = value;
        }
    }

    const size_t frame_bytes = channels * bytes_per_sample(format_);
    size_t written = 0;
    while (written < frames_total) {
        snd_pcm_sframes_t err = snd_pcm_writei(pcm_handle_,
                                               interleaved_buffer_.data() + written * frame_bytes,
                                               frames_total - written);
        if (err >= 0) {
            written += static_cast<size_t>(err);
            continue;
        }
        if (recover_pcm(static_cast<int>(err)) < 0) {
            // A resume abandoned for stop() is not a device failure
            if (!stop_requested_) {
                fault(snd_strerror(static_cast<int>(err)));
            }
            return false;
        }
    }
    return true;
}

int AlsaDriver::recover_pcm(int err) {
    if (err == -EPIPE) {
        AudioLogger::instance().log_message("ALSA", "Underrun");
        return snd_pcm_prepare(pcm_handle_);
    }
    if (err == -ESTRPIPE) {
        err = resume_suspended([this]() { return snd_pcm_resume(pcm_handle_); }, stop_requested_);
        if (err < 0 && !stop_requested_) {
            err = snd_pcm_prepare(pcm_handle_);
        }
        return err;
    }
    if (err == -EAGAIN || err == -EINTR) {
        return 0;
    }
    return err;
}

} // namespace handtone::hal
