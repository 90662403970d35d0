#include "SynthesisEngine.hpp"
#include "Logger.hpp"
#include "alsa/AlsaDriver.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>

namespace handtone {

namespace {

std::unique_ptr<hal::AudioDriver> make_alsa_driver(const EngineConfig& config) {
    return std::make_unique<hal::AlsaDriver>(config.sample_rate, config.block_size, config.channels,
                                             config.device, config.periods, config.realtime_priority);
}

} // namespace

SynthesisEngine::SynthesisEngine(const EngineConfig& config)
    : SynthesisEngine(config, make_alsa_driver(config))
{
}

SynthesisEngine::SynthesisEngine(const EngineConfig& config, std::unique_ptr<hal::AudioDriver> driver)
    : config_(config)
    , store_({config.initial_frequency, config.initial_amplitude, config.initial_room_size})
    , driver_(std::move(driver))
    , oscillator_(config.sample_rate)
    , reverb_(config.sample_rate, config.initial_room_size, config.reverb_decay, config.reverb_echoes)
    , stream_open_(false)
    , blocks_rendered_(0)
{
    if (!driver_) {
        throw InvalidParameter("SynthesisEngine requires an audio driver");
    }
    const auto problems = config_.validate();
    if (!problems.empty()) {
        throw InvalidParameter(problems.front());
    }
    driver_->set_callback([this](std::span<float> output) {
        return render_block(output);
    });
}

SynthesisEngine::~SynthesisEngine() {
    store_.stop();
    driver_->stop();
}

EngineState SynthesisEngine::state() const {
    if (stream_open_ && driver_->is_streaming() && store_.is_active()) {
        return EngineState::Running;
    }
    return EngineState::Stopped;
}

void SynthesisEngine::release_stream() {
    if (!stream_open_) return;

    store_.stop();
    driver_->stop();
    stream_open_ = false;

    if (driver_->has_faulted()) {
        const std::string reason = driver_->last_error();
        std::cerr << "[SynthesisEngine] Stream faulted: " << reason << std::endl;
        throw StreamFault(reason.empty() ? "audio stream failed" : reason);
    }
}

void SynthesisEngine::start() {
    if (state() == EngineState::Running) return;

    // Reap a stream that ended on its own; reports its fault if it had one
    release_stream();

    store_.start();
    if (!driver_->start()) {
        store_.stop();
        const std::string reason = driver_->last_error();
        std::cerr << "[SynthesisEngine] Device unavailable: " << reason << std::endl;
        throw DeviceUnavailable(reason.empty() ? "cannot open output device" : reason);
    }
    stream_open_ = true;

    std::cout << "[SynthesisEngine] Started at " << driver_->sample_rate() << " Hz, "
              << driver_->block_size() << " frames per block" << std::endl;
}

void SynthesisEngine::stop() {
    release_stream();
}

void SynthesisEngine::update_targets(float frequency_hz, float amplitude, float room_size_seconds) {
    if (!std::isfinite(frequency_hz) || !std::isfinite(amplitude) || !std::isfinite(room_size_seconds)) {
        std::cerr << "[SynthesisEngine] Ignoring non-finite targets" << std::endl;
        return;
    }
    store_.set_smoothed(frequency_hz, amplitude, room_size_seconds, config_.smoothing_alpha);
}

SynthesisParameters SynthesisEngine::playable(const SynthesisParameters& params, int sample_rate) const {
    const float nyquist = std::max(0.5f * static_cast<float>(sample_rate), config_.min_frequency);

    SynthesisParameters out = params;
    out.frequency = std::isfinite(out.frequency)
        ? std::clamp(out.frequency, config_.min_frequency, nyquist)
        : config_.min_frequency;
    out.amplitude = std::isfinite(out.amplitude) ? std::clamp(out.amplitude, 0.0f, 1.0f) : 0.0f;
    out.room_size = std::isfinite(out.room_size)
        ? std::clamp(out.room_size, 0.0f, config_.max_room_size)
        : 0.0f;
    return out;
}

hal::CallbackResult SynthesisEngine::render_block(std::span<float> output) {
    try {
        if (!store_.is_active()) {
            return hal::CallbackResult::Complete;
        }

        const int rate = driver_->sample_rate();
        if (rate != oscillator_.sample_rate()) {
            oscillator_.set_sample_rate(rate);
            reverb_.set_sample_rate(rate);
        }

        const SynthesisParameters params = playable(store_.snapshot(), rate);
        oscillator_.set_frequency(params.frequency);
        oscillator_.set_amplitude(params.amplitude);
        reverb_.set_reverb_time(params.room_size);

        // Device buffers larger than the configured block are rendered block by block
        const size_t chunk = static_cast<size_t>(std::max(config_.block_size, 1));
        for (size_t offset = 0; offset < output.size(); offset += chunk) {
            auto block = output.subspan(offset, std::min(chunk, output.size() - offset));
            oscillator_.pull(block);
            reverb_.pull(block);
            for (auto& sample : block) {
                sample = std::clamp(sample, -1.0f, 1.0f);
            }
        }

        blocks_rendered_.fetch_add(1, std::memory_order_relaxed);
        return hal::CallbackResult::Continue;
    } catch (const std::exception& e) {
        std::fill(output.begin(), output.end(), 0.0f);
        AudioLogger::instance().log_error("ENGINE", e.what());
        return hal::CallbackResult::Abort;
    }
}

} // namespace handtone
