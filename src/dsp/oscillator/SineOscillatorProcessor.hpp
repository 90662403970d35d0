/**
 * @file SineOscillatorProcessor.hpp
 * @brief Sine oscillator driven by a running sample counter.
 */

#ifndef HANDTONE_SINE_OSCILLATOR_PROCESSOR_HPP
#define HANDTONE_SINE_OSCILLATOR_PROCESSOR_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif
#include "../Processor.hpp"

namespace handtone {

/**
 * @brief Sine oscillator evaluated directly from a sample counter.
 *
 * sample[i] = amplitude * sin(2 * pi * frequency * (phase + i) / sample_rate)
 *
 * The counter carries over between blocks so consecutive blocks join without
 * a click, and wraps modulo the sample rate to keep its magnitude bounded.
 * Frequency and amplitude are taken as given; callers clamp them.
 */
class SineOscillatorProcessor : public Processor {
public:
    explicit SineOscillatorProcessor(int sample_rate)
        : sample_rate_(sample_rate)
        , frequency_(440.0)
        , amplitude_(1.0)
        , phase_(0)
    {
    }

    void set_frequency(double freq) {
        frequency_ = freq;
    }

    void set_amplitude(double amplitude) {
        amplitude_ = amplitude;
    }

    /**
     * @brief Update sample rate. Restarts the counter since it wraps on the old rate.
     */
    void set_sample_rate(int sample_rate) {
        sample_rate_ = sample_rate;
        phase_ = 0;
    }

    int sample_rate() const {
        return sample_rate_;
    }

    int64_t phase() const {
        return phase_;
    }

    void reset() override {
        phase_ = 0;
    }

protected:
    int sample_rate_;
    double frequency_;
    double amplitude_;
    int64_t phase_;

    void do_pull(std::span<float> output) override {
        if (sample_rate_ <= 0) {
            std::fill(output.begin(), output.end(), 0.0f);
            return;
        }

        const double angle_per_sample = 2.0 * M_PI * frequency_ / sample_rate_;
        for (size_t i = 0; i < output.size(); ++i) {
            const double n = static_cast<double>(phase_ + static_cast<int64_t>(i));
            output[i] = static_cast<float>(amplitude_ * std::sin(angle_per_sample * n));
        }

        phase_ = (phase_ + static_cast<int64_t>(output.size())) % sample_rate_;
    }
};

} // namespace handtone

#endif // HANDTONE_SINE_OSCILLATOR_PROCESSOR_HPP
