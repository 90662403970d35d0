/**
 * @file ReverbProcessor.hpp
 * @brief Discrete-echo room reverb applied independently to each block.
 */

#ifndef HANDTONE_REVERB_PROCESSOR_HPP
#define HANDTONE_REVERB_PROCESSOR_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <span>
#include <vector>
#include "../Processor.hpp"

namespace handtone {

/**
 * @brief Adds decaying copies of the block to itself.
 *
 * delay = floor((reverb_time / num_echoes) * sample_rate). Echo i (1-based)
 * is the dry block shifted right by delay * i samples and scaled by
 * decay_factor^i. Echoes that start at or beyond the end of the block are
 * dropped; nothing carries over into the next block. The sum is clamped
 * to [-1, 1].
 *
 * Cost is O(block size * num_echoes) with no allocation in the in-place path.
 */
class ReverbProcessor : public Processor {
public:
    static constexpr float kDefaultDecay = 0.6f;
    static constexpr int kDefaultEchoes = 5;

    explicit ReverbProcessor(int sample_rate,
                             float reverb_time = 0.3f,
                             float decay_factor = kDefaultDecay,
                             int num_echoes = kDefaultEchoes)
        : sample_rate_(sample_rate)
        , reverb_time_(reverb_time)
        , decay_factor_(decay_factor)
        , num_echoes_(num_echoes)
    {
    }

    void set_reverb_time(float seconds) { reverb_time_ = seconds; }
    void set_sample_rate(int sample_rate) { sample_rate_ = sample_rate; }

    float reverb_time() const { return reverb_time_; }
    int sample_rate() const { return sample_rate_; }

    /**
     * @brief Spacing between echoes in samples.
     *
     * Negative or non-finite reverb times count as zero. Zero echoes yields
     * zero spacing rather than a division by zero.
     */
    size_t delay_samples(float reverb_time, int num_echoes) const {
        if (num_echoes <= 0 || sample_rate_ <= 0 || !(reverb_time > 0.0f)) {
            return 0;
        }
        const double delay = std::floor((static_cast<double>(reverb_time) / num_echoes) * sample_rate_);
        if (!std::isfinite(delay)) {
            return kUnreachableDelay;
        }
        return static_cast<size_t>(std::min(delay, static_cast<double>(kUnreachableDelay)));
    }

    /**
     * @brief Reverb one block in place.
     */
    void apply_in_place(std::span<float> block, float reverb_time,
                        float decay_factor = kDefaultDecay,
                        int num_echoes = kDefaultEchoes) const {
        const size_t delay = delay_samples(reverb_time, num_echoes);

        // Walk backwards so every read of an earlier index still sees the dry sample.
        for (size_t j = block.size(); j-- > 0;) {
            const float dry = block[j];
            float wet = dry;
            float gain = 1.0f;
            for (int i = 1; i <= num_echoes; ++i) {
                gain *= decay_factor;
                if (delay != 0 && static_cast<size_t>(i) > j / delay) {
                    break;
                }
                const size_t offset = delay * static_cast<size_t>(i);
                wet += gain * (offset == 0 ? dry : block[j - offset]);
            }
            block[j] = std::clamp(wet, -1.0f, 1.0f);
        }
    }

    /**
     * @brief Pure form: reverb signal into output (sizes must match).
     */
    void apply(std::span<const float> signal, std::span<float> output, float reverb_time,
               float decay_factor = kDefaultDecay, int num_echoes = kDefaultEchoes) const {
        const size_t frames = std::min(signal.size(), output.size());
        std::copy(signal.begin(), signal.begin() + static_cast<std::ptrdiff_t>(frames), output.begin());
        apply_in_place(output.first(frames), reverb_time, decay_factor, num_echoes);
    }

    /**
     * @brief Allocating convenience for offline use. Not for the audio thread.
     */
    std::vector<float> apply(std::span<const float> signal, float reverb_time,
                             float decay_factor = kDefaultDecay,
                             int num_echoes = kDefaultEchoes) const {
        std::vector<float> output(signal.size(), 0.0f);
        apply(signal, std::span<float>(output), reverb_time, decay_factor, num_echoes);
        return output;
    }

    void reset() override {
        // No state carried between blocks
    }

protected:
    void do_pull(std::span<float> output) override {
        apply_in_place(output, reverb_time_, decay_factor_, num_echoes_);
    }

private:
    static constexpr size_t kUnreachableDelay = static_cast<size_t>(1) << 40;

    int sample_rate_;
    float reverb_time_;
    float decay_factor_;
    int num_echoes_;
};

} // namespace handtone

#endif // HANDTONE_REVERB_PROCESSOR_HPP
