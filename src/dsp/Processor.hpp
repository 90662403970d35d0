/**
 * @file Processor.hpp
 * @brief Base class for block-based DSP components.
 *
 * DSP code here never touches the audio device; the HAL feeds it spans.
 */

#ifndef HANDTONE_PROCESSOR_HPP
#define HANDTONE_PROCESSOR_HPP

#include <span>
#include <chrono>
#include <cstddef>
#include "PerformanceProfiler.hpp"

namespace handtone {

/**
 * @brief Base class for audio processing units.
 *
 * Sources (oscillators) fill the span; effects transform it in place.
 * Implementations must not allocate inside do_pull().
 */
class Processor {
public:
    /**
     * @brief Render timing snapshot; all zero unless HANDTONE_ENABLE_PROFILING is 1.
     */
    struct PerformanceMetrics {
        std::chrono::nanoseconds last_block_time{0};
        std::chrono::nanoseconds peak_block_time{0};
        size_t blocks{0};
        size_t frames{0};
    };

    virtual ~Processor() = default;

    /**
     * @brief Process one block.
     *
     * @param output Mono block, generated into or transformed in place.
     */
    void pull(std::span<float> output) {
        profiler_.begin_block(output.size());
        do_pull(output);
        profiler_.end_block();
    }

    /**
     * @brief Reset internal state.
     */
    virtual void reset() = 0;

    PerformanceMetrics get_metrics() const {
        return PerformanceMetrics{
            profiler_.last_block_time(),
            profiler_.peak_block_time(),
            profiler_.blocks(),
            profiler_.frames()
        };
    }

protected:
    virtual void do_pull(std::span<float> output) = 0;

    PerformanceProfiler profiler_;
};

} // namespace handtone

#endif // HANDTONE_PROCESSOR_HPP
