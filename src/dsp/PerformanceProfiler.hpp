/**
 * @file PerformanceProfiler.hpp
 * @brief Per-block render timing for processors on the audio thread.
 *
 * Built only with HANDTONE_ENABLE_PROFILING=1. The default build keeps the
 * same interface with empty bodies, so Processor::pull() costs nothing extra.
 */

#ifndef HANDTONE_PERFORMANCE_PROFILER_HPP
#define HANDTONE_PERFORMANCE_PROFILER_HPP

#include <chrono>
#include <cstddef>

#ifndef HANDTONE_ENABLE_PROFILING
#define HANDTONE_ENABLE_PROFILING 0
#endif

namespace handtone {

class PerformanceProfiler {
public:
    using Clock = std::chrono::steady_clock;
    using Nanoseconds = std::chrono::nanoseconds;

    static constexpr bool enabled = HANDTONE_ENABLE_PROFILING != 0;

#if HANDTONE_ENABLE_PROFILING
    void begin_block(size_t frames) {
        pending_frames_ = frames;
        block_start_ = Clock::now();
    }

    void end_block() {
        last_ = std::chrono::duration_cast<Nanoseconds>(Clock::now() - block_start_);
        if (last_ > peak_) peak_ = last_;
        frames_ += pending_frames_;
        ++blocks_;
    }

    Nanoseconds last_block_time() const { return last_; }
    Nanoseconds peak_block_time() const { return peak_; }
    size_t blocks() const { return blocks_; }
    size_t frames() const { return frames_; }

private:
    Clock::time_point block_start_;
    Nanoseconds last_{0};
    Nanoseconds peak_{0};
    size_t pending_frames_{0};
    size_t frames_{0};
    size_t blocks_{0};
#else
    void begin_block(size_t) {}
    void end_block() {}
    Nanoseconds last_block_time() const { return Nanoseconds::zero(); }
    Nanoseconds peak_block_time() const { return Nanoseconds::zero(); }
    size_t blocks() const { return 0; }
    size_t frames() const { return 0; }
#endif
};

} // namespace handtone

#endif // HANDTONE_PERFORMANCE_PROFILER_HPP
