/**
 * @file TargetAverager.hpp
 * @brief Moving-window average of per-frame control targets.
 */

#ifndef HANDTONE_TARGET_AVERAGER_HPP
#define HANDTONE_TARGET_AVERAGER_HPP

#include <cstddef>
#include <deque>
#include <optional>
#include "ParameterStore.hpp"

namespace handtone {

/**
 * @brief Targets derived from one video frame. Missing values were not observed.
 */
struct FrameTargets {
    std::optional<float> frequency;
    std::optional<float> amplitude;
    std::optional<float> room_size;
};

/**
 * @brief Averages the last few targets of each parameter and paces updates.
 *
 * The controller pushes one FrameTargets per frame; ready() turns true on
 * every update_interval-th frame.
 */
class TargetAverager {
public:
    explicit TargetAverager(size_t window = 5, size_t update_interval = 5);

    void push(const FrameTargets& targets);

    bool ready() const;

    /**
     * @brief Window means; parameters with no samples fall back to the given values.
     */
    SynthesisParameters average(const SynthesisParameters& fallback) const;

    size_t frame_count() const { return frame_count_; }

    void reset();

private:
    void push_value(std::deque<float>& history, float value);

    size_t window_;
    size_t update_interval_;
    size_t frame_count_;
    std::deque<float> frequencies_;
    std::deque<float> amplitudes_;
    std::deque<float> room_sizes_;
};

} // namespace handtone

#endif // HANDTONE_TARGET_AVERAGER_HPP
