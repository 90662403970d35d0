#include "TargetAverager.hpp"
#include <algorithm>
#include <numeric>

namespace handtone {

namespace {

float mean_or(const std::deque<float>& history, float fallback) {
    if (history.empty()) return fallback;
    return std::accumulate(history.begin(), history.end(), 0.0f) / static_cast<float>(history.size());
}

} // namespace

TargetAverager::TargetAverager(size_t window, size_t update_interval)
    : window_(std::max<size_t>(window, 1))
    , update_interval_(std::max<size_t>(update_interval, 1))
    , frame_count_(0)
{
}

void TargetAverager::push_value(std::deque<float>& history, float value) {
    history.push_back(value);
    if (history.size() > window_) {
        history.pop_front();
    }
}

void TargetAverager::push(const FrameTargets& targets) {
    if (targets.frequency) push_value(frequencies_, *targets.frequency);
    if (targets.amplitude) push_value(amplitudes_, *targets.amplitude);
    if (targets.room_size) push_value(room_sizes_, *targets.room_size);
    ++frame_count_;
}

bool TargetAverager::ready() const {
    return frame_count_ > 0 && frame_count_ % update_interval_ == 0;
}

SynthesisParameters TargetAverager::average(const SynthesisParameters& fallback) const {
    return SynthesisParameters{
        mean_or(frequencies_, fallback.frequency),
        mean_or(amplitudes_, fallback.amplitude),
        mean_or(room_sizes_, fallback.room_size)
    };
}

void TargetAverager::reset() {
    frequencies_.clear();
    amplitudes_.clear();
    room_sizes_.clear();
    frame_count_ = 0;
}

} // namespace handtone
