#include "ParameterStore.hpp"
#include <algorithm>

namespace handtone {

namespace {

// Rounding must never carry a step past its target or back behind its start.
float smooth(float current, float target, float alpha) {
    const float next = current * (1.0f - alpha) + target * alpha;
    return std::clamp(next, std::min(current, target), std::max(current, target));
}

} // namespace

void ParameterStore::set_frequency(float frequency) {
    std::lock_guard<std::mutex> lock(mutex_);
    params_.frequency = frequency;
}

void ParameterStore::set_amplitude(float amplitude) {
    std::lock_guard<std::mutex> lock(mutex_);
    params_.amplitude = amplitude;
}

void ParameterStore::set_room_size(float room_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    params_.room_size = room_size;
}

void ParameterStore::set_smoothed(float frequency_target, float amplitude_target,
                                  float room_target, float alpha) {
    alpha = std::clamp(alpha, 0.0f, 1.0f);

    std::lock_guard<std::mutex> lock(mutex_);
    params_.frequency = smooth(params_.frequency, frequency_target, alpha);
    params_.amplitude = smooth(params_.amplitude, amplitude_target, alpha);
    params_.room_size = smooth(params_.room_size, room_target, alpha);
}

SynthesisParameters ParameterStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return params_;
}

void ParameterStore::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    active_ = true;
}

void ParameterStore::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    active_ = false;
}

bool ParameterStore::is_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

} // namespace handtone
