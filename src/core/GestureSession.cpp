#include "GestureSession.hpp"

namespace handtone {

GestureSession::GestureSession(SynthesisEngine& engine, size_t window, size_t update_interval)
    : engine_(engine)
    , averager_(window, update_interval)
{
}

bool GestureSession::on_frame(const GestureFrame& frame) {
    if (!frame.left_hand_present && !frame.right_hand_present) {
        engine_.stop();
        return false;
    }

    engine_.start();

    FrameTargets targets;
    if (frame.left_hand_present) {
        targets.frequency = frame.frequency;
        targets.amplitude = frame.amplitude;
    }
    if (frame.right_hand_present) {
        targets.room_size = frame.room_size;
    }
    averager_.push(targets);

    if (!averager_.ready()) {
        return false;
    }

    const SynthesisParameters avg = averager_.average(engine_.parameters().snapshot());
    engine_.update_targets(avg.frequency, avg.amplitude, avg.room_size);
    return true;
}

} // namespace handtone
