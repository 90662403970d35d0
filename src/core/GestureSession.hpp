/**
 * @file GestureSession.hpp
 * @brief Presence-driven control loop on top of SynthesisEngine.
 */

#ifndef HANDTONE_GESTURE_SESSION_HPP
#define HANDTONE_GESTURE_SESSION_HPP

#include "SynthesisEngine.hpp"
#include "TargetAverager.hpp"

namespace handtone {

/**
 * @brief Already-mapped output of the hand tracker for one video frame.
 *
 * The left hand controls frequency and amplitude, the right hand room size.
 */
struct GestureFrame {
    bool left_hand_present = false;
    bool right_hand_present = false;
    float frequency = 0.0f;  // Valid when left_hand_present
    float amplitude = 0.0f;  // Valid when left_hand_present
    float room_size = 0.0f;  // Valid when right_hand_present
};

/**
 * @brief Starts the engine while any hand is visible and stops it otherwise.
 *
 * Targets are window-averaged and pushed to the engine every few frames.
 * Engine errors propagate to the caller, which decides when to retry.
 */
class GestureSession {
public:
    explicit GestureSession(SynthesisEngine& engine, size_t window = 5, size_t update_interval = 5);

    /**
     * @brief Feed one frame.
     *
     * @return true if the engine's targets were updated by this frame.
     */
    bool on_frame(const GestureFrame& frame);

    const TargetAverager& averager() const { return averager_; }

private:
    SynthesisEngine& engine_;
    TargetAverager averager_;
};

} // namespace handtone

#endif // HANDTONE_GESTURE_SESSION_HPP
