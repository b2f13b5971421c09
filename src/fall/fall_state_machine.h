#ifndef FALL_STATE_MACHINE_H
#define FALL_STATE_MACHINE_H

#include "FallGuard_sdk.h"

namespace FallGuardSDK {

// Debounces per-frame fall signals into one confirmed alarm.
//
// Normal -> Accumulating(count) while the condition holds, back to Normal the
// moment it does not. Reaching `trigger_frames` latches Confirmed and reports
// a single alarm edge; only Reset() leaves Confirmed.
class FallStateMachine {
public:
    explicit FallStateMachine(int trigger_frames = 60, double composite_trigger = 95.0);

    void SetParams(int trigger_frames, double composite_trigger);

    // Returns true only on the frame the alarm is confirmed
    bool Update(bool geometric_fall, double composite_risk);

    // External reset signal
    void Reset();

    // Subject lost: the count depends on consecutive frames
    void ResetCounter() { counter = 0; }

    FallState State() const;
    bool IsConfirmed() const { return confirmed; }
    int Counter() const { return counter; }
    int TriggerFrames() const { return trigger; }

private:
    int trigger;
    double composite_trigger;
    int counter = 0;
    bool confirmed = false;
};

} // namespace FallGuardSDK

#endif // FALL_STATE_MACHINE_H
