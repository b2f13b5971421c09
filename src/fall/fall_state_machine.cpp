#include "fall_state_machine.h"

namespace FallGuardSDK {

FallStateMachine::FallStateMachine(int trigger_frames, double composite)
    : trigger(trigger_frames), composite_trigger(composite) {}

void FallStateMachine::SetParams(int trigger_frames, double composite) {
    trigger = trigger_frames;
    composite_trigger = composite;
}

bool FallStateMachine::Update(bool geometric_fall, double composite_risk) {
    if (geometric_fall || composite_risk >= composite_trigger) {
        // Saturates at the trigger, a subject may stay down for hours
        if (counter < trigger) counter++;
    } else {
        counter = 0;
        return false;
    }

    if (counter >= trigger && !confirmed) {
        confirmed = true;
        return true;
    }
    return false;
}

void FallStateMachine::Reset() {
    counter = 0;
    confirmed = false;
}

FallState FallStateMachine::State() const {
    if (confirmed) return FallState::Confirmed;
    if (counter > 0) return FallState::Accumulating;
    return FallState::Normal;
}

} // namespace FallGuardSDK
