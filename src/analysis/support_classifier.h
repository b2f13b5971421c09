#ifndef SUPPORT_CLASSIFIER_H
#define SUPPORT_CLASSIFIER_H

#include "FallGuard_sdk.h"
#include "../config/internal_config.h"
#include <vector>

namespace FallGuardSDK {

struct SupportResult {
    LegSupport left;
    LegSupport right;
    bool sitting = false;
    double ground_level = 0.0;   // lower of the two ankles (largest y)
};

// Decides per leg whether the foot carries weight (grounded on the floor, or
// standing still on something raised) and whether the subject sits on a seat.
class SupportClassifier {
public:
    SupportClassifier();

    void SetConfig(const InternalConfig& config);

    // `previous` may be null (first frame after losing the subject)
    SupportResult Classify(const std::vector<Landmark>& landmarks,
                           const std::vector<Landmark>* previous,
                           const std::vector<SeatRegion>& seats);

    // Foot timers depend on a continuous previous frame
    void ResetTimers();

    int LeftTimer() const { return left_timer; }
    int RightTimer() const { return right_timer; }

private:
    int updateTimer(const std::vector<Landmark>& landmarks,
                    const std::vector<Landmark>* previous, int ankle, int timer) const;
    bool isSitting(const std::vector<Landmark>& landmarks, double ground_level,
                   const std::vector<SeatRegion>& seats) const;

    double shin_fraction = 0.3;
    double stability_velocity = 0.002;
    int stability_frames = 10;
    double seat_tolerance = 0.1;

    int left_timer = 0;
    int right_timer = 0;
};

} // namespace FallGuardSDK

#endif // SUPPORT_CLASSIFIER_H
