#include "support_classifier.h"
#include "geometry_engine.h"
#include <cmath>
#include <algorithm>

namespace FallGuardSDK {

namespace {

double segmentLength2D(const Landmark* a, const Landmark* b) {
    if (!a || !b) return 0.0;
    return std::hypot(a->x - b->x, a->y - b->y);
}

} // namespace

SupportClassifier::SupportClassifier() {}

void SupportClassifier::SetConfig(const InternalConfig& config) {
    shin_fraction = config.ground_shin_fraction;
    stability_velocity = config.foot_stability_velocity;
    stability_frames = config.foot_stability_frames;
    seat_tolerance = config.seat_depth_tolerance;
}

int SupportClassifier::updateTimer(const std::vector<Landmark>& landmarks,
                                   const std::vector<Landmark>* previous,
                                   int ankle, int timer) const {
    if (!previous) return timer;
    const Landmark* curr = Geometry::At(landmarks, ankle);
    const Landmark* prev = Geometry::At(*previous, ankle);
    if (!curr || !prev) return 0;

    double vel = std::hypot(curr->x - prev->x, curr->y - prev->y);
    if (vel < stability_velocity) return timer + 1;
    return 0;
}

bool SupportClassifier::isSitting(const std::vector<Landmark>& landmarks, double ground_level,
                                  const std::vector<SeatRegion>& seats) const {
    if (seats.empty()) return false;

    double hipX, hipY;
    if (!Geometry::Midpoint(landmarks, LEFT_HIP, RIGHT_HIP, hipX, hipY)) return false;

    for (const auto& seat : seats) {
        bool inBox = hipX > seat.x && hipX < seat.x + seat.w &&
                     hipY > seat.y && hipY < seat.y + seat.h;
        bool depthMatch = std::abs(seat.bottom_y - ground_level) < seat_tolerance;
        if (inBox && depthMatch) return true;
    }
    return false;
}

SupportResult SupportClassifier::Classify(const std::vector<Landmark>& landmarks,
                                          const std::vector<Landmark>* previous,
                                          const std::vector<SeatRegion>& seats) {
    SupportResult result;

    const Landmark* leftKnee = Geometry::At(landmarks, LEFT_KNEE);
    const Landmark* rightKnee = Geometry::At(landmarks, RIGHT_KNEE);
    const Landmark* leftAnkle = Geometry::At(landmarks, LEFT_ANKLE);
    const Landmark* rightAnkle = Geometry::At(landmarks, RIGHT_ANKLE);

    if (!leftAnkle || !rightAnkle) {
        left_timer = 0;
        right_timer = 0;
        return result;
    }

    // Shin length is taken from this frame so the threshold follows camera distance
    double avgShin = (segmentLength2D(leftKnee, leftAnkle) + segmentLength2D(rightKnee, rightAnkle)) / 2.0;
    double groundLevel = std::max(leftAnkle->y, rightAnkle->y);
    double threshold = avgShin * shin_fraction;

    result.ground_level = groundLevel;
    result.left.grounded = leftAnkle->y >= groundLevel - threshold;
    result.right.grounded = rightAnkle->y >= groundLevel - threshold;

    left_timer = updateTimer(landmarks, previous, LEFT_ANKLE, left_timer);
    right_timer = updateTimer(landmarks, previous, RIGHT_ANKLE, right_timer);
    result.left.stability_timer = left_timer;
    result.right.stability_timer = right_timer;

    result.left.supported = result.left.grounded || left_timer > stability_frames;
    result.right.supported = result.right.grounded || right_timer > stability_frames;

    result.sitting = isSitting(landmarks, groundLevel, seats);
    return result;
}

void SupportClassifier::ResetTimers() {
    left_timer = 0;
    right_timer = 0;
}

} // namespace FallGuardSDK
