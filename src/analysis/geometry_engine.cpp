#include "geometry_engine.h"
#include <cmath>
#include <algorithm>

namespace FallGuardSDK {
namespace Geometry {

namespace {

constexpr double kRadToDeg = 180.0 / M_PI;

const int kVisibilityJoints[] = {
    LEFT_SHOULDER, RIGHT_SHOULDER, LEFT_HIP, RIGHT_HIP,
    LEFT_KNEE, RIGHT_KNEE, LEFT_ANKLE, RIGHT_ANKLE
};

} // namespace

const Landmark* At(const std::vector<Landmark>& lm, int idx) {
    if (idx < 0 || idx >= (int)lm.size()) return nullptr;
    return &lm[idx];
}

bool Midpoint(const std::vector<Landmark>& lm, int a, int b, double& x, double& y) {
    const Landmark* pa = At(lm, a);
    const Landmark* pb = At(lm, b);
    if (!pa || !pb) return false;
    x = (pa->x + pb->x) / 2.0;
    y = (pa->y + pb->y) / 2.0;
    return true;
}

double JointAngle(const Landmark* a, const Landmark* b, const Landmark* c) {
    if (!a || !b || !c) return kNeutralAngle;

    double v1x = a->x - b->x, v1y = a->y - b->y, v1z = a->z - b->z;
    double v2x = c->x - b->x, v2y = c->y - b->y, v2z = c->z - b->z;

    double mag1 = std::sqrt(v1x * v1x + v1y * v1y + v1z * v1z);
    double mag2 = std::sqrt(v2x * v2x + v2y * v2y + v2z * v2z);
    if (mag1 * mag2 <= 0.0 || !std::isfinite(mag1 * mag2)) return kNeutralAngle;

    double cosv = (v1x * v2x + v1y * v2y + v1z * v2z) / (mag1 * mag2);
    cosv = std::max(-1.0, std::min(1.0, cosv));
    return std::acos(cosv) * kRadToDeg;
}

double StabilityScore(const std::vector<Landmark>& lm, double gain) {
    double hipX, hipY, ankleX, ankleY;
    if (!Midpoint(lm, LEFT_HIP, RIGHT_HIP, hipX, hipY) ||
        !Midpoint(lm, LEFT_ANKLE, RIGHT_ANKLE, ankleX, ankleY)) {
        return 100.0;
    }
    double deviation = std::abs(hipX - ankleX);
    return std::max(0.0, 100.0 - deviation * gain);
}

bool SpineTiltDegrees(const std::vector<Landmark>& lm, double& degrees) {
    double sx, sy, hx, hy;
    if (!Midpoint(lm, LEFT_SHOULDER, RIGHT_SHOULDER, sx, sy) ||
        !Midpoint(lm, LEFT_HIP, RIGHT_HIP, hx, hy)) {
        return false;
    }
    double dx = hx - sx;
    double dy = hy - sy;
    if (dx == 0.0 && dy == 0.0) return false;

    // Image y grows downwards, so an upright torso points along +y
    degrees = std::atan2(std::abs(dx), dy) * kRadToDeg;
    return true;
}

SpineStatus SpineStatusOf(const std::vector<Landmark>& lm, double poor_angle) {
    double tilt = 0.0;
    if (!SpineTiltDegrees(lm, tilt)) return SpineStatus::Unknown;
    return tilt > poor_angle ? SpineStatus::Poor : SpineStatus::Good;
}

bool HipVerticalVelocity(const std::vector<Landmark>& current,
                         const std::vector<Landmark>* previous, double& dy) {
    if (!previous) return false;
    double cx, cy, px, py;
    if (!Midpoint(current, LEFT_HIP, RIGHT_HIP, cx, cy) ||
        !Midpoint(*previous, LEFT_HIP, RIGHT_HIP, px, py)) {
        return false;
    }
    dy = cy - py;
    return true;
}

double ImpactFactor(const std::vector<Landmark>& current, const std::vector<Landmark>* previous,
                    double velocity_threshold, double gain) {
    double dy = 0.0;
    if (!HipVerticalVelocity(current, previous, dy)) return 1.0;
    if (dy <= velocity_threshold) return 1.0;
    return 1.0 + (dy - velocity_threshold) * gain;
}

bool IsFreefall(const std::vector<Landmark>& current, const std::vector<Landmark>* previous,
                double previous_velocity, double& new_velocity,
                double accel_threshold, double velocity_threshold) {
    new_velocity = previous_velocity;
    double dy = 0.0;
    if (!HipVerticalVelocity(current, previous, dy)) return false;

    double accel = dy - previous_velocity;
    new_velocity = dy;
    return accel > accel_threshold && dy > velocity_threshold;
}

bool IsGeometricFall(const std::vector<Landmark>& lm, double horizontal_angle, double low_hip_y) {
    double sx, sy, hx, hy;
    if (!Midpoint(lm, LEFT_SHOULDER, RIGHT_SHOULDER, sx, sy) ||
        !Midpoint(lm, LEFT_HIP, RIGHT_HIP, hx, hy)) {
        return false;
    }
    double dx = std::abs(sx - hx);
    double dy = std::abs(sy - hy);
    if (dx == 0.0 && dy == 0.0) return false;

    double angle = std::atan2(dy, dx) * kRadToDeg;
    bool isHorizontal = angle < horizontal_angle;
    bool isLow = hy > low_hip_y;
    return isHorizontal && isLow;
}

bool HasHandSupport(const std::vector<Landmark>& lm, double max_distance, double min_visibility) {
    const int wrists[2] = {LEFT_WRIST, RIGHT_WRIST};
    const int knees[2] = {LEFT_KNEE, RIGHT_KNEE};

    for (int w : wrists) {
        const Landmark* wrist = At(lm, w);
        if (!wrist || wrist->visibility < min_visibility) continue;
        for (int k : knees) {
            const Landmark* knee = At(lm, k);
            if (!knee || knee->visibility < min_visibility) continue;
            if (std::hypot(wrist->x - knee->x, wrist->y - knee->y) < max_distance) return true;
        }
    }
    return false;
}

double FrameVisibility(const std::vector<Landmark>& lm) {
    double total = 0.0;
    int count = 0;
    for (int idx : kVisibilityJoints) {
        const Landmark* p = At(lm, idx);
        total += p ? p->visibility : 0.0;
        count++;
    }
    return total / count;
}

MotionTrend ClassifyMotionTrend(const std::vector<Landmark>& current,
                                const std::vector<Landmark>* previous, double threshold) {
    double vy = 0.0;
    if (!HipVerticalVelocity(current, previous, vy)) return MotionTrend::Unknown;
    if (std::abs(vy) > threshold) {
        return vy > 0 ? MotionTrend::Lowering : MotionTrend::StandingUp;
    }
    return MotionTrend::Stable;
}

double KneeLoadPercent(double angle, double impact_factor) {
    // 180 deg -> 0%, 60 deg and below -> 100%
    double pressure = (180.0 - angle) / 1.8 * 1.5;
    pressure *= std::max(1.0, impact_factor);
    return std::max(0.0, std::min(100.0, pressure));
}

KneeLoadLevel ClassifyKneeLoad(double angle) {
    if (angle < 100.0) return KneeLoadLevel::Critical;
    if (angle < 140.0) return KneeLoadLevel::Moderate;
    return KneeLoadLevel::Normal;
}

} // namespace Geometry
} // namespace FallGuardSDK
