#ifndef GEOMETRY_ENGINE_H
#define GEOMETRY_ENGINE_H

#include "FallGuard_sdk.h"
#include <vector>

namespace FallGuardSDK {
namespace Geometry {

// Angle returned when a joint cannot be measured ("no stress")
constexpr double kNeutralAngle = 180.0;

// Landmark at `idx`, or nullptr if the frame is too short
const Landmark* At(const std::vector<Landmark>& lm, int idx);

// Mean of two landmarks in the image plane. False if either is missing.
bool Midpoint(const std::vector<Landmark>& lm, int a, int b, double& x, double& y);

// Angle at vertex b between b->a and b->c, degrees in [0, 180].
// Returns kNeutralAngle for missing points or zero-length vectors.
double JointAngle(const Landmark* a, const Landmark* b, const Landmark* c);

// 100 when hip center and ankle center share x, falling by `gain` per unit of deviation
double StabilityScore(const std::vector<Landmark>& lm, double gain = 500.0);

// Tilt of the shoulder-center -> hip-center vector from straight down, degrees.
bool SpineTiltDegrees(const std::vector<Landmark>& lm, double& degrees);
SpineStatus SpineStatusOf(const std::vector<Landmark>& lm, double poor_angle = 45.0);

// Hip center y delta between frames (positive = moving down the image)
bool HipVerticalVelocity(const std::vector<Landmark>& current,
                         const std::vector<Landmark>* previous, double& dy);

double ImpactFactor(const std::vector<Landmark>& current, const std::vector<Landmark>* previous,
                    double velocity_threshold = 0.015, double gain = 30.0);

/**
 * Rapid downward hip motion that is still accelerating.
 * `new_velocity` receives this frame's dy; the caller keeps it for the next call.
 * Without a previous frame returns false and passes `previous_velocity` through.
 */
bool IsFreefall(const std::vector<Landmark>& current, const std::vector<Landmark>* previous,
                double previous_velocity, double& new_velocity,
                double accel_threshold = 0.015, double velocity_threshold = 0.02);

// Torso near horizontal and hips in the lower part of the frame
bool IsGeometricFall(const std::vector<Landmark>& lm,
                     double horizontal_angle = 45.0, double low_hip_y = 0.5);

// A wrist resting near a knee (pushing off / bracing)
bool HasHandSupport(const std::vector<Landmark>& lm,
                    double max_distance = 0.15, double min_visibility = 0.5);

// Mean visibility of shoulders, hips, knees and ankles
double FrameVisibility(const std::vector<Landmark>& lm);

MotionTrend ClassifyMotionTrend(const std::vector<Landmark>& current,
                                const std::vector<Landmark>* previous,
                                double threshold = 0.005);

double KneeLoadPercent(double angle, double impact_factor);
KneeLoadLevel ClassifyKneeLoad(double angle);

} // namespace Geometry
} // namespace FallGuardSDK

#endif // GEOMETRY_ENGINE_H
