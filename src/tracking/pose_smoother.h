#ifndef POSE_SMOOTHER_H
#define POSE_SMOOTHER_H

#include "FallGuard_sdk.h"
#include "kalman_filter.h"
#include <map>
#include <vector>

namespace FallGuardSDK {

// Runs one JointFilter per skeleton joint. Filters are created lazily the
// first time a joint is seen above the visibility floor.
class PoseSmoother {
public:
    PoseSmoother();

    void SetParams(double process_noise, double measurement_noise,
                   double initial_covariance, double visibility_floor);

    // Predict + update every joint with this frame's landmarks.
    // Joints below the visibility floor are predicted only.
    const std::vector<Landmark>& Step(const std::vector<Landmark>& landmarks);

    // Predict-only step for frames without a subject
    const std::vector<Landmark>& Coast();

    // Smoothed frame extrapolated `steps` frames ahead
    std::vector<Landmark> Forecast(int steps) const;

    const std::vector<Landmark>& GetSmoothed() const { return smoothed; }
    bool HasFilter(int joint) const { return filters.count(joint) > 0; }
    const JointFilter* GetFilter(int joint) const;
    int ActiveFilterCount() const { return (int)filters.size(); }

    void Reset();

private:
    std::map<int, JointFilter> filters;
    std::vector<Landmark> smoothed;

    double q = 0.01;
    double r = 0.05;
    double p0 = 1.0;
    double visibility_floor = 0.1;
};

} // namespace FallGuardSDK

#endif // POSE_SMOOTHER_H
