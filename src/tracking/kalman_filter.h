#ifndef KALMAN_FILTER_H
#define KALMAN_FILTER_H

#include <algorithm>

namespace FallGuardSDK {

struct Point3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

// Constant-velocity estimator for a single joint.
//
// State: [x, y, z, vx, vy, vz]
// Measurement: [x, y, z]
//
// The covariance is tracked as a diagonal only and each axis is corrected
// independently, with the velocity pulled by half the position gain. This is
// an approximation of a coupled 6x6 filter, chosen so 33 joints can be run
// every frame without matrix algebra. It is not a full Kalman filter.
class JointFilter {
public:
    static constexpr double kMinInnovationCovariance = 1e-9;

    double x[6];    // State vector
    double P[6];    // Covariance diagonal

    // Constants
    double q;   // Process noise (all six entries)
    double r;   // Measurement noise (per axis)

    JointFilter(const Point3& initial, double process_noise = 0.01,
                double measurement_noise = 0.05, double initial_covariance = 1.0)
        : q(process_noise), r(measurement_noise) {
        x[0] = initial.x;
        x[1] = initial.y;
        x[2] = initial.z;
        x[3] = 0;
        x[4] = 0;
        x[5] = 0;

        for (int i = 0; i < 6; ++i) P[i] = std::max(0.0, initial_covariance);
    }

    // Predict state for next step (dt = 1 frame)
    void Predict() {
        x[0] += x[3];
        x[1] += x[4];
        x[2] += x[5];

        for (int i = 0; i < 6; ++i) P[i] += q;
    }

    // Update with measurement [mx, my, mz]
    void Update(const Point3& m) {
        updateAxis(0, m.x);
        updateAxis(1, m.y);
        updateAxis(2, m.z);
    }

    // Extrapolate position, state is not touched
    Point3 Forecast(int steps) const {
        Point3 p;
        p.x = x[0] + x[3] * steps;
        p.y = x[1] + x[4] * steps;
        p.z = x[2] + x[5] * steps;
        return p;
    }

    Point3 GetPosition() const {
        Point3 p;
        p.x = x[0];
        p.y = x[1];
        p.z = x[2];
        return p;
    }

    Point3 GetVelocity() const {
        Point3 v;
        v.x = x[3];
        v.y = x[4];
        v.z = x[5];
        return v;
    }

private:
    void updateAxis(int idx, double measured) {
        const double p_pos = P[idx];
        const double p_vel = P[idx + 3];

        // Innovation
        const double y_res = measured - x[idx];

        // S = P_pos + R, never divide by zero
        double s = p_pos + r;
        if (s <= kMinInnovationCovariance) s = kMinInnovationCovariance;

        const double k_pos = p_pos / s;
        const double k_vel = 0.5 * k_pos;

        x[idx] += k_pos * y_res;
        x[idx + 3] += k_vel * y_res;

        // P = (1 - K) * P, clamped against drift below zero
        P[idx] = std::max(0.0, (1.0 - k_pos) * p_pos);
        P[idx + 3] = std::max(0.0, (1.0 - k_vel) * p_vel);
    }
};

} // FallGuardSDK

#endif
