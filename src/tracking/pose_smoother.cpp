#include "pose_smoother.h"
#include <algorithm>

namespace FallGuardSDK {

namespace {

Point3 toPoint(const Landmark& lm) {
    Point3 p;
    p.x = lm.x;
    p.y = lm.y;
    p.z = lm.z;
    return p;
}

void writePoint(Landmark& lm, const Point3& p) {
    lm.x = p.x;
    lm.y = p.y;
    lm.z = p.z;
}

} // namespace

PoseSmoother::PoseSmoother() : smoothed(kNumLandmarks) {}

void PoseSmoother::SetParams(double process_noise, double measurement_noise,
                             double initial_covariance, double floor) {
    q = process_noise;
    r = measurement_noise;
    p0 = initial_covariance;
    visibility_floor = floor;
    for (auto& kv : filters) {
        kv.second.q = q;
        kv.second.r = r;
    }
}

const std::vector<Landmark>& PoseSmoother::Step(const std::vector<Landmark>& landmarks) {
    int n = std::min((int)landmarks.size(), kNumLandmarks);

    for (int i = 0; i < n; ++i) {
        const Landmark& lm = landmarks[i];
        bool observed = lm.visibility >= visibility_floor;

        auto it = filters.find(i);
        if (it == filters.end()) {
            if (!observed) {
                // Not tracked yet, pass the raw point through
                smoothed[i] = lm;
                continue;
            }
            it = filters.emplace(i, JointFilter(toPoint(lm), q, r, p0)).first;
        }

        JointFilter& f = it->second;
        f.Predict();
        if (observed) f.Update(toPoint(lm));

        smoothed[i].visibility = lm.visibility;
        writePoint(smoothed[i], f.GetPosition());
    }

    // Joints missing from a short frame keep coasting
    for (int i = n; i < kNumLandmarks; ++i) {
        auto it = filters.find(i);
        if (it == filters.end()) continue;
        it->second.Predict();
        writePoint(smoothed[i], it->second.GetPosition());
    }

    return smoothed;
}

const std::vector<Landmark>& PoseSmoother::Coast() {
    for (auto& kv : filters) {
        kv.second.Predict();
        writePoint(smoothed[kv.first], kv.second.GetPosition());
    }
    return smoothed;
}

std::vector<Landmark> PoseSmoother::Forecast(int steps) const {
    std::vector<Landmark> out = smoothed;
    if (steps < 0) steps = 0;
    for (const auto& kv : filters) {
        writePoint(out[kv.first], kv.second.Forecast(steps));
    }
    return out;
}

const JointFilter* PoseSmoother::GetFilter(int joint) const {
    auto it = filters.find(joint);
    if (it == filters.end()) return nullptr;
    return &it->second;
}

void PoseSmoother::Reset() {
    filters.clear();
    smoothed.assign(kNumLandmarks, Landmark());
}

} // namespace FallGuardSDK
