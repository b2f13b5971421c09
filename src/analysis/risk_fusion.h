#ifndef RISK_FUSION_H
#define RISK_FUSION_H

#include "FallGuard_sdk.h"
#include "../config/internal_config.h"

namespace FallGuardSDK {

struct RiskInputs {
    double left_knee_angle = 180.0;
    double right_knee_angle = 180.0;
    bool left_supported = false;
    bool right_supported = false;
    bool sitting = false;
    bool hand_support = false;
    double stability_score = 100.0;
    SpineStatus spine = SpineStatus::Good;
    double env_hazard = 0.0;      // 0 or the configured hazard level
    bool freefall = false;
    double impact_factor = 1.0;
};

// Weighted fusion of knee, stability and environment risk into one 0-100 index.
class RiskFusion {
public:
    RiskFusion();

    void SetConfig(const InternalConfig& config);

    // Knee angle that drives the knee term; only legs carrying weight count
    double EffectiveAngle(const RiskInputs& in) const;

    // Fills the risk fields of `out`; other fields are left untouched
    void Compute(const RiskInputs& in, RiskSnapshot& out) const;

    RiskLevel Classify(double composite) const;

private:
    InternalConfig cfg;
};

} // namespace FallGuardSDK

#endif // RISK_FUSION_H
