#include "risk_fusion.h"
#include "geometry_engine.h"
#include <algorithm>

namespace FallGuardSDK {

RiskFusion::RiskFusion() {}

void RiskFusion::SetConfig(const InternalConfig& config) {
    cfg = config;
}

double RiskFusion::EffectiveAngle(const RiskInputs& in) const {
    double angle = Geometry::kNeutralAngle;
    if (!in.sitting) {
        if (in.left_supported && in.right_supported) {
            angle = std::min(in.left_knee_angle, in.right_knee_angle);
        } else if (in.left_supported) {
            angle = in.left_knee_angle;
        } else if (in.right_supported) {
            angle = in.right_knee_angle;
        }
    }
    if (in.hand_support) angle += cfg.hand_support_bonus;
    return angle;
}

RiskLevel RiskFusion::Classify(double composite) const {
    if (composite > cfg.risk_critical_level) return RiskLevel::Critical;
    if (composite > cfg.risk_warning_level) return RiskLevel::Warning;
    return RiskLevel::Low;
}

void RiskFusion::Compute(const RiskInputs& in, RiskSnapshot& out) const {
    double effectiveAngle = EffectiveAngle(in);

    double kneeRisk = std::max(0.0, cfg.knee_reference_angle - effectiveAngle);
    double stabilityRisk = 100.0 - std::max(0.0, std::min(100.0, in.stability_score));
    double envRisk = in.env_hazard * 100.0;

    double risk = kneeRisk * cfg.knee_weight +
                  stabilityRisk * cfg.stability_weight +
                  envRisk * cfg.env_weight;

    // Order matters: freefall override, then spine penalty, then clamp
    if (in.freefall) risk = 100.0;
    if (in.spine == SpineStatus::Poor) risk += cfg.spine_penalty;
    risk = std::min(100.0, std::max(0.0, risk));

    // Published terms share the composite's 0..100 range
    out.knee_risk = std::min(100.0, kneeRisk);
    out.stability_risk = stabilityRisk;
    out.env_risk = std::min(100.0, std::max(0.0, envRisk));
    out.spine_status = in.spine;
    out.impact_factor = in.impact_factor;
    out.composite_risk = risk;
    out.risk_level = Classify(risk);
    out.stability_score = in.stability_score;
    out.sitting = in.sitting;
    out.hand_support = in.hand_support;
    out.freefall = in.freefall;

    // Displayed per-leg load: masked while sitting or when the leg is in the air
    out.left_knee_angle = (!in.sitting && in.left_supported) ? in.left_knee_angle : Geometry::kNeutralAngle;
    out.right_knee_angle = (!in.sitting && in.right_supported) ? in.right_knee_angle : Geometry::kNeutralAngle;
    out.left_knee_load = Geometry::KneeLoadPercent(out.left_knee_angle, in.impact_factor);
    out.right_knee_load = Geometry::KneeLoadPercent(out.right_knee_angle, in.impact_factor);
    out.left_knee_level = Geometry::ClassifyKneeLoad(out.left_knee_angle);
    out.right_knee_level = Geometry::ClassifyKneeLoad(out.right_knee_angle);
}

} // namespace FallGuardSDK
