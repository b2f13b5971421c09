// Unit tests for the weighted risk fusion
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "analysis/risk_fusion.h"

using namespace FallGuardSDK;
using Catch::Matchers::WithinAbs;

static RiskInputs standing(double left_angle, double right_angle) {
    RiskInputs in;
    in.left_knee_angle = left_angle;
    in.right_knee_angle = right_angle;
    in.left_supported = true;
    in.right_supported = true;
    in.stability_score = 100.0;
    in.spine = SpineStatus::Good;
    return in;
}

TEST_CASE("Stable standing reads as low risk", "[fusion]") {
    RiskFusion fusion;
    RiskSnapshot out;
    fusion.Compute(standing(170.0, 170.0), out);

    CHECK(out.knee_risk == 0.0);
    CHECK(out.composite_risk < 10.0);
    CHECK(out.risk_level == RiskLevel::Low);
}

TEST_CASE("Weighted sum of the three terms", "[fusion]") {
    RiskFusion fusion;
    RiskInputs in = standing(100.0, 120.0);
    in.stability_score = 80.0;
    in.env_hazard = 0.8;

    RiskSnapshot out;
    fusion.Compute(in, out);

    // knee 140 - 100 = 40, stability 20, env 80
    CHECK_THAT(out.knee_risk, WithinAbs(40.0, 1e-9));
    CHECK_THAT(out.stability_risk, WithinAbs(20.0, 1e-9));
    CHECK_THAT(out.env_risk, WithinAbs(80.0, 1e-9));
    CHECK_THAT(out.composite_risk, WithinAbs(40.0 * 0.3 + 20.0 * 0.4 + 80.0 * 0.2, 1e-9));
}

TEST_CASE("Only weight-bearing legs drive the knee term", "[fusion]") {
    RiskFusion fusion;

    RiskInputs in = standing(90.0, 170.0);
    in.left_supported = false;
    CHECK(fusion.EffectiveAngle(in) == 170.0);

    in.left_supported = true;
    in.right_supported = false;
    CHECK(fusion.EffectiveAngle(in) == 90.0);

    in.left_supported = false;
    CHECK(fusion.EffectiveAngle(in) == 180.0);
}

TEST_CASE("Sitting masks knee load", "[fusion]") {
    RiskFusion fusion;
    RiskInputs in = standing(80.0, 80.0);
    in.sitting = true;

    RiskSnapshot out;
    fusion.Compute(in, out);
    CHECK(out.knee_risk == 0.0);
    CHECK(out.left_knee_angle == 180.0);
    CHECK(out.left_knee_load == 0.0);
    CHECK(out.sitting);
}

TEST_CASE("Hand support adds to the effective angle", "[fusion]") {
    RiskFusion fusion;
    RiskInputs in = standing(100.0, 100.0);
    in.hand_support = true;

    CHECK(fusion.EffectiveAngle(in) == 130.0);
    RiskSnapshot out;
    fusion.Compute(in, out);
    CHECK_THAT(out.knee_risk, WithinAbs(10.0, 1e-9));
}

TEST_CASE("Freefall overrides, then spine penalty, then clamp", "[fusion]") {
    RiskFusion fusion;
    RiskSnapshot out;

    RiskInputs in = standing(170.0, 170.0);
    in.freefall = true;
    fusion.Compute(in, out);
    CHECK(out.composite_risk == 100.0);
    CHECK(out.risk_level == RiskLevel::Critical);

    // Penalty after the override still clamps to 100
    in.spine = SpineStatus::Poor;
    fusion.Compute(in, out);
    CHECK(out.composite_risk == 100.0);

    // Without freefall the penalty is added to the weighted sum
    in.freefall = false;
    fusion.Compute(in, out);
    CHECK_THAT(out.composite_risk, WithinAbs(10.0, 1e-9));
    CHECK(out.spine_status == SpineStatus::Poor);
}

TEST_CASE("Composite risk stays within 0..100", "[fusion]") {
    RiskFusion fusion;
    RiskInputs in = standing(0.0, 0.0);
    in.stability_score = -50.0;
    in.env_hazard = 1.0;
    in.spine = SpineStatus::Poor;

    RiskSnapshot out;
    fusion.Compute(in, out);
    CHECK(out.composite_risk == 100.0);
    CHECK(out.stability_risk == 100.0);
}

TEST_CASE("Published knee and environment terms stay within 0..100", "[fusion]") {
    RiskFusion fusion;
    RiskInputs in = standing(20.0, 20.0);
    in.env_hazard = 1.5;

    RiskSnapshot out;
    fusion.Compute(in, out);
    CHECK(out.knee_risk == 100.0);
    CHECK(out.env_risk == 100.0);

    // The composite keeps the full weighted knee term: 120 * 0.3 + 150 * 0.2
    CHECK_THAT(out.composite_risk, WithinAbs(66.0, 1e-9));
}

TEST_CASE("Risk levels", "[fusion]") {
    RiskFusion fusion;
    CHECK(fusion.Classify(10.0) == RiskLevel::Low);
    CHECK(fusion.Classify(40.0) == RiskLevel::Low);
    CHECK(fusion.Classify(55.0) == RiskLevel::Warning);
    CHECK(fusion.Classify(71.0) == RiskLevel::Critical);
}

TEST_CASE("Displayed knee load is amplified by impact", "[fusion]") {
    RiskFusion fusion;
    RiskInputs in = standing(120.0, 180.0);
    in.impact_factor = 1.5;

    RiskSnapshot out;
    fusion.Compute(in, out);
    CHECK_THAT(out.left_knee_load, WithinAbs(75.0, 1e-9));
    CHECK(out.right_knee_load == 0.0);
    CHECK(out.left_knee_level == KneeLoadLevel::Moderate);
    CHECK(out.impact_factor == 1.5);
}
