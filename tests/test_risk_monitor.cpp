// End-to-end tests of the per-subject risk pipeline
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <algorithm>

#include "fall/risk_monitor.h"
#include "pose_fixtures.h"

using namespace FallGuardSDK;
using Catch::Matchers::WithinAbs;

namespace {

struct EventLog {
    std::vector<FallGuardEvent> events;

    FallGuardCallback callback() {
        return [this](const FallGuardEvent& e) { events.push_back(e); };
    }

    int count(FallGuardEventType type) const {
        int n = 0;
        for (const auto& e : events) {
            if (e.type == type) n++;
        }
        return n;
    }

    const FallGuardEvent* first(FallGuardEventType type) const {
        for (const auto& e : events) {
            if (e.type == type) return &e;
        }
        return nullptr;
    }
};

StatusCode feed(RiskMonitor& monitor, const std::vector<Landmark>& lm, RiskSnapshot& snap,
                uint64_t timestamp = 0) {
    PoseFrame frame = fixtures::frameOf(lm, timestamp);
    return monitor.Process(&frame, frame.timestamp, snap);
}

} // namespace

TEST_CASE("Sixty lying frames raise exactly one alarm on frame 60", "[monitor][scenario]") {
    RiskMonitor monitor;
    EventLog log;
    monitor.RegisterCallback(log.callback());

    std::vector<Landmark> lying = fixtures::lyingPose();
    RiskSnapshot snap;
    for (int i = 0; i < 60; ++i) {
        REQUIRE(feed(monitor, lying, snap) == StatusCode::OK);
        CHECK(snap.geometric_fall);
    }

    CHECK(log.count(FallGuardEventType::FallConfirmed) == 1);
    REQUIRE(log.first(FallGuardEventType::FallConfirmed) != nullptr);
    CHECK(log.first(FallGuardEventType::FallConfirmed)->frame_index == 60);
    CHECK(snap.fall_state == FallState::Confirmed);

    // Staying on the floor does not repeat the alarm
    for (int i = 0; i < 60; ++i) feed(monitor, lying, snap);
    CHECK(log.count(FallGuardEventType::FallConfirmed) == 1);
}

TEST_CASE("Stable standing stays below 10 indefinitely", "[monitor][scenario]") {
    RiskMonitor monitor;
    std::vector<Landmark> pose = fixtures::standingPose(170.0);

    RiskSnapshot snap;
    double worst = 0.0;
    for (int i = 0; i < 300; ++i) {
        feed(monitor, pose, snap);
        worst = std::max(worst, snap.composite_risk);
    }

    CHECK(worst < 10.0);
    CHECK(snap.tracking == TrackingStatus::Active);
    CHECK(snap.spine_status == SpineStatus::Good);
    CHECK(snap.left_leg.supported);
    CHECK(snap.right_leg.supported);
    CHECK(snap.fall_state == FallState::Normal);
    CHECK(snap.motion_trend == MotionTrend::Stable);
}

TEST_CASE("Accelerating hip drop forces composite risk to 100", "[monitor][scenario]") {
    // Default config: geometry runs on smoothed landmarks
    RiskMonitor monitor;
    REQUIRE(monitor.GetConfig().analyze_smoothed_landmarks);
    EventLog log;
    monitor.RegisterCallback(log.callback());

    std::vector<Landmark> f0 = fixtures::standingPose();
    std::vector<Landmark> f1 = fixtures::shifted(f0, 0.0, 0.01);
    std::vector<Landmark> f2 = fixtures::shifted(f1, 0.0, 0.02);
    std::vector<Landmark> f3 = fixtures::shifted(f2, 0.0, 0.04);

    RiskSnapshot snap;
    for (int i = 0; i < 20; ++i) feed(monitor, f0, snap);
    CHECK_FALSE(snap.freefall);
    feed(monitor, f1, snap);
    CHECK_FALSE(snap.freefall);
    feed(monitor, f2, snap);
    CHECK_FALSE(snap.freefall);
    CHECK(snap.composite_risk < 10.0);

    feed(monitor, f3, snap);
    CHECK(snap.freefall);
    CHECK(snap.composite_risk == 100.0);
    CHECK(snap.risk_level == RiskLevel::Critical);
    CHECK(snap.impact_factor > 1.0);
    CHECK(snap.motion_trend == MotionTrend::Lowering);
    CHECK(log.count(FallGuardEventType::HighRisk) == 1);
}

TEST_CASE("Raw-frame drop detection matches with smoothing on or off", "[monitor][scenario]") {
    for (bool smoothed : {true, false}) {
        RiskMonitor monitor;
        InternalConfig cfg;
        cfg.analyze_smoothed_landmarks = smoothed;
        monitor.SetConfig(cfg);

        std::vector<Landmark> pose = fixtures::standingPose();
        RiskSnapshot snap;
        for (int i = 0; i < 20; ++i) feed(monitor, pose, snap);

        int firstFreefall = -1;
        const double drops[] = {0.01, 0.02, 0.04, 0.07};
        for (int i = 0; i < 4; ++i) {
            pose = fixtures::shifted(pose, 0.0, drops[i]);
            feed(monitor, pose, snap);
            if (snap.freefall && firstFreefall < 0) {
                firstFreefall = i;
                CHECK(snap.composite_risk == 100.0);
            }
        }
        CHECK(firstFreefall == 2);
    }
}

TEST_CASE("Knee angles follow world landmarks when a full set is given", "[monitor][world]") {
    RiskMonitor monitor;

    // Image space shows straight legs, world space a 90 degree bend
    PoseFrame frame = fixtures::frameOf(fixtures::standingPose(180.0));
    frame.world_landmarks = fixtures::standingPose(90.0);

    RiskSnapshot snap;
    for (int i = 0; i < 30; ++i) {
        REQUIRE(monitor.Process(&frame, frame.timestamp, snap) == StatusCode::OK);
    }

    REQUIRE(snap.left_leg.supported);
    REQUIRE(snap.right_leg.supported);
    CHECK_THAT(snap.left_knee_angle, WithinAbs(90.0, 1e-6));
    CHECK_THAT(snap.right_knee_angle, WithinAbs(90.0, 1e-6));
    CHECK_THAT(snap.knee_risk, WithinAbs(50.0, 1e-6));
}

TEST_CASE("Short or empty world landmarks fall back to image space", "[monitor][world]") {
    std::vector<Landmark> bent = fixtures::standingPose(90.0);
    std::vector<std::vector<Landmark>> worlds = {
        {},
        std::vector<Landmark>(bent.begin(), bent.begin() + 20),
    };

    for (const auto& world : worlds) {
        RiskMonitor monitor;
        PoseFrame frame = fixtures::frameOf(fixtures::standingPose(180.0));
        frame.world_landmarks = world;

        RiskSnapshot snap;
        for (int i = 0; i < 30; ++i) monitor.Process(&frame, frame.timestamp, snap);

        CHECK(snap.tracking == TrackingStatus::Active);
        CHECK_THAT(snap.left_knee_angle, WithinAbs(180.0, 1e-6));
        CHECK(snap.knee_risk == 0.0);
    }
}

TEST_CASE("Low visibility holds the fall counter", "[monitor]") {
    RiskMonitor monitor;
    EventLog log;
    monitor.RegisterCallback(log.callback());

    std::vector<Landmark> lying = fixtures::lyingPose();
    std::vector<Landmark> dim = fixtures::withVisibility(lying, 0.3);

    RiskSnapshot snap;
    for (int i = 0; i < 30; ++i) feed(monitor, lying, snap);
    REQUIRE(snap.fall_counter == 30);

    for (int i = 1; i <= 8; ++i) {
        feed(monitor, dim, snap);
        CHECK(snap.fall_counter == 30);
        CHECK(snap.composite_risk == 0.0);
        CHECK(snap.tracking == (i > 5 ? TrackingStatus::LowVisibility : TrackingStatus::Active));
    }

    for (int i = 0; i < 29; ++i) feed(monitor, lying, snap);
    CHECK(log.count(FallGuardEventType::FallConfirmed) == 0);
    feed(monitor, lying, snap);
    CHECK(log.count(FallGuardEventType::FallConfirmed) == 1);
}

TEST_CASE("Missing subject resets the fall counter", "[monitor]") {
    RiskMonitor monitor;
    EventLog log;
    monitor.RegisterCallback(log.callback());

    std::vector<Landmark> lying = fixtures::lyingPose();
    RiskSnapshot snap;
    for (int i = 0; i < 30; ++i) feed(monitor, lying, snap);

    REQUIRE(monitor.Process(nullptr, 0, snap) == StatusCode::OK);
    CHECK(snap.tracking == TrackingStatus::NoSubject);
    CHECK(snap.fall_counter == 0);
    CHECK(snap.composite_risk == 0.0);

    for (int i = 0; i < 59; ++i) feed(monitor, lying, snap);
    CHECK(log.count(FallGuardEventType::FallConfirmed) == 0);
    feed(monitor, lying, snap);
    CHECK(log.count(FallGuardEventType::FallConfirmed) == 1);
}

TEST_CASE("Malformed frame is treated as a missing subject", "[monitor]") {
    RiskMonitor monitor;
    RiskSnapshot snap;
    feed(monitor, fixtures::standingPose(), snap);

    std::vector<Landmark> shortFrame(10, fixtures::point(0.5, 0.5));
    CHECK(feed(monitor, shortFrame, snap) == StatusCode::ERROR_INVALID_INPUT);
    CHECK(snap.tracking == TrackingStatus::NoSubject);
    CHECK(snap.frame_index == 2);
}

TEST_CASE("External reset clears a confirmed alarm", "[monitor]") {
    RiskMonitor monitor;
    InternalConfig cfg;
    cfg.fall_trigger_frames = 5;
    monitor.SetConfig(cfg);
    EventLog log;
    monitor.RegisterCallback(log.callback());

    std::vector<Landmark> lying = fixtures::lyingPose();
    RiskSnapshot snap;
    for (int i = 0; i < 10; ++i) feed(monitor, lying, snap);
    REQUIRE(log.count(FallGuardEventType::FallConfirmed) == 1);

    monitor.ResetAlarm();
    CHECK(log.count(FallGuardEventType::AlarmReset) == 1);
    CHECK(monitor.GetLastSnapshot().fall_state == FallState::Normal);

    for (int i = 0; i < 5; ++i) feed(monitor, lying, snap);
    CHECK(log.count(FallGuardEventType::FallConfirmed) == 2);
}

TEST_CASE("Obstacle near the feet adds environment risk", "[monitor]") {
    RiskMonitor monitor;
    EventLog log;
    monitor.RegisterCallback(log.callback());

    std::vector<Landmark> pose = fixtures::standingPose();
    RiskSnapshot snap;
    feed(monitor, pose, snap);

    ObjectDetection bag;
    bag.class_name = "backpack";
    bag.score = 0.8;
    bag.x = 45;
    bag.y = 85;
    bag.w = 10;
    bag.h = 10;
    std::vector<ObjectDetection> dets = {bag};
    REQUIRE(monitor.UpdateDetections(dets, 100, 100) == StatusCode::OK);
    monitor.UpdateDetections(dets, 100, 100);
    CHECK(log.count(FallGuardEventType::ObstacleHazard) == 1);
    CHECK(log.first(FallGuardEventType::ObstacleHazard)->detail == "backpack");

    feed(monitor, pose, snap);
    CHECK(snap.obstacle_hazard);
    CHECK_THAT(snap.env_risk, WithinAbs(80.0, 1e-9));
    CHECK_THAT(snap.composite_risk, WithinAbs(16.0, 1e-6));

    CHECK(monitor.UpdateDetections(dets, 0, 0) == StatusCode::ERROR_INVALID_INPUT);
}

TEST_CASE("Sitting on a detected seat masks knee load", "[monitor]") {
    RiskMonitor monitor;
    std::vector<Landmark> pose = fixtures::standingPose(90.0);

    ObjectDetection chair;
    chair.class_name = "chair";
    chair.x = 40;
    chair.y = 40;
    chair.w = 20;
    chair.h = 48;
    std::vector<ObjectDetection> dets = {chair};

    RiskSnapshot snap;
    feed(monitor, pose, snap);
    CHECK(snap.knee_risk > 0.0);

    monitor.UpdateDetections(dets, 100, 100);
    REQUIRE(monitor.GetSeatRegions().size() == 1);
    feed(monitor, pose, snap);
    CHECK(snap.sitting);
    CHECK(snap.knee_risk == 0.0);
}

TEST_CASE("Irregular frame interval is flagged, not rejected", "[monitor]") {
    RiskMonitor monitor;
    InternalConfig cfg;
    cfg.expected_frame_interval_ms = 33;
    cfg.frame_interval_tolerance_ms = 10;
    monitor.SetConfig(cfg);

    std::vector<Landmark> pose = fixtures::standingPose();
    RiskSnapshot snap;
    feed(monitor, pose, snap, 1000);
    CHECK_FALSE(snap.irregular_timing);
    feed(monitor, pose, snap, 1033);
    CHECK_FALSE(snap.irregular_timing);
    CHECK(feed(monitor, pose, snap, 1200) == StatusCode::OK);
    CHECK(snap.irregular_timing);
    CHECK(snap.tracking == TrackingStatus::Active);
}

TEST_CASE("Session reset starts over", "[monitor]") {
    RiskMonitor monitor;
    RiskSnapshot snap;
    for (int i = 0; i < 5; ++i) feed(monitor, fixtures::standingPose(), snap);
    CHECK(monitor.GetForecastLandmarks(15).size() == (size_t)kNumLandmarks);

    monitor.ResetSession();
    CHECK(monitor.GetLastSnapshot().frame_index == 0);

    feed(monitor, fixtures::lyingPose(), snap);
    CHECK(snap.frame_index == 1);
    // Filters were rebuilt from the new pose, no blending with the old one
    CHECK_THAT(monitor.GetSmoothedLandmarks()[LEFT_HIP].x, WithinAbs(0.6, 1e-12));
}
