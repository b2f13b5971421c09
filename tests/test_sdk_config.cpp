// Tests of the public SDK facade: lifecycle, versioned config, INI loading
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

#include "FallGuard_sdk.h"
#include "pose_fixtures.h"

using SDK = FallGuardSDK::FallGuardSDK;
using namespace FallGuardSDK;
namespace fs = std::filesystem;

// Helper: write a temporary INI file, removed when the guard goes out of scope.
struct TmpIni {
    fs::path path;
    explicit TmpIni(const std::string& content) {
        path = fs::temp_directory_path() / ("fallguard_test_" + std::to_string(reinterpret_cast<uintptr_t>(this)) + ".ini");
        std::ofstream out(path);
        out << content;
    }
    ~TmpIni() { std::error_code ec; fs::remove(path, ec); }
    TmpIni(const TmpIni&) = delete;
    TmpIni& operator=(const TmpIni&) = delete;
};

TEST_CASE("Processing before Init is rejected", "[sdk]") {
    SDK sdk;
    RiskSnapshot snap;
    PoseFrame frame = fixtures::frameOf(fixtures::standingPose());

    CHECK(sdk.ProcessFrame(frame, snap) == StatusCode::ERROR_NOT_INITIALIZED);
    CHECK(sdk.ProcessMissingFrame(0, snap) == StatusCode::ERROR_NOT_INITIALIZED);
    std::vector<ObjectDetection> none;
    CHECK(sdk.SetObjectDetections(none, 640, 480) == StatusCode::ERROR_NOT_INITIALIZED);

    REQUIRE(sdk.Init() == StatusCode::OK);
    CHECK(sdk.ProcessFrame(frame, snap) == StatusCode::OK);
    CHECK(snap.frame_index == 1);
    CHECK(sdk.GetLastSnapshot().frame_index == 1);
}

TEST_CASE("Versioned config is validated", "[sdk][config]") {
    SDK sdk;

    CHECK(sdk.SetConfig(nullptr) == StatusCode::ERROR_INVALID_INPUT);

    FallConfirmation_v1 fall;
    fall.header.version = 2;
    CHECK(sdk.SetConfig(&fall) == StatusCode::ERROR_INVALID_INPUT);

    fall.header.version = 1;
    fall.trigger_frames = 0;
    CHECK(sdk.SetConfig(&fall) == StatusCode::ERROR_INVALID_INPUT);

    fall.trigger_frames = 30;
    CHECK(sdk.SetConfig(&fall) == StatusCode::OK);

    JointFilter_v1 filter;
    filter.measurement_noise = -1.0;
    CHECK(sdk.SetConfig(&filter) == StatusCode::ERROR_INVALID_INPUT);

    Environment_v1 env;
    env.frame_visibility_gate = 1.5;
    CHECK(sdk.SetConfig(&env) == StatusCode::ERROR_INVALID_INPUT);

    Logging_v1 log;
    log.enable_debug_log = true;
    CHECK(sdk.SetConfig(&log) == StatusCode::OK);
}

TEST_CASE("Trigger frames from SetConfig drive the alarm", "[sdk][config]") {
    SDK sdk;
    FallConfirmation_v1 fall;
    fall.trigger_frames = 3;
    REQUIRE(sdk.SetConfig(&fall) == StatusCode::OK);
    REQUIRE(sdk.Init() == StatusCode::OK);

    int alarms = 0;
    long long alarmFrame = 0;
    sdk.RegisterFallGuardCallback([&](const FallGuardEvent& e) {
        if (e.type == FallGuardEventType::FallConfirmed) {
            alarms++;
            alarmFrame = e.frame_index;
        }
    });

    RiskSnapshot snap;
    PoseFrame frame = fixtures::frameOf(fixtures::lyingPose());
    for (int i = 0; i < 5; ++i) sdk.ProcessFrame(frame, snap);

    CHECK(alarms == 1);
    CHECK(alarmFrame == 3);

    sdk.ResetAlarm();
    CHECK(sdk.GetLastSnapshot().fall_state == FallState::Normal);
}

TEST_CASE("INI file overrides only the keys it names", "[sdk][config][ini]") {
    TmpIni ini(R"(
[Fall]
Trigger_Frames = 2

[Environment]
Seat_Classes = sofa, stool

[Filter]
Forecast_Steps = 4
)");

    SDK sdk;
    REQUIRE(sdk.LoadConfigFile(ini.path.string()) == StatusCode::OK);
    REQUIRE(sdk.Init() == StatusCode::OK);

    int alarms = 0;
    sdk.RegisterFallGuardCallback([&](const FallGuardEvent& e) {
        if (e.type == FallGuardEventType::FallConfirmed) alarms++;
    });

    RiskSnapshot snap;
    PoseFrame frame = fixtures::frameOf(fixtures::lyingPose());
    sdk.ProcessFrame(frame, snap);
    sdk.ProcessFrame(frame, snap);
    CHECK(alarms == 1);

    ObjectDetection chair;
    chair.class_name = "chair";
    chair.w = 10;
    chair.h = 10;
    ObjectDetection stool = chair;
    stool.class_name = "stool";
    std::vector<ObjectDetection> dets = {chair, stool};
    REQUIRE(sdk.SetObjectDetections(dets, 100, 100) == StatusCode::OK);
    REQUIRE(sdk.GetSeatRegions().size() == 1);
    CHECK(sdk.GetSeatRegions()[0].class_name == "stool");

    CHECK(sdk.GetForecastLandmarks(-1).size() == (size_t)kNumLandmarks);
}

TEST_CASE("INI file errors", "[sdk][config][ini]") {
    SDK sdk;
    CHECK(sdk.LoadConfigFile("/nonexistent/fallguard/parameter.ini") == StatusCode::ERROR_CONFIG_LOAD_FAILED);

    TmpIni bad("[Fall]\nTrigger_Frames = -5\n");
    CHECK(sdk.LoadConfigFile(bad.path.string()) == StatusCode::ERROR_INVALID_INPUT);
}

TEST_CASE("A rejected INI section leaves the whole config unchanged", "[sdk][config][ini]") {
    // [Fall] is valid and read first, [Environment] is out of range
    TmpIni ini(R"(
[Fall]
Trigger_Frames = 2

[Environment]
Frame_Visibility_Gate = 1.5
)");

    SDK sdk;
    CHECK(sdk.LoadConfigFile(ini.path.string()) == StatusCode::ERROR_INVALID_INPUT);
    REQUIRE(sdk.Init() == StatusCode::OK);

    int alarms = 0;
    sdk.RegisterFallGuardCallback([&](const FallGuardEvent& e) {
        if (e.type == FallGuardEventType::FallConfirmed) alarms++;
    });

    // Default 60-frame trigger still in force
    RiskSnapshot snap;
    PoseFrame frame = fixtures::frameOf(fixtures::lyingPose());
    for (int i = 0; i < 59; ++i) sdk.ProcessFrame(frame, snap);
    CHECK(alarms == 0);
    CHECK(snap.fall_counter == 59);
    sdk.ProcessFrame(frame, snap);
    CHECK(alarms == 1);
}

TEST_CASE("Missing frames are reported as no subject", "[sdk]") {
    SDK sdk;
    REQUIRE(sdk.Init() == StatusCode::OK);

    RiskSnapshot snap;
    CHECK(sdk.ProcessMissingFrame(33, snap) == StatusCode::OK);
    CHECK(snap.tracking == TrackingStatus::NoSubject);
    CHECK(snap.composite_risk == 0.0);

    PoseFrame shortFrame;
    shortFrame.landmarks.resize(5);
    CHECK(sdk.ProcessFrame(shortFrame, snap) == StatusCode::ERROR_INVALID_INPUT);
    CHECK(snap.frame_index == 2);

    sdk.ResetSession();
    CHECK(sdk.GetLastSnapshot().frame_index == 0);
    CHECK(std::string(SDK::GetVersion()) == "1.0.0");
}
