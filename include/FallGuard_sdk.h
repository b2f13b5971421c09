#ifndef FALLGUARD_SDK_H
#define FALLGUARD_SDK_H

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace FallGuardSDK {

// Fixed 33-point skeletal topology of the external pose model
constexpr int kNumLandmarks = 33;

enum LandmarkIndex {
    LEFT_SHOULDER = 11,
    RIGHT_SHOULDER = 12,
    LEFT_WRIST = 15,
    RIGHT_WRIST = 16,
    LEFT_HIP = 23,
    RIGHT_HIP = 24,
    LEFT_KNEE = 25,
    RIGHT_KNEE = 26,
    LEFT_ANKLE = 27,
    RIGHT_ANKLE = 28,
    LEFT_HEEL = 29,
    RIGHT_HEEL = 30,
    LEFT_FOOT_INDEX = 31,
    RIGHT_FOOT_INDEX = 32
};

// Config Types
enum class ConfigType {
    JointFilter_v1,
    SupportDetection_v1,
    RiskFusion_v1,
    FallConfirmation_v1,
    Environment_v1,
    FrameTiming_v1,
    Logging_v1
};

struct ConfigHeader {
    ConfigType type;
    int version;
};

// Versioned Structs

struct JointFilter_v1 {
    ConfigHeader header{ConfigType::JointFilter_v1, 1};
    double process_noise = 0.01;
    double measurement_noise = 0.05;
    double initial_covariance = 1.0;
    double visibility_floor = 0.1;        // below this a joint coasts (predict only)
    int forecast_steps = 15;
    bool analyze_smoothed_landmarks = true;
};

struct SupportDetection_v1 {
    ConfigHeader header{ConfigType::SupportDetection_v1, 1};
    double ground_shin_fraction = 0.3;
    double foot_stability_velocity = 0.002;
    int foot_stability_frames = 10;
    double seat_depth_tolerance = 0.1;
    double hand_support_distance = 0.15;
    double hand_visibility_threshold = 0.5;
};

struct RiskFusion_v1 {
    ConfigHeader header{ConfigType::RiskFusion_v1, 1};
    double knee_reference_angle = 140.0;
    double knee_weight = 0.3;
    double stability_weight = 0.4;
    double env_weight = 0.2;
    double hand_support_bonus = 30.0;
    double spine_poor_angle = 45.0;
    double spine_penalty = 10.0;
    double stability_deviation_gain = 500.0;
    double impact_velocity_threshold = 0.015;
    double impact_gain = 30.0;
    double freefall_accel_threshold = 0.015;
    double freefall_velocity_threshold = 0.02;
    double high_risk_threshold = 85.0;
};

struct FallConfirmation_v1 {
    ConfigHeader header{ConfigType::FallConfirmation_v1, 1};
    int trigger_frames = 60;              // ~2 seconds @ 30fps
    double composite_trigger = 95.0;
    double torso_horizontal_angle = 45.0;
    double low_hip_y = 0.5;
};

struct Environment_v1 {
    ConfigHeader header{ConfigType::Environment_v1, 1};
    double obstacle_distance = 0.2;
    double obstacle_min_center_y = 0.5;
    double hazard_level = 0.8;
    double frame_visibility_gate = 0.6;
    int low_visibility_status_frames = 5;
    int low_visibility_suspend_frames = 10;
    std::vector<std::string> seat_classes = {"chair", "couch", "bench", "bed"};
};

struct FrameTiming_v1 {
    ConfigHeader header{ConfigType::FrameTiming_v1, 1};
    int expected_frame_interval_ms = 0;   // 0 disables the check
    int frame_interval_tolerance_ms = 33;
};

struct Logging_v1 {
    ConfigHeader header{ConfigType::Logging_v1, 1};
    bool enable_debug_log = false;
};

// ==========================================
// Pose / Detection Input Types
// ==========================================

struct Landmark {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
    double visibility = 0.0;
};

struct PoseFrame {
    std::vector<Landmark> landmarks;        // image space, normalized 0-1
    std::vector<Landmark> world_landmarks;  // meters, hip centered (may be empty)
    uint64_t timestamp = 0;                 // Timestamp in milliseconds
};

struct ObjectDetection {
    std::string class_name;
    double score = 0.0;
    double x = 0.0, y = 0.0, w = 0.0, h = 0.0;  // pixels
};

struct SeatRegion {
    double x = 0.0, y = 0.0, w = 0.0, h = 0.0;  // normalized
    double bottom_y = 0.0;
    std::string class_name;
};

// ==========================================
// Risk Output Types
// ==========================================

enum class SpineStatus { Unknown, Good, Poor };
enum class RiskLevel { Low, Warning, Critical };
enum class KneeLoadLevel { Normal, Moderate, Critical };
enum class MotionTrend { Unknown, Stable, Lowering, StandingUp };
enum class TrackingStatus { Active, LowVisibility, NoSubject };
enum class FallState { Normal, Accumulating, Confirmed };

struct LegSupport {
    bool grounded = false;
    int stability_timer = 0;
    bool supported = false;
};

struct RiskSnapshot {
    long long frame_index = 0;

    double knee_risk = 0.0;
    double stability_risk = 0.0;
    double env_risk = 0.0;
    SpineStatus spine_status = SpineStatus::Unknown;
    double impact_factor = 1.0;
    double composite_risk = 0.0;
    RiskLevel risk_level = RiskLevel::Low;

    double stability_score = 100.0;
    double left_knee_angle = 180.0;   // 180 when sitting or leg unsupported
    double right_knee_angle = 180.0;
    double left_knee_load = 0.0;      // percent, amplified by impact_factor
    double right_knee_load = 0.0;
    KneeLoadLevel left_knee_level = KneeLoadLevel::Normal;
    KneeLoadLevel right_knee_level = KneeLoadLevel::Normal;

    LegSupport left_leg;
    LegSupport right_leg;
    bool sitting = false;
    bool hand_support = false;
    bool freefall = false;
    bool geometric_fall = false;
    bool obstacle_hazard = false;

    MotionTrend motion_trend = MotionTrend::Unknown;
    TrackingStatus tracking = TrackingStatus::NoSubject;
    FallState fall_state = FallState::Normal;
    int fall_counter = 0;
    bool irregular_timing = false;
};

enum class FallGuardEventType {
    FallConfirmed,
    HighRisk,
    ObstacleHazard,
    AlarmReset
};

struct FallGuardEvent {
    FallGuardEventType type;
    long long frame_index;
    double composite_risk;
    std::string detail;   // obstacle class name, if any
};

using FallGuardCallback = std::function<void(const FallGuardEvent&)>;

enum class StatusCode {
    OK,
    ERROR_INIT_FAILED,
    ERROR_INVALID_INPUT,
    ERROR_NOT_INITIALIZED,
    ERROR_CONFIG_LOAD_FAILED
};

class FallGuardSDK {
public:

    FallGuardSDK();
    ~FallGuardSDK();

    static const char* GetVersion();

    // Initialize SDK with default configuration
    StatusCode Init();

    // Set Configuration (any of the *_v1 structs above)
    StatusCode SetConfig(const void* config);

    /**
     * @brief Load an INI parameter file and apply every section found.
     *
     * Sections: [Filter] [Support] [Risk] [Fall] [Environment] [Timing] [Log].
     * Keys that are absent keep their current values. Every section is
     * validated before any is applied: on ERROR_INVALID_INPUT the current
     * configuration is left unchanged.
     */
    StatusCode LoadConfigFile(const std::string& path);

    void RegisterFallGuardCallback(FallGuardCallback callback);

    /**
     * @brief Run the risk pipeline on one pose frame.
     *
     * A snapshot is always written, also when the frame is rejected as
     * malformed (in which case the frame is treated as "no subject").
     */
    StatusCode ProcessFrame(const PoseFrame& frame, RiskSnapshot& snapshot);

    // Advance the pipeline for a frame in which no subject was detected
    StatusCode ProcessMissingFrame(uint64_t timestamp, RiskSnapshot& snapshot);

    // Latest object detector output (may be throttled by the caller)
    StatusCode SetObjectDetections(const std::vector<ObjectDetection>& detections,
                                   int frame_width, int frame_height);

    // External reset signal: clears the fall counter and a confirmed alarm
    void ResetAlarm();

    // Start over for a new subject (filters, timers, alarm)
    void ResetSession();

    // Get internal state for visualization
    RiskSnapshot GetLastSnapshot() const;
    std::vector<Landmark> GetSmoothedLandmarks() const;
    std::vector<Landmark> GetForecastLandmarks(int steps) const;   // steps < 0: configured forecast_steps
    std::vector<SeatRegion> GetSeatRegions() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace FallGuardSDK

#endif // FALLGUARD_SDK_H
