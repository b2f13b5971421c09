#ifndef INTERNAL_CONFIG_H
#define INTERNAL_CONFIG_H

#include <string>
#include <vector>

namespace FallGuardSDK {

// Internal Configuration Structure (aggregates all parameters)
struct InternalConfig {
    // Joint Filter
    double process_noise = 0.01;
    double measurement_noise = 0.05;
    double initial_covariance = 1.0;
    double visibility_floor = 0.1;
    int forecast_steps = 15;
    bool analyze_smoothed_landmarks = true;

    // Support Detection
    double ground_shin_fraction = 0.3;
    double foot_stability_velocity = 0.002;
    int foot_stability_frames = 10;
    double seat_depth_tolerance = 0.1;
    double hand_support_distance = 0.15;
    double hand_visibility_threshold = 0.5;

    // Risk Fusion
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
    double risk_warning_level = 40.0;
    double risk_critical_level = 70.0;
    double trend_velocity_threshold = 0.005;

    // Fall Confirmation
    int fall_trigger_frames = 60;
    double fall_composite_trigger = 95.0;
    double torso_horizontal_angle = 45.0;
    double low_hip_y = 0.5;

    // Environment
    double obstacle_distance = 0.2;
    double obstacle_min_center_y = 0.5;
    double hazard_level = 0.8;
    double frame_visibility_gate = 0.6;
    int low_visibility_status_frames = 5;
    int low_visibility_suspend_frames = 10;
    std::vector<std::string> seat_classes = {"chair", "couch", "bench", "bed"};

    // Frame Timing
    int expected_frame_interval_ms = 0;
    int frame_interval_tolerance_ms = 33;

    // Logging
    bool enable_debug_log = false;
};

} // namespace FallGuardSDK

#endif // INTERNAL_CONFIG_H
