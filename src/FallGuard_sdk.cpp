#include "FallGuard_sdk.h"
#include "fall/risk_monitor.h"
#include "config/config_loader.h"
#include "config/internal_config.h"
#include <iostream>
#include <sstream>

// Member definitions live inside the namespace, where "FallGuardSDK::"
// names the class and not the namespace.

namespace FallGuardSDK {
    // Define Impl inside namespace
    class FallGuardSDK::Impl {
    public:
        RiskMonitor risk_monitor;
        InternalConfig config;
        bool initialized = false;
    };

    namespace {

    bool validJointFilter(const JointFilter_v1& c) {
        return c.process_noise >= 0.0 && c.measurement_noise > 0.0 &&
               c.initial_covariance >= 0.0 && c.visibility_floor >= 0.0 &&
               c.visibility_floor <= 1.0 && c.forecast_steps >= 0;
    }

    bool validSupport(const SupportDetection_v1& c) {
        return c.ground_shin_fraction >= 0.0 && c.foot_stability_velocity > 0.0 &&
               c.foot_stability_frames >= 0 && c.seat_depth_tolerance >= 0.0 &&
               c.hand_support_distance >= 0.0;
    }

    bool validRisk(const RiskFusion_v1& c) {
        return c.knee_weight >= 0.0 && c.stability_weight >= 0.0 && c.env_weight >= 0.0 &&
               c.stability_deviation_gain >= 0.0 && c.impact_gain >= 0.0 &&
               c.spine_poor_angle >= 0.0 && c.spine_poor_angle <= 180.0;
    }

    bool validFall(const FallConfirmation_v1& c) {
        return c.trigger_frames > 0 && c.torso_horizontal_angle >= 0.0 &&
               c.torso_horizontal_angle <= 90.0;
    }

    bool validEnvironment(const Environment_v1& c) {
        return c.obstacle_distance >= 0.0 && c.hazard_level >= 0.0 && c.hazard_level <= 1.0 &&
               c.frame_visibility_gate >= 0.0 && c.frame_visibility_gate <= 1.0 &&
               c.low_visibility_status_frames >= 0 && c.low_visibility_suspend_frames >= 0;
    }

    bool validTiming(const FrameTiming_v1& c) {
        return c.expected_frame_interval_ms >= 0 && c.frame_interval_tolerance_ms >= 0;
    }

    std::vector<std::string> splitList(const std::string& text) {
        std::vector<std::string> out;
        std::stringstream ss(text);
        std::string item;
        while (std::getline(ss, item, ',')) {
            size_t first = item.find_first_not_of(" \t");
            if (first == std::string::npos) continue;
            size_t last = item.find_last_not_of(" \t");
            out.push_back(item.substr(first, last - first + 1));
        }
        return out;
    }

    std::string joinList(const std::vector<std::string>& items) {
        std::string out;
        for (size_t i = 0; i < items.size(); ++i) {
            if (i) out += ",";
            out += items[i];
        }
        return out;
    }

    } // namespace

// Constructor/Destructor
FallGuardSDK::FallGuardSDK() : pImpl(std::unique_ptr<Impl>(new Impl())) {}
FallGuardSDK::~FallGuardSDK() = default;

#define FALLGUARD_SDK_VERSION_INTERNAL "1.0.0"

const char* FallGuardSDK::GetVersion() {
    return FALLGUARD_SDK_VERSION_INTERNAL;
}

StatusCode FallGuardSDK::Init() {
    pImpl->risk_monitor.SetConfig(pImpl->config);
    pImpl->risk_monitor.ResetSession();
    pImpl->initialized = true;

    std::cout << "FallGuardSDK " << GetVersion() << " Initialized." << std::endl;
    return StatusCode::OK;
}

StatusCode FallGuardSDK::SetConfig(const void* config) {
    if (!config) return StatusCode::ERROR_INVALID_INPUT;

    // Use ConfigHeader to identify type and version
    const ConfigHeader* header = static_cast<const ConfigHeader*>(config);

    if (header->version != 1) {
        std::cerr << "[FallGuardSDK] Error: Unsupported config version: " << header->version << std::endl;
        return StatusCode::ERROR_INVALID_INPUT;
    }

    InternalConfig& cfg = pImpl->config;

    switch (header->type) {
        case ConfigType::JointFilter_v1: {
            const auto* c = static_cast<const JointFilter_v1*>(config);
            if (!validJointFilter(*c)) break;
            cfg.process_noise = c->process_noise;
            cfg.measurement_noise = c->measurement_noise;
            cfg.initial_covariance = c->initial_covariance;
            cfg.visibility_floor = c->visibility_floor;
            cfg.forecast_steps = c->forecast_steps;
            cfg.analyze_smoothed_landmarks = c->analyze_smoothed_landmarks;
            pImpl->risk_monitor.SetConfig(cfg);
            return StatusCode::OK;
        }
        case ConfigType::SupportDetection_v1: {
            const auto* c = static_cast<const SupportDetection_v1*>(config);
            if (!validSupport(*c)) break;
            cfg.ground_shin_fraction = c->ground_shin_fraction;
            cfg.foot_stability_velocity = c->foot_stability_velocity;
            cfg.foot_stability_frames = c->foot_stability_frames;
            cfg.seat_depth_tolerance = c->seat_depth_tolerance;
            cfg.hand_support_distance = c->hand_support_distance;
            cfg.hand_visibility_threshold = c->hand_visibility_threshold;
            pImpl->risk_monitor.SetConfig(cfg);
            return StatusCode::OK;
        }
        case ConfigType::RiskFusion_v1: {
            const auto* c = static_cast<const RiskFusion_v1*>(config);
            if (!validRisk(*c)) break;
            cfg.knee_reference_angle = c->knee_reference_angle;
            cfg.knee_weight = c->knee_weight;
            cfg.stability_weight = c->stability_weight;
            cfg.env_weight = c->env_weight;
            cfg.hand_support_bonus = c->hand_support_bonus;
            cfg.spine_poor_angle = c->spine_poor_angle;
            cfg.spine_penalty = c->spine_penalty;
            cfg.stability_deviation_gain = c->stability_deviation_gain;
            cfg.impact_velocity_threshold = c->impact_velocity_threshold;
            cfg.impact_gain = c->impact_gain;
            cfg.freefall_accel_threshold = c->freefall_accel_threshold;
            cfg.freefall_velocity_threshold = c->freefall_velocity_threshold;
            cfg.high_risk_threshold = c->high_risk_threshold;
            pImpl->risk_monitor.SetConfig(cfg);
            return StatusCode::OK;
        }
        case ConfigType::FallConfirmation_v1: {
            const auto* c = static_cast<const FallConfirmation_v1*>(config);
            if (!validFall(*c)) break;
            cfg.fall_trigger_frames = c->trigger_frames;
            cfg.fall_composite_trigger = c->composite_trigger;
            cfg.torso_horizontal_angle = c->torso_horizontal_angle;
            cfg.low_hip_y = c->low_hip_y;
            pImpl->risk_monitor.SetConfig(cfg);
            return StatusCode::OK;
        }
        case ConfigType::Environment_v1: {
            const auto* c = static_cast<const Environment_v1*>(config);
            if (!validEnvironment(*c)) break;
            cfg.obstacle_distance = c->obstacle_distance;
            cfg.obstacle_min_center_y = c->obstacle_min_center_y;
            cfg.hazard_level = c->hazard_level;
            cfg.frame_visibility_gate = c->frame_visibility_gate;
            cfg.low_visibility_status_frames = c->low_visibility_status_frames;
            cfg.low_visibility_suspend_frames = c->low_visibility_suspend_frames;
            cfg.seat_classes = c->seat_classes;
            pImpl->risk_monitor.SetConfig(cfg);
            return StatusCode::OK;
        }
        case ConfigType::FrameTiming_v1: {
            const auto* c = static_cast<const FrameTiming_v1*>(config);
            if (!validTiming(*c)) break;
            cfg.expected_frame_interval_ms = c->expected_frame_interval_ms;
            cfg.frame_interval_tolerance_ms = c->frame_interval_tolerance_ms;
            pImpl->risk_monitor.SetConfig(cfg);
            return StatusCode::OK;
        }
        case ConfigType::Logging_v1: {
            const auto* c = static_cast<const Logging_v1*>(config);
            cfg.enable_debug_log = c->enable_debug_log;
            pImpl->risk_monitor.SetConfig(cfg);
            return StatusCode::OK;
        }
        default:
            return StatusCode::ERROR_INVALID_INPUT;
    }

    std::cerr << "[FallGuardSDK] Error: Rejected out-of-range values for config type "
              << (int)header->type << std::endl;
    return StatusCode::ERROR_INVALID_INPUT;
}

StatusCode FallGuardSDK::LoadConfigFile(const std::string& path) {
    ConfigLoader ini;
    if (!ini.load(path)) {
        std::cerr << "[FallGuardSDK] Error: Cannot open config file " << path << std::endl;
        return StatusCode::ERROR_CONFIG_LOAD_FAILED;
    }

    const InternalConfig& cur = pImpl->config;

    // 1. Joint Filter Config
    JointFilter_v1 filterCfg;
    filterCfg.process_noise = ini.getDouble("Filter.Process_Noise", cur.process_noise);
    filterCfg.measurement_noise = ini.getDouble("Filter.Measurement_Noise", cur.measurement_noise);
    filterCfg.initial_covariance = ini.getDouble("Filter.Initial_Covariance", cur.initial_covariance);
    filterCfg.visibility_floor = ini.getDouble("Filter.Visibility_Floor", cur.visibility_floor);
    filterCfg.forecast_steps = ini.getInt("Filter.Forecast_Steps", cur.forecast_steps);
    filterCfg.analyze_smoothed_landmarks = ini.getBool("Filter.Analyze_Smoothed", cur.analyze_smoothed_landmarks);

    // 2. Support Detection Config
    SupportDetection_v1 supportCfg;
    supportCfg.ground_shin_fraction = ini.getDouble("Support.Ground_Shin_Fraction", cur.ground_shin_fraction);
    supportCfg.foot_stability_velocity = ini.getDouble("Support.Foot_Stability_Velocity", cur.foot_stability_velocity);
    supportCfg.foot_stability_frames = ini.getInt("Support.Foot_Stability_Frames", cur.foot_stability_frames);
    supportCfg.seat_depth_tolerance = ini.getDouble("Support.Seat_Depth_Tolerance", cur.seat_depth_tolerance);
    supportCfg.hand_support_distance = ini.getDouble("Support.Hand_Support_Distance", cur.hand_support_distance);
    supportCfg.hand_visibility_threshold = ini.getDouble("Support.Hand_Visibility_Threshold", cur.hand_visibility_threshold);

    // 3. Risk Fusion Config
    RiskFusion_v1 riskCfg;
    riskCfg.knee_reference_angle = ini.getDouble("Risk.Knee_Reference_Angle", cur.knee_reference_angle);
    riskCfg.knee_weight = ini.getDouble("Risk.Knee_Weight", cur.knee_weight);
    riskCfg.stability_weight = ini.getDouble("Risk.Stability_Weight", cur.stability_weight);
    riskCfg.env_weight = ini.getDouble("Risk.Env_Weight", cur.env_weight);
    riskCfg.hand_support_bonus = ini.getDouble("Risk.Hand_Support_Bonus", cur.hand_support_bonus);
    riskCfg.spine_poor_angle = ini.getDouble("Risk.Spine_Poor_Angle", cur.spine_poor_angle);
    riskCfg.spine_penalty = ini.getDouble("Risk.Spine_Penalty", cur.spine_penalty);
    riskCfg.stability_deviation_gain = ini.getDouble("Risk.Stability_Deviation_Gain", cur.stability_deviation_gain);
    riskCfg.impact_velocity_threshold = ini.getDouble("Risk.Impact_Velocity_Threshold", cur.impact_velocity_threshold);
    riskCfg.impact_gain = ini.getDouble("Risk.Impact_Gain", cur.impact_gain);
    riskCfg.freefall_accel_threshold = ini.getDouble("Risk.Freefall_Accel_Threshold", cur.freefall_accel_threshold);
    riskCfg.freefall_velocity_threshold = ini.getDouble("Risk.Freefall_Velocity_Threshold", cur.freefall_velocity_threshold);
    riskCfg.high_risk_threshold = ini.getDouble("Risk.High_Risk_Threshold", cur.high_risk_threshold);

    // 4. Fall Confirmation Config
    FallConfirmation_v1 fallCfg;
    fallCfg.trigger_frames = ini.getInt("Fall.Trigger_Frames", cur.fall_trigger_frames);
    fallCfg.composite_trigger = ini.getDouble("Fall.Composite_Trigger", cur.fall_composite_trigger);
    fallCfg.torso_horizontal_angle = ini.getDouble("Fall.Torso_Horizontal_Angle", cur.torso_horizontal_angle);
    fallCfg.low_hip_y = ini.getDouble("Fall.Low_Hip_Y", cur.low_hip_y);

    // 5. Environment Config
    Environment_v1 envCfg;
    envCfg.obstacle_distance = ini.getDouble("Environment.Obstacle_Distance", cur.obstacle_distance);
    envCfg.obstacle_min_center_y = ini.getDouble("Environment.Obstacle_Min_Center_Y", cur.obstacle_min_center_y);
    envCfg.hazard_level = ini.getDouble("Environment.Hazard_Level", cur.hazard_level);
    envCfg.frame_visibility_gate = ini.getDouble("Environment.Frame_Visibility_Gate", cur.frame_visibility_gate);
    envCfg.low_visibility_status_frames = ini.getInt("Environment.Low_Visibility_Status_Frames", cur.low_visibility_status_frames);
    envCfg.low_visibility_suspend_frames = ini.getInt("Environment.Low_Visibility_Suspend_Frames", cur.low_visibility_suspend_frames);
    envCfg.seat_classes = splitList(ini.getString("Environment.Seat_Classes", joinList(cur.seat_classes)));

    // 6. Frame Timing Config
    FrameTiming_v1 timingCfg;
    timingCfg.expected_frame_interval_ms = ini.getInt("Timing.Expected_Frame_Interval", cur.expected_frame_interval_ms);
    timingCfg.frame_interval_tolerance_ms = ini.getInt("Timing.Frame_Interval_Tolerance", cur.frame_interval_tolerance_ms);

    // 7. Logging Config
    Logging_v1 logCfg;
    logCfg.enable_debug_log = ini.getBool("Log.Enable_Debug_Log", cur.enable_debug_log);

    // All or nothing: a bad section leaves the running config untouched
    const char* rejected = nullptr;
    if (!validJointFilter(filterCfg)) rejected = "Filter";
    else if (!validSupport(supportCfg)) rejected = "Support";
    else if (!validRisk(riskCfg)) rejected = "Risk";
    else if (!validFall(fallCfg)) rejected = "Fall";
    else if (!validEnvironment(envCfg)) rejected = "Environment";
    else if (!validTiming(timingCfg)) rejected = "Timing";
    if (rejected) {
        std::cerr << "[FallGuardSDK] Error: Rejected out-of-range values in [" << rejected
                  << "] of " << path << ", nothing applied" << std::endl;
        return StatusCode::ERROR_INVALID_INPUT;
    }

    const void* sections[] = {&filterCfg, &supportCfg, &riskCfg, &fallCfg,
                              &envCfg, &timingCfg, &logCfg};
    for (const void* section : sections) {
        StatusCode ret = SetConfig(section);
        if (ret != StatusCode::OK) return ret;
    }

    std::cout << "[FallGuardSDK] Loaded " << path << " (" << ini.size() << " keys)" << std::endl;
    return StatusCode::OK;
}

void FallGuardSDK::RegisterFallGuardCallback(FallGuardCallback callback) {
    pImpl->risk_monitor.RegisterCallback(callback);
}

StatusCode FallGuardSDK::ProcessFrame(const PoseFrame& frame, RiskSnapshot& snapshot) {
    if (!pImpl->initialized) return StatusCode::ERROR_NOT_INITIALIZED;
    return pImpl->risk_monitor.Process(&frame, frame.timestamp, snapshot);
}

StatusCode FallGuardSDK::ProcessMissingFrame(uint64_t timestamp, RiskSnapshot& snapshot) {
    if (!pImpl->initialized) return StatusCode::ERROR_NOT_INITIALIZED;
    return pImpl->risk_monitor.Process(nullptr, timestamp, snapshot);
}

StatusCode FallGuardSDK::SetObjectDetections(const std::vector<ObjectDetection>& detections,
                                                          int frame_width, int frame_height) {
    if (!pImpl->initialized) return StatusCode::ERROR_NOT_INITIALIZED;
    return pImpl->risk_monitor.UpdateDetections(detections, frame_width, frame_height);
}

void FallGuardSDK::ResetAlarm() {
    pImpl->risk_monitor.ResetAlarm();
}

void FallGuardSDK::ResetSession() {
    pImpl->risk_monitor.ResetSession();
}

RiskSnapshot FallGuardSDK::GetLastSnapshot() const {
    return pImpl->risk_monitor.GetLastSnapshot();
}

std::vector<Landmark> FallGuardSDK::GetSmoothedLandmarks() const {
    return pImpl->risk_monitor.GetSmoothedLandmarks();
}

std::vector<Landmark> FallGuardSDK::GetForecastLandmarks(int steps) const {
    if (steps < 0) steps = pImpl->config.forecast_steps;
    return pImpl->risk_monitor.GetForecastLandmarks(steps);
}

std::vector<SeatRegion> FallGuardSDK::GetSeatRegions() const {
    return pImpl->risk_monitor.GetSeatRegions();
}

} // namespace FallGuardSDK
