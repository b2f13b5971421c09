#include "risk_monitor.h"
#include "fall_state_machine.h"
#include "../tracking/pose_smoother.h"
#include "../analysis/geometry_engine.h"
#include "../analysis/support_classifier.h"
#include "../analysis/environment_monitor.h"
#include "../analysis/risk_fusion.h"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>

#define ENABLE_PERF_PROFILING 1

namespace FallGuardSDK {

class RiskMonitor::Impl {
public:
    InternalConfig config; // Use unified Config

    // Stages
    PoseSmoother smoother;
    SupportClassifier support;
    EnvironmentMonitor environment;
    RiskFusion fusion;
    FallStateMachine fall_machine;

    // Previous frame for velocity / acceleration. Analysis input and raw
    // detector output are kept apart: freefall needs the unfiltered hip.
    std::vector<Landmark> previous_landmarks;
    std::vector<Landmark> previous_raw_landmarks;
    bool has_previous = false;
    double previous_velocity = 0.0;

    int low_visibility_frames = 0;
    long long frame_index = 0;
    uint64_t last_timestamp = 0;
    bool high_risk_active = false;

    RiskSnapshot last_snapshot;
    FallGuardCallback callback;

    // Profiling
    struct ProfilingData {
        long long total_time = 0;
        long long smooth_time = 0;
        long long analysis_time = 0;
        int frame_count = 0;

        void Reset() {
            total_time = 0;
            smooth_time = 0;
            analysis_time = 0;
            frame_count = 0;
        }
    } prof;

    // Helper for timing
    long long get_now_us() {
        struct timespec ts;
        clock_gettime(CLOCK_MONOTONIC, &ts);
        return (long long)ts.tv_sec * 1000000 + ts.tv_nsec / 1000;
    }

    void applyConfig() {
        smoother.SetParams(config.process_noise, config.measurement_noise,
                           config.initial_covariance, config.visibility_floor);
        support.SetConfig(config);
        environment.SetConfig(config);
        fusion.SetConfig(config);
        fall_machine.SetParams(config.fall_trigger_frames, config.fall_composite_trigger);
    }

    void emit(FallGuardEventType type, double risk, const std::string& detail) {
        if (!callback) return;
        FallGuardEvent event;
        event.type = type;
        event.frame_index = frame_index;
        event.composite_risk = risk;
        event.detail = detail;
        callback(event);
    }

    // Frames that carry no usable signal report the safest reading
    void fillNoRisk(RiskSnapshot& s, TrackingStatus tracking) {
        s.tracking = tracking;
        s.composite_risk = 0.0;
        s.knee_risk = 0.0;
        s.stability_risk = 0.0;
        s.env_risk = 0.0;
        s.stability_score = 100.0;
        s.spine_status = SpineStatus::Unknown;
        s.risk_level = RiskLevel::Low;
        s.obstacle_hazard = environment.HasHazard();
        s.fall_state = fall_machine.State();
        s.fall_counter = fall_machine.Counter();
    }

    bool checkTiming(uint64_t timestamp) {
        bool irregular = false;
        if (config.expected_frame_interval_ms > 0 && last_timestamp > 0 && timestamp > 0) {
            long long diff = (long long)timestamp - (long long)last_timestamp;
            long long error = std::llabs(diff - config.expected_frame_interval_ms);
            if (error > config.frame_interval_tolerance_ms) {
                // The motion model assumes one unit step per frame
                printf("[RiskMonitor] Irregular frame interval: %lld ms (expected %d ms). Frame %lld\n",
                       diff, config.expected_frame_interval_ms, frame_index);
                irregular = true;
            }
        }
        if (timestamp > 0) last_timestamp = timestamp;
        return irregular;
    }

    void onSubjectLost() {
        fall_machine.ResetCounter();
        support.ResetTimers();
        previous_landmarks.clear();
        previous_raw_landmarks.clear();
        has_previous = false;
        previous_velocity = 0.0;
        high_risk_active = false;
    }

    void analyze(const PoseFrame& frame, const std::vector<Landmark>& lm, RiskSnapshot& s);
};

void RiskMonitor::Impl::analyze(const PoseFrame& frame, const std::vector<Landmark>& lm, RiskSnapshot& s) {
    const std::vector<Landmark>* prev = has_previous ? &previous_landmarks : nullptr;
    const std::vector<Landmark>* rawPrev = has_previous ? &previous_raw_landmarks : nullptr;

    // 1. Knee angles, world space when available (camera independent)
    const std::vector<Landmark>& angleSrc =
        ((int)frame.world_landmarks.size() == kNumLandmarks) ? frame.world_landmarks : lm;
    double leftKnee = Geometry::JointAngle(Geometry::At(angleSrc, LEFT_HIP),
                                           Geometry::At(angleSrc, LEFT_KNEE),
                                           Geometry::At(angleSrc, LEFT_ANKLE));
    double rightKnee = Geometry::JointAngle(Geometry::At(angleSrc, RIGHT_HIP),
                                            Geometry::At(angleSrc, RIGHT_KNEE),
                                            Geometry::At(angleSrc, RIGHT_ANKLE));

    // 2. Support / sitting
    SupportResult sup = support.Classify(lm, prev, environment.Seats());

    // 3. Geometry metrics
    RiskInputs in;
    in.left_knee_angle = leftKnee;
    in.right_knee_angle = rightKnee;
    in.left_supported = sup.left.supported;
    in.right_supported = sup.right.supported;
    in.sitting = sup.sitting;
    in.hand_support = Geometry::HasHandSupport(lm, config.hand_support_distance,
                                               config.hand_visibility_threshold);
    in.stability_score = Geometry::StabilityScore(lm, config.stability_deviation_gain);
    in.spine = Geometry::SpineStatusOf(lm, config.spine_poor_angle);
    in.env_hazard = environment.HazardFlag();

    // Hip velocity from the raw frame, the filter lags a sudden drop
    in.impact_factor = Geometry::ImpactFactor(frame.landmarks, rawPrev,
                                              config.impact_velocity_threshold, config.impact_gain);

    double newVelocity = previous_velocity;
    in.freefall = Geometry::IsFreefall(frame.landmarks, rawPrev, previous_velocity, newVelocity,
                                       config.freefall_accel_threshold,
                                       config.freefall_velocity_threshold);
    previous_velocity = newVelocity;

    // 4. Fusion
    fusion.Compute(in, s);
    s.left_leg = sup.left;
    s.right_leg = sup.right;
    s.obstacle_hazard = environment.HasHazard();
    s.motion_trend = Geometry::ClassifyMotionTrend(lm, prev, config.trend_velocity_threshold);
    s.tracking = TrackingStatus::Active;

    if (s.sitting && config.enable_debug_log) {
        printf("[Debug] Sitting detected, knee load masked. Frame %lld\n", frame_index);
    }

    // 5. Fall confirmation
    s.geometric_fall = Geometry::IsGeometricFall(lm, config.torso_horizontal_angle, config.low_hip_y);
    bool alarm = fall_machine.Update(s.geometric_fall, s.composite_risk);
    s.fall_state = fall_machine.State();
    s.fall_counter = fall_machine.Counter();

    if (alarm) {
        printf("[RiskMonitor] CONFIRMED FALL (Count %d/%d, Risk %.1f, Geometric %d). Frame %lld\n",
               fall_machine.Counter(), fall_machine.TriggerFrames(), s.composite_risk,
               (int)s.geometric_fall, frame_index);
        emit(FallGuardEventType::FallConfirmed, s.composite_risk, "");
    }

    // High risk edge (rising only)
    bool highRisk = s.composite_risk > config.high_risk_threshold;
    if (highRisk && !high_risk_active) {
        std::cout << "[RiskMonitor] High fall risk: " << (int)std::round(s.composite_risk) << "%" << std::endl;
        emit(FallGuardEventType::HighRisk, s.composite_risk, "");
    }
    high_risk_active = highRisk;
}

RiskMonitor::RiskMonitor() : pImpl(std::make_shared<Impl>()) {
    pImpl->applyConfig();
}

RiskMonitor::~RiskMonitor() = default;

void RiskMonitor::SetConfig(const InternalConfig& config) {
    pImpl->config = config; // Update internal config
    pImpl->applyConfig();
}

const InternalConfig& RiskMonitor::GetConfig() const {
    return pImpl->config;
}

void RiskMonitor::RegisterCallback(FallGuardCallback cb) {
    pImpl->callback = cb;
}

StatusCode RiskMonitor::Process(const PoseFrame* frame, uint64_t timestamp, RiskSnapshot& snapshot) {
    pImpl->frame_index++;

    #if ENABLE_PERF_PROFILING
    long long t0 = pImpl->get_now_us();
    #endif

    RiskSnapshot s;
    s.frame_index = pImpl->frame_index;
    s.irregular_timing = pImpl->checkTiming(frame ? frame->timestamp : timestamp);

    StatusCode ret = StatusCode::OK;
    if (frame && (int)frame->landmarks.size() != kNumLandmarks) {
        printf("[RiskMonitor] Malformed frame: %zu landmarks (expected %d). Frame %lld\n",
               frame->landmarks.size(), kNumLandmarks, pImpl->frame_index);
        frame = nullptr;
        ret = StatusCode::ERROR_INVALID_INPUT;
    }

    // 1. No subject: coast the filters and drop anything that needs a previous frame
    if (!frame) {
        pImpl->smoother.Coast();
        pImpl->onSubjectLost();
        pImpl->low_visibility_frames++;
        if (pImpl->low_visibility_frames > pImpl->config.low_visibility_suspend_frames) {
            pImpl->environment.ClearHazard();
        }
        pImpl->fillNoRisk(s, TrackingStatus::NoSubject);
        pImpl->last_snapshot = s;
        snapshot = s;
        return ret;
    }

    // 2. Smoothing
    const std::vector<Landmark>& smoothed = pImpl->smoother.Step(frame->landmarks);
    const std::vector<Landmark>& lm =
        pImpl->config.analyze_smoothed_landmarks ? smoothed : frame->landmarks;

    #if ENABLE_PERF_PROFILING
    long long t1 = pImpl->get_now_us();
    pImpl->prof.smooth_time += (t1 - t0);
    #endif

    // 3. Visibility gate
    double visibility = Geometry::FrameVisibility(frame->landmarks);
    if (visibility < pImpl->config.frame_visibility_gate) {
        pImpl->low_visibility_frames++;
        if (pImpl->config.enable_debug_log) {
            printf("[Debug] Low visibility %.2f (%d frames). Frame %lld\n",
                   visibility, pImpl->low_visibility_frames, pImpl->frame_index);
        }
        if (pImpl->low_visibility_frames > pImpl->config.low_visibility_suspend_frames) {
            pImpl->environment.ClearHazard();
        }
        TrackingStatus status = pImpl->low_visibility_frames > pImpl->config.low_visibility_status_frames
                                    ? TrackingStatus::LowVisibility : TrackingStatus::Active;
        pImpl->fillNoRisk(s, status);
    } else {
        pImpl->low_visibility_frames = 0;
        pImpl->analyze(*frame, lm, s);
    }

    pImpl->previous_landmarks = lm;
    pImpl->previous_raw_landmarks = frame->landmarks;
    pImpl->has_previous = true;

    #if ENABLE_PERF_PROFILING
    long long t2 = pImpl->get_now_us();
    pImpl->prof.analysis_time += (t2 - t1);
    pImpl->prof.total_time += (t2 - t0);
    pImpl->prof.frame_count++;
    if (pImpl->prof.frame_count >= 100) {
        if (pImpl->config.enable_debug_log) {
            double n = (double)pImpl->prof.frame_count;
            printf("[RiskMonitor Profiling] Avg Time (ms) - Total: %.3f, Smooth: %.3f, Analysis: %.3f\n",
                   pImpl->prof.total_time / n / 1000.0, pImpl->prof.smooth_time / n / 1000.0,
                   pImpl->prof.analysis_time / n / 1000.0);
        }
        pImpl->prof.Reset();
    }
    #endif

    pImpl->last_snapshot = s;
    snapshot = s;
    return ret;
}

StatusCode RiskMonitor::UpdateDetections(const std::vector<ObjectDetection>& detections,
                                         int frame_width, int frame_height) {
    bool hadHazard = pImpl->environment.HasHazard();
    const std::vector<Landmark>* feet = pImpl->has_previous ? &pImpl->previous_landmarks : nullptr;
    bool evaluate = pImpl->low_visibility_frames == 0;

    StatusCode ret = pImpl->environment.Update(detections, frame_width, frame_height, feet, evaluate);
    if (ret != StatusCode::OK) {
        printf("[RiskMonitor] Invalid detection frame size %dx%d\n", frame_width, frame_height);
        return ret;
    }

    if (pImpl->environment.HasHazard() && !hadHazard) {
        std::cout << "[RiskMonitor] Obstacle hazard: " << pImpl->environment.HazardClass() << std::endl;
        pImpl->emit(FallGuardEventType::ObstacleHazard, pImpl->last_snapshot.composite_risk,
                    pImpl->environment.HazardClass());
    }
    return StatusCode::OK;
}

void RiskMonitor::ResetAlarm() {
    pImpl->fall_machine.Reset();
    pImpl->last_snapshot.fall_state = pImpl->fall_machine.State();
    pImpl->last_snapshot.fall_counter = 0;
    std::cout << "[RiskMonitor] System Reset: alarm cleared" << std::endl;
    pImpl->emit(FallGuardEventType::AlarmReset, pImpl->last_snapshot.composite_risk, "");
}

void RiskMonitor::ResetSession() {
    pImpl->smoother.Reset();
    pImpl->environment.Reset();
    pImpl->fall_machine.Reset();
    pImpl->onSubjectLost();
    pImpl->low_visibility_frames = 0;
    pImpl->frame_index = 0;
    pImpl->last_timestamp = 0;
    pImpl->last_snapshot = RiskSnapshot();
    pImpl->prof.Reset();
}

const RiskSnapshot& RiskMonitor::GetLastSnapshot() const {
    return pImpl->last_snapshot;
}

std::vector<Landmark> RiskMonitor::GetSmoothedLandmarks() const {
    return pImpl->smoother.GetSmoothed();
}

std::vector<Landmark> RiskMonitor::GetForecastLandmarks(int steps) const {
    return pImpl->smoother.Forecast(steps);
}

std::vector<SeatRegion> RiskMonitor::GetSeatRegions() const {
    return pImpl->environment.Seats();
}

} // FallGuardSDK
