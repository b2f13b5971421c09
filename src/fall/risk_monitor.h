#ifndef RISK_MONITOR_H
#define RISK_MONITOR_H

#include <vector>
#include <memory>

#include "FallGuard_sdk.h"
#include "../config/internal_config.h"

namespace FallGuardSDK {

// One monitored subject: owns every piece of per-frame state (filters, previous
// frame, velocity baseline, foot timers, fall counter) and runs the stages in
// order: smoothing -> geometry/support -> fusion -> fall confirmation.
class RiskMonitor {
public:
    RiskMonitor();
    ~RiskMonitor();

    // Configure algorithm parameters
    void SetConfig(const InternalConfig& config);
    const InternalConfig& GetConfig() const;

    // Register a callback for alarm / hazard events
    void RegisterCallback(FallGuardCallback cb);

    // Main pipeline step. `frame` == nullptr means no subject in this frame.
    // Always fills `snapshot`.
    StatusCode Process(const PoseFrame* frame, uint64_t timestamp, RiskSnapshot& snapshot);

    StatusCode UpdateDetections(const std::vector<ObjectDetection>& detections,
                                int frame_width, int frame_height);

    // External reset signal (fall counter + confirmed alarm)
    void ResetAlarm();

    // Drop all per-subject state
    void ResetSession();

    const RiskSnapshot& GetLastSnapshot() const;
    std::vector<Landmark> GetSmoothedLandmarks() const;
    std::vector<Landmark> GetForecastLandmarks(int steps) const;
    std::vector<SeatRegion> GetSeatRegions() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

}

#endif
