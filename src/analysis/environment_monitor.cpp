#include "environment_monitor.h"
#include "geometry_engine.h"
#include <cmath>
#include <algorithm>

namespace FallGuardSDK {

EnvironmentMonitor::EnvironmentMonitor() {
    InternalConfig defaults;
    SetConfig(defaults);
}

void EnvironmentMonitor::SetConfig(const InternalConfig& config) {
    seat_classes = config.seat_classes;
    obstacle_distance = config.obstacle_distance;
    obstacle_min_center_y = config.obstacle_min_center_y;
    hazard_level = config.hazard_level;
}

bool EnvironmentMonitor::isSeatClass(const std::string& name) const {
    return std::find(seat_classes.begin(), seat_classes.end(), name) != seat_classes.end();
}

StatusCode EnvironmentMonitor::Update(const std::vector<ObjectDetection>& detections,
                                      int frame_width, int frame_height,
                                      const std::vector<Landmark>* feet, bool evaluate_hazard) {
    if (frame_width <= 0 || frame_height <= 0) return StatusCode::ERROR_INVALID_INPUT;

    double feetX = 0.0, feetY = 0.0;
    bool haveFeet = false;
    if (feet) {
        const Landmark* lh = Geometry::At(*feet, LEFT_HEEL);
        const Landmark* rh = Geometry::At(*feet, RIGHT_HEEL);
        if (lh && rh) {
            feetX = (lh->x + rh->x) / 2.0;
            feetY = std::max(lh->y, rh->y);
            haveFeet = true;
        }
    }
    bool checkHazard = evaluate_hazard && haveFeet;

    seats.clear();
    bool obstacleDetected = false;
    std::string obstacleClass;

    for (const auto& det : detections) {
        double bx = det.x / frame_width;
        double by = det.y / frame_height;
        double bw = det.w / frame_width;
        double bh = det.h / frame_height;

        if (isSeatClass(det.class_name)) {
            SeatRegion seat;
            seat.x = bx;
            seat.y = by;
            seat.w = bw;
            seat.h = bh;
            seat.bottom_y = by + bh;
            seat.class_name = det.class_name;
            seats.push_back(seat);
            continue;
        }

        if (det.class_name == "person" || !checkHazard) continue;

        double cx = bx + bw / 2.0;
        double cy = by + bh / 2.0;
        double dist = std::hypot(cx - feetX, cy - feetY);
        if (dist < obstacle_distance && cy > obstacle_min_center_y) {
            obstacleDetected = true;
            obstacleClass = det.class_name;
        }
    }

    // Previous hazard is kept when it could not be re-evaluated
    if (checkHazard) {
        hazard = obstacleDetected ? hazard_level : 0.0;
        hazard_class = obstacleDetected ? obstacleClass : std::string();
    }
    return StatusCode::OK;
}

void EnvironmentMonitor::ClearHazard() {
    hazard = 0.0;
    hazard_class.clear();
}

void EnvironmentMonitor::Reset() {
    seats.clear();
    ClearHazard();
}

} // namespace FallGuardSDK
