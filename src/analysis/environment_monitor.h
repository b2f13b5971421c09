#ifndef ENVIRONMENT_MONITOR_H
#define ENVIRONMENT_MONITOR_H

#include "FallGuard_sdk.h"
#include "../config/internal_config.h"
#include <string>
#include <vector>

namespace FallGuardSDK {

// Turns object detector output into seat regions and a trip hazard flag.
// Seats are rebuilt from scratch on every detection update, no identity is kept.
class EnvironmentMonitor {
public:
    EnvironmentMonitor();

    void SetConfig(const InternalConfig& config);

    /**
     * @param detections  boxes in pixels
     * @param feet        latest landmarks used to locate the feet, may be null
     * @param evaluate_hazard  false while subject visibility is degraded
     */
    StatusCode Update(const std::vector<ObjectDetection>& detections,
                      int frame_width, int frame_height,
                      const std::vector<Landmark>* feet, bool evaluate_hazard);

    // Drop the hazard signal (subject visibility lost for too long)
    void ClearHazard();
    void Reset();

    double HazardFlag() const { return hazard; }
    bool HasHazard() const { return hazard > 0.0; }
    const std::string& HazardClass() const { return hazard_class; }
    const std::vector<SeatRegion>& Seats() const { return seats; }

private:
    bool isSeatClass(const std::string& name) const;

    std::vector<std::string> seat_classes;
    double obstacle_distance = 0.2;
    double obstacle_min_center_y = 0.5;
    double hazard_level = 0.8;

    std::vector<SeatRegion> seats;
    double hazard = 0.0;
    std::string hazard_class;
};

} // namespace FallGuardSDK

#endif // ENVIRONMENT_MONITOR_H
