#ifndef LANDMARK_CSV_H
#define LANDMARK_CSV_H

#include "FallGuard_sdk.h"
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

// Landmark CSV format, one frame per line:
//   timestamp_ms, x0, y0, z0, v0, x1, y1, z1, v1, ... (33 joints)
// A line with only a timestamp means no subject was detected in that frame.

// Returns false on a line that is neither a full frame nor a bare timestamp,
// or whose timestamp is negative or out of range
inline bool parseFrameLine(const std::string& line, FallGuardSDK::PoseFrame& frame, bool& has_subject) {
    using namespace FallGuardSDK;

    std::stringstream ss(line);
    std::string cell;
    std::vector<double> values;
    while (std::getline(ss, cell, ',')) {
        if (cell.empty()) continue;
        char* end = nullptr;
        double v = std::strtod(cell.c_str(), &end);
        if (end == cell.c_str()) return false;
        values.push_back(v);
    }
    if (values.empty()) return false;

    double ts = values[0];
    if (!std::isfinite(ts) || ts < 0.0 || ts >= 18446744073709551616.0) return false;

    frame = PoseFrame();
    frame.timestamp = (uint64_t)ts;
    has_subject = values.size() > 1;
    if (!has_subject) return true;
    if (values.size() != 1 + kNumLandmarks * 4) return false;

    frame.landmarks.resize(kNumLandmarks);
    for (int j = 0; j < kNumLandmarks; ++j) {
        Landmark& lm = frame.landmarks[j];
        lm.x = values[1 + j * 4];
        lm.y = values[2 + j * 4];
        lm.z = values[3 + j * 4];
        lm.visibility = values[4 + j * 4];
    }
    return true;
}

#endif // LANDMARK_CSV_H
