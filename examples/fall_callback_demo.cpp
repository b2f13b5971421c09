#include "FallGuard_sdk.h"
#include "landmark_csv.h"
#include <iostream>
#include <vector>
#include <string>
#include <cstdio>
#include <cstdlib>
#include <fstream>

using SDK = FallGuardSDK::FallGuardSDK;
using namespace FallGuardSDK;

// Global Stats
std::vector<long long> detected_frames;

// Callback function
void onFallGuardEvent(const FallGuardEvent& event) {
    switch (event.type) {
        case FallGuardEventType::FallConfirmed:
            detected_frames.push_back(event.frame_index);
            std::cout << "\n>>> [CALLBACK] Fall Confirmed! Frame: " << event.frame_index << " <<<" << std::endl;
            std::cout << "    Risk: " << event.composite_risk << std::endl;
            break;
        case FallGuardEventType::HighRisk:
            std::cout << "[CALLBACK] High risk " << (int)event.composite_risk << "% at frame " << event.frame_index << std::endl;
            break;
        case FallGuardEventType::ObstacleHazard:
            std::cout << "[CALLBACK] Obstacle near feet: " << event.detail << std::endl;
            break;
        case FallGuardEventType::AlarmReset:
            std::cout << "[CALLBACK] Alarm reset" << std::endl;
            break;
    }
}

// Helpers
std::vector<std::pair<long long, long long>> loadFallPeriods(const std::string& filename) {
    std::vector<std::pair<long long, long long>> periods;
    std::ifstream file(filename);
    if (!file.is_open()) return periods;
    std::string line;
    while (std::getline(file, line)) {
        long long start = 0, end = 0;
        if (std::sscanf(line.c_str(), "%lld,%lld", &start, &end) == 2) {
            periods.push_back({start, end});
        }
    }
    return periods;
}

bool isFrameInPeriods(long long frame, const std::vector<std::pair<long long, long long>>& periods) {
    for (auto& p : periods) {
        if (frame >= p.first && frame <= p.second) return true;
    }
    return false;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <landmarks.csv> [parameter.ini] [fall_periods.txt]" << std::endl;
        return 1;
    }
    std::string csvFile = argv[1];
    std::string paramFile = argc > 2 ? argv[2] : "parameter.ini";
    std::string gtFile = argc > 3 ? argv[3] : "";

    std::cout << "Starting Fall Callback Demo..." << std::endl;

    // 1. Load Config
    SDK sdk;
    StatusCode ret = sdk.LoadConfigFile(paramFile);
    if (ret == StatusCode::ERROR_CONFIG_LOAD_FAILED) {
        std::cerr << "Warning: " << paramFile << " not found, using defaults." << std::endl;
    } else if (ret != StatusCode::OK) {
        std::cerr << "Warning: " << paramFile << " has rejected values, check the log above." << std::endl;
    }

    // 2. Initialize SDK
    if (sdk.Init() != StatusCode::OK) {
        std::cerr << "SDK init failed" << std::endl;
        return 1;
    }
    sdk.RegisterFallGuardCallback(onFallGuardEvent);

    // Ground Truth
    auto gt_periods = loadFallPeriods(gtFile);
    std::cout << "Loaded " << gt_periods.size() << " Ground Truth Fall Periods." << std::endl;

    // 3. Processing Loop
    std::ifstream csv(csvFile);
    if (!csv.is_open()) {
        std::cerr << "Error: Cannot open " << csvFile << std::endl;
        return 1;
    }

    std::string line;
    int lineNo = 0;
    double peakRisk = 0.0;
    while (std::getline(csv, line)) {
        lineNo++;
        if (line.empty() || line[0] == '#') continue;

        PoseFrame frame;
        bool hasSubject = false;
        if (!parseFrameLine(line, frame, hasSubject)) {
            std::cerr << "Skipping malformed line " << lineNo << std::endl;
            continue;
        }

        RiskSnapshot snap;
        if (hasSubject) {
            sdk.ProcessFrame(frame, snap);
        } else {
            sdk.ProcessMissingFrame(frame.timestamp, snap);
        }
        if (snap.composite_risk > peakRisk) peakRisk = snap.composite_risk;

        if (snap.frame_index % 50 == 0) {
            std::printf("Processed frame %lld (risk %.1f, counter %d)\n",
                        snap.frame_index, snap.composite_risk, snap.fall_counter);
        }
    }

    // 4. Evaluation
    size_t tp = 0; // Successful detections (intervals covered)
    int fp = 0; // False alarms (frames outside GT)

    for (const auto& p : gt_periods) {
        for (long long frame : detected_frames) {
            if (frame >= p.first && frame <= p.second) {
                tp++;
                break;
            }
        }
    }

    for (long long frame : detected_frames) {
        if (!isFrameInPeriods(frame, gt_periods)) fp++;
    }

    std::cout << "\n========================================" << std::endl;
    std::cout << "Peak Composite Risk      : " << peakRisk << std::endl;
    std::cout << "Confirmed Falls          : " << detected_frames.size() << std::endl;
    if (!gt_periods.empty()) {
        std::cout << "Total Ground Truth Falls : " << gt_periods.size() << std::endl;
        std::cout << "Successful Detections    : " << tp << std::endl;
        std::cout << "Missed Detections        : " << (gt_periods.size() - tp) << std::endl;
        std::cout << "False Alarms (Frames)    : " << fp << std::endl;
    }
    std::cout << "========================================" << std::endl;

    return 0;
}
