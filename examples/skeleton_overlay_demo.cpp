#include "FallGuard_sdk.h"
#include "landmark_csv.h"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>
#include <iostream>
#include <vector>
#include <string>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sys/stat.h>
#include <sys/types.h>

using SDK = FallGuardSDK::FallGuardSDK;
using namespace FallGuardSDK;

// Renders raw, smoothed and forecast skeletons with the risk readout for a
// landmark CSV (same format as fall_callback_demo) and saves one PNG per frame.

static const int kBones[][2] = {
    {LEFT_SHOULDER, RIGHT_SHOULDER},
    {LEFT_SHOULDER, LEFT_HIP}, {RIGHT_SHOULDER, RIGHT_HIP},
    {LEFT_HIP, RIGHT_HIP},
    {LEFT_SHOULDER, 13}, {13, LEFT_WRIST},
    {RIGHT_SHOULDER, 14}, {14, RIGHT_WRIST},
    {LEFT_HIP, LEFT_KNEE}, {LEFT_KNEE, LEFT_ANKLE},
    {RIGHT_HIP, RIGHT_KNEE}, {RIGHT_KNEE, RIGHT_ANKLE},
    {LEFT_ANKLE, LEFT_HEEL}, {LEFT_HEEL, LEFT_FOOT_INDEX},
    {RIGHT_ANKLE, RIGHT_HEEL}, {RIGHT_HEEL, RIGHT_FOOT_INDEX},
};

static void drawSkeleton(cv::Mat& canvas, const std::vector<Landmark>& lm,
                         const cv::Scalar& color, int thickness) {
    if ((int)lm.size() != kNumLandmarks) return;
    auto toPixel = [&](const Landmark& p) {
        return cv::Point((int)(p.x * canvas.cols), (int)(p.y * canvas.rows));
    };

    for (const auto& bone : kBones) {
        cv::line(canvas, toPixel(lm[bone[0]]), toPixel(lm[bone[1]]), color, thickness);
    }
    for (int j = LEFT_SHOULDER; j < kNumLandmarks; ++j) {
        cv::circle(canvas, toPixel(lm[j]), thickness + 2, color, cv::FILLED);
    }
}

static void drawReadout(cv::Mat& canvas, const RiskSnapshot& s) {
    cv::Scalar riskColor = cv::Scalar(0, 200, 0);
    if (s.risk_level == RiskLevel::Warning) riskColor = cv::Scalar(0, 200, 255);
    if (s.risk_level == RiskLevel::Critical) riskColor = cv::Scalar(0, 0, 255);

    char text[128];
    std::snprintf(text, sizeof(text), "Risk %.0f%%  Knee L %.0f%% R %.0f%%",
                  s.composite_risk, s.left_knee_load, s.right_knee_load);
    cv::putText(canvas, text, cv::Point(10, 25), cv::FONT_HERSHEY_SIMPLEX, 0.6, riskColor, 2);

    std::snprintf(text, sizeof(text), "Stability %.0f  Spine %s  %s",
                  s.stability_score,
                  s.spine_status == SpineStatus::Poor ? "POOR" : "ok",
                  s.sitting ? "SITTING" : "");
    cv::putText(canvas, text, cv::Point(10, 50), cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(255, 255, 255), 1);

    if (s.tracking == TrackingStatus::LowVisibility) {
        cv::putText(canvas, "LOW VISIBILITY", cv::Point(10, 75), cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(0, 200, 255), 2);
    } else if (s.tracking == TrackingStatus::NoSubject) {
        cv::putText(canvas, "NO SUBJECT", cv::Point(10, 75), cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(128, 128, 128), 2);
    }

    if (s.fall_state == FallState::Confirmed) {
        cv::rectangle(canvas, cv::Point(0, 0), cv::Point(canvas.cols - 1, canvas.rows - 1), cv::Scalar(0, 0, 255), 6);
        cv::putText(canvas, "FALL DETECTED", cv::Point(10, canvas.rows - 20), cv::FONT_HERSHEY_SIMPLEX, 1.0, cv::Scalar(0, 0, 255), 3);
    } else if (s.fall_counter > 0) {
        cv::putText(canvas, "Fall count " + std::to_string(s.fall_counter), cv::Point(10, canvas.rows - 20),
                    cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(0, 128, 255), 2);
    }
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <landmarks.csv> [parameter.ini] [output_dir] [width] [height]" << std::endl;
        return 1;
    }
    std::string csvFile = argv[1];
    std::string paramFile = argc > 2 ? argv[2] : "parameter.ini";
    std::string outDir = argc > 3 ? argv[3] : "overlay_results";
    int W = argc > 4 ? std::atoi(argv[4]) : 640;
    int H = argc > 5 ? std::atoi(argv[5]) : 480;
    if (W <= 0 || H <= 0) {
        std::cerr << "Invalid canvas size " << W << "x" << H << std::endl;
        return 1;
    }

    SDK sdk;
    if (sdk.LoadConfigFile(paramFile) != StatusCode::OK) {
        std::cerr << "Warning: using default parameters" << std::endl;
    }
    if (sdk.Init() != StatusCode::OK) return 1;

    mkdir(outDir.c_str(), 0777);

    std::ifstream csv(csvFile);
    if (!csv.is_open()) {
        std::cerr << "Error: Cannot open " << csvFile << std::endl;
        return 1;
    }

    std::string line;
    int saved = 0;
    while (std::getline(csv, line)) {
        if (line.empty() || line[0] == '#') continue;

        PoseFrame frame;
        bool hasSubject = false;
        if (!parseFrameLine(line, frame, hasSubject)) continue;

        RiskSnapshot snap;
        if (hasSubject) {
            sdk.ProcessFrame(frame, snap);
        } else {
            sdk.ProcessMissingFrame(frame.timestamp, snap);
        }

        cv::Mat canvas(H, W, CV_8UC3, cv::Scalar(30, 30, 30));
        if (hasSubject) drawSkeleton(canvas, frame.landmarks, cv::Scalar(110, 110, 110), 1);
        drawSkeleton(canvas, sdk.GetForecastLandmarks(-1), cv::Scalar(0, 220, 220), 1);
        drawSkeleton(canvas, sdk.GetSmoothedLandmarks(), cv::Scalar(0, 255, 0), 2);

        for (const auto& seat : sdk.GetSeatRegions()) {
            cv::rectangle(canvas,
                cv::Point((int)(seat.x * W), (int)(seat.y * H)),
                cv::Point((int)((seat.x + seat.w) * W), (int)((seat.y + seat.h) * H)),
                cv::Scalar(255, 128, 0), 2);
        }
        drawReadout(canvas, snap);

        char name[512];
        std::snprintf(name, sizeof(name), "%s/frame_%06lld.png", outDir.c_str(), snap.frame_index);
        if (cv::imwrite(name, canvas)) saved++;
    }

    std::cout << "Saved " << saved << " frames to " << outDir << std::endl;
    return 0;
}
