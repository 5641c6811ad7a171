#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include <pipeline/types.hpp>

namespace sr {
    std::string report_to_json(const DetectionReport& report);
    std::string stats_to_json(const FaceStatistics& stats);

    // Copy of the image with boxes (and optionally "name: conf" labels) drawn.
    cv::Mat draw_detections(const cv::Mat& bgr,
                            const std::vector<Region>& regions,
                            bool draw_labels = true);
}
