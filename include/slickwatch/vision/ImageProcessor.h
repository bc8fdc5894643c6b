#pragma once
#include <opencv2/core.hpp>
#include <vector>

#include "Detector.h"
#include "Types.h"

namespace slickwatch {

struct ImageStats {
    int    total_detections    = 0;
    double avg_confidence      = 0.0;
    double max_confidence      = 0.0;
    double min_confidence      = 0.0;
    double total_area          = 0.0;   // summed box area, pixels
    double coverage_percentage = 0.0;   // total_area / image area * 100, capped at 100
    double largest_area        = 0.0;
};

struct ImageResult {
    cv::Mat                original;
    cv::Mat                annotated;
    std::vector<Detection> detections;
    ImageStats             stats;
};

// Single still image through the detector. Detector errors propagate.
ImageResult processImage(Detector& detector, const cv::Mat& bgr, float conf_threshold);

ImageStats computeImageStats(const std::vector<Detection>& dets, cv::Size image_size);

} // namespace slickwatch
