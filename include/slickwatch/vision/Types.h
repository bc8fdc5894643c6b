#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace slickwatch {

// Detector output box, pixel space of the frame it was produced from
struct Detection {
    float       x1 = 0.f, y1 = 0.f;   // top-left
    float       x2 = 0.f, y2 = 0.f;   // bottom-right
    float       conf = 0.f;           // 0~1
    int         cls_id = -1;
    std::string label;                // "oil_spill", ...

    float width()  const { return x2 > x1 ? x2 - x1 : 0.f; }
    float height() const { return y2 > y1 ? y2 - y1 : 0.f; }
    float area()   const { return width() * height(); }

    cv::Rect rect() const {
        return cv::Rect(cv::Point(static_cast<int>(x1), static_cast<int>(y1)),
                        cv::Point(static_cast<int>(x2), static_cast<int>(y2)));
    }
};

// One decoded frame with its detections. Retained frames own their buffers.
struct FrameRecord {
    int64_t                frame_index = -1;   // 0-based decode index
    cv::Mat                original;           // untouched BGR frame
    cv::Mat                annotated;          // boxes drawn on a copy
    std::vector<Detection> detections;
    float                  avg_conf = 0.f;     // mean over detections, 0 when none

    bool hasDetection() const { return !detections.empty(); }
};

// Per-frame line of the detection history (no pixel data)
struct FrameSummary {
    int64_t frame_index = -1;
    int     detections = 0;
    float   avg_conf = 0.f;
};

// mean confidence of a detection list (0 for an empty list)
float averageConfidence(const std::vector<Detection>& dets);

} // namespace slickwatch
