#pragma once
#include "Types.h"
#include <opencv2/core.hpp>
#include <vector>

namespace slickwatch {

// Detection capability consumed by the pipeline. Any backend (local model,
// remote service, test script) plugs in here.
class Detector {
public:
    virtual ~Detector() = default;

    // bgr: full-size frame; boxes are returned in its pixel space.
    // May throw; the video session absorbs per-frame failures.
    virtual std::vector<Detection> detect(const cv::Mat& bgr, float conf_threshold) = 0;
};

} // namespace slickwatch
