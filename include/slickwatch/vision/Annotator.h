#pragma once
#include <opencv2/core.hpp>
#include <vector>
#include "Types.h"

namespace slickwatch {

// Returns a copy of bgr with every detection drawn (box + "label conf").
// The input buffer is never modified.
cv::Mat annotateFrame(const cv::Mat& bgr, const std::vector<Detection>& dets);

// Side-by-side original | annotated with a caption strip underneath.
cv::Mat composeComparison(const FrameRecord& rec, int max_width = 1600);

} // namespace slickwatch
