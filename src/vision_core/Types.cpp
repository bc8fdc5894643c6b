#include "slickwatch/vision/Types.h"

namespace slickwatch {

float averageConfidence(const std::vector<Detection>& dets) {
    if (dets.empty()) return 0.f;
    double sum = 0.0;
    for (const auto& d : dets) sum += d.conf;
    return static_cast<float>(sum / static_cast<double>(dets.size()));
}

} // namespace slickwatch
