#include "slickwatch/vision/Nms.h"

#include <algorithm>

namespace slickwatch {

float iou(const Detection& a, const Detection& b) {
    const float w = std::min(a.x2, b.x2) - std::max(a.x1, b.x1);
    const float h = std::min(a.y2, b.y2) - std::max(a.y1, b.y1);
    if (w <= 0.f || h <= 0.f) return 0.f;
    const float inter = w * h;
    const float uni = a.area() + b.area() - inter;
    return uni <= 0.f ? 0.f : inter / uni;
}

std::vector<Detection> nmsClasswise(const std::vector<Detection>& boxes, float iou_thres) {
    std::vector<Detection> order = boxes;
    std::stable_sort(order.begin(), order.end(), [](const Detection& a, const Detection& b) {
        return a.conf > b.conf;
    });

    std::vector<Detection> kept;
    kept.reserve(order.size());
    for (const auto& cand : order) {
        bool suppressed = false;
        for (const auto& k : kept) {
            if (k.cls_id == cand.cls_id && iou(k, cand) > iou_thres) { suppressed = true; break; }
        }
        if (!suppressed) kept.push_back(cand);
    }
    return kept;
}

} // namespace slickwatch
