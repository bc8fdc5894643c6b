#pragma once
#include <vector>
#include "Types.h"

namespace slickwatch {

// Class-wise NMS: sort by confidence, suppress same-class boxes whose IoU
// with a kept box exceeds iou_thres.
std::vector<Detection> nmsClasswise(const std::vector<Detection>& boxes, float iou_thres);

// IoU of two detections (0 when disjoint or degenerate)
float iou(const Detection& a, const Detection& b);

} // namespace slickwatch
