#include "slickwatch/vision/FrameStore.h"
#include <algorithm>

namespace slickwatch {

FrameStore::FrameStore(const RetentionPolicy& policy)
    : policy_(policy) {
    frames_.reserve(std::min<size_t>(policy_.max_retained_frames, 64));
}

bool FrameStore::accepts(int64_t frame_index, bool has_detection) const {
    if (policy_.require_detection && !has_detection) return false;
    if (full()) return false;
    if (frame_index < 0) return false;
    if (!frames_.empty() && frame_index <= frames_.back().frame_index) return false;
    return true;
}

bool FrameStore::offer(FrameRecord&& rec) {
    if (!accepts(rec.frame_index, rec.hasDetection())) return false;
    frames_.push_back(std::move(rec));
    return true;
}

} // namespace slickwatch
