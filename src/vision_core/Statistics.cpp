#include "slickwatch/vision/Statistics.h"

#include <algorithm>

namespace slickwatch {

void StatisticsAggregator::update(const FrameRecord& rec) {
    ++total_frames_;

    const int n = static_cast<int>(rec.detections.size());
    history_.push_back(FrameSummary{rec.frame_index, n, rec.avg_conf});
    if (n == 0) return;

    ++frames_with_det_;
    total_det_ += n;
    max_det_in_frame_ = std::max(max_det_in_frame_, n);

    for (const auto& d : rec.detections) {
        const double c = d.conf;
        if (conf_count_ == 0) {
            conf_min_ = c;
            conf_max_ = c;
        } else {
            conf_min_ = std::min(conf_min_, c);
            conf_max_ = std::max(conf_max_, c);
        }
        conf_sum_ += c;
        ++conf_count_;
    }
}

StatisticsAggregate StatisticsAggregator::finalize() const {
    StatisticsAggregate s;
    s.total_frames = total_frames_;
    s.frames_with_detections = frames_with_det_;
    s.total_detections = total_det_;
    s.detector_errors = detector_errors_;
    s.max_detections_in_frame = max_det_in_frame_;

    if (conf_count_ > 0) {
        s.mean_confidence = conf_sum_ / static_cast<double>(conf_count_);
        s.min_confidence = conf_min_;
        s.max_confidence = conf_max_;
    }
    if (total_frames_ > 0) {
        s.coverage_ratio = static_cast<double>(frames_with_det_) / static_cast<double>(total_frames_);
        s.avg_detections_per_frame = static_cast<double>(total_det_) / static_cast<double>(total_frames_);
    }
    return s;
}

} // namespace slickwatch
