#pragma once
#include <cstdint>
#include <vector>

#include "Types.h"

namespace slickwatch {

// Read-only snapshot produced by StatisticsAggregator::finalize()
struct StatisticsAggregate {
    int64_t total_frames           = 0;
    int64_t frames_with_detections = 0;   // <= total_frames
    int64_t total_detections       = 0;
    double  mean_confidence        = 0.0; // 0 when no detection was seen
    double  min_confidence         = 0.0;
    double  max_confidence         = 0.0;
    double  coverage_ratio         = 0.0; // frames_with_detections / total_frames

    double  avg_detections_per_frame = 0.0;
    int     max_detections_in_frame  = 0;
    int64_t detector_errors          = 0; // frames whose detector call failed

    double coveragePercentage() const { return coverage_ratio * 100.0; }
};

/*  StatisticsAggregator: incremental accumulator fed once per decoded frame
*
*   Counters and the confidence fold are constant size. history() keeps one
*   FrameSummary (index, count, mean confidence, no pixels) per decoded frame,
*   so it grows linearly with video length, unlike the FrameStore which is
*   bounded by RetentionPolicy. A one-hour 30 fps video holds 108000 entries.
*/
class StatisticsAggregator {
public:
    void update(const FrameRecord& rec);
    void noteDetectorError() { ++detector_errors_; }

    // safe on zero frames / zero detections
    StatisticsAggregate finalize() const;

    const std::vector<FrameSummary>& history() const { return history_; }

private:
    int64_t total_frames_ = 0;
    int64_t frames_with_det_ = 0;
    int64_t total_det_ = 0;
    int64_t detector_errors_ = 0;
    int     max_det_in_frame_ = 0;

    // confidence fold
    double  conf_sum_ = 0.0;
    int64_t conf_count_ = 0;
    double  conf_min_ = 0.0;
    double  conf_max_ = 0.0;

    std::vector<FrameSummary> history_;
};

} // namespace slickwatch
