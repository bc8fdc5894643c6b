#include "slickwatch/report/RecordBuilders.h"

namespace slickwatch {

RecordValue detectionRecord(const Detection& d) {
    RecordValue r = RecordValue::object();
    r["class_id"] = d.cls_id;
    r["class_name"] = d.label.empty() ? std::string("Unknown") : d.label;
    r["confidence"] = d.conf;
    RecordValue bbox = RecordValue::array();
    bbox.push_back(d.x1);
    bbox.push_back(d.y1);
    bbox.push_back(d.x2);
    bbox.push_back(d.y2);
    r["bbox"] = bbox;
    r["area"] = d.area();
    return r;
}

RecordValue detectionsRecord(const std::vector<Detection>& dets) {
    RecordValue arr = RecordValue::array();
    for (const auto& d : dets) arr.push_back(detectionRecord(d));
    return arr;
}

RecordValue statisticsRecord(const StatisticsAggregate& st) {
    RecordValue r = RecordValue::object();
    r["total_frames"]             = st.total_frames;
    r["frames_with_detections"]   = st.frames_with_detections;
    r["total_detections"]         = st.total_detections;
    r["avg_confidence"]           = st.mean_confidence;
    r["min_confidence"]           = st.min_confidence;
    r["max_confidence"]           = st.max_confidence;
    r["coverage_ratio"]           = st.coverage_ratio;
    r["coverage_percentage"]      = st.coveragePercentage();
    r["avg_detections_per_frame"] = st.avg_detections_per_frame;
    r["max_detections_in_frame"]  = st.max_detections_in_frame;
    r["detector_errors"]          = st.detector_errors;
    return r;
}

RecordValue imageStatsRecord(const ImageStats& st) {
    RecordValue r = RecordValue::object();
    r["total_detections"]    = st.total_detections;
    r["avg_confidence"]      = st.avg_confidence;
    r["max_confidence"]      = st.max_confidence;
    r["min_confidence"]      = st.min_confidence;
    r["total_spill_area"]    = st.total_area;
    r["coverage_percentage"] = st.coverage_percentage;
    r["largest_spill_area"]  = st.largest_area;
    return r;
}

RecordValue historyRecord(const std::vector<FrameSummary>& history) {
    RecordValue arr = RecordValue::array();
    for (const auto& h : history) {
        RecordValue r = RecordValue::object();
        r["frame"] = h.frame_index;
        r["detections"] = h.detections;
        r["avg_confidence"] = h.avg_conf;
        arr.push_back(std::move(r));
    }
    return arr;
}

RecordValue retainedFramesRecord(const std::vector<FrameRecord>& frames) {
    RecordValue arr = RecordValue::array();
    for (const auto& f : frames) {
        RecordValue r = RecordValue::object();
        r["frame_index"] = f.frame_index;
        r["avg_confidence"] = f.avg_conf;
        r["detections"] = detectionsRecord(f.detections);
        arr.push_back(std::move(r));
    }
    return arr;
}

RecordValue videoStatisticsRecord(const SessionResult& res, bool with_buffers) {
    RecordValue r = statisticsRecord(res.stats);
    r["source"] = res.source_path;
    r["output"] = res.output_path;
    r["codec"]  = res.codec;
    r["width"]  = res.width;
    r["height"] = res.height;
    r["fps"]    = res.fps;
    r["reported_frames"] = res.reported_frames;
    r["retained_frames"] = static_cast<int64_t>(res.frames.size());

    if (with_buffers) {
        RecordValue originals = RecordValue::array();
        RecordValue annotated = RecordValue::array();
        for (const auto& f : res.frames.retainedFrames()) {
            originals.push_back(f.original);
            annotated.push_back(f.annotated);
        }
        r["original_frames"] = originals;
        r["annotated_frames"] = annotated;
    }
    return r;
}

} // namespace slickwatch
