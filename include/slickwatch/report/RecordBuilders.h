#pragma once
#include <vector>

#include "RecordValue.h"
#include "slickwatch/vision/ImageProcessor.h"
#include "slickwatch/vision/Statistics.h"
#include "slickwatch/vision/Types.h"
#include "slickwatch/vision/VideoSession.h"

namespace slickwatch {

// {class_id, class_name, confidence, bbox: [x1, y1, x2, y2], area}
RecordValue detectionRecord(const Detection& d);
RecordValue detectionsRecord(const std::vector<Detection>& dets);

RecordValue statisticsRecord(const StatisticsAggregate& st);
RecordValue imageStatsRecord(const ImageStats& st);
RecordValue historyRecord(const std::vector<FrameSummary>& history);

// retained frames without pixel data: [{frame_index, avg_confidence, detections}]
RecordValue retainedFramesRecord(const std::vector<FrameRecord>& frames);

// session statistics plus run metadata; with_buffers adds original_frames /
// annotated_frames, which the serializer elides by default
RecordValue videoStatisticsRecord(const SessionResult& res, bool with_buffers = false);

} // namespace slickwatch
