#pragma once
#include <string>
#include <utility>
#include <vector>

#include "SafeSerializer.h"
#include "slickwatch/vision/ImageProcessor.h"
#include "slickwatch/vision/VideoSession.h"

namespace slickwatch {

// ordered key/value block printed under "INFORMATION"
using InfoMap = std::vector<std::pair<std::string, std::string>>;

/*  ReportBundle: exports of one finished run
*
*   text   human readable summary
*   csv    Frame,Class,Confidence,X1,Y1,X2,Y2,Area (one row per retained detection)
*   json   {timestamp, statistics, frames, detection_history}, SafeSerializer output
*   pages  JPEG pages, a summary page then original | annotated per retained frame
*/
class ReportBundle {
public:
    static ReportBundle fromVideo(const SessionResult& res, InfoMap info = {});
    static ReportBundle fromImage(const ImageResult& res, InfoMap info = {});

    std::string textReport() const;
    std::string csvReport() const;
    std::string jsonReport() const;

    // One multi-page document (TIFF): a summary page, then one original | annotated
    // page per retained frame up to max_frames. Returns the page count, throws
    // PipelineError(ProcessingFailed, "report_pages") when the file cannot be written.
    int writePagedReport(const std::string& path, int max_frames = 20) const;

    bool isVideo() const { return video_; }
    const std::vector<FrameRecord>& frames() const { return frames_; }

private:
    ReportBundle() = default;

    std::string statisticsBlock() const;
    std::vector<std::string> summaryLines() const;

    bool                      video_ = true;
    InfoMap                   info_;
    SessionResult             session_;      // video runs
    ImageStats                image_stats_;  // image runs
    std::vector<FrameRecord>  frames_;       // retained frames, or the single image
    SafeSerializer            serializer_;
};

} // namespace slickwatch
