#include "ActivityRecorder.h"
#include "TimeUtils.h"
#include "slickwatch/report/RecordBuilders.h"

#include <opencv2/imgcodecs.hpp>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace slickwatch {

namespace {

std::string fixed(double v, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << v;
    return ss.str();
}

std::string displayName(const std::string& path, const std::string& original_name) {
    if (!original_name.empty()) return original_name;
    if (path.empty()) return "unknown";
    return fs::path(path).filename().string();
}

} // namespace

ActivityRecorder::ActivityRecorder(ActivityStore& store, AlertPolicy policy, SerializerOptions opt)
    : store_(store), policy_(policy), serializer_(std::move(opt)) {}

std::optional<AlertRecord> ActivityRecorder::raiseAlert(const ActivityLogEntry& entry,
                                                        int64_t detections, double avg_conf, double coverage) {
    const AlertDecision d = policy_.evaluate(detections, avg_conf, coverage);
    if (!d.raised()) return std::nullopt;

    AlertRecord a;
    a.severity = toString(d.severity);
    a.message = d.message;
    a.total_detections = d.total_detections;
    a.avg_confidence = d.avg_confidence;
    a.coverage_percentage = d.coverage_percentage;
    a.timestamp = entry.timestamp;
    a.entry_id = entry.id;
    // the entry is already committed, a lost alert row must not fail the run record
    try {
        return store_.appendAlert(a);
    } catch (const PipelineError& err) {
        std::cerr << "[ActivityRecorder] Entry #" << entry.id << " stored, alert not recorded: "
                  << err.what() << "\n";
        return std::nullopt;
    }
}

RecordOutcome ActivityRecorder::logVideoDetection(const std::string& input_path,
                                                  const std::string& output_path,
                                                  const SessionResult& result,
                                                  const std::string& original_name) {
    const std::string name = displayName(input_path, original_name);

    ActivityLogEntry e;
    e.action_type         = ActionTypes::VIDEO_DETECTION;
    e.original_filename   = name;
    e.total_detections    = result.stats.total_detections;
    e.avg_confidence      = fixed(result.stats.mean_confidence, 4);
    e.coverage_percentage = fixed(result.stats.coveragePercentage(), 2) + "%";
    e.detection_details   = serializer_.dumps(retainedFramesRecord(result.frames.retainedFrames()));
    e.statistics          = serializer_.dumps(videoStatisticsRecord(result, true));

    e.input_file = store_.archiveFile(ArchiveKind::INPUT_VIDEO, input_path, name);
    std::error_code ec;
    if (!output_path.empty() && fs::exists(output_path, ec)) {
        e.output_file = store_.archiveFile(ArchiveKind::OUTPUT_VIDEO, output_path,
                                           "annotated_" + fs::path(name).stem().string()
                                               + fs::path(output_path).extension().string());
    }

    RecordOutcome out;
    out.entry = store_.append(std::move(e));
    out.alert = raiseAlert(out.entry, result.stats.total_detections,
                           result.stats.mean_confidence, result.stats.coveragePercentage());
    return out;
}

RecordOutcome ActivityRecorder::logImageDetection(const std::string& input_path,
                                                  const ImageResult& result,
                                                  const std::string& original_name,
                                                  int jpg_quality) {
    const std::string name = displayName(input_path, original_name);

    ActivityLogEntry e;
    e.action_type         = ActionTypes::IMAGE_DETECTION;
    e.original_filename   = name;
    e.total_detections    = result.stats.total_detections;
    e.avg_confidence      = fixed(result.stats.avg_confidence, 4);
    e.coverage_percentage = fixed(result.stats.coverage_percentage, 2) + "%";
    e.detection_details   = serializer_.dumps(detectionsRecord(result.detections));

    RecordValue stats = imageStatsRecord(result.stats);
    stats["original_frame"] = result.original;
    stats["annotated_frame"] = result.annotated;
    e.statistics = serializer_.dumps(stats);

    std::vector<uchar> encoded;
    if (!result.annotated.empty()) {
        const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, jpg_quality};
        if (!cv::imencode(".jpg", result.annotated, encoded, params)) {
            std::cerr << "[ActivityRecorder] Could not encode annotated image for " << name << "\n";
            encoded.clear();
        }
    }

    e.input_file = store_.archiveFile(ArchiveKind::INPUT_IMAGE, input_path, name);
    if (!encoded.empty()) {
        e.output_file = store_.archiveBytes(ArchiveKind::OUTPUT_IMAGE, encoded,
                                            "annotated_" + fs::path(name).stem().string() + ".jpg");
    }

    RecordOutcome out;
    out.entry = store_.append(std::move(e));
    out.alert = raiseAlert(out.entry, result.stats.total_detections,
                           result.stats.avg_confidence, result.stats.coverage_percentage);
    return out;
}

ActivityLogEntry ActivityRecorder::logReportGeneration(const std::string& report_type,
                                                       const std::string& report_bytes,
                                                       const std::string& extension,
                                                       const std::string& original_name,
                                                       const std::string& associated_action) {
    std::string ext = extension;
    if (!ext.empty() && ext.front() != '.') ext = "." + ext;
    const std::string report_name =
        "report_" + TimeUtils::formatMicros(TimeUtils::nowMicros(), "%Y-%m-%d_%H%M%S") + ext;

    RecordValue stats = RecordValue::object();
    stats["report_type"] = report_type;
    stats["bytes"] = static_cast<uint64_t>(report_bytes.size());
    stats["associated_action"] = associated_action.empty() ? std::string("N/A") : associated_action;

    ActivityLogEntry e;
    e.action_type       = ActionTypes::REPORT_PREFIX + report_type;
    e.input_file        = original_name.empty() ? "N/A" : original_name;
    e.original_filename = original_name.empty() ? "N/A" : original_name;
    e.statistics        = serializer_.dumps(stats);
    e.output_file       = store_.archiveBytes(ArchiveKind::OUTPUT_REPORT, report_bytes, report_name);
    return store_.append(std::move(e));
}

ActivityLogEntry ActivityRecorder::logComparison(const std::string& comparison_type,
                                                 const std::vector<std::string>& files,
                                                 const RecordValue& results) {
    ActivityLogEntry e;
    e.action_type = ActionTypes::COMPARE_PREFIX + comparison_type;
    e.statistics  = serializer_.dumps(results);

    std::string archived;
    std::string names;
    for (const auto& f : files) {
        const std::string name = displayName(f, "");
        const std::string stored = store_.archiveFile(ArchiveKind::INPUT_IMAGE, f, name);
        archived += (archived.empty() ? "" : "; ") + stored;
        names += (names.empty() ? "" : "; ") + name;
    }
    e.input_file        = archived.empty() ? "N/A" : archived;
    e.original_filename = names.empty() ? "N/A" : names;
    return store_.append(std::move(e));
}

ActivityLogEntry ActivityRecorder::logFailedRun(const std::string& action_type,
                                                const std::string& input_path,
                                                const PipelineError& error,
                                                const std::string& original_name) {
    RecordValue stats = RecordValue::object();
    stats["error_kind"] = toString(error.kind());
    stats["stage"] = error.stage();
    stats["detail"] = error.detail();
    stats["frame_index"] = error.frameIndex();

    ActivityLogEntry e;
    e.action_type       = ActionTypes::FAILED_PREFIX + action_type;
    e.input_file        = input_path;
    e.original_filename = displayName(input_path, original_name);
    e.statistics        = serializer_.dumps(stats);
    return store_.append(std::move(e));
}

} // namespace slickwatch
