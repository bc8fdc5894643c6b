#include "slickwatch/report/ReportBundle.h"
#include "slickwatch/report/RecordBuilders.h"
#include "slickwatch/vision/Annotator.h"
#include "slickwatch/errors.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;
using nlohmann::json;

namespace slickwatch {

namespace {

const std::string kRule(60, '=');
const std::string kSubRule(60, '-');

std::string localNow(const char* format) {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = {};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::stringstream ss;
    ss << std::put_time(&tm, format);
    return ss.str();
}

std::string fixed(double v, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << v;
    return ss.str();
}

std::string csvField(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string bboxText(const Detection& d) {
    return "[" + fixed(d.x1, 2) + ", " + fixed(d.y1, 2) + ", " + fixed(d.x2, 2) + ", " + fixed(d.y2, 2) + "]";
}

void appendDetection(std::ostringstream& out, const Detection& d, size_t n, const std::string& indent) {
    out << indent << "Detection " << n << ":\n";
    out << indent << "  Class: " << (d.label.empty() ? "Unknown" : d.label) << "\n";
    out << indent << "  Confidence: " << fixed(d.conf, 4) << "\n";
    out << indent << "  Bounding Box: " << bboxText(d) << "\n";
    out << indent << "  Area: " << fixed(d.area(), 2) << " pixels\n";
}

} // namespace

ReportBundle ReportBundle::fromVideo(const SessionResult& res, InfoMap info) {
    ReportBundle b;
    b.video_ = true;
    b.info_ = std::move(info);
    b.session_ = res;
    b.frames_ = res.frames.retainedFrames();
    return b;
}

ReportBundle ReportBundle::fromImage(const ImageResult& res, InfoMap info) {
    ReportBundle b;
    b.video_ = false;
    b.info_ = std::move(info);
    b.image_stats_ = res.stats;

    FrameRecord rec;
    rec.frame_index = 0;
    rec.original = res.original;
    rec.annotated = res.annotated;
    rec.detections = res.detections;
    rec.avg_conf = averageConfidence(res.detections);
    b.frames_.push_back(std::move(rec));
    return b;
}

std::string ReportBundle::statisticsBlock() const {
    std::ostringstream out;
    out << "DETECTION STATISTICS:\n" << kSubRule << "\n";
    if (video_) {
        const StatisticsAggregate& st = session_.stats;
        out << "  Total Frames: " << st.total_frames << "\n";
        out << "  Frames with Detections: " << st.frames_with_detections << "\n";
        out << "  Total Detections: " << st.total_detections << "\n";
        out << "  Average Confidence: " << fixed(st.mean_confidence, 4) << "\n";
        out << "  Max Confidence: " << fixed(st.max_confidence, 4) << "\n";
        out << "  Min Confidence: " << fixed(st.min_confidence, 4) << "\n";
        out << "  Detection Rate: " << fixed(st.coveragePercentage(), 2) << "%\n";
        out << "  Avg Detections per Frame: " << fixed(st.avg_detections_per_frame, 2) << "\n";
        out << "  Max Detections in a Frame: " << st.max_detections_in_frame << "\n";
        if (st.detector_errors > 0) {
            out << "  Frames with Detector Errors: " << st.detector_errors << "\n";
        }
    } else {
        const ImageStats& st = image_stats_;
        out << "  Total Detections: " << st.total_detections << "\n";
        out << "  Average Confidence: " << fixed(st.avg_confidence, 4) << "\n";
        out << "  Max Confidence: " << fixed(st.max_confidence, 4) << "\n";
        out << "  Min Confidence: " << fixed(st.min_confidence, 4) << "\n";
        out << "  Coverage Percentage: " << fixed(st.coverage_percentage, 2) << "%\n";
        out << "  Total Spill Area: " << fixed(st.total_area, 2) << " pixels\n";
    }
    return out.str();
}

std::string ReportBundle::textReport() const {
    std::ostringstream out;
    out << kRule << "\n";
    out << (video_ ? "VIDEO OIL SPILL DETECTION REPORT" : "OIL SPILL DETECTION REPORT") << "\n";
    out << kRule << "\n";
    out << "Generated: " << localNow("%Y-%m-%d %H:%M:%S") << "\n\n";

    if (!info_.empty()) {
        out << (video_ ? "VIDEO INFORMATION:" : "IMAGE INFORMATION:") << "\n" << kSubRule << "\n";
        for (const auto& kv : info_) out << "  " << kv.first << ": " << kv.second << "\n";
        out << "\n";
    }

    out << statisticsBlock() << "\n";

    if (video_) {
        out << "FRAME DETAILS:\n" << kSubRule << "\n";
        if (frames_.empty()) {
            out << "  No frames with detections retained.\n";
        }
        for (const auto& f : frames_) {
            out << "  Frame " << f.frame_index << ": " << f.detections.size()
                << " detection(s), avg confidence " << fixed(f.avg_conf, 4) << "\n";
            for (size_t i = 0; i < f.detections.size(); ++i) {
                appendDetection(out, f.detections[i], i + 1, "    ");
            }
            out << "\n";
        }
    } else {
        out << "DETECTION DETAILS:\n" << kSubRule << "\n";
        const auto& dets = frames_.front().detections;
        if (dets.empty()) {
            out << "  No detections found.\n";
        }
        for (size_t i = 0; i < dets.size(); ++i) {
            appendDetection(out, dets[i], i + 1, "  ");
            out << "\n";
        }
    }

    out << kRule << "\n";
    return out.str();
}

std::string ReportBundle::csvReport() const {
    std::ostringstream out;
    out << "Frame,Class,Confidence,X1,Y1,X2,Y2,Area\n";
    for (const auto& f : frames_) {
        for (const auto& d : f.detections) {
            out << f.frame_index << ','
                << csvField(d.label.empty() ? "Unknown" : d.label) << ','
                << fixed(d.conf, 4) << ','
                << fixed(d.x1, 2) << ',' << fixed(d.y1, 2) << ','
                << fixed(d.x2, 2) << ',' << fixed(d.y2, 2) << ','
                << fixed(d.area(), 2) << "\n";
        }
    }
    return out.str();
}

std::string ReportBundle::jsonReport() const {
    json root = json::object();
    root["timestamp"] = localNow("%Y-%m-%dT%H:%M:%S");
    if (video_) {
        root["statistics"] = serializer_.toSafeTree(videoStatisticsRecord(session_, true));
        root["frames"] = serializer_.toSafeTree(retainedFramesRecord(frames_));
        root["detection_history"] = serializer_.toSafeTree(historyRecord(session_.history));
    } else {
        root["statistics"] = serializer_.toSafeTree(imageStatsRecord(image_stats_));
        root["frames"] = serializer_.toSafeTree(retainedFramesRecord(frames_));
        root["detection_history"] = json::array();
    }
    return serializer_.dumps(root);
}

std::vector<std::string> ReportBundle::summaryLines() const {
    std::vector<std::string> lines;
    lines.push_back(video_ ? "Video Oil Spill Detection Report" : "Oil Spill Detection Report");
    lines.push_back("Generated: " + localNow("%Y-%m-%d %H:%M:%S"));
    lines.push_back("");
    for (const auto& kv : info_) lines.push_back(kv.first + ": " + kv.second);
    if (!info_.empty()) lines.push_back("");

    std::istringstream block(statisticsBlock());
    std::string line;
    while (std::getline(block, line)) {
        if (line == kSubRule) continue;
        lines.push_back(line);
    }
    return lines;
}

int ReportBundle::writePagedReport(const std::string& path, int max_frames) const {
    const fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw PipelineError(ErrorKind::ProcessingFailed, "report_pages",
                            "cannot create " + target.parent_path().string() + ": " + ec.message());
    }

    std::vector<cv::Mat> pages;

    // page 1: summary text on a white sheet
    {
        const std::vector<std::string> lines = summaryLines();
        const int line_h = 28;
        cv::Mat sheet(std::max(400, 60 + line_h * static_cast<int>(lines.size())), 1000, CV_8UC3,
                      cv::Scalar(255, 255, 255));
        int y = 50;
        for (size_t i = 0; i < lines.size(); ++i) {
            const double scale = i == 0 ? 0.9 : 0.6;
            const int thick = i == 0 ? 2 : 1;
            cv::putText(sheet, lines[i], cv::Point(30, y), cv::FONT_HERSHEY_SIMPLEX, scale,
                        cv::Scalar(40, 40, 40), thick, cv::LINE_AA);
            y += line_h;
        }
        pages.push_back(sheet);
    }

    const size_t n = std::min(frames_.size(), static_cast<size_t>(std::max(0, max_frames)));
    for (size_t i = 0; i < n; ++i) {
        cv::Mat page = composeComparison(frames_[i]);
        if (!page.empty()) pages.push_back(page);
    }

    bool ok = false;
    try {
        ok = cv::imwritemulti(path, pages);
    } catch (const cv::Exception& ex) {
        throw PipelineError(ErrorKind::ProcessingFailed, "report_pages", "imwritemulti failed: " + std::string(ex.what()));
    }
    if (!ok) {
        fs::remove(target, ec);
        throw PipelineError(ErrorKind::ProcessingFailed, "report_pages", "imwritemulti failed: " + path);
    }

    std::cout << "[ReportBundle] Wrote " << pages.size() << " page(s) to " << path << "\n";
    return static_cast<int>(pages.size());
}

} // namespace slickwatch
