/*
*   Name:  slick_video.cpp
*   Usage: slick_video <video> [output.mp4] [--config cfg.yml] [--model m.onnx] [--conf C]
*                      [--codec mp4v,XVID] [--max-frames N] [--report-dir D] [--pages]
*                      [--record-root R] [--no-record]
*   ==========================================================================================
*   Runs one video through the detector, writes the annotated video, the text / csv / json
*   reports and (with --pages) the multi-page comparison document, then records the run.
*/
#include "slickwatch/errors.hpp"
#include "slickwatch/report/ReportBundle.h"
#include "slickwatch/vision/Config.h"
#include "slickwatch/vision/OrtYolo.h"
#include "slickwatch/vision/VideoSession.h"
#include "ActivityRecorder.h"
#include "ActivityStore.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace slickwatch;

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) if (flag == argv[i]) return true; return false;
}
static const char* getOpt(int argc, char** argv, const std::string& key, const char* defv = nullptr) {
    for (int i = 1; i + 1 < argc; ++i) if (key == argv[i]) return argv[i + 1]; return defv;
}

static std::vector<std::string> splitList(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) if (!item.empty()) out.push_back(item);
    return out;
}

static bool writeText(const fs::path& path, const std::string& body) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        std::cerr << "[Main] Cannot write " << path.string() << "\n";
        return false;
    }
    out << body;
    return static_cast<bool>(out);
}

static std::string readBytes(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void printUsage() {
    std::cout << "Usage: slick_video <video> [output.mp4] [--config cfg.yml] [--model m.onnx] [--conf C]\n"
              << "                   [--codec mp4v,XVID] [--max-frames N] [--report-dir D] [--pages]\n"
              << "                   [--record-root R] [--no-record]\n";
}

int main(int argc, char** argv) {
    if (argc < 2 || hasFlag(argc, argv, "-h") || hasFlag(argc, argv, "--help")) {
        printUsage();
        return argc < 2 ? 2 : 0;
    }

    const std::string video_path = argv[1];
    std::string output_path = (argc >= 3 && argv[2][0] != '-') ? argv[2] : std::string();
    if (output_path.empty()) {
        output_path = (fs::path("runtime") / ("annotated_" + fs::path(video_path).stem().string() + ".mp4")).string();
    }

    AppConfig cfg = AppConfig::load(getOpt(argc, argv, "--config", ""));
    const bool pages = hasFlag(argc, argv, "--pages");
    const bool record = !hasFlag(argc, argv, "--no-record");
    size_t max_frames = static_cast<size_t>(pages ? cfg.report_max_frames : cfg.ui_max_frames);
    try {
        if (const char* v = getOpt(argc, argv, "--model"))       cfg.model_path = v;
        if (const char* v = getOpt(argc, argv, "--conf"))        cfg.conf_threshold = std::stof(v);
        if (const char* v = getOpt(argc, argv, "--codec"))       cfg.codec_preference = splitList(v);
        if (const char* v = getOpt(argc, argv, "--record-root")) cfg.record_root = v;
        if (const char* v = getOpt(argc, argv, "--max-frames"))  max_frames = static_cast<size_t>(std::stoul(v));
    } catch (const std::exception& ex) {
        std::cerr << "[Main] Bad option value: " << ex.what() << "\n";
        printUsage();
        return 2;
    }
    const fs::path report_dir = getOpt(argc, argv, "--report-dir", "runtime/reports");

    std::cout << "[Main] slick_video starting...\n"
              << "  video  : " << video_path << "\n"
              << "  output : " << output_path << "\n"
              << "  model  : " << cfg.model_path << "\n"
              << "  conf   : " << cfg.conf_threshold << "\n"
              << "  retain : " << max_frames << " frame(s)\n";

    OrtYoloDetector::SessionOptions opt;
    opt.model_path = cfg.model_path;
    opt.input_w = cfg.input_w;
    opt.input_h = cfg.input_h;
    opt.nms_iou = cfg.nms_iou;
    opt.intra_threads = cfg.intra_threads;
    opt.class_names = cfg.class_names;
    auto detector = DetectorCache::get(opt);
    if (!detector || !detector->isReady()) {
        std::cerr << "[Main] Detector not available: " << cfg.model_path << "\n";
        return 3;
    }

    std::unique_ptr<ActivityStore> store;
    std::unique_ptr<ActivityRecorder> recorder;
    if (record) {
        try {
            store.reset(new ActivityStore(cfg.record_root, cfg.activity_db));
            recorder.reset(new ActivityRecorder(*store, AlertPolicy(AlertThresholds::fromAppConfig(cfg))));
        } catch (const PipelineError& err) {
            std::cerr << "[Main] Activity store unavailable, run will not be recorded: " << err.what() << "\n";
        }
    }

    VideoProcessingSession session(*detector, SessionConfig::fromAppConfig(cfg, max_frames));
    SessionResult result;
    try {
        result = session.run(video_path, output_path, [](int64_t done, int64_t total) {
            if (done % 100 == 0) std::cout << "[Main] progress " << done << "/" << total << "\n";
        });
    } catch (const PipelineError& err) {
        std::cerr << "[Main] Video processing failed: " << err.what() << "\n";
        if (recorder) {
            try {
                recorder->logFailedRun(ActionTypes::VIDEO_DETECTION, video_path, err);
            } catch (const PipelineError& log_err) {
                std::cerr << "[Main] Could not record the failed run: " << log_err.what() << "\n";
            }
        }
        DetectorCache::shutdown();
        return 1;
    }

    InfoMap info = {
        {"File", fs::path(video_path).filename().string()},
        {"Resolution", std::to_string(result.width) + "x" + std::to_string(result.height)},
        {"FPS", std::to_string(result.fps)},
        {"Codec", result.codec},
        {"Total Frames", std::to_string(result.stats.total_frames)},
    };
    ReportBundle bundle = ReportBundle::fromVideo(result, info);

    int rc = 0;
    std::error_code ec;
    fs::create_directories(report_dir, ec);
    const std::string stem = fs::path(video_path).stem().string();
    const std::string text = bundle.textReport();
    const std::string csv = bundle.csvReport();
    std::string json_text;
    try {
        json_text = bundle.jsonReport();
    } catch (const PipelineError& err) {
        std::cerr << "[Main] JSON report skipped: " << err.what() << "\n";
        rc = 1;
    }
    if (!writeText(report_dir / (stem + "_report.txt"), text)) rc = 1;
    if (!writeText(report_dir / (stem + "_detections.csv"), csv)) rc = 1;
    if (!json_text.empty() && !writeText(report_dir / (stem + "_report.json"), json_text)) rc = 1;

    std::string paged_bytes;
    if (pages) {
        const fs::path paged = report_dir / (stem + "_comparison.tiff");
        try {
            bundle.writePagedReport(paged.string(), cfg.report_max_frames);
            paged_bytes = readBytes(paged);
        } catch (const PipelineError& err) {
            std::cerr << "[Main] Comparison document failed: " << err.what() << "\n";
            rc = 1;
        }
    }

    if (recorder) {
        try {
            RecordOutcome rec = recorder->logVideoDetection(video_path, output_path, result);
            recorder->logReportGeneration("TXT", text, "txt", rec.entry.original_filename, ActionTypes::VIDEO_DETECTION);
            recorder->logReportGeneration("CSV", csv, "csv", rec.entry.original_filename, ActionTypes::VIDEO_DETECTION);
            if (!json_text.empty()) {
                recorder->logReportGeneration("JSON", json_text, "json", rec.entry.original_filename, ActionTypes::VIDEO_DETECTION);
            }
            if (!paged_bytes.empty()) {
                recorder->logReportGeneration("PAGES", paged_bytes, "tiff", rec.entry.original_filename, ActionTypes::VIDEO_DETECTION);
            }
            if (rec.alert) std::cout << "[Main] " << rec.alert->message << "\n";
        } catch (const PipelineError& err) {
            std::cerr << "[Main] Recording failed: " << err.what() << "\n";
            rc = 1;
        }
    }

    std::cout << text;
    DetectorCache::shutdown();
    return rc;
}
