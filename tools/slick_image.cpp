/*
*   Name:  slick_image.cpp
*   Usage: slick_image <image> [--out annotated.jpg] [--config cfg.yml] [--model m.onnx] [--conf C]
*                      [--report-dir D] [--record-root R] [--no-record]
*   ==========================================================================================
*   Single still image: detect, annotate, print the text report and record the run.
*/
#include "slickwatch/errors.hpp"
#include "slickwatch/report/ReportBundle.h"
#include "slickwatch/vision/Config.h"
#include "slickwatch/vision/ImageProcessor.h"
#include "slickwatch/vision/OrtYolo.h"
#include "ActivityRecorder.h"
#include "ActivityStore.h"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using namespace slickwatch;

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) if (flag == argv[i]) return true; return false;
}
static const char* getOpt(int argc, char** argv, const std::string& key, const char* defv = nullptr) {
    for (int i = 1; i + 1 < argc; ++i) if (key == argv[i]) return argv[i + 1]; return defv;
}

int main(int argc, char** argv) {
    if (argc < 2 || hasFlag(argc, argv, "-h") || hasFlag(argc, argv, "--help")) {
        std::cout << "Usage: slick_image <image> [--out annotated.jpg] [--config cfg.yml] [--model m.onnx] [--conf C]\n"
                  << "                   [--report-dir D] [--record-root R] [--no-record]\n";
        return argc < 2 ? 2 : 0;
    }
    const std::string image_path = argv[1];

    AppConfig cfg = AppConfig::load(getOpt(argc, argv, "--config", ""));
    try {
        if (const char* v = getOpt(argc, argv, "--model"))       cfg.model_path = v;
        if (const char* v = getOpt(argc, argv, "--conf"))        cfg.conf_threshold = std::stof(v);
        if (const char* v = getOpt(argc, argv, "--record-root")) cfg.record_root = v;
    } catch (const std::exception& ex) {
        std::cerr << "[Main] Bad option value: " << ex.what() << "\n";
        return 2;
    }
    const bool record = !hasFlag(argc, argv, "--no-record");

    cv::Mat bgr = cv::imread(image_path, cv::IMREAD_COLOR);
    if (bgr.empty()) {
        std::cerr << "[Main] Cannot read image: " << image_path << "\n";
        return 1;
    }

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

    ImageResult result;
    try {
        result = processImage(*detector, bgr, cfg.conf_threshold);
    } catch (const std::exception& ex) {
        std::cerr << "[Main] Detection failed: " << ex.what() << "\n";
        DetectorCache::shutdown();
        return 1;
    }

    int rc = 0;
    if (const char* out = getOpt(argc, argv, "--out")) {
        const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, std::clamp(cfg.jpg_quality, 1, 100)};
        if (!cv::imwrite(out, result.annotated, params)) {
            std::cerr << "[Main] Failed to write " << out << "\n";
            rc = 1;
        }
    }

    InfoMap info = {
        {"File", fs::path(image_path).filename().string()},
        {"Resolution", std::to_string(bgr.cols) + "x" + std::to_string(bgr.rows)},
    };
    ReportBundle bundle = ReportBundle::fromImage(result, info);
    const std::string text = bundle.textReport();

    if (const char* dir = getOpt(argc, argv, "--report-dir")) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        const std::string stem = fs::path(image_path).stem().string();
        std::ofstream(fs::path(dir) / (stem + "_report.txt"), std::ios::binary) << text;
        std::ofstream(fs::path(dir) / (stem + "_detections.csv"), std::ios::binary) << bundle.csvReport();
        try {
            std::ofstream(fs::path(dir) / (stem + "_report.json"), std::ios::binary) << bundle.jsonReport();
        } catch (const PipelineError& err) {
            std::cerr << "[Main] JSON report skipped: " << err.what() << "\n";
            rc = 1;
        }
    }

    if (record) {
        try {
            ActivityStore store(cfg.record_root, cfg.activity_db);
            ActivityRecorder recorder(store, AlertPolicy(AlertThresholds::fromAppConfig(cfg)));
            RecordOutcome rec = recorder.logImageDetection(image_path, result, "", cfg.jpg_quality);
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
