#pragma once
#include <onnxruntime_cxx_api.h>
#include <opencv2/core.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "Detector.h"

namespace slickwatch {

    struct RawDet {         // model output box, letterboxed input space
        float cx, cy, w, h;
        float conf;
        int cls_id;
    };

    // YOLOv8/v11 style ONNX detector ([1, 4 + classes, boxes] output)
    class OrtYoloDetector : public Detector {
    public:
        struct SessionOptions {
            std::string model_path = "assets/weights/oil_spill_yolo.onnx";
            int input_w = 640;
            int input_h = 640;
            float nms_iou = 0.45f;
            int intra_threads = 0;
            std::vector<std::string> class_names = { "oil_spill" };
        };

        explicit OrtYoloDetector(const SessionOptions& opt);
        ~OrtYoloDetector() override = default;

        bool isReady() const { return ready_; }
        const SessionOptions& options() const { return opt_; }

        std::vector<Detection> detect(const cv::Mat& bgr, float conf_threshold) override;

        // raw inference on an input_w x input_h letterboxed BGR image
        std::vector<RawDet> infer(const cv::Mat& letterboxed, float conf_threshold);

    private:
        struct Letterbox {
            cv::Mat img;
            float scale;
            int dx, dy;
        };
        static Letterbox letterbox(const cv::Mat& src, int target_w, int target_h);

        std::string labelFor(int cls_id) const;

        SessionOptions opt_;
        bool ready_ = false;

        Ort::Env env_;
        Ort::SessionOptions session_options_;
        std::unique_ptr<Ort::Session> session_;
        std::mutex run_mutex_;
    };

    // Process-wide detector cache: one loaded model per path, created on first
    // use and dropped by shutdown().
    class DetectorCache {
    public:
        static std::shared_ptr<OrtYoloDetector> get(const OrtYoloDetector::SessionOptions& opt);
        static void shutdown();
    };

} // namespace slickwatch
