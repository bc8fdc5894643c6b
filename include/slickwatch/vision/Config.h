#pragma once
#include <string>
#include <vector>

namespace slickwatch {

// SlickWatch running config (load from slickwatch.yml or .json)
struct AppConfig {
    // ===================== fields ===================== //

    std::string model_path   = "assets/weights/oil_spill_yolo.onnx";   // onnx export of the detector
    std::string config_path  = "config/slickwatch.yml";                // config file self path
    std::string record_root  = "information_record";                   // archive + activity log root
    std::string activity_db  = "activity_log.db";                      // file name under record_root

    // model input size
    int input_w = 640;
    int input_h = 640;

    // class names, index = model class id
    std::vector<std::string> class_names = { "oil_spill" };

    /* thresholds
    *  conf: boxes below are dropped by the detector
    *  NMS:  overlapping boxes of one class above this IoU keep only the best
    */
    float conf_threshold = 0.25f;
    float nms_iou        = 0.45f;

    // output encoder, most compatible first
    std::vector<std::string> codec_preference = { "mp4v", "XVID", "MJPG", "X264" };

    // frame retention
    bool retain_frames      = true;
    int  ui_max_frames      = 12;   // result grid
    int  report_max_frames  = 20;   // paged comparison report

    // report images
    int jpg_quality = 90;

    // alert thresholds (detections per run)
    int alert_critical = 10;
    int alert_high     = 5;
    int alert_medium   = 2;
    int alert_low      = 1;

    // ONNX Runtime threads
    int intra_threads = 0; // 0=auto

    // ===================== methods ===================== //

    std::string activityDbPath() const;

    static AppConfig fromYaml(const std::string& yaml_path);
    static AppConfig fromJson(const std::string& json_path);
    // pick loader by extension, defaults when path is empty
    static AppConfig load(const std::string& path);
};

} // namespace slickwatch
