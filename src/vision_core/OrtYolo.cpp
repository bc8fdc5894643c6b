#include "slickwatch/vision/OrtYolo.h"
#include "slickwatch/vision/Nms.h"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <map>
#include <stdexcept>

namespace slickwatch {

    OrtYoloDetector::OrtYoloDetector(const SessionOptions& opt)
        : opt_(opt),
          env_(ORT_LOGGING_LEVEL_WARNING, "SlickWatchYolo"),
          session_options_()
    {
        if (!std::filesystem::exists(opt_.model_path)) {
            std::cerr << "[OrtYoloDetector] Model file not found: " << opt_.model_path << "\n";
            return;
        }

        session_options_.SetIntraOpNumThreads(opt_.intra_threads);   // 0 = auto decide threads usage

        try {
#ifdef _WIN32
            std::wstring model_path_w(opt_.model_path.begin(), opt_.model_path.end());
            session_ = std::make_unique<Ort::Session>(env_, model_path_w.c_str(), session_options_);
#else
            session_ = std::make_unique<Ort::Session>(env_, opt_.model_path.c_str(), session_options_);
#endif
            ready_ = true;
            std::cout << "[OrtYoloDetector] ONNX session created with model: " << opt_.model_path << "\n";
        } catch (const Ort::Exception& ex) {
            std::cerr << "[OrtYoloDetector] Failed to create ONNX session: " << ex.what() << "\n";
            ready_ = false;
        }
    }

    OrtYoloDetector::Letterbox OrtYoloDetector::letterbox(const cv::Mat& src, int target_w, int target_h) {
        int w = src.cols, h = src.rows;
        float scaling_rate = std::min((float)target_w / w, (float)target_h / h);
        int new_w = int(std::round(w * scaling_rate));
        int new_h = int(std::round(h * scaling_rate));
        int dx = (target_w - new_w) / 2;
        int dy = (target_h - new_h) / 2;

        cv::Mat resized;
        cv::resize(src, resized, cv::Size(new_w, new_h));

        cv::Mat canvas(target_h, target_w, src.type(), cv::Scalar(114, 114, 114));
        resized.copyTo(canvas(cv::Rect(dx, dy, new_w, new_h)));
        return {canvas, scaling_rate, dx, dy};
    }

    std::string OrtYoloDetector::labelFor(int cls_id) const {
        if (cls_id >= 0 && cls_id < static_cast<int>(opt_.class_names.size())) return opt_.class_names[cls_id];
        return "class_" + std::to_string(cls_id);
    }

    std::vector<RawDet> OrtYoloDetector::infer(const cv::Mat& letterboxed, float conf_threshold) {
        if (!session_ || !ready_) {
            throw std::runtime_error("ONNX session not ready (" + opt_.model_path + ")");
        }
        if (letterboxed.empty() || letterboxed.cols != opt_.input_w || letterboxed.rows != opt_.input_h) {
            throw std::invalid_argument("input size mismatch, expected " + std::to_string(opt_.input_w) +
                                        "x" + std::to_string(opt_.input_h) + ", got " +
                                        std::to_string(letterboxed.cols) + "x" + std::to_string(letterboxed.rows));
        }

        Ort::AllocatorWithDefaultOptions allocator;
        Ort::AllocatedStringPtr input_name_ptr = session_->GetInputNameAllocated(0, allocator);
        Ort::AllocatedStringPtr output_name_ptr = session_->GetOutputNameAllocated(0, allocator);
        const char* input_name = input_name_ptr.get();      // "images"
        const char* output_name = output_name_ptr.get();    // "output0"

        // bgr -> rgb, hwc -> nchw, [0,255] -> [0,1]
        cv::Mat rgb;
        cv::cvtColor(letterboxed, rgb, cv::COLOR_BGR2RGB);

        std::vector<float> input_tensor_val(1 * 3 * opt_.input_w * opt_.input_h);
        for (int c = 0; c < 3; ++c) {
            for (int h = 0; h < opt_.input_h; ++h) {
                for (int w = 0; w < opt_.input_w; ++w) {
                    int idx = c * opt_.input_h * opt_.input_w + h * opt_.input_w + w;
                    input_tensor_val[idx] = rgb.at<cv::Vec3b>(h, w)[c] / 255.0f;
                }
            }
        }

        std::vector<int64_t> input_shape = {1, 3, opt_.input_h, opt_.input_w};
        Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
            memory_info,
            input_tensor_val.data(),
            input_tensor_val.size(),
            input_shape.data(),
            input_shape.size()
        );

        std::vector<const char*> input_names = {input_name};
        std::vector<const char*> output_names = {output_name};
        std::vector<Ort::Value> output_tensors;
        {
            std::lock_guard<std::mutex> lock(run_mutex_);
            output_tensors = session_->Run(
                Ort::RunOptions{nullptr},
                input_names.data(),  &input_tensor, 1,
                output_names.data(), 1
            );
        }

        float* output_data = output_tensors[0].GetTensorMutableData<float>();
        auto output_shape = output_tensors[0].GetTensorTypeAndShapeInfo().GetShape();

        int num_boxes = static_cast<int>(output_shape.size()>=3 ? output_shape[2] : 0);
        int num_attrs = static_cast<int>(output_shape.size()>=2 ? output_shape[1] : 0);

        std::vector<RawDet> detect_results;
        if (num_attrs == 5) {          // single-class: [cx,cy,w,h,conf]
            for (int i = 0; i < num_boxes; ++i) {
                float conf = output_data[4 * num_boxes + i];
                if (conf >= conf_threshold) {
                    detect_results.push_back({output_data[i], output_data[num_boxes + i],
                                              output_data[2 * num_boxes + i], output_data[3 * num_boxes + i],
                                              conf, 0});
                }
            }
        } else if (num_attrs >= 6) {   // multi-class: [cx,cy,w,h] + class scores
            int num_classes = num_attrs - 4;
            for (int i = 0; i < num_boxes; ++i) {
                float best_score = 0.f; int best_cls = -1;
                for (int c = 0; c < num_classes; ++c) {
                    float score = output_data[(4 + c) * num_boxes + i];
                    if (score > best_score) { best_score = score; best_cls = c; }
                }
                if (best_score >= conf_threshold) {
                    detect_results.push_back({output_data[i], output_data[num_boxes + i],
                                              output_data[2 * num_boxes + i], output_data[3 * num_boxes + i],
                                              best_score, best_cls});
                }
            }
        } else {
            throw std::runtime_error("unexpected output attributes count: " + std::to_string(num_attrs));
        }
        return detect_results;
    }

    std::vector<Detection> OrtYoloDetector::detect(const cv::Mat& bgr, float conf_threshold) {
        if (bgr.empty()) return {};

        auto lb = letterbox(bgr, opt_.input_w, opt_.input_h);
        auto raw = infer(lb.img, conf_threshold);

        // letterbox space -> source pixels
        std::vector<Detection> dets;
        dets.reserve(raw.size());
        const float max_x = static_cast<float>(bgr.cols);
        const float max_y = static_cast<float>(bgr.rows);
        for (const auto& r : raw) {
            Detection d;
            d.x1 = std::clamp((r.cx - r.w * 0.5f - lb.dx) / lb.scale, 0.f, max_x);
            d.y1 = std::clamp((r.cy - r.h * 0.5f - lb.dy) / lb.scale, 0.f, max_y);
            d.x2 = std::clamp((r.cx + r.w * 0.5f - lb.dx) / lb.scale, 0.f, max_x);
            d.y2 = std::clamp((r.cy + r.h * 0.5f - lb.dy) / lb.scale, 0.f, max_y);
            d.conf = std::clamp(r.conf, 0.f, 1.f);
            d.cls_id = r.cls_id;
            d.label = labelFor(r.cls_id);
            dets.push_back(d);
        }

        const float nms_iou = std::max(0.f, std::min(1.f, opt_.nms_iou));
        if (!dets.empty() && nms_iou > 0.f) {
            dets = nmsClasswise(dets, nms_iou);
        }
        return dets;
    }

    // ============================ DetectorCache ============================

    namespace {
        std::mutex& cacheMutex() {
            static std::mutex m;
            return m;
        }
        std::map<std::string, std::shared_ptr<OrtYoloDetector>>& cacheMap() {
            static std::map<std::string, std::shared_ptr<OrtYoloDetector>> m;
            return m;
        }
    } // namespace

    std::shared_ptr<OrtYoloDetector> DetectorCache::get(const OrtYoloDetector::SessionOptions& opt) {
        std::lock_guard<std::mutex> lock(cacheMutex());
        auto& cache = cacheMap();
        auto it = cache.find(opt.model_path);
        if (it != cache.end()) return it->second;

        auto detector = std::make_shared<OrtYoloDetector>(opt);
        if (detector->isReady()) {
            cache.emplace(opt.model_path, detector);
        }
        return detector;
    }

    void DetectorCache::shutdown() {
        std::lock_guard<std::mutex> lock(cacheMutex());
        std::cout << "[DetectorCache] Releasing " << cacheMap().size() << " cached model(s)\n";
        cacheMap().clear();
    }

} // namespace slickwatch
