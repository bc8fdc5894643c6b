#include "slickwatch/vision/ImageProcessor.h"
#include "slickwatch/vision/Annotator.h"

#include <algorithm>
#include <iostream>

namespace slickwatch {

ImageStats computeImageStats(const std::vector<Detection>& dets, cv::Size image_size) {
    ImageStats st;
    st.total_detections = static_cast<int>(dets.size());
    if (dets.empty()) return st;

    double sum = 0.0;
    st.min_confidence = dets.front().conf;
    st.max_confidence = dets.front().conf;
    for (const auto& d : dets) {
        sum += d.conf;
        st.min_confidence = std::min<double>(st.min_confidence, d.conf);
        st.max_confidence = std::max<double>(st.max_confidence, d.conf);
        st.total_area += d.area();
        st.largest_area = std::max<double>(st.largest_area, d.area());
    }
    st.avg_confidence = sum / static_cast<double>(dets.size());

    const double image_area = static_cast<double>(image_size.width) * image_size.height;
    if (image_area > 0.0) {
        st.coverage_percentage = std::min(100.0, st.total_area / image_area * 100.0);
    }
    return st;
}

ImageResult processImage(Detector& detector, const cv::Mat& bgr, float conf_threshold) {
    ImageResult res;
    if (bgr.empty()) {
        std::cerr << "[ImageProcessor] Empty image, nothing to detect\n";
        return res;
    }
    res.original = bgr;
    res.detections = detector.detect(bgr, conf_threshold);
    res.annotated = annotateFrame(bgr, res.detections);
    res.stats = computeImageStats(res.detections, bgr.size());

    std::cout << "[ImageProcessor] " << res.stats.total_detections << " detection(s), coverage "
              << res.stats.coverage_percentage << "%\n";
    return res;
}

} // namespace slickwatch
