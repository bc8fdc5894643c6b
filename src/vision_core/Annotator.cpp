#include "slickwatch/vision/Annotator.h"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cstdio>
#include <string>

namespace slickwatch {

namespace {

const cv::Scalar kBoxColor(0, 0, 255);        // red on BGR
const cv::Scalar kTextColor(255, 255, 255);

void drawLabel(cv::Mat& img, const cv::Rect& box, const std::string& text) {
    int baseline = 0;
    const double scale = 0.5;
    cv::Size ts = cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, scale, 1, &baseline);
    int top = std::max(box.y - ts.height - baseline - 4, 0);
    cv::Rect bg(box.x, top, ts.width + 6, ts.height + baseline + 4);
    bg &= cv::Rect(0, 0, img.cols, img.rows);
    if (bg.area() <= 0) return;
    cv::rectangle(img, bg, kBoxColor, cv::FILLED);
    cv::putText(img, text, cv::Point(bg.x + 3, bg.y + ts.height + 2),
                cv::FONT_HERSHEY_SIMPLEX, scale, kTextColor, 1, cv::LINE_AA);
}

} // namespace

cv::Mat annotateFrame(const cv::Mat& bgr, const std::vector<Detection>& dets) {
    cv::Mat draw = bgr.clone();
    if (draw.empty()) return draw;

    const int thickness = std::max(2, std::min(draw.cols, draw.rows) / 320);
    for (const auto& d : dets) {
        cv::Rect r = d.rect() & cv::Rect(0, 0, draw.cols, draw.rows);
        if (r.area() <= 0) continue;
        cv::rectangle(draw, r, kBoxColor, thickness);

        char buf[96];
        std::snprintf(buf, sizeof(buf), "%s %.2f", d.label.empty() ? "object" : d.label.c_str(), d.conf);
        drawLabel(draw, r, buf);
    }
    return draw;
}

cv::Mat composeComparison(const FrameRecord& rec, int max_width) {
    if (rec.original.empty() || rec.annotated.empty()) return {};

    cv::Mat right = rec.annotated;
    if (right.size() != rec.original.size()) {
        cv::resize(rec.annotated, right, rec.original.size());
    }
    cv::Mat pair;
    cv::hconcat(rec.original, right, pair);

    if (max_width > 0 && pair.cols > max_width) {
        double f = static_cast<double>(max_width) / pair.cols;
        cv::resize(pair, pair, cv::Size(), f, f, cv::INTER_AREA);
    }

    const int strip_h = 36;
    cv::Mat page(pair.rows + strip_h, pair.cols, pair.type(), cv::Scalar(255, 255, 255));
    pair.copyTo(page(cv::Rect(0, 0, pair.cols, pair.rows)));

    char caption[160];
    std::snprintf(caption, sizeof(caption), "Frame %lld  |  %zu detection(s)  |  avg confidence %.2f%%",
                  static_cast<long long>(rec.frame_index + 1), rec.detections.size(), rec.avg_conf * 100.0);
    cv::putText(page, caption, cv::Point(10, pair.rows + 24),
                cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(40, 40, 40), 1, cv::LINE_AA);
    return page;
}

} // namespace slickwatch
