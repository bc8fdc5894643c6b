#include "slickwatch/vision/FrameIO.h"

#include <iostream>

namespace slickwatch {

int fourccFromString(const std::string& codec) {
    if (codec.size() != 4) return -1;
    return cv::VideoWriter::fourcc(codec[0], codec[1], codec[2], codec[3]);
}

// ============================ OpenCvFrameSource ============================

bool OpenCvFrameSource::open(const std::string& path) {
    release();
    try {
        if (!cap_.open(path)) {
            std::cerr << "[FrameSource] Failed to open video: " << path << "\n";
            return false;
        }
    } catch (const cv::Exception& ex) {
        std::cerr << "[FrameSource] OpenCV error opening " << path << ": " << ex.what() << "\n";
        return false;
    }
    frame_count_ = static_cast<int64_t>(cap_.get(cv::CAP_PROP_FRAME_COUNT));
    if (frame_count_ < 0) frame_count_ = 0;
    fps_ = cap_.get(cv::CAP_PROP_FPS);
    size_ = cv::Size(static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_WIDTH)),
                     static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_HEIGHT)));
    return true;
}

ReadStatus OpenCvFrameSource::read(cv::Mat& bgr) {
    if (!cap_.isOpened()) return ReadStatus::ERROR;
    try {
        if (!cap_.read(bgr)) return ReadStatus::END;   // frame counts are estimates, a short read ends the stream
    } catch (const cv::Exception& ex) {
        std::cerr << "[FrameSource] Decode error: " << ex.what() << "\n";
        return ReadStatus::ERROR;
    }
    return bgr.empty() ? ReadStatus::ERROR : ReadStatus::OK;
}

void OpenCvFrameSource::release() {
    if (cap_.isOpened()) cap_.release();
}

// ============================ OpenCvVideoSink ============================

bool OpenCvVideoSink::open(const std::string& path, const std::string& codec, double fps, cv::Size size) {
    release();
    const int fourcc = fourccFromString(codec);
    if (fourcc < 0) return false;
    try {
        writer_.open(path, fourcc, fps, size);
    } catch (const cv::Exception& ex) {
        std::cerr << "[VideoSink] OpenCV error opening writer (" << codec << "): " << ex.what() << "\n";
        writer_.release();
        return false;
    }
    size_ = size;
    return writer_.isOpened();
}

bool OpenCvVideoSink::write(const cv::Mat& bgr) {
    if (!writer_.isOpened() || bgr.empty() || bgr.size() != size_) return false;
    try {
        writer_.write(bgr);
    } catch (const cv::Exception& ex) {
        std::cerr << "[VideoSink] Write error: " << ex.what() << "\n";
        return false;
    }
    return true;
}

void OpenCvVideoSink::release() {
    if (writer_.isOpened()) writer_.release();
}

SourceFactory openCvSourceFactory() {
    return [] { return std::unique_ptr<FrameSource>(new OpenCvFrameSource()); };
}

SinkFactory openCvSinkFactory() {
    return [] { return std::unique_ptr<VideoSink>(new OpenCvVideoSink()); };
}

} // namespace slickwatch
