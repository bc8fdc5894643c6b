#pragma once
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace slickwatch {

enum class ReadStatus {
    OK = 0,
    END,        // container exhausted
    ERROR       // decode failure
};

// Decoder seam of the video session
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual bool open(const std::string& path) = 0;
    virtual ReadStatus read(cv::Mat& bgr) = 0;   // bgr must be a fresh Mat per call
    virtual int64_t frameCount() const = 0;      // container estimate, 0 if unknown
    virtual double fps() const = 0;
    virtual cv::Size frameSize() const = 0;
    virtual void release() = 0;
};

// Encoder seam of the video session
class VideoSink {
public:
    virtual ~VideoSink() = default;

    virtual bool open(const std::string& path, const std::string& codec, double fps, cv::Size size) = 0;
    virtual bool isOpened() const = 0;
    virtual bool write(const cv::Mat& bgr) = 0;
    virtual void release() = 0;
};

using SourceFactory = std::function<std::unique_ptr<FrameSource>()>;
using SinkFactory   = std::function<std::unique_ptr<VideoSink>()>;

// "mp4v" -> cv::VideoWriter::fourcc('m','p','4','v'); -1 when not 4 chars
int fourccFromString(const std::string& codec);

// ======================= OpenCV backed defaults =======================

class OpenCvFrameSource : public FrameSource {
public:
    OpenCvFrameSource() = default;
    ~OpenCvFrameSource() override { release(); }

    bool open(const std::string& path) override;
    ReadStatus read(cv::Mat& bgr) override;
    int64_t frameCount() const override { return frame_count_; }
    double fps() const override { return fps_; }
    cv::Size frameSize() const override { return size_; }
    void release() override;

private:
    cv::VideoCapture cap_;
    int64_t frame_count_ = 0;
    double fps_ = 0.0;
    cv::Size size_;
};

class OpenCvVideoSink : public VideoSink {
public:
    OpenCvVideoSink() = default;
    ~OpenCvVideoSink() override { release(); }

    bool open(const std::string& path, const std::string& codec, double fps, cv::Size size) override;
    bool isOpened() const override { return writer_.isOpened(); }
    bool write(const cv::Mat& bgr) override;
    void release() override;

private:
    cv::VideoWriter writer_;
    cv::Size size_;
};

SourceFactory openCvSourceFactory();
SinkFactory   openCvSinkFactory();

} // namespace slickwatch
