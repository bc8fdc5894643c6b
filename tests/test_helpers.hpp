#pragma once
#include "slickwatch/vision/Detector.h"
#include "slickwatch/vision/FrameIO.h"
#include "slickwatch/vision/Types.h"

#include <opencv2/core.hpp>

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace slickwatch {
namespace testing {

inline void print_test_result(const std::string& test_name, bool success) {
    std::cout << (success ? "[✅] " : "[❌] ") << test_name << std::endl;
}

inline bool near(double a, double b, double eps = 1e-6) { return std::fabs(a - b) <= eps; }

// fresh empty directory under the system temp dir
inline std::filesystem::path makeTempDir(const std::string& name) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto dir = std::filesystem::temp_directory_path() / ("slickwatch_" + name + "_" + std::to_string(stamp));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

inline void writeFile(const std::filesystem::path& p, const std::string& body) {
    std::ofstream out(p, std::ios::binary);
    out << body;
}

inline std::string readFile(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline Detection makeDetection(float conf, float x1 = 4.f, float y1 = 4.f, float x2 = 20.f, float y2 = 16.f) {
    Detection d;
    d.x1 = x1; d.y1 = y1; d.x2 = x2; d.y2 = y2;
    d.conf = conf;
    d.cls_id = 0;
    d.label = "oil_spill";
    return d;
}

// ======================= Detector =======================

// Answers by call order: call i gets script[i] (empty when absent), throws on calls in throw_on.
// Calls in throw_foreign_on throw an int, like a backend that does not use std::exception.
class ScriptedDetector : public Detector {
public:
    std::map<int, std::vector<Detection>> script;
    std::set<int> throw_on;
    std::set<int> throw_foreign_on;
    int calls = 0;

    std::vector<Detection> detect(const cv::Mat& bgr, float conf_threshold) override {
        const int i = calls++;
        if (bgr.empty()) throw std::runtime_error("empty frame");
        if (throw_on.count(i)) throw std::runtime_error("scripted detector failure at call " + std::to_string(i));
        if (throw_foreign_on.count(i)) throw 42;
        std::vector<Detection> out;
        auto it = script.find(i);
        if (it == script.end()) return out;
        for (const auto& d : it->second) if (d.conf >= conf_threshold) out.push_back(d);
        return out;
    }
};

// ======================= FrameSource =======================

struct SourceScript {
    bool     open_ok = true;
    int      frames = 5;                 // frames actually decodable
    int64_t  reported = -1;              // frameCount(), -1 = same as frames
    double   fps = 10.0;
    cv::Size size = cv::Size(64, 48);
    int      error_at = -1;              // read() returns ERROR at this index
};

struct SourceLog {
    int opens = 0;
    int reads = 0;
    int releases = 0;
};

class FakeFrameSource : public FrameSource {
public:
    FakeFrameSource(SourceScript s, std::shared_ptr<SourceLog> log) : s_(s), log_(std::move(log)) {}

    bool open(const std::string&) override { ++log_->opens; return s_.open_ok; }
    ReadStatus read(cv::Mat& bgr) override {
        ++log_->reads;
        if (next_ == s_.error_at) return ReadStatus::ERROR;
        if (next_ >= s_.frames) return ReadStatus::END;
        bgr = cv::Mat(s_.size, CV_8UC3, cv::Scalar(next_ * 10 % 255, 80, 160));
        ++next_;
        return ReadStatus::OK;
    }
    int64_t frameCount() const override { return s_.reported < 0 ? s_.frames : s_.reported; }
    double fps() const override { return s_.fps; }
    cv::Size frameSize() const override { return s_.size; }
    void release() override { ++log_->releases; }

private:
    SourceScript s_;
    std::shared_ptr<SourceLog> log_;
    int next_ = 0;
};

inline SourceFactory fakeSourceFactory(SourceScript s, std::shared_ptr<SourceLog> log) {
    return [s, log]() { return std::unique_ptr<FrameSource>(new FakeFrameSource(s, log)); };
}

// ======================= VideoSink =======================

struct SinkScript {
    std::set<std::string> working_codecs = { "mp4v" };
    int fail_write_at = -1;              // write() returns false at this frame
    int throw_foreign_at = -1;           // write() throws an int at this frame
};

struct SinkLog {
    std::vector<std::string> attempted;
    std::string opened_codec;
    int writes = 0;
    int releases = 0;
};

// Creates the container file on every open, like a real writer probing a codec.
class FakeVideoSink : public VideoSink {
public:
    FakeVideoSink(SinkScript s, std::shared_ptr<SinkLog> log) : s_(s), log_(std::move(log)) {}

    bool open(const std::string& path, const std::string& codec, double, cv::Size) override {
        log_->attempted.push_back(codec);
        writeFile(path, "container-header");
        opened_ = s_.working_codecs.count(codec) > 0;
        if (opened_) log_->opened_codec = codec;
        return opened_;
    }
    bool isOpened() const override { return opened_; }
    bool write(const cv::Mat& bgr) override {
        if (!opened_ || bgr.empty()) return false;
        if (log_->writes == s_.fail_write_at) return false;
        if (log_->writes == s_.throw_foreign_at) throw 7;
        ++log_->writes;
        return true;
    }
    void release() override { opened_ = false; ++log_->releases; }

private:
    SinkScript s_;
    std::shared_ptr<SinkLog> log_;
    bool opened_ = false;
};

inline SinkFactory fakeSinkFactory(SinkScript s, std::shared_ptr<SinkLog> log) {
    return [s, log]() { return std::unique_ptr<VideoSink>(new FakeVideoSink(s, log)); };
}

} // namespace testing
} // namespace slickwatch
