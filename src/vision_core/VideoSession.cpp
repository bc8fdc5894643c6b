#include "slickwatch/vision/VideoSession.h"
#include "slickwatch/vision/Annotator.h"
#include "slickwatch/errors.hpp"

#include <opencv2/imgproc.hpp>

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace slickwatch {

SessionConfig SessionConfig::fromAppConfig(const AppConfig& cfg, size_t max_retained) {
    SessionConfig sc;
    if (!cfg.codec_preference.empty()) sc.codec_preference = cfg.codec_preference;
    sc.conf_threshold = cfg.conf_threshold;
    sc.retain_frames = cfg.retain_frames;
    sc.retention.max_retained_frames = max_retained;
    return sc;
}

struct VideoProcessingSession::Impl {
    Detector& detector;
    SessionConfig cfg;
    SourceFactory sources;
    SinkFactory sinks;

    SessionState state = SessionState::IDLE;
    SessionState outcome = SessionState::IDLE;

    std::unique_ptr<FrameSource> source;
    std::unique_ptr<VideoSink> sink;
    std::string output_path;

    Impl(Detector& d, const SessionConfig& c, SourceFactory s, SinkFactory k)
        : detector(d), cfg(c), sources(std::move(s)), sinks(std::move(k)) {}

    // release decoder + writer, remember the terminal state
    void close(SessionState terminal) {
        if (sink) { sink->release(); sink.reset(); }
        if (source) { source->release(); source.reset(); }
        outcome = terminal;
        state = SessionState::CLOSED;
    }

    void discardOutput() {
        if (sink) { sink->release(); sink.reset(); }
        if (output_path.empty()) return;
        std::error_code ec;
        if (fs::exists(output_path, ec)) {
            fs::remove(output_path, ec);
            if (ec) {
                std::cerr << "[VideoSession] Failed to delete partial output " << output_path << ": " << ec.message() << "\n";
            } else {
                std::cout << "[VideoSession] Partial output deleted: " << output_path << "\n";
            }
        }
    }

    static bool samePath(const std::string& a, const std::string& b) {
        std::error_code ec1, ec2;
        auto ca = fs::weakly_canonical(a, ec1);
        auto cb = fs::weakly_canonical(b, ec2);
        if (ec1 || ec2) return a == b;
        return ca == cb;
    }
};

VideoProcessingSession::VideoProcessingSession(Detector& detector,
                                               const SessionConfig& cfg,
                                               SourceFactory sources,
                                               SinkFactory sinks)
    : impl_(new Impl(detector, cfg, std::move(sources), std::move(sinks))) {}

VideoProcessingSession::~VideoProcessingSession() = default;

SessionState VideoProcessingSession::state() const { return impl_->state; }
SessionState VideoProcessingSession::outcome() const { return impl_->outcome; }

SessionResult VideoProcessingSession::run(const std::string& video_path,
                                          const std::string& output_path,
                                          const ProgressCallback& progress,
                                          const std::atomic<bool>* cancel) {
    Impl& s = *impl_;
    if (s.state != SessionState::IDLE) {
        throw std::logic_error("VideoProcessingSession::run called twice");
    }
    if (Impl::samePath(video_path, output_path)) {
        s.close(SessionState::FAILED);
        throw PipelineError(ErrorKind::ProcessingFailed, "setup",
                            "output path must differ from the input video: " + output_path);
    }

    SessionResult result;
    result.source_path = video_path;
    result.output_path = output_path;
    result.frames = FrameStore(s.cfg.retention);

    // ======== IDLE -> OPENED ========
    s.source = s.sources ? s.sources() : nullptr;
    if (!s.source || !s.source->open(video_path)) {
        s.close(SessionState::FAILED);
        throw PipelineError(ErrorKind::SourceUnreadable, "open", "cannot open video: " + video_path);
    }
    result.reported_frames = s.source->frameCount();
    const cv::Size size = s.source->frameSize();
    if (result.reported_frames <= 0 || size.width <= 0 || size.height <= 0) {
        s.close(SessionState::FAILED);
        throw PipelineError(ErrorKind::SourceUnreadable, "open",
                            "video reports no frames or no resolution: " + video_path);
    }
    result.width = size.width;
    result.height = size.height;
    result.fps = s.source->fps() > 0.0 ? s.source->fps() : s.cfg.fallback_fps;
    s.state = SessionState::OPENED;

    std::cout << "[VideoSession] Opened " << video_path << ": " << result.width << "x" << result.height
              << " @ " << result.fps << " fps, ~" << result.reported_frames << " frames\n";

    // ======== OPENED -> RUNNING ========
    {
        std::error_code ec;
        auto parent = fs::path(output_path).parent_path();
        if (!parent.empty()) fs::create_directories(parent, ec);
    }
    try {
        CodecNegotiator negotiator(s.sinks);
        NegotiatedWriter writer = negotiator.open(s.cfg.codec_preference, output_path,
                                                  result.width, result.height, result.fps);
        s.sink = std::move(writer.sink);
        result.codec = writer.codec;
    } catch (...) {
        s.close(SessionState::FAILED);
        throw;
    }
    s.output_path = output_path;
    s.state = SessionState::RUNNING;

    // ======== RUNNING ========
    StatisticsAggregator aggregator;
    int64_t idx = 0;
    try {
        for (;;) {
            if (cancel && cancel->load()) {
                throw PipelineError(ErrorKind::ProcessingFailed, "cancelled",
                                    "run cancelled by caller", idx);
            }

            cv::Mat bgr;    // fresh buffer each frame, retained records keep theirs
            const ReadStatus rs = s.source->read(bgr);
            if (rs == ReadStatus::END) break;
            if (rs == ReadStatus::ERROR) {
                throw PipelineError(ErrorKind::ProcessingFailed, "decode", "source decode failure", idx);
            }
            if (bgr.size() != size) {
                cv::Mat fitted;
                cv::resize(bgr, fitted, size);
                bgr = fitted;
            }

            // detector failure on one frame is not fatal
            std::vector<Detection> dets;
            try {
                dets = s.detector.detect(bgr, s.cfg.conf_threshold);
            } catch (const std::exception& ex) {
                std::cerr << "[VideoSession] " << toString(ErrorKind::DetectorFrameError)
                          << " at frame " << idx << ": " << ex.what() << " (frame kept unannotated)\n";
                aggregator.noteDetectorError();
                dets.clear();
            } catch (...) {
                std::cerr << "[VideoSession] " << toString(ErrorKind::DetectorFrameError)
                          << " at frame " << idx << ": unknown error (frame kept unannotated)\n";
                aggregator.noteDetectorError();
                dets.clear();
            }

            cv::Mat annotated = dets.empty() ? bgr : annotateFrame(bgr, dets);
            if (!s.sink->write(annotated)) {
                throw PipelineError(ErrorKind::ProcessingFailed, "write", "output writer rejected frame", idx);
            }

            FrameRecord rec;
            rec.frame_index = idx;
            rec.original = bgr;
            rec.annotated = annotated;
            rec.avg_conf = averageConfidence(dets);
            rec.detections = std::move(dets);

            aggregator.update(rec);
            if (s.cfg.retain_frames && result.frames.accepts(rec.frame_index, rec.hasDetection())) {
                result.frames.offer(std::move(rec));
            }

            ++idx;
            if (progress) progress(idx, result.reported_frames);
            if (idx % 50 == 0) {
                std::cout << "[VideoSession] Processed " << idx << "/" << result.reported_frames << " frames\n";
            }
        }

        if (idx == 0) {
            throw PipelineError(ErrorKind::SourceUnreadable, "decode", "video yielded no decodable frame: " + video_path);
        }
    } catch (const PipelineError& err) {
        std::cerr << "[VideoSession] Run failed: " << err.what() << "\n";
        s.discardOutput();
        s.close(SessionState::FAILED);
        throw;
    } catch (const std::exception& ex) {
        std::cerr << "[VideoSession] Run failed at frame " << idx << ": " << ex.what() << "\n";
        s.discardOutput();
        s.close(SessionState::FAILED);
        throw PipelineError(ErrorKind::ProcessingFailed, "running", ex.what(), idx);
    } catch (...) {
        std::cerr << "[VideoSession] Run failed at frame " << idx << ": unknown error\n";
        s.discardOutput();
        s.close(SessionState::FAILED);
        throw PipelineError(ErrorKind::ProcessingFailed, "running", "unknown error", idx);
    }

    // ======== RUNNING -> COMPLETED ========
    s.sink->release();
    result.stats = aggregator.finalize();
    result.history = aggregator.history();
    s.state = SessionState::COMPLETED;

    std::cout << "[VideoSession] Completed " << video_path << " -> " << output_path
              << " (" << result.stats.total_frames << " frames, "
              << result.stats.frames_with_detections << " with detections, "
              << result.stats.total_detections << " detections, codec " << result.codec << ")\n";

    s.close(SessionState::COMPLETED);
    return result;
}

} // namespace slickwatch
