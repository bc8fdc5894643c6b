#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "CodecNegotiator.h"
#include "Config.h"
#include "Detector.h"
#include "FrameIO.h"
#include "FrameStore.h"
#include "Statistics.h"
#include "Types.h"

namespace slickwatch {

enum class SessionState {
    IDLE = 0,
    OPENED,
    RUNNING,
    COMPLETED,
    FAILED,
    CLOSED
};

inline std::string toString(SessionState s) {
    switch (s) {
        case SessionState::IDLE:      return "IDLE";
        case SessionState::OPENED:    return "OPENED";
        case SessionState::RUNNING:   return "RUNNING";
        case SessionState::COMPLETED: return "COMPLETED";
        case SessionState::FAILED:    return "FAILED";
        case SessionState::CLOSED:    return "CLOSED";
    }
    return "UNKNOWN";
}

struct SessionConfig {
    std::vector<std::string> codec_preference = CodecNegotiator::defaultPreference();
    float           conf_threshold = 0.25f;   // handed to the detector
    bool            retain_frames  = true;
    RetentionPolicy retention;
    double          fallback_fps   = 25.0;    // when the container reports none

    static SessionConfig fromAppConfig(const AppConfig& cfg, size_t max_retained);
};

struct SessionResult {
    std::string source_path;
    std::string output_path;
    std::string codec;
    int         width  = 0;
    int         height = 0;
    double      fps    = 0.0;
    int64_t     reported_frames = 0;            // container estimate

    StatisticsAggregate       stats;
    FrameStore                frames;
    std::vector<FrameSummary> history;
};

// frames_done counts decoded frames so far, total is the container estimate
using ProgressCallback = std::function<void(int64_t frames_done, int64_t total_frames)>;

/*  VideoProcessingSession: one run over one video
*
*   IDLE -> OPENED -> RUNNING -> {COMPLETED, FAILED} -> CLOSED
*
*   - single-threaded, run() returns when the loop is done
*   - per-frame detector failures are absorbed (frame written unannotated)
*   - decode/write failures and cancellation delete the partial output
*   - decoder and writer are released on every exit path
*/
class VideoProcessingSession {
public:
    VideoProcessingSession(Detector& detector,
                           const SessionConfig& cfg,
                           SourceFactory sources = openCvSourceFactory(),
                           SinkFactory sinks = openCvSinkFactory());
    ~VideoProcessingSession();

    VideoProcessingSession(const VideoProcessingSession&) = delete;
    VideoProcessingSession& operator=(const VideoProcessingSession&) = delete;

    // throws PipelineError (SourceUnreadable / NoCodecAvailable / ProcessingFailed)
    SessionResult run(const std::string& video_path,
                      const std::string& output_path,
                      const ProgressCallback& progress = {},
                      const std::atomic<bool>* cancel = nullptr);

    SessionState state() const;
    SessionState outcome() const;   // COMPLETED or FAILED once closed

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace slickwatch
