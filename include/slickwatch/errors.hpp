#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace slickwatch {

// Failure taxonomy shared by the pipeline, the serializer and the activity store.
enum class ErrorKind {
    SourceUnreadable,               // fatal, nothing written yet
    NoCodecAvailable,               // fatal, no output file left behind
    ProcessingFailed,               // fatal mid-run, partial output deleted
    DetectorFrameError,             // recoverable, absorbed per frame
    UnsupportedSerializationType,   // fatal to the export being built
    ActivityStoreWriteError         // surfaced, artifacts untouched
};

inline std::string toString(ErrorKind k) {
    switch (k) {
        case ErrorKind::SourceUnreadable:             return "SourceUnreadable";
        case ErrorKind::NoCodecAvailable:             return "NoCodecAvailable";
        case ErrorKind::ProcessingFailed:             return "ProcessingFailed";
        case ErrorKind::DetectorFrameError:           return "DetectorFrameError";
        case ErrorKind::UnsupportedSerializationType: return "UnsupportedSerializationType";
        case ErrorKind::ActivityStoreWriteError:      return "ActivityStoreWriteError";
    }
    return "Unknown";
}

class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind,
                  const std::string& stage,
                  const std::string& detail,
                  int64_t frame_index = -1)
        : std::runtime_error(compose(kind, stage, detail, frame_index)),
          kind_(kind), stage_(stage), detail_(detail), frame_index_(frame_index) {}

    ErrorKind kind() const { return kind_; }
    const std::string& stage() const { return stage_; }
    const std::string& detail() const { return detail_; }
    int64_t frameIndex() const { return frame_index_; }   // -1 when not frame related

private:
    static std::string compose(ErrorKind kind, const std::string& stage,
                               const std::string& detail, int64_t frame_index) {
        std::string msg = toString(kind) + " [" + stage + "]";
        if (frame_index >= 0) msg += " at frame " + std::to_string(frame_index);
        if (!detail.empty()) msg += ": " + detail;
        return msg;
    }

    ErrorKind kind_;
    std::string stage_;
    std::string detail_;
    int64_t frame_index_;
};

} // namespace slickwatch
