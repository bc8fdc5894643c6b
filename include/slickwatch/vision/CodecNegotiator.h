#pragma once
#include <opencv2/core.hpp>
#include <memory>
#include <string>
#include <vector>

#include "FrameIO.h"

namespace slickwatch {

struct NegotiatedWriter {
    std::unique_ptr<VideoSink> sink;
    std::string codec;              // the candidate that opened
};

// Opens the first codec of an ordered preference list that yields a working
// writer. Encoder availability differs between hosts, so no single codec is
// assumed.
class CodecNegotiator {
public:
    explicit CodecNegotiator(SinkFactory factory);

    // Throws PipelineError(NoCodecAvailable) when every candidate fails; in
    // that case nothing is left at output_path.
    NegotiatedWriter open(const std::vector<std::string>& preference,
                          const std::string& output_path,
                          int width, int height, double fps) const;

    static std::vector<std::string> defaultPreference();

private:
    SinkFactory factory_;
};

} // namespace slickwatch
