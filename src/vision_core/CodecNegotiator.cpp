#include "slickwatch/vision/CodecNegotiator.h"
#include "slickwatch/errors.hpp"

#include <filesystem>
#include <iostream>
#include <system_error>

namespace slickwatch {

namespace {

// a failed writer may still have created an empty container
void removePartial(const std::string& path) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::filesystem::remove(path, ec);
        if (ec) {
            std::cerr << "[CodecNegotiator] Failed to remove partial file " << path << ": " << ec.message() << "\n";
        }
    }
}

} // namespace

CodecNegotiator::CodecNegotiator(SinkFactory factory)
    : factory_(std::move(factory)) {}

std::vector<std::string> CodecNegotiator::defaultPreference() {
    return { "mp4v", "XVID", "MJPG", "X264" };
}

NegotiatedWriter CodecNegotiator::open(const std::vector<std::string>& preference,
                                       const std::string& output_path,
                                       int width, int height, double fps) const {
    std::string tried;
    for (const auto& codec : preference) {
        if (!tried.empty()) tried += ", ";
        tried += codec;

        if (fourccFromString(codec) < 0) {
            std::cerr << "[CodecNegotiator] Skipping invalid codec id \"" << codec << "\"\n";
            continue;
        }

        std::unique_ptr<VideoSink> sink = factory_ ? factory_() : nullptr;
        if (!sink) break;

        if (sink->open(output_path, codec, fps, cv::Size(width, height)) && sink->isOpened()) {
            std::cout << "[CodecNegotiator] Using codec " << codec << " for " << output_path
                      << " (" << width << "x" << height << " @ " << fps << " fps)\n";
            return NegotiatedWriter{std::move(sink), codec};
        }

        std::cerr << "[CodecNegotiator] Codec " << codec << " unavailable, trying next\n";
        sink->release();
        removePartial(output_path);
    }

    removePartial(output_path);
    throw PipelineError(ErrorKind::NoCodecAvailable, "codec_negotiation",
                        "no working encoder among [" + tried + "] for " + output_path);
}

} // namespace slickwatch
