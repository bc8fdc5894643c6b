#pragma once
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>

#include <set>
#include <string>

#include "RecordValue.h"

namespace slickwatch {

struct SerializerOptions {
    // top-level keys that carry pixel buffers and never reach an export
    std::set<std::string> elided_keys = {
        "original_frames", "annotated_frames", "original_frame", "annotated_frame"
    };
    int indent = 2;     // dumps(), -1 for compact
};

/*  SafeSerializer: RecordValue / json -> plain JSON tree
*
*   Output holds only null, bool, numbers, strings, arrays and objects.
*   - narrow numerics widen, non-finite floating point becomes null
*   - cv::Mat -> nested lists (rows x cols [x channels], N-d generalizes)
*   - cv::Scalar -> 4 numbers, cv::Point -> [x, y], cv::Rect -> {x, y, width, height}
*   - binary json payloads -> byte lists
*   - Opaque leaves throw PipelineError(UnsupportedSerializationType) with the key path
*   Applying it to its own output returns the same tree.
*/
class SafeSerializer {
public:
    explicit SafeSerializer(SerializerOptions opt = {});

    nlohmann::json toSafeTree(const RecordValue& root) const;
    nlohmann::json toSafeTree(const nlohmann::json& root) const;

    std::string dumps(const RecordValue& root) const;
    std::string dumps(const nlohmann::json& root) const;

    const SerializerOptions& options() const { return opt_; }

    static nlohmann::json matToList(const cv::Mat& m);

private:
    nlohmann::json convert(const RecordValue& v, const std::string& path) const;
    nlohmann::json convertJson(const nlohmann::json& v) const;

    SerializerOptions opt_;
};

} // namespace slickwatch
