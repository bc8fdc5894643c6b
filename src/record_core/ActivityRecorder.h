#ifndef SLICKWATCH_ACTIVITY_RECORDER_H
#define SLICKWATCH_ACTIVITY_RECORDER_H

#include <optional>
#include <string>
#include <vector>

#include "ActivityStore.h"
#include "RecordTypes.h"
#include "slickwatch/errors.hpp"
#include "slickwatch/report/AlertPolicy.h"
#include "slickwatch/report/SafeSerializer.h"
#include "slickwatch/vision/ImageProcessor.h"
#include "slickwatch/vision/VideoSession.h"

namespace slickwatch {

// What a log call produced. alert is set when the run crossed a severity threshold
// and the alert row was stored; a failed alert insert is logged and leaves it unset.
struct RecordOutcome {
    ActivityLogEntry           entry;
    std::optional<AlertRecord> alert;
};

/*  ActivityRecorder: archive + serialize + append for one finished run
*
*   Order is serialize, archive, append. A serialization failure leaves the
*   store and the archive untouched; an append failure leaves archived files
*   in place and propagates PipelineError(ActivityStoreWriteError).
*/
class ActivityRecorder {
public:
    explicit ActivityRecorder(ActivityStore& store,
                              AlertPolicy policy = AlertPolicy(),
                              SerializerOptions opt = SerializerOptions());

    RecordOutcome logVideoDetection(const std::string& input_path,
                                    const std::string& output_path,   // may be empty
                                    const SessionResult& result,
                                    const std::string& original_name = "");

    RecordOutcome logImageDetection(const std::string& input_path,
                                    const ImageResult& result,
                                    const std::string& original_name = "",
                                    int jpg_quality = 90);

    // report_type: "TXT", "CSV", "JSON", "PAGES", ...
    ActivityLogEntry logReportGeneration(const std::string& report_type,
                                         const std::string& report_bytes,
                                         const std::string& extension,
                                         const std::string& original_name = "",
                                         const std::string& associated_action = "");

    // comparison_type: "Before/After", "Multiple", "Threshold", ...
    // files are archived as input images, results may be any record tree
    ActivityLogEntry logComparison(const std::string& comparison_type,
                                   const std::vector<std::string>& files,
                                   const RecordValue& results);

    ActivityLogEntry logFailedRun(const std::string& action_type,
                                  const std::string& input_path,
                                  const PipelineError& error,
                                  const std::string& original_name = "");

private:
    std::optional<AlertRecord> raiseAlert(const ActivityLogEntry& entry,
                                          int64_t detections, double avg_conf, double coverage);

    ActivityStore& store_;
    AlertPolicy policy_;
    SafeSerializer serializer_;
};

} // namespace slickwatch

#endif // SLICKWATCH_ACTIVITY_RECORDER_H
