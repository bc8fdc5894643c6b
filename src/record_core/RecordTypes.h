#ifndef SLICKWATCH_RECORD_TYPES_H
#define SLICKWATCH_RECORD_TYPES_H

#include <cstdint>
#include <string>

namespace slickwatch {

namespace ActionTypes {
    const std::string IMAGE_DETECTION = "Image Detection";
    const std::string VIDEO_DETECTION = "Video Detection";
    const std::string REPORT_PREFIX   = "Report Generation - ";
    const std::string FAILED_PREFIX   = "Failed Run - ";
    const std::string COMPARE_PREFIX  = "Comparison Mode - ";
} // namespace ActionTypes

// archive buckets under the record root
enum class ArchiveKind {
    INPUT_IMAGE,
    INPUT_VIDEO,
    OUTPUT_IMAGE,
    OUTPUT_VIDEO,
    OUTPUT_REPORT
};

std::string archiveSubdir(ArchiveKind kind);   // e.g. "inputs/images"

// Row of activity_log. id, ts_us and the date/time columns are assigned on append.
struct ActivityLogEntry {
    int64_t     id    = 0;
    int64_t     ts_us = 0;
    std::string date;                // YYYY-mm-dd
    std::string time;                // HH:MM:SS
    std::string day;                 // weekday name
    std::string action_type;
    std::string input_file;
    std::string output_file;         // empty when there is none
    std::string original_filename;
    int64_t     total_detections = 0;
    std::string avg_confidence      = "0.0000";
    std::string coverage_percentage = "0.00%";
    std::string detection_details   = "[]";    // serialized JSON
    std::string statistics          = "{}";    // serialized JSON
    std::string timestamp;           // YYYY-mm-dd HH:MM:SS
};

struct ActivityFilter {
    std::string action_type;         // exact, empty = any
    std::string action_prefix;       // e.g. "Report Generation - ", empty = any
    std::string date_from;           // YYYY-mm-dd inclusive, empty = open
    std::string date_to;             // YYYY-mm-dd inclusive, empty = open
    std::string filename_contains;   // substring of Original_Filename
    int         limit = 0;           // most recent N, 0 = all
};

struct AlertRecord {
    int64_t     alert_id = 0;
    std::string severity;
    std::string message;
    int64_t     total_detections    = 0;
    double      avg_confidence      = 0.0;
    double      coverage_percentage = 0.0;
    std::string timestamp;
    int64_t     entry_id = 0;        // activity_log row that raised it
};

} // namespace slickwatch

#endif // SLICKWATCH_RECORD_TYPES_H
