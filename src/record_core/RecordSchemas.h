#ifndef SLICKWATCH_RECORD_SCHEMAS_H
#define SLICKWATCH_RECORD_SCHEMAS_H

#include <string>

namespace slickwatch {
namespace RecordSchemas {
    // one row per completed or failed run, never updated
    const std::string CREATE_ACTIVITY_LOG_TABLE = R"(
        CREATE TABLE IF NOT EXISTS activity_log (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            ts_us INTEGER NOT NULL UNIQUE,
            Date TEXT NOT NULL,
            Time TEXT NOT NULL,
            Day TEXT NOT NULL,
            Action_Type TEXT NOT NULL,
            Input_File TEXT,
            Output_File TEXT,
            Original_Filename TEXT,
            Total_Detections INTEGER DEFAULT 0,
            Avg_Confidence TEXT,
            Coverage_Percentage TEXT,
            Detection_Details TEXT DEFAULT '[]',
            Statistics TEXT DEFAULT '{}',
            Timestamp TEXT NOT NULL
        );
    )";

    const std::string CREATE_ALERTS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS alerts (
            alert_id INTEGER PRIMARY KEY AUTOINCREMENT,
            severity TEXT NOT NULL CHECK(severity IN ('info', 'low', 'medium', 'high', 'critical')),
            message TEXT NOT NULL,
            total_detections INTEGER DEFAULT 0,
            avg_confidence REAL DEFAULT 0,
            coverage_percentage REAL DEFAULT 0,
            timestamp TEXT NOT NULL,
            entry_id INTEGER,
            FOREIGN KEY (entry_id) REFERENCES activity_log(id)
        );
    )";

    const std::string CREATE_INDEXES = R"(
        CREATE INDEX IF NOT EXISTS idx_activity_date ON activity_log(Date);
        CREATE INDEX IF NOT EXISTS idx_activity_action ON activity_log(Action_Type);
        CREATE INDEX IF NOT EXISTS idx_alerts_entry ON alerts(entry_id);
    )";
} // namespace RecordSchemas
} // namespace slickwatch

#endif // SLICKWATCH_RECORD_SCHEMAS_H
