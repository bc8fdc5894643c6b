#ifndef SLICKWATCH_ACTIVITY_STORE_H
#define SLICKWATCH_ACTIVITY_STORE_H

#include <SQLiteCpp/SQLiteCpp.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "RecordTypes.h"

namespace slickwatch {

/*  ActivityStore: append-only run log plus file archive under one record root
*
*   <root>/activity_log.db               activity_log + alerts tables
*   <root>/inputs/{images,videos}/       archived inputs
*   <root>/outputs/{images,videos,reports}/
*
*   Appends from every store instance in the process go through one mutex,
*   SQLite file locking covers other processes. Entry timestamps are in
*   microseconds and strictly increasing in append order.
*   Write failures throw PipelineError(ActivityStoreWriteError).
*/
class ActivityStore {
public:
    explicit ActivityStore(const std::string& record_root = "information_record",
                           const std::string& db_file = "activity_log.db");
    ~ActivityStore();

    ActivityStore(const ActivityStore&) = delete;
    ActivityStore& operator=(const ActivityStore&) = delete;

    // commits one row, returns it with id / ts_us / date columns filled
    ActivityLogEntry append(ActivityLogEntry entry);

    // copies into the archive as YYYYmmdd_HHMMSS_<stem><ext>, returns the stored path
    std::string archiveFile(ArchiveKind kind,
                            const std::string& source_path,
                            const std::string& original_name = "");
    std::string archiveBytes(ArchiveKind kind,
                             const std::vector<uint8_t>& bytes,
                             const std::string& name);
    std::string archiveBytes(ArchiveKind kind,
                             const std::string& bytes,
                             const std::string& name);

    std::vector<ActivityLogEntry> listEntries(const ActivityFilter& filter = ActivityFilter()) const;
    int64_t count() const;

    AlertRecord appendAlert(AlertRecord alert);
    std::vector<AlertRecord> listAlerts(int limit = 0) const;

    const std::string& recordRoot() const { return root_; }
    const std::string& dbPath() const { return db_path_; }

private:
    static std::mutex& storeMutex();

    void createLayout();
    bool createTables();
    std::string reserveArchivePath(ArchiveKind kind, const std::string& name);
    bool writeThenRename(const std::string& tmp_path, const std::string& final_path,
                         const char* data, size_t size);
    bool copyThenRename(const std::string& source_path, const std::string& tmp_path,
                        const std::string& final_path);

    std::string root_;
    std::string db_path_;
    std::unique_ptr<SQLite::Database> database_;
};

} // namespace slickwatch

#endif // SLICKWATCH_ACTIVITY_STORE_H
