#include "ActivityStore.h"
#include "RecordSchemas.h"
#include "TimeUtils.h"
#include "slickwatch/errors.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace slickwatch {

std::string archiveSubdir(ArchiveKind kind) {
    switch (kind) {
        case ArchiveKind::INPUT_IMAGE:   return "inputs/images";
        case ArchiveKind::INPUT_VIDEO:   return "inputs/videos";
        case ArchiveKind::OUTPUT_IMAGE:  return "outputs/images";
        case ArchiveKind::OUTPUT_VIDEO:  return "outputs/videos";
        case ArchiveKind::OUTPUT_REPORT: return "outputs/reports";
    }
    return "outputs/reports";
}

namespace {

const char* kEntryColumns =
    "id, ts_us, Date, Time, Day, Action_Type, Input_File, Output_File, Original_Filename, "
    "Total_Detections, Avg_Confidence, Coverage_Percentage, Detection_Details, Statistics, Timestamp";

std::string textOf(const SQLite::Column& c) {
    return c.isNull() ? std::string() : c.getString();
}

ActivityLogEntry rowToEntry(SQLite::Statement& q) {
    ActivityLogEntry e;
    e.id                  = q.getColumn(0).getInt64();
    e.ts_us               = q.getColumn(1).getInt64();
    e.date                = textOf(q.getColumn(2));
    e.time                = textOf(q.getColumn(3));
    e.day                 = textOf(q.getColumn(4));
    e.action_type         = textOf(q.getColumn(5));
    e.input_file          = textOf(q.getColumn(6));
    e.output_file         = textOf(q.getColumn(7));
    e.original_filename   = textOf(q.getColumn(8));
    e.total_detections    = q.getColumn(9).getInt64();
    e.avg_confidence      = textOf(q.getColumn(10));
    e.coverage_percentage = textOf(q.getColumn(11));
    e.detection_details   = textOf(q.getColumn(12));
    e.statistics          = textOf(q.getColumn(13));
    e.timestamp           = textOf(q.getColumn(14));
    return e;
}

void bindText(SQLite::Statement& q, int idx, const std::string& v) {
    if (v.empty()) q.bind(idx);     // NULL
    else q.bind(idx, v);
}

} // namespace

std::mutex& ActivityStore::storeMutex() {
    static std::mutex m;
    return m;
}

ActivityStore::ActivityStore(const std::string& record_root, const std::string& db_file)
    : root_(record_root), db_path_((fs::path(record_root) / db_file).string()) {
    std::lock_guard<std::mutex> lock(storeMutex());
    try {
        createLayout();
        database_ = std::make_unique<SQLite::Database>(db_path_, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);
        database_->setBusyTimeout(5000);
        std::cout << "[ActivityStore] Database opened: " << db_path_ << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[ActivityStore] Failed to open " << db_path_ << ": " << e.what() << "\n";
        throw PipelineError(ErrorKind::ActivityStoreWriteError, "open", e.what());
    }
    if (!createTables()) {
        throw PipelineError(ErrorKind::ActivityStoreWriteError, "open", "table creation failed: " + db_path_);
    }
}

ActivityStore::~ActivityStore() = default;

void ActivityStore::createLayout() {
    const ArchiveKind kinds[] = {ArchiveKind::INPUT_IMAGE, ArchiveKind::INPUT_VIDEO,
                                 ArchiveKind::OUTPUT_IMAGE, ArchiveKind::OUTPUT_VIDEO,
                                 ArchiveKind::OUTPUT_REPORT};
    for (ArchiveKind k : kinds) {
        fs::create_directories(fs::path(root_) / archiveSubdir(k));    // throws on failure
    }
}

bool ActivityStore::createTables() {
    try {
        database_->exec(RecordSchemas::CREATE_ACTIVITY_LOG_TABLE);
        database_->exec(RecordSchemas::CREATE_ALERTS_TABLE);
        database_->exec(RecordSchemas::CREATE_INDEXES);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[ActivityStore] Table creation failed: " << e.what() << "\n";
        return false;
    }
}

ActivityLogEntry ActivityStore::append(ActivityLogEntry entry) {
    std::lock_guard<std::mutex> lock(storeMutex());
    try {
        SQLite::Transaction tx(*database_);

        int64_t last_ts = 0;
        {
            SQLite::Statement last(*database_, "SELECT ts_us FROM activity_log ORDER BY id DESC LIMIT 1");
            if (last.executeStep()) last_ts = last.getColumn(0).getInt64();
        }
        int64_t ts = TimeUtils::nowMicros();
        if (ts <= last_ts) ts = last_ts + 1;

        entry.ts_us     = ts;
        entry.date      = TimeUtils::formatMicros(ts, "%Y-%m-%d");
        entry.time      = TimeUtils::formatMicros(ts, "%H:%M:%S");
        entry.day       = TimeUtils::formatMicros(ts, "%A");
        entry.timestamp = TimeUtils::formatMicros(ts, "%Y-%m-%d %H:%M:%S");

        SQLite::Statement ins(*database_, R"(
            INSERT INTO activity_log (ts_us, Date, Time, Day, Action_Type, Input_File, Output_File,
                                      Original_Filename, Total_Detections, Avg_Confidence,
                                      Coverage_Percentage, Detection_Details, Statistics, Timestamp)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        )");
        ins.bind(1, entry.ts_us);
        ins.bind(2, entry.date);
        ins.bind(3, entry.time);
        ins.bind(4, entry.day);
        ins.bind(5, entry.action_type);
        bindText(ins, 6, entry.input_file);
        bindText(ins, 7, entry.output_file);
        bindText(ins, 8, entry.original_filename);
        ins.bind(9, entry.total_detections);
        ins.bind(10, entry.avg_confidence);
        ins.bind(11, entry.coverage_percentage);
        ins.bind(12, entry.detection_details);
        ins.bind(13, entry.statistics);
        ins.bind(14, entry.timestamp);

        if (ins.exec() != 1) {
            throw std::runtime_error("insert affected no row");
        }
        entry.id = database_->getLastInsertRowid();
        tx.commit();

        std::cout << "[ActivityStore] Logged #" << entry.id << " " << entry.action_type
                  << " (" << entry.original_filename << ")\n";
        return entry;
    } catch (const std::exception& e) {
        std::cerr << "[ActivityStore] Append failed: " << e.what() << "\n";
        throw PipelineError(ErrorKind::ActivityStoreWriteError, "append", e.what());
    }
}

std::string ActivityStore::reserveArchivePath(ArchiveKind kind, const std::string& name) {
    // only the final component of the caller's name is used
    fs::path base = fs::path(name).filename();
    std::string stem = base.stem().string();
    std::string ext = base.extension().string();
    if (stem.empty()) stem = "file";

    const fs::path dir = fs::path(root_) / archiveSubdir(kind);
    const std::string prefix = TimeUtils::archiveStamp(TimeUtils::nowMicros()) + "_" + stem;

    fs::path candidate = dir / (prefix + ext);
    for (int n = 1; fs::exists(candidate) || fs::exists(candidate.string() + ".part"); ++n) {
        candidate = dir / (prefix + "_" + std::to_string(n) + ext);
    }
    return candidate.string();
}

bool ActivityStore::writeThenRename(const std::string& tmp_path, const std::string& final_path,
                                    const char* data, size_t size) {
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            std::cerr << "[ActivityStore] Cannot create " << tmp_path << "\n";
            return false;
        }
        out.write(data, static_cast<std::streamsize>(size));
        if (!out) {
            std::cerr << "[ActivityStore] Short write to " << tmp_path << "\n";
            std::error_code ec;
            out.close();
            fs::remove(tmp_path, ec);
            return false;
        }
    }
    std::error_code ec;
    fs::rename(tmp_path, final_path, ec);
    if (ec) {
        std::cerr << "[ActivityStore] Rename to " << final_path << " failed: " << ec.message() << "\n";
        fs::remove(tmp_path, ec);
        return false;
    }
    return true;
}

bool ActivityStore::copyThenRename(const std::string& source_path, const std::string& tmp_path,
                                   const std::string& final_path) {
    std::error_code ec;
    fs::copy_file(source_path, tmp_path, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        std::cerr << "[ActivityStore] Copy " << source_path << " failed: " << ec.message() << "\n";
        fs::remove(tmp_path, ec);
        return false;
    }
    fs::rename(tmp_path, final_path, ec);
    if (ec) {
        std::cerr << "[ActivityStore] Rename to " << final_path << " failed: " << ec.message() << "\n";
        fs::remove(tmp_path, ec);
        return false;
    }
    return true;
}

std::string ActivityStore::archiveFile(ArchiveKind kind,
                                       const std::string& source_path,
                                       const std::string& original_name) {
    std::lock_guard<std::mutex> lock(storeMutex());
    std::error_code ec;
    if (!fs::is_regular_file(source_path, ec)) {
        throw PipelineError(ErrorKind::ActivityStoreWriteError, "archive", "not a readable file: " + source_path);
    }
    const std::string name = original_name.empty() ? fs::path(source_path).filename().string() : original_name;
    const std::string final_path = reserveArchivePath(kind, name);
    if (!copyThenRename(source_path, final_path + ".part", final_path)) {
        throw PipelineError(ErrorKind::ActivityStoreWriteError, "archive", "cannot archive " + source_path);
    }
    std::cout << "[ActivityStore] Archived " << source_path << " -> " << final_path << "\n";
    return final_path;
}

std::string ActivityStore::archiveBytes(ArchiveKind kind,
                                        const std::vector<uint8_t>& bytes,
                                        const std::string& name) {
    std::lock_guard<std::mutex> lock(storeMutex());
    const std::string final_path = reserveArchivePath(kind, name);
    const char* data = bytes.empty() ? "" : reinterpret_cast<const char*>(bytes.data());
    if (!writeThenRename(final_path + ".part", final_path, data, bytes.size())) {
        throw PipelineError(ErrorKind::ActivityStoreWriteError, "archive", "cannot write " + final_path);
    }
    std::cout << "[ActivityStore] Archived " << bytes.size() << " bytes -> " << final_path << "\n";
    return final_path;
}

std::string ActivityStore::archiveBytes(ArchiveKind kind,
                                        const std::string& bytes,
                                        const std::string& name) {
    return archiveBytes(kind, std::vector<uint8_t>(bytes.begin(), bytes.end()), name);
}

std::vector<ActivityLogEntry> ActivityStore::listEntries(const ActivityFilter& filter) const {
    if (!filter.date_from.empty() && !TimeUtils::isValidDate(filter.date_from)) {
        throw std::invalid_argument("date_from must be YYYY-mm-dd: " + filter.date_from);
    }
    if (!filter.date_to.empty() && !TimeUtils::isValidDate(filter.date_to)) {
        throw std::invalid_argument("date_to must be YYYY-mm-dd: " + filter.date_to);
    }

    std::string sql = std::string("SELECT ") + kEntryColumns + " FROM activity_log WHERE 1 = 1";
    if (!filter.action_type.empty())       sql += " AND Action_Type = ?";
    if (!filter.action_prefix.empty())     sql += " AND substr(Action_Type, 1, ?) = ?";
    if (!filter.date_from.empty())         sql += " AND Date >= ?";
    if (!filter.date_to.empty())           sql += " AND Date <= ?";
    if (!filter.filename_contains.empty()) sql += " AND instr(Original_Filename, ?) > 0";
    sql += " ORDER BY id DESC LIMIT ?";

    std::lock_guard<std::mutex> lock(storeMutex());
    std::vector<ActivityLogEntry> results;
    try {
        SQLite::Statement q(*database_, sql);
        int idx = 1;
        if (!filter.action_type.empty()) q.bind(idx++, filter.action_type);
        if (!filter.action_prefix.empty()) {
            q.bind(idx++, static_cast<int>(filter.action_prefix.size()));
            q.bind(idx++, filter.action_prefix);
        }
        if (!filter.date_from.empty())         q.bind(idx++, filter.date_from);
        if (!filter.date_to.empty())           q.bind(idx++, filter.date_to);
        if (!filter.filename_contains.empty()) q.bind(idx++, filter.filename_contains);
        q.bind(idx++, filter.limit > 0 ? filter.limit : -1);

        while (q.executeStep()) {
            results.push_back(rowToEntry(q));
        }
    } catch (const std::exception& e) {
        std::cerr << "[ActivityStore] List entries failed: " << e.what() << "\n";
        results.clear();
    }
    std::reverse(results.begin(), results.end());
    return results;
}

int64_t ActivityStore::count() const {
    std::lock_guard<std::mutex> lock(storeMutex());
    try {
        SQLite::Statement q(*database_, "SELECT COUNT(*) FROM activity_log");
        if (q.executeStep()) return q.getColumn(0).getInt64();
    } catch (const std::exception& e) {
        std::cerr << "[ActivityStore] Count failed: " << e.what() << "\n";
    }
    return 0;
}

AlertRecord ActivityStore::appendAlert(AlertRecord alert) {
    std::lock_guard<std::mutex> lock(storeMutex());
    if (alert.timestamp.empty()) alert.timestamp = TimeUtils::getCurrentTimestamp();
    try {
        SQLite::Statement ins(*database_, R"(
            INSERT INTO alerts (severity, message, total_detections, avg_confidence,
                                coverage_percentage, timestamp, entry_id)
            VALUES (?, ?, ?, ?, ?, ?, ?)
        )");
        ins.bind(1, alert.severity);
        ins.bind(2, alert.message);
        ins.bind(3, alert.total_detections);
        ins.bind(4, alert.avg_confidence);
        ins.bind(5, alert.coverage_percentage);
        ins.bind(6, alert.timestamp);
        if (alert.entry_id > 0) ins.bind(7, alert.entry_id);
        else ins.bind(7);

        if (ins.exec() != 1) {
            throw std::runtime_error("insert affected no row");
        }
        alert.alert_id = database_->getLastInsertRowid();
        std::cout << "[ActivityStore] Alert #" << alert.alert_id << " (" << alert.severity << "): "
                  << alert.message << "\n";
        return alert;
    } catch (const std::exception& e) {
        std::cerr << "[ActivityStore] Insert alert failed: " << e.what() << "\n";
        throw PipelineError(ErrorKind::ActivityStoreWriteError, "alert", e.what());
    }
}

std::vector<AlertRecord> ActivityStore::listAlerts(int limit) const {
    std::lock_guard<std::mutex> lock(storeMutex());
    std::vector<AlertRecord> alerts;
    try {
        SQLite::Statement q(*database_, R"(
            SELECT alert_id, severity, message, total_detections, avg_confidence,
                   coverage_percentage, timestamp, entry_id
            FROM alerts ORDER BY alert_id DESC LIMIT ?
        )");
        q.bind(1, limit > 0 ? limit : -1);
        while (q.executeStep()) {
            AlertRecord a;
            a.alert_id            = q.getColumn(0).getInt64();
            a.severity            = textOf(q.getColumn(1));
            a.message             = textOf(q.getColumn(2));
            a.total_detections    = q.getColumn(3).getInt64();
            a.avg_confidence      = q.getColumn(4).getDouble();
            a.coverage_percentage = q.getColumn(5).getDouble();
            a.timestamp           = textOf(q.getColumn(6));
            a.entry_id            = q.getColumn(7).isNull() ? 0 : q.getColumn(7).getInt64();
            alerts.push_back(a);
        }
    } catch (const std::exception& e) {
        std::cerr << "[ActivityStore] List alerts failed: " << e.what() << "\n";
        alerts.clear();
    }
    std::reverse(alerts.begin(), alerts.end());
    return alerts;
}

} // namespace slickwatch
