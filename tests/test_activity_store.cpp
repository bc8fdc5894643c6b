#include "slickwatch/errors.hpp"
#include "ActivityRecorder.h"
#include "ActivityStore.h"
#include "test_helpers.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <regex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace slickwatch;
using namespace slickwatch::testing;
using nlohmann::json;

static ActivityLogEntry sampleEntry(const std::string& action, const std::string& name, int64_t dets = 0) {
    ActivityLogEntry e;
    e.action_type = action;
    e.original_filename = name;
    e.input_file = "inputs/" + name;
    e.total_detections = dets;
    return e;
}

static bool strictlyIncreasing(const std::vector<ActivityLogEntry>& rows) {
    for (size_t i = 1; i < rows.size(); ++i) {
        if (rows[i].ts_us <= rows[i - 1].ts_us || rows[i].id <= rows[i - 1].id) return false;
    }
    return true;
}

bool test_cold_start_appends(const fs::path& root) {
    const int M = 25;
    ActivityStore store(root.string());
    for (int i = 0; i < M; ++i) {
        store.append(sampleEntry(ActionTypes::IMAGE_DETECTION, "img_" + std::to_string(i) + ".jpg", i));
    }
    auto rows = store.listEntries();
    std::set<int64_t> stamps;
    for (const auto& r : rows) stamps.insert(r.ts_us);

    bool columns_ok = !rows.empty() && rows.front().date.size() == 10 && rows.front().time.size() == 8 &&
                      !rows.front().day.empty() && rows.front().timestamp.size() == 19 &&
                      rows.front().detection_details == "[]" && rows.front().statistics == "{}" &&
                      rows.front().output_file.empty();

    bool success = store.count() == M && rows.size() == static_cast<size_t>(M) &&
                   stamps.size() == static_cast<size_t>(M) && strictlyIncreasing(rows) &&
                   rows.back().original_filename == "img_24.jpg" && rows.back().total_detections == 24 &&
                   fs::exists(root / "activity_log.db") && columns_ok;
    print_test_result("M appends from cold start -> M rows, increasing timestamps", success);
    return success;
}

bool test_persistence_across_reopen(const fs::path& root) {
    int64_t last_ts = 0;
    {
        ActivityStore store(root.string());
        store.append(sampleEntry(ActionTypes::VIDEO_DETECTION, "a.mp4"));
        last_ts = store.append(sampleEntry(ActionTypes::VIDEO_DETECTION, "b.mp4")).ts_us;
    }
    ActivityStore reopened(root.string());
    ActivityLogEntry next = reopened.append(sampleEntry(ActionTypes::VIDEO_DETECTION, "c.mp4"));
    auto rows = reopened.listEntries();
    bool success = rows.size() == 3 && rows[0].original_filename == "a.mp4" &&
                   rows[1].original_filename == "b.mp4" && next.ts_us > last_ts && strictlyIncreasing(rows);
    print_test_result("entries survive reopen, timestamps keep increasing", success);
    return success;
}

bool test_concurrent_appends(const fs::path& root) {
    ActivityStore a(root.string());
    ActivityStore b(root.string());
    auto worker = [](ActivityStore* s, const std::string& tag) {
        for (int i = 0; i < 20; ++i) s->append(sampleEntry(ActionTypes::IMAGE_DETECTION, tag + std::to_string(i)));
    };
    std::thread t1(worker, &a, "a_");
    std::thread t2(worker, &b, "b_");
    t1.join();
    t2.join();

    auto rows = a.listEntries();
    std::set<int64_t> stamps;
    for (const auto& r : rows) stamps.insert(r.ts_us);
    bool success = rows.size() == 40 && stamps.size() == 40 && strictlyIncreasing(rows);
    print_test_result("two stores appending concurrently never collide", success);
    return success;
}

bool test_archive_layout(const fs::path& root) {
    ActivityStore store(root.string());
    bool layout = fs::is_directory(root / "inputs" / "images") && fs::is_directory(root / "inputs" / "videos") &&
                  fs::is_directory(root / "outputs" / "images") && fs::is_directory(root / "outputs" / "videos") &&
                  fs::is_directory(root / "outputs" / "reports");

    const fs::path src = root.parent_path() / (root.filename().string() + "_clip.mp4");
    writeFile(src, "video-bytes");
    std::string first = store.archiveFile(ArchiveKind::INPUT_VIDEO, src.string(), "harbor clip.mp4");
    std::string second = store.archiveFile(ArchiveKind::INPUT_VIDEO, src.string(), "harbor clip.mp4");
    std::string report = store.archiveBytes(ArchiveKind::OUTPUT_REPORT, std::string("a,b\n1,2\n"), "../../escape.csv");

    const std::regex stamped(R"(\d{8}_\d{6}_harbor clip(_\d+)?\.mp4)");
    const std::string n1 = fs::path(first).filename().string();
    const std::string n2 = fs::path(second).filename().string();

    bool copies_ok = readFile(first) == "video-bytes" && readFile(second) == "video-bytes" && readFile(src) == "video-bytes";
    bool names_ok = std::regex_match(n1, stamped) && std::regex_match(n2, stamped) && first != second &&
                    fs::path(first).parent_path() == root / "inputs" / "videos";
    bool report_ok = fs::path(report).parent_path() == root / "outputs" / "reports" &&
                     readFile(report) == "a,b\n1,2\n" &&
                     fs::path(report).filename().string().find("escape.csv") != std::string::npos;

    bool no_leftovers = true;
    for (const auto& e : fs::recursive_directory_iterator(root)) {
        if (e.path().extension() == ".part") no_leftovers = false;
    }

    bool missing_throws = false;
    try {
        store.archiveFile(ArchiveKind::INPUT_IMAGE, (root / "nope.jpg").string());
    } catch (const PipelineError& err) {
        missing_throws = err.kind() == ErrorKind::ActivityStoreWriteError;
    }

    fs::remove(src);
    bool success = layout && copies_ok && names_ok && report_ok && no_leftovers && missing_throws;
    print_test_result("archive layout, stamped names, collision suffix", success);
    return success;
}

bool test_filters(const fs::path& root) {
    ActivityStore store(root.string());
    store.append(sampleEntry(ActionTypes::IMAGE_DETECTION, "coast_north.jpg", 1));
    store.append(sampleEntry(ActionTypes::VIDEO_DETECTION, "coast_south.mp4", 4));
    store.append(sampleEntry(ActionTypes::REPORT_PREFIX + "CSV", "coast_south.mp4"));
    store.append(sampleEntry(ActionTypes::VIDEO_DETECTION, "harbor.mp4", 0));
    ActivityLogEntry last = store.append(sampleEntry(ActionTypes::REPORT_PREFIX + "JSON", "harbor.mp4"));

    ActivityFilter by_action;
    by_action.action_type = ActionTypes::VIDEO_DETECTION;
    ActivityFilter reports;
    reports.action_prefix = ActionTypes::REPORT_PREFIX;
    ActivityFilter by_name;
    by_name.filename_contains = "south";
    ActivityFilter limited;
    limited.limit = 2;
    ActivityFilter today;
    today.date_from = last.date;
    today.date_to = last.date;
    ActivityFilter future;
    future.date_from = "2999-01-01";

    auto v = store.listEntries(by_action);
    auto r = store.listEntries(reports);
    auto n = store.listEntries(by_name);
    auto l = store.listEntries(limited);

    bool bad_date_throws = false;
    try {
        ActivityFilter bad;
        bad.date_to = "19/10/2026";
        store.listEntries(bad);
    } catch (const std::invalid_argument&) {
        bad_date_throws = true;
    }

    bool success = v.size() == 2 && v[0].original_filename == "coast_south.mp4" &&
                   r.size() == 2 && n.size() == 2 &&
                   l.size() == 2 && l[0].ts_us < l[1].ts_us && l[1].id == last.id &&
                   store.listEntries(today).size() == 5 && store.listEntries(future).empty() &&
                   bad_date_throws;
    print_test_result("listEntries filters: action, prefix, filename, date, limit", success);
    return success;
}

bool test_alerts(const fs::path& root) {
    ActivityStore store(root.string());
    ActivityLogEntry e = store.append(sampleEntry(ActionTypes::IMAGE_DETECTION, "alert.jpg", 6));
    AlertRecord a;
    a.severity = "high";
    a.message = "HIGH ALERT: 6 oil spills detected. Coverage: 12.00%";
    a.total_detections = 6;
    a.coverage_percentage = 12.0;
    a.entry_id = e.id;
    AlertRecord stored = store.appendAlert(a);

    bool bad_severity_throws = false;
    try {
        AlertRecord bad;
        bad.severity = "apocalyptic";
        bad.message = "x";
        store.appendAlert(bad);
    } catch (const PipelineError& err) {
        bad_severity_throws = err.kind() == ErrorKind::ActivityStoreWriteError;
    }

    auto alerts = store.listAlerts();
    bool success = stored.alert_id > 0 && !stored.timestamp.empty() && alerts.size() == 1 &&
                   alerts[0].entry_id == e.id && alerts[0].severity == "high" &&
                   alerts[0].total_detections == 6 && bad_severity_throws;
    print_test_result("alerts stored and linked to their entry", success);
    return success;
}

static SessionResult fakeSession(const fs::path& input, const fs::path& output) {
    SessionResult r;
    r.source_path = input.string();
    r.output_path = output.string();
    r.codec = "mp4v";
    r.width = 64;
    r.height = 48;
    r.fps = 10.0;
    r.reported_frames = 5;
    r.stats.total_frames = 5;
    r.stats.frames_with_detections = 2;
    r.stats.total_detections = 12;
    r.stats.mean_confidence = 0.75;
    r.stats.coverage_ratio = 0.4;

    FrameRecord f;
    f.frame_index = 1;
    f.original = cv::Mat(48, 64, CV_8UC3, cv::Scalar::all(3));
    f.annotated = f.original.clone();
    f.detections = { makeDetection(0.9f) };
    f.avg_conf = 0.9f;
    r.frames.offer(std::move(f));
    return r;
}

bool test_recorder(const fs::path& root) {
    ActivityStore store(root.string());
    ActivityRecorder recorder(store);

    const fs::path work = makeTempDir("recorder_inputs");
    writeFile(work / "spill.mp4", "input");
    writeFile(work / "spill_out.mp4", "output");

    RecordOutcome video = recorder.logVideoDetection((work / "spill.mp4").string(), (work / "spill_out.mp4").string(),
                                                     fakeSession(work / "spill.mp4", work / "spill_out.mp4"));
    json stats = json::parse(video.entry.statistics);
    json details = json::parse(video.entry.detection_details);

    ActivityLogEntry report = recorder.logReportGeneration("CSV", "Frame,Class\n", "csv", "spill.mp4",
                                                           ActionTypes::VIDEO_DETECTION);
    PipelineError err(ErrorKind::SourceUnreadable, "open", "cannot open video: gone.mp4");
    ActivityLogEntry failed = recorder.logFailedRun(ActionTypes::VIDEO_DETECTION, "gone.mp4", err);

    bool video_ok = video.entry.action_type == ActionTypes::VIDEO_DETECTION &&
                    video.entry.total_detections == 12 && video.entry.avg_confidence == "0.7500" &&
                    video.entry.coverage_percentage == "40.00%" &&
                    fs::path(video.entry.input_file).parent_path() == root / "inputs" / "videos" &&
                    fs::path(video.entry.output_file).parent_path() == root / "outputs" / "videos" &&
                    readFile(video.entry.output_file) == "output" &&
                    stats["total_frames"] == 5 && !stats.contains("original_frames") &&
                    !stats.contains("annotated_frames") &&
                    details.size() == 1 && details[0]["frame_index"] == 1 &&
                    video.alert && video.alert->severity == "critical" && video.alert->entry_id == video.entry.id;
    bool report_ok = report.action_type == "Report Generation - CSV" &&
                     fs::path(report.output_file).parent_path() == root / "outputs" / "reports" &&
                     readFile(report.output_file) == "Frame,Class\n";
    bool failed_ok = failed.action_type == "Failed Run - Video Detection" &&
                     json::parse(failed.statistics)["error_kind"] == "SourceUnreadable";

    std::error_code ec;
    fs::remove_all(work, ec);
    bool success = video_ok && report_ok && failed_ok;
    print_test_result("recorder archives, serializes and appends", success);
    return success;
}

static size_t countFiles(const fs::path& dir) {
    size_t n = 0;
    std::error_code ec;
    for (const auto& e : fs::recursive_directory_iterator(dir, ec)) {
        if (e.is_regular_file()) ++n;
    }
    return n;
}

bool test_comparison_logged(const fs::path& root) {
    ActivityStore store(root.string());
    ActivityRecorder recorder(store);

    const fs::path work = makeTempDir("compare_inputs");
    writeFile(work / "before.jpg", "before");
    writeFile(work / "after.jpg", "after");

    RecordValue results = RecordValue::object();
    results["before_detections"] = 1;
    results["after_detections"] = 4;
    results["change"] = 3.0;

    ActivityLogEntry e = recorder.logComparison("Before/After",
                                                { (work / "before.jpg").string(), (work / "after.jpg").string() },
                                                results);
    json stats = json::parse(e.statistics);

    bool success = e.action_type == "Comparison Mode - Before/After" &&
                   e.original_filename == "before.jpg; after.jpg" &&
                   e.input_file.find("; ") != std::string::npos &&
                   stats["after_detections"] == 4 &&
                   countFiles(root / "inputs" / "images") == 2 && store.count() == 1;

    std::error_code ec;
    fs::remove_all(work, ec);
    print_test_result("comparison run archives its inputs and stores results", success);
    return success;
}

// serialize runs before archive and append
bool test_serialization_failure_touches_nothing(const fs::path& root) {
    ActivityStore store(root.string());
    ActivityRecorder recorder(store);
    store.append(sampleEntry(ActionTypes::IMAGE_DETECTION, "baseline.jpg"));

    const fs::path work = makeTempDir("unserializable_inputs");
    writeFile(work / "a.jpg", "a");

    struct Handle { int fd; };
    RecordValue results = RecordValue::object();
    results["score"] = 0.5;
    results["handle"] = RecordValue::opaque(Handle{ 3 });

    const int64_t before = store.count();
    bool threw = false;
    try {
        recorder.logComparison("Threshold", { (work / "a.jpg").string() }, results);
    } catch (const PipelineError& err) {
        threw = err.kind() == ErrorKind::UnsupportedSerializationType &&
                std::string(err.what()).find("$.handle") != std::string::npos;
    }

    bool success = threw && store.count() == before &&
                   countFiles(root / "inputs") == 0 && countFiles(root / "outputs") == 0;

    std::error_code ec;
    fs::remove_all(work, ec);
    print_test_result("unserializable result leaves log and archive unchanged", success);
    return success;
}

// a failed archive copy leaves earlier files and rows as they were
bool test_archive_failure_keeps_earlier_artifacts(const fs::path& root) {
    ActivityStore store(root.string());
    ActivityRecorder recorder(store);

    const fs::path work = makeTempDir("archive_fail_inputs");
    writeFile(work / "kept.jpg", "kept");
    writeFile(work / "first.jpg", "first");
    const std::string kept = store.archiveFile(ArchiveKind::INPUT_IMAGE, (work / "kept.jpg").string());
    ActivityLogEntry row = store.append(sampleEntry(ActionTypes::IMAGE_DETECTION, "kept.jpg", 2));

    bool direct_throws = false;
    try {
        store.archiveFile(ArchiveKind::INPUT_IMAGE, (work / "missing.jpg").string());
    } catch (const PipelineError& err) {
        direct_throws = err.kind() == ErrorKind::ActivityStoreWriteError && err.stage() == "archive";
    }

    bool recorder_throws = false;
    try {
        recorder.logComparison("Multiple", { (work / "first.jpg").string(), (work / "missing.jpg").string() },
                               RecordValue::object());
    } catch (const PipelineError& err) {
        recorder_throws = err.kind() == ErrorKind::ActivityStoreWriteError;
    }

    bool video_throws = false;
    try {
        recorder.logVideoDetection((work / "missing.mp4").string(), "", fakeSession(work / "missing.mp4", ""));
    } catch (const PipelineError& err) {
        video_throws = err.kind() == ErrorKind::ActivityStoreWriteError;
    }

    bool no_parts = true;
    for (const auto& e : fs::recursive_directory_iterator(root)) {
        if (e.path().extension() == ".part") no_parts = false;
    }

    auto rows = store.listEntries();
    bool success = direct_throws && recorder_throws && video_throws && no_parts &&
                   readFile(kept) == "kept" &&
                   countFiles(root / "inputs" / "images") == 2 &&   // kept + first.jpg copied before the failure
                   countFiles(root / "inputs" / "videos") == 0 &&
                   store.count() == 1 && rows.size() == 1 && rows[0].id == row.id &&
                   rows[0].original_filename == "kept.jpg";

    std::error_code ec;
    fs::remove_all(work, ec);
    print_test_result("archive failure throws and keeps earlier files and rows", success);
    return success;
}

bool test_alert_failure_keeps_entry(const fs::path& root) {
    ActivityStore store(root.string());
    ActivityRecorder recorder(store);
    {
        SQLite::Database other(store.dbPath(), SQLite::OPEN_READWRITE);
        other.exec("DROP TABLE alerts");
    }

    const fs::path work = makeTempDir("alert_fail_inputs");
    writeFile(work / "spill.mp4", "input");

    bool threw = false;
    RecordOutcome out;
    try {
        out = recorder.logVideoDetection((work / "spill.mp4").string(), "",
                                         fakeSession(work / "spill.mp4", ""));
    } catch (const PipelineError&) {
        threw = true;
    }

    auto rows = store.listEntries();
    bool success = !threw && out.entry.id > 0 && !out.alert &&
                   rows.size() == 1 && rows[0].id == out.entry.id && rows[0].total_detections == 12;

    std::error_code ec;
    fs::remove_all(work, ec);
    print_test_result("failed alert insert keeps the committed entry", success);
    return success;
}

int main() {
    std::cout << "=== activity store tests ===" << std::endl;
    const fs::path base = makeTempDir("store");
    std::vector<bool> results;
    try {
        results.push_back(test_cold_start_appends(base / "cold"));
        results.push_back(test_persistence_across_reopen(base / "reopen"));
        results.push_back(test_concurrent_appends(base / "concurrent"));
        results.push_back(test_archive_layout(base / "archive"));
        results.push_back(test_filters(base / "filters"));
        results.push_back(test_alerts(base / "alerts"));
        results.push_back(test_recorder(base / "recorder"));
        results.push_back(test_comparison_logged(base / "comparison"));
        results.push_back(test_serialization_failure_touches_nothing(base / "unserializable"));
        results.push_back(test_archive_failure_keeps_earlier_artifacts(base / "archive_fail"));
        results.push_back(test_alert_failure_keeps_entry(base / "alert_fail"));
    } catch (const std::exception& ex) {
        std::cerr << "unexpected exception: " << ex.what() << std::endl;
        results.push_back(false);
    }

    std::error_code ec;
    fs::remove_all(base, ec);

    int passed = static_cast<int>(std::count(results.begin(), results.end(), true));
    std::cout << passed << "/" << results.size() << " passed" << std::endl;
    return passed == static_cast<int>(results.size()) ? 0 : 1;
}
