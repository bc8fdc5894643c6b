/*
*   Name:  activity_log.cpp
*   Usage: activity_log [--root information_record] [--config cfg.yml] [--action "Video Detection"]
*                       [--reports] [--from YYYY-mm-dd] [--to YYYY-mm-dd] [--file name] [--limit N]
*                       [--alerts] [--json]
*   ==========================================================================================
*   Read-only view of the activity log and the alerts raised by recorded runs.
*/
#include "slickwatch/errors.hpp"
#include "slickwatch/vision/Config.h"
#include "ActivityStore.h"
#include "RecordTypes.h"

#include <nlohmann/json.hpp>

#include <iomanip>
#include <iostream>
#include <map>
#include <string>

using namespace slickwatch;
using nlohmann::json;

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) if (flag == argv[i]) return true; return false;
}
static const char* getOpt(int argc, char** argv, const std::string& key, const char* defv = nullptr) {
    for (int i = 1; i + 1 < argc; ++i) if (key == argv[i]) return argv[i + 1]; return defv;
}

static json entryToJson(const ActivityLogEntry& e) {
    json j;
    j["id"] = e.id;
    j["Date"] = e.date;
    j["Time"] = e.time;
    j["Day"] = e.day;
    j["Action_Type"] = e.action_type;
    j["Input_File"] = e.input_file;
    j["Output_File"] = e.output_file.empty() ? json(nullptr) : json(e.output_file);
    j["Original_Filename"] = e.original_filename;
    j["Total_Detections"] = e.total_detections;
    j["Avg_Confidence"] = e.avg_confidence;
    j["Coverage_Percentage"] = e.coverage_percentage;
    j["Detection_Details"] = json::parse(e.detection_details, nullptr, false);
    j["Statistics"] = json::parse(e.statistics, nullptr, false);
    j["Timestamp"] = e.timestamp;
    return j;
}

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "-h") || hasFlag(argc, argv, "--help")) {
        std::cout << "Usage: activity_log [--root information_record] [--config cfg.yml] [--action TYPE] [--reports]\n"
                  << "                    [--from YYYY-mm-dd] [--to YYYY-mm-dd] [--file NAME] [--limit N]\n"
                  << "                    [--alerts] [--json]\n";
        return 0;
    }

    AppConfig cfg = AppConfig::load(getOpt(argc, argv, "--config", ""));
    if (const char* v = getOpt(argc, argv, "--root")) cfg.record_root = v;

    ActivityFilter filter;
    if (const char* v = getOpt(argc, argv, "--action")) filter.action_type = v;
    if (hasFlag(argc, argv, "--reports"))               filter.action_prefix = ActionTypes::REPORT_PREFIX;
    if (const char* v = getOpt(argc, argv, "--from"))   filter.date_from = v;
    if (const char* v = getOpt(argc, argv, "--to"))     filter.date_to = v;
    if (const char* v = getOpt(argc, argv, "--file"))   filter.filename_contains = v;
    try {
        if (const char* v = getOpt(argc, argv, "--limit")) filter.limit = std::stoi(v);
    } catch (const std::exception& ex) {
        std::cerr << "[Main] Bad --limit: " << ex.what() << "\n";
        return 2;
    }
    const bool as_json = hasFlag(argc, argv, "--json");

    try {
        ActivityStore store(cfg.record_root, cfg.activity_db);

        if (hasFlag(argc, argv, "--alerts")) {
            const auto alerts = store.listAlerts(filter.limit);
            std::map<std::string, int> by_severity;
            for (const auto& a : alerts) ++by_severity[a.severity];

            if (as_json) {
                json arr = json::array();
                for (const auto& a : alerts) {
                    arr.push_back({{"alert_id", a.alert_id}, {"severity", a.severity}, {"message", a.message},
                                   {"detections", a.total_detections}, {"confidence", a.avg_confidence},
                                   {"coverage", a.coverage_percentage}, {"timestamp", a.timestamp},
                                   {"entry_id", a.entry_id}});
                }
                std::cout << json{{"total", alerts.size()}, {"by_severity", by_severity}, {"alerts", arr}}.dump(2) << "\n";
            } else {
                for (const auto& a : alerts) {
                    std::cout << "#" << a.alert_id << "  " << a.timestamp << "  [" << a.severity << "]  "
                              << a.message << "\n";
                }
                std::cout << "Total alerts: " << alerts.size() << "\n";
                for (const auto& kv : by_severity) std::cout << "  " << kv.first << ": " << kv.second << "\n";
            }
            return 0;
        }

        const auto entries = store.listEntries(filter);
        if (as_json) {
            json arr = json::array();
            for (const auto& e : entries) arr.push_back(entryToJson(e));
            std::cout << arr.dump(2) << "\n";
        } else {
            for (const auto& e : entries) {
                std::cout << "#" << std::left << std::setw(5) << e.id
                          << e.date << " " << e.time << " " << std::setw(10) << e.day
                          << std::setw(32) << e.action_type
                          << std::setw(28) << e.original_filename
                          << " detections=" << e.total_detections
                          << " conf=" << e.avg_confidence
                          << " coverage=" << e.coverage_percentage << "\n";
            }
            std::cout << entries.size() << " of " << store.count() << " entries\n";
        }
    } catch (const PipelineError& err) {
        std::cerr << "[Main] " << err.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& ex) {
        std::cerr << "[Main] " << ex.what() << "\n";
        return 2;
    }
    return 0;
}
