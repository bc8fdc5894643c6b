#include "slickwatch/vision/Config.h"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>
#include <iostream>

using nlohmann::json;

namespace slickwatch {

static void try_get(const YAML::Node& n, const char* key, std::string& v) { if (n[key]) v = n[key].as<std::string>(); }
static void try_get(const YAML::Node& n, const char* key, int& v)         { if (n[key]) v = n[key].as<int>(); }
static void try_get(const YAML::Node& n, const char* key, float& v)       { if (n[key]) v = n[key].as<float>(); }
static void try_get(const YAML::Node& n, const char* key, bool& v)        { if (n[key]) v = n[key].as<bool>(); }
static void try_get(const YAML::Node& n, const char* key, std::vector<std::string>& v) {
    if (!n[key]) return;
    v.clear();
    for (const auto& it : n[key]) v.push_back(it.as<std::string>());
}

std::string AppConfig::activityDbPath() const {
    return (std::filesystem::path(record_root) / activity_db).string();
}

AppConfig AppConfig::fromYaml(const std::string& yaml_path) {
    AppConfig c;
    c.config_path = yaml_path;
    try {
        YAML::Node r = YAML::LoadFile(yaml_path);
        try_get(r, "model_path",  c.model_path);
        try_get(r, "record_root", c.record_root);
        try_get(r, "activity_db", c.activity_db);

        try_get(r, "input_w", c.input_w);
        try_get(r, "input_h", c.input_h);
        try_get(r, "class_names", c.class_names);

        try_get(r, "conf_threshold", c.conf_threshold);
        try_get(r, "nms_iou",        c.nms_iou);

        try_get(r, "codec_preference", c.codec_preference);

        try_get(r, "retain_frames",     c.retain_frames);
        try_get(r, "ui_max_frames",     c.ui_max_frames);
        try_get(r, "report_max_frames", c.report_max_frames);
        try_get(r, "jpg_quality",       c.jpg_quality);

        try_get(r, "alert_critical", c.alert_critical);
        try_get(r, "alert_high",     c.alert_high);
        try_get(r, "alert_medium",   c.alert_medium);
        try_get(r, "alert_low",      c.alert_low);

        try_get(r, "intra_threads", c.intra_threads);
    } catch (const YAML::Exception& ex) {
        std::cerr << "[AppConfig] Failed to read " << yaml_path << ", keeping defaults: " << ex.what() << "\n";
        c = AppConfig{};
        c.config_path = yaml_path;
    }
    return c;
}

AppConfig AppConfig::fromJson(const std::string& json_path) {
    AppConfig c;
    c.config_path = json_path;
    try {
        std::ifstream ifs(json_path);
        if (!ifs) {
            std::cerr << "[AppConfig] Cannot open " << json_path << ", keeping defaults\n";
            return c;
        }
        json r; ifs >> r;
        auto get_s = [&](const char* k, std::string& v){ if(r.contains(k)) v = r[k].get<std::string>(); };
        auto get_i = [&](const char* k, int& v){ if(r.contains(k)) v = r[k].get<int>(); };
        auto get_f = [&](const char* k, float& v){ if(r.contains(k)) v = r[k].get<float>(); };
        auto get_b = [&](const char* k, bool& v){ if(r.contains(k)) v = r[k].get<bool>(); };
        auto get_l = [&](const char* k, std::vector<std::string>& v){
            if (!r.contains(k)) return;
            v.clear();
            for (auto& it : r[k]) v.push_back(it.get<std::string>());
        };

        get_s("model_path", c.model_path);
        get_s("record_root", c.record_root);
        get_s("activity_db", c.activity_db);

        get_i("input_w", c.input_w);
        get_i("input_h", c.input_h);
        get_l("class_names", c.class_names);

        get_f("conf_threshold", c.conf_threshold);
        get_f("nms_iou", c.nms_iou);

        get_l("codec_preference", c.codec_preference);

        get_b("retain_frames", c.retain_frames);
        get_i("ui_max_frames", c.ui_max_frames);
        get_i("report_max_frames", c.report_max_frames);
        get_i("jpg_quality", c.jpg_quality);

        get_i("alert_critical", c.alert_critical);
        get_i("alert_high", c.alert_high);
        get_i("alert_medium", c.alert_medium);
        get_i("alert_low", c.alert_low);

        get_i("intra_threads", c.intra_threads);
    } catch (const json::exception& ex) {
        std::cerr << "[AppConfig] Failed to parse " << json_path << ", keeping defaults: " << ex.what() << "\n";
        c = AppConfig{};
        c.config_path = json_path;
    }
    return c;
}

AppConfig AppConfig::load(const std::string& path) {
    if (path.empty()) return AppConfig{};
    const auto ext = std::filesystem::path(path).extension().string();
    if (ext == ".json") return fromJson(path);
    return fromYaml(path);
}

} // namespace slickwatch
