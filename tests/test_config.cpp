#include "slickwatch/vision/Config.h"
#include "slickwatch/vision/VideoSession.h"
#include "test_helpers.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <vector>

namespace fs = std::filesystem;
using namespace slickwatch;
using namespace slickwatch::testing;

bool test_yaml_overrides(const fs::path& dir) {
    const fs::path p = dir / "slickwatch.yml";
    writeFile(p,
        "model_path: models/spill.onnx\n"
        "conf_threshold: 0.4\n"
        "codec_preference: [MJPG, mp4v]\n"
        "report_max_frames: 8\n"
        "retain_frames: false\n"
        "alert_critical: 20\n"
        "record_root: /tmp/records\n");
    AppConfig c = AppConfig::load(p.string());
    bool success = c.model_path == "models/spill.onnx" && near(c.conf_threshold, 0.4, 1e-6) &&
                   c.codec_preference == std::vector<std::string>({ "MJPG", "mp4v" }) &&
                   c.report_max_frames == 8 && !c.retain_frames && c.alert_critical == 20 &&
                   c.ui_max_frames == 12 && c.alert_high == 5 && c.input_w == 640 &&
                   fs::path(c.activityDbPath()) == fs::path("/tmp/records") / "activity_log.db";
    print_test_result("yaml overrides, missing keys keep defaults", success);
    return success;
}

bool test_json_overrides(const fs::path& dir) {
    const fs::path p = dir / "slickwatch.json";
    writeFile(p, R"({"class_names": ["oil_spill", "sheen"], "jpg_quality": 75, "ui_max_frames": 6})");
    AppConfig c = AppConfig::load(p.string());
    bool success = c.class_names.size() == 2 && c.class_names[1] == "sheen" && c.jpg_quality == 75 &&
                   c.ui_max_frames == 6 && c.report_max_frames == 20;
    print_test_result("json overrides", success);
    return success;
}

bool test_broken_files_keep_defaults(const fs::path& dir) {
    const fs::path y = dir / "broken.yml";
    writeFile(y, "conf_threshold: [unterminated\n");
    const fs::path j = dir / "broken.json";
    writeFile(j, R"({"jpg_quality": 70, "ui_max_frames": "many")");

    AppConfig a = AppConfig::load(y.string());
    AppConfig b = AppConfig::load(j.string());
    AppConfig c = AppConfig::load((dir / "missing.json").string());
    AppConfig d = AppConfig::load("");

    bool success = near(a.conf_threshold, 0.25, 1e-6) && b.jpg_quality == 90 && b.ui_max_frames == 12 &&
                   c.report_max_frames == 20 && d.codec_preference.size() == 4;
    print_test_result("unreadable config files fall back to defaults", success);
    return success;
}

bool test_session_config_from_app_config() {
    AppConfig c;
    c.codec_preference = { "XVID" };
    c.conf_threshold = 0.6f;
    c.retain_frames = false;
    SessionConfig s = SessionConfig::fromAppConfig(c, 20);
    bool success = s.codec_preference == std::vector<std::string>({ "XVID" }) && near(s.conf_threshold, 0.6, 1e-6) &&
                   !s.retain_frames && s.retention.max_retained_frames == 20 && s.retention.require_detection;
    print_test_result("session config derived from app config", success);
    return success;
}

int main() {
    std::cout << "=== config tests ===" << std::endl;
    const fs::path dir = makeTempDir("config");
    std::vector<bool> results;
    results.push_back(test_yaml_overrides(dir));
    results.push_back(test_json_overrides(dir));
    results.push_back(test_broken_files_keep_defaults(dir));
    results.push_back(test_session_config_from_app_config());

    std::error_code ec;
    fs::remove_all(dir, ec);

    int passed = static_cast<int>(std::count(results.begin(), results.end(), true));
    std::cout << passed << "/" << results.size() << " passed" << std::endl;
    return passed == static_cast<int>(results.size()) ? 0 : 1;
}
