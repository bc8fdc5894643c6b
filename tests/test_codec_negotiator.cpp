#include "slickwatch/errors.hpp"
#include "slickwatch/vision/CodecNegotiator.h"
#include "test_helpers.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <vector>

namespace fs = std::filesystem;
using namespace slickwatch;
using namespace slickwatch::testing;

bool test_second_candidate_wins(const fs::path& dir) {
    auto log = std::make_shared<SinkLog>();
    SinkScript script;
    script.working_codecs = { "BBBB" };
    CodecNegotiator negotiator(fakeSinkFactory(script, log));

    const std::string out = (dir / "second.mp4").string();
    NegotiatedWriter w = negotiator.open({ "AAAA", "BBBB", "CCCC" }, out, 64, 48, 10.0);

    bool usable = w.sink && w.sink->isOpened() && w.sink->write(cv::Mat(48, 64, CV_8UC3, cv::Scalar::all(1)));
    bool success = w.codec == "BBBB" && usable &&
                   log->attempted == std::vector<std::string>({ "AAAA", "BBBB" }) &&
                   log->releases == 1 && fs::exists(out);
    w.sink->release();
    print_test_result("[A,B,C] with only B working picks B", success);
    return success;
}

bool test_all_fail_leaves_nothing(const fs::path& dir) {
    auto log = std::make_shared<SinkLog>();
    SinkScript script;
    script.working_codecs = {};
    CodecNegotiator negotiator(fakeSinkFactory(script, log));

    const std::string out = (dir / "none.mp4").string();
    bool threw = false;
    bool lists_all = false;
    try {
        negotiator.open({ "AAAA", "BBBB", "CCCC" }, out, 64, 48, 10.0);
    } catch (const PipelineError& err) {
        threw = err.kind() == ErrorKind::NoCodecAvailable;
        const std::string msg = err.what();
        lists_all = msg.find("AAAA") != std::string::npos && msg.find("BBBB") != std::string::npos &&
                    msg.find("CCCC") != std::string::npos;
    }
    bool success = threw && lists_all && !fs::exists(out) && log->attempted.size() == 3 && log->releases == 3;
    print_test_result("all candidates fail -> NoCodecAvailable, no file", success);
    return success;
}

bool test_invalid_ids_skipped(const fs::path& dir) {
    auto log = std::make_shared<SinkLog>();
    SinkScript script;
    script.working_codecs = { "MJPG" };
    CodecNegotiator negotiator(fakeSinkFactory(script, log));

    const std::string out = (dir / "invalid.avi").string();
    NegotiatedWriter w = negotiator.open({ "h264-long", "", "MJPG" }, out, 32, 32, 0.5);
    bool success = w.codec == "MJPG" && log->attempted == std::vector<std::string>({ "MJPG" });
    w.sink->release();
    print_test_result("non-FOURCC ids count as failed candidates", success);
    return success;
}

bool test_empty_preference(const fs::path& dir) {
    auto log = std::make_shared<SinkLog>();
    CodecNegotiator negotiator(fakeSinkFactory(SinkScript(), log));
    bool threw = false;
    try {
        negotiator.open({}, (dir / "empty.mp4").string(), 32, 32, 25.0);
    } catch (const PipelineError& err) {
        threw = err.kind() == ErrorKind::NoCodecAvailable;
    }
    print_test_result("empty preference list -> NoCodecAvailable", threw);
    return threw;
}

bool test_default_order_and_fourcc() {
    auto pref = CodecNegotiator::defaultPreference();
    bool success = pref == std::vector<std::string>({ "mp4v", "XVID", "MJPG", "X264" }) &&
                   fourccFromString("mp4v") == cv::VideoWriter::fourcc('m', 'p', '4', 'v') &&
                   fourccFromString("mp4") == -1 &&
                   fourccFromString("") == -1;
    print_test_result("default preference order and fourcc parsing", success);
    return success;
}

int main() {
    std::cout << "=== codec negotiation tests ===" << std::endl;
    const fs::path dir = makeTempDir("codec");
    std::vector<bool> results;
    results.push_back(test_second_candidate_wins(dir));
    results.push_back(test_all_fail_leaves_nothing(dir));
    results.push_back(test_invalid_ids_skipped(dir));
    results.push_back(test_empty_preference(dir));
    results.push_back(test_default_order_and_fourcc());

    std::error_code ec;
    fs::remove_all(dir, ec);

    int passed = static_cast<int>(std::count(results.begin(), results.end(), true));
    std::cout << passed << "/" << results.size() << " passed" << std::endl;
    return passed == static_cast<int>(results.size()) ? 0 : 1;
}
