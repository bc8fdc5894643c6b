#include "TimeUtils.h"
#include <chrono>
#include <iomanip>
#include <sstream>

namespace slickwatch {

int64_t TimeUtils::nowMicros() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
}

std::string TimeUtils::getCurrentTimestamp() {
    return formatMicros(nowMicros(), "%Y-%m-%d %H:%M:%S");
}

std::string TimeUtils::formatMicros(int64_t ts_us, const std::string& format) {
    std::tm tm = toLocal(static_cast<time_t>(ts_us / 1000000));
    std::stringstream ss;
    ss << std::put_time(&tm, format.c_str());
    return ss.str();
}

std::string TimeUtils::archiveStamp(int64_t ts_us) {
    return formatMicros(ts_us, "%Y%m%d_%H%M%S");
}

bool TimeUtils::isValidDate(const std::string& date) {
    if (date.size() != 10) return false;
    std::tm tm = {};
    std::istringstream ss(date);
    ss >> std::get_time(&tm, "%Y-%m-%d");
    return !ss.fail();
}

std::tm TimeUtils::toLocal(time_t t) {
    std::tm tm = {};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return tm;
}

} // namespace slickwatch
