#ifndef SLICKWATCH_TIME_UTILS_H
#define SLICKWATCH_TIME_UTILS_H

#include <cstdint>
#include <ctime>
#include <string>

namespace slickwatch {

class TimeUtils {
public:
    static int64_t nowMicros();
    static std::string getCurrentTimestamp();                                   // YYYY-mm-dd HH:MM:SS
    static std::string formatMicros(int64_t ts_us, const std::string& format);  // local time
    static std::string archiveStamp(int64_t ts_us);                             // YYYYmmdd_HHMMSS
    static bool isValidDate(const std::string& date);                           // YYYY-mm-dd

private:
    static std::tm toLocal(time_t t);
};

} // namespace slickwatch

#endif // SLICKWATCH_TIME_UTILS_H
