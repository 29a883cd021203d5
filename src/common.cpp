#include "common.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace conductor {

std::string utc_timestamp(WallTime when) {
    auto time_t = WallClock::to_time_t(when);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        when.time_since_epoch()) % 1000;

    std::tm utc_tm{};
    gmtime_r(&time_t, &utc_tm);

    std::ostringstream oss;
    oss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return oss.str();
}

std::string local_timestamp(WallTime when) {
    auto time_t = WallClock::to_time_t(when);
    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%dT%H:%M:%S%z");
    return oss.str();
}

} // namespace conductor
