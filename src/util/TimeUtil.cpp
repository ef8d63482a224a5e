#include "util/TimeUtil.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace timeutil {

static std::tm to_utc_tm(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

std::string utc_iso(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    const std::tm tm = to_utc_tm(tp);
    auto us = duration_cast<microseconds>(tp.time_since_epoch()).count() % 1000000;
    if (us < 0) us += 1000000;

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(6) << std::setfill('0') << us
        << "+00:00";
    return oss.str();
}

std::string utc_now_iso() {
    return utc_iso(std::chrono::system_clock::now());
}

std::string utc_compact(std::chrono::system_clock::time_point tp) {
    const std::tm tm = to_utc_tm(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%dT%H%M%SZ");
    return oss.str();
}

}
