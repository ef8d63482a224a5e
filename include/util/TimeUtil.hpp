#pragma once
#include <chrono>
#include <string>

namespace timeutil {

// ISO-8601 UTC with microseconds, e.g. 2026-02-22T07:17:59.123456+00:00
std::string utc_iso(std::chrono::system_clock::time_point tp);
std::string utc_now_iso();

// compact form used in artifact names, e.g. 20260222T071759Z
std::string utc_compact(std::chrono::system_clock::time_point tp);

}
