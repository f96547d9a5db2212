#include "common/clock.hpp"

#include <ctime>

#include <fmt/format.h>

namespace mockdb {

std::string format_iso8601(Clock::time_point tp) {
    const auto ms   = std::chrono::floor<std::chrono::milliseconds>(tp);
    const auto secs = std::chrono::floor<std::chrono::seconds>(ms);
    const auto frac = (ms - secs).count();

    const std::time_t t = std::chrono::system_clock::to_time_t(secs);
    std::tm utc{};
    gmtime_r(&t, &utc);

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                       utc.tm_hour, utc.tm_min, utc.tm_sec, frac);
}

} // namespace mockdb
