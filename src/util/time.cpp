// CURATOR - Time Utilities Implementation
// Copyright (c) 2024 CURATOR Developers
// MIT License

#include <curator/util/time.h>

#include <sstream>

namespace curator {
namespace util {

namespace {
    constexpr int64_t SECONDS_PER_MINUTE = 60;
    constexpr int64_t SECONDS_PER_HOUR = 3600;
    constexpr int64_t SECONDS_PER_DAY = 86400;
}

int64_t GetTime() {
    return std::chrono::duration_cast<Seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string FormatDuration(Seconds duration) {
    int64_t total = duration.count();

    if (total < 0) {
        return "-" + FormatDuration(Seconds{-total});
    }
    if (total == 0) {
        return "0s";
    }

    int64_t days = total / SECONDS_PER_DAY;
    total %= SECONDS_PER_DAY;
    int64_t hours = total / SECONDS_PER_HOUR;
    total %= SECONDS_PER_HOUR;
    int64_t minutes = total / SECONDS_PER_MINUTE;
    int64_t seconds = total % SECONDS_PER_MINUTE;

    std::ostringstream oss;
    if (days > 0) oss << days << "d ";
    if (hours > 0) oss << hours << "h ";
    if (minutes > 0) oss << minutes << "m ";
    if (seconds > 0) oss << seconds << "s";

    std::string out = oss.str();
    if (!out.empty() && out.back() == ' ') {
        out.pop_back();
    }
    return out;
}

} // namespace util
} // namespace curator
