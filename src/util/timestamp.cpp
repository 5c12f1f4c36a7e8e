#include "util/timestamp.hpp"

#include <fmt/format.h>

#include <cctype>
#include <iomanip>
#include <sstream>

using namespace std::chrono;

namespace lc::util {

namespace {

std::string formatTm(const std::tm& tm, const int millis, const bool withMillis) {
    const int hour12 = tm.tm_hour % 12 == 0 ? 12 : tm.tm_hour % 12;
    const char* designator = tm.tm_hour < 12 ? "AM" : "PM";

    if (withMillis)
        return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03} {}",
                           tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                           hour12, tm.tm_min, tm.tm_sec, millis, designator);

    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02} {}",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       hour12, tm.tm_min, tm.tm_sec, designator);
}

}

int64_t lockTimestampMs(const TimePoint tp) {
    const auto sinceEpoch = duration_cast<milliseconds>(tp.time_since_epoch()) - LOCK_TIMESTAMP_EPOCH;
    return sinceEpoch.count();
}

TimePoint fromLockTimestampMs(const int64_t ms) {
    return TimePoint(duration_cast<system_clock::duration>(LOCK_TIMESTAMP_EPOCH + milliseconds(ms)));
}

std::string formatLocalDateTime(const TimePoint tp) {
    const std::time_t t = system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    return formatTm(tm, 0, false);
}

std::string formatUtcFileTime(const TimePoint tp) {
    const auto secs = time_point_cast<seconds>(tp);
    auto millis = duration_cast<milliseconds>(tp - secs).count();
    auto t = system_clock::to_time_t(secs);
    if (millis < 0) {
        millis += 1000;
        --t;
    }
    std::tm tm{};
    gmtime_r(&t, &tm);
    return formatTm(tm, static_cast<int>(millis), true);
}

std::optional<TimePoint> parseUtcFileTime(const std::string& str) {
    std::tm tm{};
    std::istringstream ss(str);
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) return std::nullopt;

    int millis = 0;
    if (ss.peek() == '.') {
        ss.get();
        std::string digits;
        while (std::isdigit(ss.peek())) digits.push_back(static_cast<char>(ss.get()));
        if (digits.empty()) return std::nullopt;
        digits.resize(3, '0');
        millis = std::stoi(digits);
    }

    std::string designator;
    ss >> designator;
    for (auto& c : designator) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    if (designator == "AM" || designator == "PM") {
        if (tm.tm_hour < 1 || tm.tm_hour > 12) return std::nullopt;
        if (designator == "AM" && tm.tm_hour == 12) tm.tm_hour = 0;
        else if (designator == "PM" && tm.tm_hour != 12) tm.tm_hour += 12;
    } else if (!designator.empty()) {
        return std::nullopt;
    }

    return system_clock::from_time_t(timegm(&tm)) + milliseconds(millis);
}

bool nearlyEqualFileTimes(const TimePoint a, const TimePoint b) {
    const auto diff = a > b ? a - b : b - a;
    return diff <= FILE_TIME_TOLERANCE;
}

TimePoint toSystemTime(const std::filesystem::file_time_type ft) {
    return time_point_cast<system_clock::duration>(file_clock::to_sys(ft));
}

std::filesystem::file_time_type toFileTime(const TimePoint tp) {
    return time_point_cast<std::filesystem::file_time_type::duration>(file_clock::from_sys(tp));
}

TimePoint lastWriteTimeUtc(const std::filesystem::path& path) {
    return toSystemTime(std::filesystem::last_write_time(path));
}

}
