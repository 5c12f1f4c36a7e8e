#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>

namespace lc::util {

using TimePoint = std::chrono::system_clock::time_point;

// Lock file timestamps count milliseconds from 2010-01-01T00:00:00Z.
constexpr std::chrono::seconds LOCK_TIMESTAMP_EPOCH{1262304000};

// Modification times are considered equal within this tolerance (FAT32 stores 2 second resolution).
constexpr std::chrono::milliseconds FILE_TIME_TOLERANCE{2050};

[[nodiscard]] int64_t lockTimestampMs(TimePoint tp);

[[nodiscard]] TimePoint fromLockTimestampMs(int64_t ms);

// "yyyy-MM-dd hh:mm:ss tt" in local time, written into lock files.
[[nodiscard]] std::string formatLocalDateTime(TimePoint tp);

// "yyyy-MM-dd hh:mm:ss.fff tt" in UTC, written into FilePartInfo files.
[[nodiscard]] std::string formatUtcFileTime(TimePoint tp);

// Accepts the FilePartInfo format; the AM/PM designator and milliseconds are optional.
[[nodiscard]] std::optional<TimePoint> parseUtcFileTime(const std::string& str);

[[nodiscard]] bool nearlyEqualFileTimes(TimePoint a, TimePoint b);

[[nodiscard]] TimePoint toSystemTime(std::filesystem::file_time_type ft);

[[nodiscard]] std::filesystem::file_time_type toFileTime(TimePoint tp);

[[nodiscard]] TimePoint lastWriteTimeUtc(const std::filesystem::path& path);

}
