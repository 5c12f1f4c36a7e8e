#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace lc::util {

// Rounded to the nearest whole MB
[[nodiscard]] uintmax_t bytesToMB(uintmax_t bytes);

// 165342 -> "161.5 KB"
[[nodiscard]] std::string bytesToHumanReadable(uintmax_t bytes);

std::vector<std::string> readLines(const std::filesystem::path& path);

// Truncates and writes one line per entry, failing if the file cannot be created.
void writeLines(const std::filesystem::path& path, const std::vector<std::string>& lines);

// Short host name (domain stripped) of this machine.
[[nodiscard]] std::string hostName();

// Deletes path if present. On failure the file is made writable, beforeRetry runs
// (when given) and the delete is attempted once more. A second failure is logged and
// reported as false; nothing is thrown.
bool removeFileIgnoreErrors(const std::filesystem::path& path, const std::function<void()>& beforeRetry = {});

[[nodiscard]] bool iequals(const std::string& a, const std::string& b);

[[nodiscard]] bool istartsWith(const std::string& str, const std::string& prefix);

}
