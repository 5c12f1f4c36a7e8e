#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lc::queue {

constexpr const auto* LOCK_FILE_EXTENSION = ".lock";
constexpr const auto* UNKNOWN_MANAGER = "UnknownManager";

/**
 * An advertised transfer: <timestampMs>_<sizeMB:0000>_<host>_<manager>.lock
 *
 * Only the leading timestamp and size are read back by other processes; the
 * content lines exist for operators browsing the lock directory.
 */
struct LockFile {
    int64_t timestampMs{};
    uintmax_t sizeBytes{};
    std::string host;
    std::string manager;
    std::filesystem::path source;
    std::filesystem::path target;

    [[nodiscard]] uintmax_t sizeMB() const;
    [[nodiscard]] std::string fileName() const;
    [[nodiscard]] std::vector<std::string> contentLines() const;
};

struct LockFileName {
    int64_t timestampMs{};
    uintmax_t sizeMB{};
};

// Path separators, wildcards, quotes, angle brackets, pipes and spaces become '_'
[[nodiscard]] std::string sanitizeLockFileName(std::string name);

// nullopt for anything that is not <digits>_<digits>_*.lock
[[nodiscard]] std::optional<LockFileName> parseLockFileName(const std::string& fileName);

// Writes the lock file into lockDir, appending '-' to the stem until the name is unused.
// Returns the created path; throws std::runtime_error when the file cannot be written.
std::filesystem::path createLockFile(const std::filesystem::path& lockDir, const LockFile& lock);

}
