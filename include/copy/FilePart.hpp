#pragma once

#include "util/timestamp.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace lc::copy {

constexpr const auto* FILE_PART_SUFFIX = ".#FilePart#";
constexpr const auto* FILE_PART_INFO_SUFFIX = ".#FilePartInfo#";

[[nodiscard]] std::filesystem::path filePartPath(const std::filesystem::path& target);
[[nodiscard]] std::filesystem::path filePartInfoPath(const std::filesystem::path& target);

/**
 * Describes the source a .#FilePart# was copied from.
 *
 * Stored as three lines: absolute source path, length in bytes, and the UTC
 * last-write time as "yyyy-MM-dd hh:mm:ss.fff tt".
 */
struct FilePartInfo {
    std::string sourcePath;
    uintmax_t length{};
    util::TimePoint lastWriteUtc{};

    // Current state of a source file
    [[nodiscard]] static FilePartInfo describe(const std::filesystem::path& source);

    // nullopt when the file is missing, short or unparsable
    [[nodiscard]] static std::optional<FilePartInfo> read(const std::filesystem::path& infoFile);

    void write(const std::filesystem::path& infoFile) const;

    // Same path, same length, modification times within the file time tolerance
    [[nodiscard]] bool matches(const FilePartInfo& current) const;
};

}
