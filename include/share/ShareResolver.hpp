#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lc::share {

/**
 * Maps a file path to the network share it lives on and to that share's lock directory.
 *
 * A path is on a share when it is UNC-style (\\server\share\... or //server/share/...)
 * or lies below one of the configured mounted share roots. Local paths have no lock
 * directory and never take part in lock-queue coordination.
 */
class ShareResolver {
public:
    ShareResolver() = default;
    explicit ShareResolver(config::SharesConfig shares, std::vector<std::string> slowSharePrefixes = {});

    [[nodiscard]] static bool isUncPath(const std::string& path);

    // \\server\share\file.txt -> \\server; empty for non-UNC paths. Aliased servers map to their configured base.
    [[nodiscard]] std::string serverShareBase(const std::string& path) const;

    // Expected lock directory, not verified to exist
    [[nodiscard]] std::optional<std::filesystem::path> lockDirectoryPath(const std::filesystem::path& file) const;

    // Lock directory only when it exists
    [[nodiscard]] std::optional<std::filesystem::path> lockDirectory(const std::filesystem::path& file) const;

    [[nodiscard]] bool isSlowShare(const std::filesystem::path& lockDir) const;

    [[nodiscard]] const config::SharesConfig& config() const { return shares_; }

private:
    config::SharesConfig shares_;
    std::vector<std::string> slowSharePrefixes_;

    [[nodiscard]] std::optional<std::filesystem::path> mountedShareRoot(const std::filesystem::path& file) const;
};

}
