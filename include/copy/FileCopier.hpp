#pragma once

#include "notify/Notifier.hpp"

#include <filesystem>
#include <memory>

namespace lc::copy {

constexpr int DEFAULT_BACKUP_VERSIONS = 9;

// Whole-file copy that creates missing parent directories and keeps the source modification time.
class FileCopier {
public:
    explicit FileCopier(std::shared_ptr<notify::Notifier> notifier = nullptr);

    // Throws std::filesystem::filesystem_error when the target exists and overwrite is false
    void copy(const std::filesystem::path& source,
              const std::filesystem::path& target,
              bool overwrite,
              bool backupBeforeCopy = false,
              int versionsToKeep = DEFAULT_BACKUP_VERSIONS) const;

    /**
     * Renames name.ext to name_Old1.ext, name_Old1.ext to name_Old2.ext and so on,
     * dropping the oldest version beyond versionsToKeep. 0 keeps 2 versions, a negative
     * count keeps 1. Backups of files without an extension get ".bak".
     */
    static void backupBeforeCopy(const std::filesystem::path& target, int versionsToKeep = DEFAULT_BACKUP_VERSIONS);

private:
    std::shared_ptr<notify::Notifier> notifier_;
};

}
