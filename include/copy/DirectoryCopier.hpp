#pragma once

#include "copy/ResumableCopier.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lc::queue {
class Coordinator;
}

namespace lc::copy {

enum class OverwriteMode {
    DoNotOverwrite,
    AlwaysOverwrite,
    OverwriteIfSourceNewer,
    OverwriteIfDateOrLengthDiffer
};

[[nodiscard]] std::string to_string(OverwriteMode mode);
[[nodiscard]] std::optional<OverwriteMode> parseOverwriteMode(const std::string& name);

struct DirectoryCopyStats {
    unsigned int skipped = 0;
    unsigned int resumed = 0;
    unsigned int newlyCopied = 0;
};

class DirectoryCopier {
public:
    DirectoryCopier(queue::Coordinator& coordinator, ResumableCopier& resumable);

    // Every file goes through the lock queue. Names in fileNamesToSkip match either the
    // file name or its full path, ignoring case. When readOnly is set, each target file takes
    // the source permissions with the write bits cleared (true) or owner write added (false).
    void copyDirectory(const std::filesystem::path& source,
                       const std::filesystem::path& target,
                       bool overwrite,
                       const std::string& managerName,
                       const std::vector<std::string>& fileNamesToSkip = {},
                       std::optional<bool> readOnly = std::nullopt);

    // Copies through the lock queue, deleting each source file once copied and each
    // source directory once empty
    bool moveDirectory(const std::filesystem::path& source,
                       const std::filesystem::path& target,
                       bool overwrite,
                       const std::string& managerName);

    DirectoryCopyStats copyDirectoryWithResume(const std::filesystem::path& source,
                                               const std::filesystem::path& target,
                                               bool recurse,
                                               OverwriteMode mode = OverwriteMode::OverwriteIfDateOrLengthDiffer,
                                               const std::vector<std::string>& fileNamesToSkip = {},
                                               bool ignoreFileLocks = false);

private:
    queue::Coordinator& coordinator_;
    ResumableCopier& resumable_;

    // rootTarget is never descended into, whatever depth it sits at below the source
    void copyDirectoryEx(const std::filesystem::path& source, const std::filesystem::path& target,
                         const std::filesystem::path& rootTarget, bool overwrite, const std::string& managerName,
                         const std::vector<std::string>& fileNamesToSkip, std::optional<bool> readOnly);

    void moveDirectoryEx(const std::filesystem::path& source, const std::filesystem::path& target,
                         const std::filesystem::path& rootTarget, bool overwrite, const std::string& managerName);

    void resumeDirectory(const std::filesystem::path& source, const std::filesystem::path& target,
                         const std::filesystem::path& rootTarget, bool recurse, OverwriteMode mode,
                         const std::vector<std::string>& fileNamesToSkip, bool ignoreFileLocks,
                         DirectoryCopyStats& stats);
};

}
