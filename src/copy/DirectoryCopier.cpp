#include "copy/DirectoryCopier.hpp"
#include "queue/Coordinator.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

using namespace lc::copy;
using namespace lc::logging;
namespace fs = std::filesystem;

namespace {

bool shouldSkip(const fs::path& file, const std::vector<std::string>& fileNamesToSkip) {
    const auto name = file.filename().string();
    const auto full = file.string();
    return std::ranges::any_of(fileNamesToSkip, [&](const std::string& skip) {
        return lc::util::iequals(skip, name) || lc::util::iequals(skip, full);
    });
}

fs::path normalized(const fs::path& p) {
    auto abs = fs::absolute(p).lexically_normal();
    if (!abs.has_filename()) abs = abs.parent_path();
    return abs;
}

void verifyDirectories(const fs::path& source, const fs::path& target) {
    if (!fs::is_directory(source))
        throw std::runtime_error("Source directory does not exist: " + source.string());

    const auto parent = target.parent_path();
    if (parent.empty() || !fs::is_directory(parent))
        throw std::runtime_error("Destination directory does not exist: " + parent.string());
}

void applyReadOnly(const fs::path& source, const fs::path& target, const bool readOnly) {
    if (!fs::exists(target)) return;

    constexpr auto writeBits = fs::perms::owner_write | fs::perms::group_write | fs::perms::others_write;
    auto perms = fs::status(source).permissions();
    perms = readOnly ? perms & ~writeBits : perms | fs::perms::owner_write;
    fs::permissions(target, perms, fs::perm_options::replace);
}

bool targetIsCurrent(const fs::path& source, const fs::path& existing, const OverwriteMode mode) {
    using lc::util::lastWriteTimeUtc;
    using lc::util::nearlyEqualFileTimes;

    const auto sameLength = fs::file_size(source) == fs::file_size(existing);
    const auto sourceTime = lastWriteTimeUtc(source);
    const auto existingTime = lastWriteTimeUtc(existing);

    switch (mode) {
        case OverwriteMode::AlwaysOverwrite: return false;
        case OverwriteMode::DoNotOverwrite: return true;
        case OverwriteMode::OverwriteIfSourceNewer:
            return sourceTime < existingTime || (nearlyEqualFileTimes(sourceTime, existingTime) && sameLength);
        case OverwriteMode::OverwriteIfDateOrLengthDiffer:
            return nearlyEqualFileTimes(sourceTime, existingTime) && sameLength;
    }
    return true;
}

}

std::string lc::copy::to_string(const OverwriteMode mode) {
    switch (mode) {
        case OverwriteMode::DoNotOverwrite: return "never";
        case OverwriteMode::AlwaysOverwrite: return "always";
        case OverwriteMode::OverwriteIfSourceNewer: return "newer";
        case OverwriteMode::OverwriteIfDateOrLengthDiffer: return "differ";
    }
    return "unknown";
}

std::optional<OverwriteMode> lc::copy::parseOverwriteMode(const std::string& name) {
    for (const auto mode : {OverwriteMode::DoNotOverwrite, OverwriteMode::AlwaysOverwrite,
                            OverwriteMode::OverwriteIfSourceNewer, OverwriteMode::OverwriteIfDateOrLengthDiffer})
        if (util::iequals(name, to_string(mode))) return mode;
    return std::nullopt;
}

DirectoryCopier::DirectoryCopier(queue::Coordinator& coordinator, ResumableCopier& resumable)
    : coordinator_(coordinator), resumable_(resumable) {}

void DirectoryCopier::copyDirectory(const fs::path& source, const fs::path& target, const bool overwrite,
                                    const std::string& managerName, const std::vector<std::string>& fileNamesToSkip,
                                    const std::optional<bool> readOnly) {
    const auto src = normalized(source);
    const auto dst = normalized(target);
    verifyDirectories(src, dst);
    copyDirectoryEx(src, dst, dst, overwrite, managerName, fileNamesToSkip, readOnly);
}

void DirectoryCopier::copyDirectoryEx(const fs::path& source, const fs::path& target,
                                      const fs::path& rootTarget, const bool overwrite,
                                      const std::string& managerName, const std::vector<std::string>& fileNamesToSkip,
                                      const std::optional<bool> readOnly) {
    fs::create_directories(target);

    std::vector<fs::path> subdirs;
    for (const auto& entry : fs::directory_iterator(source)) {
        if (entry.is_directory()) {
            subdirs.push_back(entry.path());
            continue;
        }
        if (!entry.is_regular_file() || shouldSkip(entry.path(), fileNamesToSkip)) continue;

        const auto targetFile = target / entry.path().filename();

        // Existing files are left alone so the rest of the directory still copies
        if (overwrite || !fs::exists(targetFile))
            coordinator_.copyWithLockCoordination(entry.path(), targetFile, managerName, overwrite);

        if (readOnly) applyReadOnly(entry.path(), targetFile, *readOnly);
    }

    std::ranges::sort(subdirs);
    for (const auto& dir : subdirs) {
        if (dir == rootTarget) continue;
        copyDirectoryEx(dir, target / dir.filename(), rootTarget, overwrite, managerName, fileNamesToSkip, readOnly);
    }
}

bool DirectoryCopier::moveDirectory(const fs::path& source, const fs::path& target, const bool overwrite,
                                    const std::string& managerName) {
    const auto src = normalized(source);
    const auto dst = normalized(target);

    if (!fs::is_directory(src))
        throw std::runtime_error("Source directory does not exist: " + src.string());
    if (src == dst) throw std::runtime_error("Source and target directories cannot be the same: " + dst.string());

    moveDirectoryEx(src, dst, dst, overwrite, managerName);
    LogRegistry::copy()->info("[DirectoryCopier] Moved {} to {}", src.string(), dst.string());
    return true;
}

void DirectoryCopier::moveDirectoryEx(const fs::path& source, const fs::path& target,
                                      const fs::path& rootTarget, const bool overwrite,
                                      const std::string& managerName) {
    std::vector<fs::path> subdirs, files;
    for (const auto& entry : fs::directory_iterator(source)) {
        if (entry.is_directory()) subdirs.push_back(entry.path());
        else if (entry.is_regular_file()) files.push_back(entry.path());
    }

    std::ranges::sort(subdirs);
    for (const auto& dir : subdirs) {
        if (dir == rootTarget) continue;
        moveDirectoryEx(dir, target / dir.filename(), rootTarget, overwrite, managerName);
    }

    fs::create_directories(target);

    std::ranges::sort(files);
    for (const auto& file : files) {
        const auto targetFile = target / file.filename();
        if (!coordinator_.copyWithLockCoordination(file, targetFile, managerName, overwrite))
            throw std::runtime_error(fmt::format("Error copying file {} to {}", file.string(), targetFile.string()));

        if (!util::removeFileIgnoreErrors(file))
            LogRegistry::copy()->warn("[DirectoryCopier] Could not delete moved file {}", file.string());
    }

    std::error_code ec;
    if (fs::is_empty(source, ec) && !ec) {
        fs::remove(source, ec);
        if (ec) LogRegistry::copy()->warn("[DirectoryCopier] Could not remove emptied directory {}: {}",
                                          source.string(), ec.message());
    }
}

DirectoryCopyStats DirectoryCopier::copyDirectoryWithResume(const fs::path& source, const fs::path& target,
                                                            const bool recurse, const OverwriteMode mode,
                                                            const std::vector<std::string>& fileNamesToSkip,
                                                            const bool ignoreFileLocks) {
    const auto src = normalized(source);
    const auto dst = normalized(target);

    verifyDirectories(src, dst);
    if (src == dst) throw std::runtime_error("Source and target directories cannot be the same: " + dst.string());

    DirectoryCopyStats stats;
    try {
        resumeDirectory(src, dst, dst, recurse, mode, fileNamesToSkip, ignoreFileLocks, stats);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Exception copying directory with resume: ") + e.what());
    }

    LogRegistry::copy()->info("[DirectoryCopier] {} -> {}: {} copied, {} resumed, {} skipped",
                              src.string(), dst.string(), stats.newlyCopied, stats.resumed, stats.skipped);
    return stats;
}

void DirectoryCopier::resumeDirectory(const fs::path& source, const fs::path& target,
                                      const fs::path& rootTarget, const bool recurse,
                                      const OverwriteMode mode, const std::vector<std::string>& fileNamesToSkip,
                                      const bool ignoreFileLocks, DirectoryCopyStats& stats) {
    fs::create_directories(target);

    std::vector<fs::path> subdirs;
    for (const auto& entry : fs::directory_iterator(source)) {
        if (entry.is_directory()) {
            subdirs.push_back(entry.path());
            continue;
        }
        if (!entry.is_regular_file()) continue;

        const auto& file = entry.path();
        const auto targetFile = target / file.filename();

        bool copyFile = !shouldSkip(file, fileNamesToSkip);
        if (copyFile && fs::exists(targetFile)) copyFile = !targetIsCurrent(file, targetFile, mode);

        if (!copyFile) {
            ++stats.skipped;
            continue;
        }

        if (resumable_.copyWithResume(file, targetFile, ignoreFileLocks).resumed) ++stats.resumed;
        else ++stats.newlyCopied;
    }

    if (!recurse) return;

    std::ranges::sort(subdirs);
    for (const auto& dir : subdirs) {
        if (dir == rootTarget) continue;
        resumeDirectory(dir, target / dir.filename(), rootTarget, recurse, mode, fileNamesToSkip, ignoreFileLocks, stats);
    }
}
