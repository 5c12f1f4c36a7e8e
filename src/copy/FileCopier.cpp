#include "copy/FileCopier.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>

using namespace lc::copy;
using namespace lc::logging;
namespace fs = std::filesystem;

FileCopier::FileCopier(std::shared_ptr<notify::Notifier> notifier) : notifier_(std::move(notifier)) {}

void FileCopier::copy(const fs::path& source, const fs::path& target, const bool overwrite,
                      const bool backupBeforeCopy, const int versionsToKeep) const {
    const auto parent = target.parent_path();
    if (!parent.empty()) fs::create_directories(parent);

    if (!overwrite && fs::exists(target))
        throw fs::filesystem_error("Target file already exists", source, target,
                                   std::make_error_code(std::errc::file_exists));

    if (backupBeforeCopy) FileCopier::backupBeforeCopy(target, versionsToKeep);

    if (notifier_) notifier_->publish(notify::CopyStarting{source.string()});
    LogRegistry::copy()->debug("[FileCopier] Copying {} to {}", source.string(), target.string());

    const auto options = overwrite ? fs::copy_options::overwrite_existing : fs::copy_options::none;
    if (!fs::copy_file(source, target, options))
        throw fs::filesystem_error("Target file already exists", source, target,
                                   std::make_error_code(std::errc::file_exists));

    fs::last_write_time(target, fs::last_write_time(source));
}

void FileCopier::backupBeforeCopy(const fs::path& target, int versionsToKeep) {
    if (!fs::exists(target)) return;

    if (versionsToKeep == 0) versionsToKeep = 2;
    if (versionsToKeep < 1) versionsToKeep = 1;

    const auto dir = target.parent_path();
    const auto baseName = target.stem().string();
    auto extension = target.extension().string();
    if (extension.empty()) extension = ".bak";

    for (int revision = versionsToKeep - 1; revision >= 0; --revision) {
        const auto current = revision == 0 ? target : dir / fmt::format("{}_Old{}{}", baseName, revision, extension);
        const auto next = dir / fmt::format("{}_Old{}{}", baseName, revision + 1, extension);

        if (fs::exists(next)) fs::remove(next);
        if (fs::exists(current)) fs::rename(current, next);
    }

    LogRegistry::copy()->debug("[FileCopier] Backed up {} ({} versions kept)", target.string(), versionsToKeep);
}
