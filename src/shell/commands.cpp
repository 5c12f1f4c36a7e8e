#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/argsHelpers.hpp"
#include "copy/DirectoryCopier.hpp"
#include "copy/FileCopier.hpp"
#include "copy/ResumableCopier.hpp"
#include "crypto/Hash.hpp"
#include "queue/Coordinator.hpp"
#include "queue/LockDirectoryEstimator.hpp"
#include "queue/LockFile.hpp"
#include "share/ShareResolver.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

#include <fmt/format.h>
#include <sstream>

using namespace lc::shell;
namespace fs = std::filesystem;

namespace {

std::vector<std::string> splitList(const std::string& csv) {
    std::vector<std::string> out;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ','))
        if (!item.empty()) out.push_back(item);
    return out;
}

std::optional<CommandResult> requirePositionals(const CommandCall& call, const size_t count, const std::string& usage) {
    if (call.positionals.size() < count)
        return invalid(fmt::format("Missing arguments. Usage: lockcopy {}", usage));
    return std::nullopt;
}

std::string managerFor(const CommandCall& call, const lc::config::Config& config) {
    return optVal(call, "manager").value_or(config.lock_queue.manager_name);
}

}

void lc::shell::registerAllCommands(Router& router, const std::shared_ptr<CommandContext>& ctx) {
    registerCopyCommands(router, ctx);
    registerQueueCommands(router, ctx);
    registerToolCommands(router, ctx);
}

void lc::shell::registerCopyCommands(Router& router, const std::shared_ptr<CommandContext>& ctx) {
    static const std::string copyUsage = "copy <source> <target> [--manager <name>] [--overwrite] [--backup]";
    router.registerCommand("copy", "Copy a file, queueing behind other large transfers on its shares", copyUsage,
        [ctx](const CommandCall& call) -> CommandResult {
            if (auto err = requirePositionals(call, 2, copyUsage)) return *err;
            const fs::path source = call.positionals[0], target = call.positionals[1];
            const bool overwrite = hasKey(call, "overwrite");

            // Without --overwrite an existing target wins, so there is nothing to back up
            if (hasKey(call, "backup") && overwrite)
                copy::FileCopier::backupBeforeCopy(target, ctx->config.copy.backup_versions_to_keep);

            queue::Coordinator coordinator(ctx->config, ctx->notifier);
            coordinator.copyWithLockCoordination(source, target, managerFor(call, ctx->config), overwrite);

            return ok(fmt::format("Copied {} to {}\n", source.string(), target.string()),
                      {{"source", source.string()}, {"target", target.string()},
                       {"state", queue::to_string(coordinator.state())}});
        }, {"cp"});

    static const std::string resumeUsage = "resume <source> <target> [--ignore-locks] [--chunk <MB>] [--flush <MB>]";
    router.registerCommand("resume", "Copy a file in chunks, resuming an interrupted copy when possible", resumeUsage,
        [ctx](const CommandCall& call) -> CommandResult {
            if (auto err = requirePositionals(call, 2, resumeUsage)) return *err;

            copy::ResumableCopier copier(ctx->config.copy, ctx->notifier);
            if (const auto chunk = optVal(call, "chunk")) {
                const auto mb = parseUInt(*chunk);
                if (!mb) return invalid("Invalid --chunk value: " + *chunk);
                copier.setChunkSizeMB(*mb);
            }
            if (const auto flush = optVal(call, "flush")) {
                const auto mb = parseUInt(*flush);
                if (!mb) return invalid("Invalid --flush value: " + *flush);
                copier.setFlushThresholdMB(*mb);
            }

            const auto result = copier.copyWithResume(call.positionals[0], call.positionals[1], hasKey(call, "ignore-locks"));
            return ok(fmt::format("{} {} to {}\n", result.resumed ? "Resumed copy of" : "Copied",
                                  call.positionals[0], call.positionals[1]),
                      {{"success", result.success}, {"resumed", result.resumed}});
        });

    static const std::string copydirUsage =
        "copydir <source> <target> [--overwrite] [--manager <name>] [--skip <a,b>] [--readonly|--writable]";
    router.registerCommand("copydir", "Copy a directory tree, queueing each large file", copydirUsage,
        [ctx](const CommandCall& call) -> CommandResult {
            if (auto err = requirePositionals(call, 2, copydirUsage)) return *err;

            std::optional<bool> readOnly;
            if (hasKey(call, "readonly") && hasKey(call, "writable"))
                return invalid("--readonly and --writable cannot be combined");
            if (hasKey(call, "readonly")) readOnly = true;
            else if (hasKey(call, "writable")) readOnly = false;

            queue::Coordinator coordinator(ctx->config, ctx->notifier);
            copy::DirectoryCopier copier(coordinator, coordinator.resumableCopier());
            copier.copyDirectory(call.positionals[0], call.positionals[1], hasKey(call, "overwrite"),
                                 managerFor(call, ctx->config), splitList(optVal(call, "skip").value_or("")), readOnly);

            return ok(fmt::format("Copied directory {} to {}\n", call.positionals[0], call.positionals[1]),
                      {{"source", call.positionals[0]}, {"target", call.positionals[1]}});
        });

    static const std::string movedirUsage = "movedir <source> <target> [--overwrite] [--manager <name>]";
    router.registerCommand("movedir", "Move a directory tree, queueing each large file", movedirUsage,
        [ctx](const CommandCall& call) -> CommandResult {
            if (auto err = requirePositionals(call, 2, movedirUsage)) return *err;

            queue::Coordinator coordinator(ctx->config, ctx->notifier);
            copy::DirectoryCopier copier(coordinator, coordinator.resumableCopier());
            copier.moveDirectory(call.positionals[0], call.positionals[1], hasKey(call, "overwrite"),
                                 managerFor(call, ctx->config));

            return ok(fmt::format("Moved directory {} to {}\n", call.positionals[0], call.positionals[1]),
                      {{"source", call.positionals[0]}, {"target", call.positionals[1]}});
        }, {"mvdir"});

    static const std::string resumedirUsage =
        "resumedir <source> <target> [--recurse] [--mode never|always|newer|differ] [--skip <a,b>] [--ignore-locks]";
    router.registerCommand("resumedir", "Copy a directory with resumable file copies", resumedirUsage,
        [ctx](const CommandCall& call) -> CommandResult {
            if (auto err = requirePositionals(call, 2, resumedirUsage)) return *err;

            auto mode = copy::OverwriteMode::OverwriteIfDateOrLengthDiffer;
            if (const auto m = optVal(call, "mode")) {
                const auto parsed = copy::parseOverwriteMode(*m);
                if (!parsed) return invalid("Invalid --mode value: " + *m);
                mode = *parsed;
            }

            queue::Coordinator coordinator(ctx->config, ctx->notifier);
            copy::DirectoryCopier copier(coordinator, coordinator.resumableCopier());
            const auto stats = copier.copyDirectoryWithResume(
                call.positionals[0], call.positionals[1], hasKey(call, "recurse") || hasKey(call, "r"), mode,
                splitList(optVal(call, "skip").value_or("")), hasKey(call, "ignore-locks"));

            return ok(fmt::format("{} copied, {} resumed, {} skipped\n", stats.newlyCopied, stats.resumed, stats.skipped),
                      {{"copied", stats.newlyCopied}, {"resumed", stats.resumed}, {"skipped", stats.skipped}});
        });
}

void lc::shell::registerQueueCommands(Router& router, const std::shared_ptr<CommandContext>& ctx) {
    static const std::string queueUsage = "queue <path> [--at <timestampMs>]";
    router.registerCommand("queue", "Show the lock file backlog for a share or lock directory", queueUsage,
        [ctx](const CommandCall& call) -> CommandResult {
            if (auto err = requirePositionals(call, 1, queueUsage)) return *err;

            const fs::path path = call.positionals[0];
            std::optional<fs::path> lockDir;
            if (path.filename() == ctx->config.shares.lock_directory_name && fs::is_directory(path)) lockDir = path;
            else lockDir = share::ShareResolver(ctx->config.shares).lockDirectory(path);

            if (!lockDir) return invalid("No lock directory found for " + path.string());

            auto timestamp = util::lockTimestampMs(std::chrono::system_clock::now());
            if (const auto at = optVal(call, "at")) {
                try {
                    timestamp = std::stoll(*at);
                } catch (const std::logic_error&) {
                    return invalid("Invalid --at value: " + *at);
                }
            }

            const queue::LockDirectoryEstimator estimator(ctx->config.lock_queue.stale_lock);
            const auto backlog = estimator.backlog(*lockDir, timestamp);

            return ok(fmt::format("{}: {} queued transfer(s), {} MB\n", lockDir->string(), backlog.count, backlog.totalMB),
                      {{"lock_directory", lockDir->string()}, {"count", backlog.count}, {"total_mb", backlog.totalMB}});
        }, {"backlog"});
}

void lc::shell::registerToolCommands(Router& router, const std::shared_ptr<CommandContext>& ctx) {
    static const std::string hashUsage = "hash <file> [--algo crc32|md5|sha1]";
    router.registerCommand("hash", "Compute a file checksum", hashUsage,
        [](const CommandCall& call) -> CommandResult {
            if (auto err = requirePositionals(call, 1, hashUsage)) return *err;

            const auto name = optVal(call, "algo").value_or("sha1");
            const auto algorithm = crypto::Hash::parseAlgorithm(name);
            if (!algorithm) return invalid("Unknown hash algorithm: " + name);

            const auto digest = crypto::Hash::compute(call.positionals[0], *algorithm);
            return ok(fmt::format("{}  {}\n", digest, call.positionals[0]),
                      {{"file", call.positionals[0]}, {"algorithm", crypto::to_string(*algorithm)}, {"hash", digest}});
        });

    static const std::string backupUsage = "backup <file> [--keep <N>]";
    router.registerCommand("backup", "Rotate name.ext into name_Old1.ext, name_Old2.ext, ...", backupUsage,
        [ctx](const CommandCall& call) -> CommandResult {
            if (auto err = requirePositionals(call, 1, backupUsage)) return *err;

            int keep = ctx->config.copy.backup_versions_to_keep;
            if (const auto k = optVal(call, "keep")) {
                const auto parsed = parseInt(*k);
                if (!parsed) return invalid("Invalid --keep value: " + *k);
                keep = *parsed;
            }

            copy::FileCopier::backupBeforeCopy(call.positionals[0], keep);
            return ok(fmt::format("Backed up {}\n", call.positionals[0]), {{"file", call.positionals[0]}, {"keep", keep}});
        });

    router.registerCommand("config", "Print the effective configuration", "config",
        [ctx](const CommandCall&) -> CommandResult {
            return ok(config::dumpConfig(ctx->config) + "\n");
        });
}
