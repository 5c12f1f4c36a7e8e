#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace lc::config {

constexpr static uintmax_t MiB = 1024 * 1024;

struct LockQueueConfig {
    std::string manager_name = "Unknown-Manager";
    uintmax_t min_source_size_mb = 20;      // smaller files never queue
    uintmax_t transfer_threshold_mb = 1000; // backlog + own size must stay below this
    std::chrono::minutes max_wait{180};
    std::chrono::minutes stale_lock{180};   // older lock files are left over from crashed copies
    std::chrono::minutes slow_share_max_wait{30};
    std::vector<std::string> slow_share_prefixes; // empty: no share is slow unless configured
    std::chrono::minutes notify_lock_paths_after{5};
    double throughput_mb_per_sec = 200.0;
    std::chrono::seconds min_poll_interval{1};
    std::chrono::seconds max_poll_interval{30};
};

struct CopyConfig {
    unsigned int chunk_size_mb = 1;
    unsigned int flush_threshold_mb = 25;
    uintmax_t resumable_threshold_mb = 1024; // 0 = coordinator always uses a plain copy
    int backup_versions_to_keep = 9;
};

struct SharesConfig {
    std::string lock_directory_name = "DMS_LockFiles";
    std::vector<std::filesystem::path> mounted_shares;
    std::map<std::string, std::string> aliases = {{"picfs", "picfs/projects/DMS"}};
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum lockcopy = spdlog::level::info;
    spdlog::level::level_enum queue    = spdlog::level::info;   // Lock creation, waits, timeouts
    spdlog::level::level_enum copy     = spdlog::level::info;   // Resume decisions and copy failures
    spdlog::level::level_enum share    = spdlog::level::warn;
    spdlog::level::level_enum notify   = spdlog::level::info;
    spdlog::level::level_enum crypto   = spdlog::level::warn;
    spdlog::level::level_enum shell    = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/lockcopy";
    LogLevelsConfig levels;
};

struct Config {
    LockQueueConfig lock_queue;
    CopyConfig copy;
    SharesConfig shares;
    LoggingConfig logging;
};

// Missing file or missing keys keep the defaults above.
Config loadConfig(const std::filesystem::path& path);
Config parseConfig(const std::string& yaml);

// Effective configuration rendered back to YAML (lockcopy config).
std::string dumpConfig(const Config& config);

} // namespace lc::config
