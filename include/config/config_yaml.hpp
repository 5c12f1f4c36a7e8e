#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace lc::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<LockQueueConfig> {
    static Node encode(const LockQueueConfig& rhs) {
        Node node;
        node["manager_name"] = rhs.manager_name;
        node["min_source_size_mb"] = rhs.min_source_size_mb;
        node["transfer_threshold_mb"] = rhs.transfer_threshold_mb;
        node["max_wait_minutes"] = rhs.max_wait.count();
        node["stale_lock_minutes"] = rhs.stale_lock.count();
        node["slow_share_max_wait_minutes"] = rhs.slow_share_max_wait.count();
        node["slow_share_prefixes"] = rhs.slow_share_prefixes;
        node["notify_lock_paths_after_minutes"] = rhs.notify_lock_paths_after.count();
        node["throughput_mb_per_sec"] = rhs.throughput_mb_per_sec;
        node["min_poll_interval_seconds"] = rhs.min_poll_interval.count();
        node["max_poll_interval_seconds"] = rhs.max_poll_interval.count();
        return node;
    }

    static bool decode(const Node& node, LockQueueConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.manager_name = node["manager_name"].as<std::string>(rhs.manager_name);
        rhs.min_source_size_mb = node["min_source_size_mb"].as<uintmax_t>(rhs.min_source_size_mb);
        rhs.transfer_threshold_mb = node["transfer_threshold_mb"].as<uintmax_t>(rhs.transfer_threshold_mb);
        rhs.max_wait = std::chrono::minutes(node["max_wait_minutes"].as<long>(rhs.max_wait.count()));
        rhs.stale_lock = std::chrono::minutes(node["stale_lock_minutes"].as<long>(rhs.stale_lock.count()));
        rhs.slow_share_max_wait = std::chrono::minutes(
            node["slow_share_max_wait_minutes"].as<long>(rhs.slow_share_max_wait.count()));
        if (node["slow_share_prefixes"])
            rhs.slow_share_prefixes = node["slow_share_prefixes"].as<std::vector<std::string>>();
        rhs.notify_lock_paths_after = std::chrono::minutes(
            node["notify_lock_paths_after_minutes"].as<long>(rhs.notify_lock_paths_after.count()));
        rhs.throughput_mb_per_sec = node["throughput_mb_per_sec"].as<double>(rhs.throughput_mb_per_sec);
        rhs.min_poll_interval = std::chrono::seconds(
            node["min_poll_interval_seconds"].as<long>(rhs.min_poll_interval.count()));
        rhs.max_poll_interval = std::chrono::seconds(
            node["max_poll_interval_seconds"].as<long>(rhs.max_poll_interval.count()));
        return true;
    }
};

template<>
struct convert<CopyConfig> {
    static Node encode(const CopyConfig& rhs) {
        Node node;
        node["chunk_size_mb"] = rhs.chunk_size_mb;
        node["flush_threshold_mb"] = rhs.flush_threshold_mb;
        node["resumable_threshold_mb"] = rhs.resumable_threshold_mb;
        node["backup_versions_to_keep"] = rhs.backup_versions_to_keep;
        return node;
    }

    static bool decode(const Node& node, CopyConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.chunk_size_mb = node["chunk_size_mb"].as<unsigned int>(rhs.chunk_size_mb);
        rhs.flush_threshold_mb = node["flush_threshold_mb"].as<unsigned int>(rhs.flush_threshold_mb);
        rhs.resumable_threshold_mb = node["resumable_threshold_mb"].as<uintmax_t>(rhs.resumable_threshold_mb);
        rhs.backup_versions_to_keep = node["backup_versions_to_keep"].as<int>(rhs.backup_versions_to_keep);
        return true;
    }
};

template<>
struct convert<SharesConfig> {
    static Node encode(const SharesConfig& rhs) {
        Node node;
        node["lock_directory_name"] = rhs.lock_directory_name;
        for (const auto& p : rhs.mounted_shares) node["mounted_shares"].push_back(p.string());
        for (const auto& [server, base] : rhs.aliases) node["aliases"][server] = base;
        return node;
    }

    static bool decode(const Node& node, SharesConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.lock_directory_name = node["lock_directory_name"].as<std::string>(rhs.lock_directory_name);
        if (node["mounted_shares"]) {
            rhs.mounted_shares.clear();
            for (const auto& s : node["mounted_shares"].as<std::vector<std::string>>())
                rhs.mounted_shares.emplace_back(s);
        }
        if (node["aliases"]) rhs.aliases = node["aliases"].as<std::map<std::string, std::string>>();
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["lockcopy"] = to_std_string(spdlog::level::to_string_view(rhs.lockcopy));
        node["queue"]    = to_std_string(spdlog::level::to_string_view(rhs.queue));
        node["copy"]     = to_std_string(spdlog::level::to_string_view(rhs.copy));
        node["share"]    = to_std_string(spdlog::level::to_string_view(rhs.share));
        node["notify"]   = to_std_string(spdlog::level::to_string_view(rhs.notify));
        node["crypto"]   = to_std_string(spdlog::level::to_string_view(rhs.crypto));
        node["shell"]    = to_std_string(spdlog::level::to_string_view(rhs.shell));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.lockcopy = spdlog::level::from_str(node["lockcopy"].as<std::string>("info"));
        rhs.queue = spdlog::level::from_str(node["queue"].as<std::string>("info"));
        rhs.copy = spdlog::level::from_str(node["copy"].as<std::string>("info"));
        rhs.share = spdlog::level::from_str(node["share"].as<std::string>("warn"));
        rhs.notify = spdlog::level::from_str(node["notify"].as<std::string>("info"));
        rhs.crypto = spdlog::level::from_str(node["crypto"].as<std::string>("warn"));
        rhs.shell = spdlog::level::from_str(node["shell"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>(rhs.log_dir.string());
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
