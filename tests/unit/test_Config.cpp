#include <gtest/gtest.h>
#include "config/Config.hpp"

#include <filesystem>

using namespace lc::config;
using namespace std::chrono_literals;

TEST(ConfigTest, DefaultsMatchPackagedValues) {
    const Config cfg;
    EXPECT_EQ(cfg.lock_queue.min_source_size_mb, 20u);
    EXPECT_EQ(cfg.lock_queue.transfer_threshold_mb, 1000u);
    EXPECT_EQ(cfg.lock_queue.max_wait, 180min);
    EXPECT_EQ(cfg.lock_queue.stale_lock, 180min);
    EXPECT_EQ(cfg.lock_queue.slow_share_max_wait, 30min);
    EXPECT_TRUE(cfg.lock_queue.slow_share_prefixes.empty());
    EXPECT_EQ(cfg.lock_queue.notify_lock_paths_after, 5min);
    EXPECT_EQ(cfg.copy.chunk_size_mb, 1u);
    EXPECT_EQ(cfg.copy.flush_threshold_mb, 25u);
    EXPECT_EQ(cfg.shares.lock_directory_name, "DMS_LockFiles");
}

TEST(ConfigTest, MissingFileKeepsDefaults) {
    const auto cfg = loadConfig("/nonexistent/lockcopy/config.yaml");
    EXPECT_EQ(cfg.lock_queue.transfer_threshold_mb, 1000u);
    EXPECT_TRUE(cfg.shares.mounted_shares.empty());
}

TEST(ConfigTest, ParsesEverySection) {
    const auto cfg = parseConfig(R"(
lock_queue:
  manager_name: Capture-7
  min_source_size_mb: 50
  transfer_threshold_mb: 2000
  max_wait_minutes: 60
  stale_lock_minutes: 90
  slow_share_max_wait_minutes: 10
  slow_share_prefixes: ["//proto-2/", "/mnt/proto-2/"]
  notify_lock_paths_after_minutes: 2
  throughput_mb_per_sec: 100.5
  min_poll_interval_seconds: 2
  max_poll_interval_seconds: 45
copy:
  chunk_size_mb: 4
  flush_threshold_mb: 40
  resumable_threshold_mb: 0
  backup_versions_to_keep: 3
shares:
  lock_directory_name: Locks
  mounted_shares: [/mnt/proto-5, /mnt/proto-6]
  aliases:
    archive: archive/root
logging:
  log_dir: /tmp/lockcopy-logs
  log_levels:
    console_log_level: warn
    subsystem_levels:
      queue: debug
)");

    EXPECT_EQ(cfg.lock_queue.manager_name, "Capture-7");
    EXPECT_EQ(cfg.lock_queue.min_source_size_mb, 50u);
    EXPECT_EQ(cfg.lock_queue.transfer_threshold_mb, 2000u);
    EXPECT_EQ(cfg.lock_queue.max_wait, 60min);
    EXPECT_EQ(cfg.lock_queue.stale_lock, 90min);
    EXPECT_EQ(cfg.lock_queue.slow_share_max_wait, 10min);
    ASSERT_EQ(cfg.lock_queue.slow_share_prefixes.size(), 2u);
    EXPECT_EQ(cfg.lock_queue.slow_share_prefixes[1], "/mnt/proto-2/");
    EXPECT_EQ(cfg.lock_queue.notify_lock_paths_after, 2min);
    EXPECT_DOUBLE_EQ(cfg.lock_queue.throughput_mb_per_sec, 100.5);
    EXPECT_EQ(cfg.lock_queue.min_poll_interval, 2s);
    EXPECT_EQ(cfg.lock_queue.max_poll_interval, 45s);

    EXPECT_EQ(cfg.copy.chunk_size_mb, 4u);
    EXPECT_EQ(cfg.copy.flush_threshold_mb, 40u);
    EXPECT_EQ(cfg.copy.resumable_threshold_mb, 0u);
    EXPECT_EQ(cfg.copy.backup_versions_to_keep, 3);

    EXPECT_EQ(cfg.shares.lock_directory_name, "Locks");
    ASSERT_EQ(cfg.shares.mounted_shares.size(), 2u);
    EXPECT_EQ(cfg.shares.mounted_shares[0], std::filesystem::path("/mnt/proto-5"));
    ASSERT_EQ(cfg.shares.aliases.size(), 1u);
    EXPECT_EQ(cfg.shares.aliases.at("archive"), "archive/root");

    EXPECT_EQ(cfg.logging.log_dir, std::filesystem::path("/tmp/lockcopy-logs"));
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.queue, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.share, spdlog::level::warn);
}

TEST(ConfigTest, PartialSectionKeepsOtherDefaults) {
    const auto cfg = parseConfig("lock_queue:\n  max_wait_minutes: 15\n");
    EXPECT_EQ(cfg.lock_queue.max_wait, 15min);
    EXPECT_EQ(cfg.lock_queue.transfer_threshold_mb, 1000u);
    EXPECT_EQ(cfg.copy.flush_threshold_mb, 25u);
    EXPECT_EQ(cfg.shares.aliases.at("picfs"), "picfs/projects/DMS");
}

TEST(ConfigTest, EmptyDocumentIsDefault) {
    const auto cfg = parseConfig("");
    EXPECT_EQ(cfg.lock_queue.manager_name, "Unknown-Manager");
}

TEST(ConfigTest, DumpParsesBackToSameValues) {
    Config original;
    original.lock_queue.max_wait = 42min;
    original.lock_queue.slow_share_prefixes = {"//slow/"};
    original.copy.chunk_size_mb = 8;
    original.shares.mounted_shares = {"/mnt/a"};

    const auto reparsed = parseConfig(dumpConfig(original));
    EXPECT_EQ(reparsed.lock_queue.max_wait, 42min);
    EXPECT_EQ(reparsed.lock_queue.slow_share_prefixes, original.lock_queue.slow_share_prefixes);
    EXPECT_EQ(reparsed.copy.chunk_size_mb, 8u);
    EXPECT_EQ(reparsed.shares.mounted_shares, original.shares.mounted_shares);
    EXPECT_EQ(reparsed.logging.levels.file_log_level, spdlog::level::debug);
}
