#include <gtest/gtest.h>
#include "queue/LockDirectoryEstimator.hpp"
#include "queue/LockFile.hpp"
#include "util/files.hpp"
#include "support/TestFiles.hpp"

namespace fs = std::filesystem;
using namespace lc::queue;
using namespace std::chrono_literals;

class LockDirectoryEstimatorTest : public ::testing::Test {
protected:
    std::unique_ptr<lc::test::TempDir> tmp;
    fs::path lockDir;

    static constexpr int64_t now = 400000000000;

    void SetUp() override {
        tmp = std::make_unique<lc::test::TempDir>("lockcopy_estimator");
        lockDir = tmp->path() / "DMS_LockFiles";
        fs::create_directories(lockDir);
    }

    void touch(const std::string& name) const { lc::test::writeTextFile(lockDir / name, "Date: test\n"); }

    TransferRequest request(const int64_t ts, const uintmax_t mb) const {
        return {ts, "/mnt/src/run.raw", "/mnt/dst/run.raw", mb * lc::config::MiB, "Test-Manager"};
    }
};

TEST_F(LockDirectoryEstimatorTest, CountsOnlyEarlierLocks) {
    touch(std::to_string(now - 300000) + "_0100_hostA_mgr.lock");
    touch(std::to_string(now - 10000) + "_0250_hostB_mgr.lock");
    touch(std::to_string(now + 5000) + "_0999_hostC_mgr.lock");

    const LockDirectoryEstimator estimator(60min);
    const auto backlog = estimator.backlog(lockDir, now);
    EXPECT_EQ(backlog.count, 2u);
    EXPECT_EQ(backlog.totalMB, 350u);
}

TEST_F(LockDirectoryEstimatorTest, IgnoresOwnTimestampAndStaleLocks) {
    touch(std::to_string(now) + "_0100_self_mgr.lock");
    touch(std::to_string(now - 61 * 60000) + "_0500_crashed_mgr.lock");
    touch(std::to_string(now - 59 * 60000) + "_0020_slow_mgr.lock");

    const LockDirectoryEstimator estimator(60min);
    const auto backlog = estimator.backlog(lockDir, now);
    EXPECT_EQ(backlog.count, 1u);
    EXPECT_EQ(backlog.totalMB, 20u);
}

TEST_F(LockDirectoryEstimatorTest, IgnoresForeignFiles) {
    touch("README.txt");
    touch("notes.lock");
    touch(std::to_string(now - 1000) + "_0010_host_mgr.lock.tmp");
    fs::create_directories(lockDir / (std::to_string(now - 1000) + "_0010_dir.lock"));
    touch(std::to_string(now - 1000) + "_0010_host_mgr.lock");

    const LockDirectoryEstimator estimator;
    EXPECT_EQ(estimator.backlog(lockDir, now).count, 1u);
    EXPECT_EQ(estimator.staleWindow(), 180min);
}

TEST_F(LockDirectoryEstimatorTest, MissingDirectoryIsEmptyBacklog) {
    const LockDirectoryEstimator estimator;
    const auto backlog = estimator.backlog(tmp->path() / "missing", now);
    EXPECT_EQ(backlog.count, 0u);
    EXPECT_EQ(backlog.totalMB, 0u);
}

TEST_F(LockDirectoryEstimatorTest, AnnounceWithdrawAndRelease) {
    LockDirectoryEstimator estimator;

    const auto intent = estimator.announce(lockDir, request(now, 50));
    ASSERT_TRUE(intent.has_value());
    EXPECT_EQ(intent->queue, lockDir);
    EXPECT_TRUE(fs::exists(intent->marker));
    EXPECT_EQ(intent->marker.filename().string().rfind(std::to_string(now) + "_0050_", 0), 0u);
    EXPECT_FALSE(estimator.withdrawn(*intent));

    const auto lines = lc::util::readLines(intent->marker);
    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[4], "Manager: Test-Manager");

    // A later request sees this one in its backlog
    EXPECT_EQ(estimator.backlog(lockDir, now + 1).count, 1u);

    estimator.release(*intent);
    EXPECT_FALSE(fs::exists(intent->marker));
    EXPECT_TRUE(estimator.withdrawn(*intent));

    // Releasing twice is harmless
    estimator.release(*intent);
}

TEST_F(LockDirectoryEstimatorTest, ConcurrentAnnouncementsGetDistinctFiles) {
    LockDirectoryEstimator estimator;
    const auto a = estimator.announce(lockDir, request(now, 50));
    const auto b = estimator.announce(lockDir, request(now, 50));
    ASSERT_TRUE(a && b);
    EXPECT_NE(a->marker, b->marker);
    EXPECT_EQ(lc::test::listFiles(lockDir).size(), 2u);
}

TEST_F(LockDirectoryEstimatorTest, AnnounceIntoMissingDirectoryFailsSoftly) {
    LockDirectoryEstimator estimator;
    EXPECT_FALSE(estimator.announce(tmp->path() / "missing", request(now, 50)).has_value());
}
