#include <gtest/gtest.h>
#include "queue/LockFile.hpp"
#include "util/files.hpp"
#include "support/TestFiles.hpp"

namespace fs = std::filesystem;
using namespace lc::queue;

namespace {

LockFile sampleLock() {
    return {
        .timestampMs = 358497345123,
        .sizeBytes = 52428800,
        .host = "Proto-7",
        .manager = "Capture-Manager",
        .source = "/mnt/proto-7/data/run1.raw",
        .target = "/mnt/archive/run1.raw"
    };
}

}

TEST(LockFileTest, FileNameEncodesTimestampSizeHostAndManager) {
    EXPECT_EQ(sampleLock().fileName(), "358497345123_0050_Proto-7_Capture-Manager.lock");
}

TEST(LockFileTest, SizeIsZeroPaddedAndRounded) {
    auto lock = sampleLock();
    lock.sizeBytes = 3 * 1024 * 1024 + 600 * 1024;
    EXPECT_EQ(lock.sizeMB(), 4u);
    EXPECT_EQ(lock.fileName().substr(13, 5), "0004_");

    lock.sizeBytes = 12345ull * 1024 * 1024;
    EXPECT_EQ(lock.fileName().substr(13, 6), "12345_");
}

TEST(LockFileTest, BlankManagerBecomesUnknown) {
    auto lock = sampleLock();
    lock.manager = "  ";
    EXPECT_EQ(lock.fileName(), "358497345123_0050_Proto-7_UnknownManager.lock");
    EXPECT_EQ(lock.contentLines().back(), "Manager: UnknownManager");
}

TEST(LockFileTest, InvalidCharactersAreReplaced) {
    auto lock = sampleLock();
    lock.manager = "Mgr A/B:C*?";
    EXPECT_EQ(lock.fileName(), "358497345123_0050_Proto-7_Mgr_A_B_C__.lock");
    EXPECT_EQ(sanitizeLockFileName("a\"b<c>d|e\tf"), "a_b_c_d_e_f");
}

TEST(LockFileTest, ContentLines) {
    const auto lines = sampleLock().contentLines();
    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[0].rfind("Date: 2021-", 0), 0u);
    EXPECT_EQ(lines[1], "Source: /mnt/proto-7/data/run1.raw");
    EXPECT_EQ(lines[2], "Target: /mnt/archive/run1.raw");
    EXPECT_EQ(lines[3], "Size_Bytes: 52428800");
    EXPECT_EQ(lines[4], "Manager: Capture-Manager");
}

TEST(LockFileTest, ParsesOwnNames) {
    const auto parsed = parseLockFileName(sampleLock().fileName());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->timestampMs, 358497345123);
    EXPECT_EQ(parsed->sizeMB, 50u);
}

TEST(LockFileTest, ParsesCollisionSuffixedNames) {
    const auto parsed = parseLockFileName("100_0007_host_mgr--.lock");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->timestampMs, 100);
    EXPECT_EQ(parsed->sizeMB, 7u);
}

TEST(LockFileTest, IgnoresForeignFiles) {
    EXPECT_FALSE(parseLockFileName("100_0007_host_mgr.txt").has_value());
    EXPECT_FALSE(parseLockFileName("abc_0007_host.lock").has_value());
    EXPECT_FALSE(parseLockFileName("100-0007_host.lock").has_value());
    EXPECT_FALSE(parseLockFileName("README").has_value());
    EXPECT_FALSE(parseLockFileName("99999999999999999999999_1_h.lock").has_value());
}

TEST(LockFileTest, CreateWritesContentAndAvoidsCollisions) {
    const lc::test::TempDir tmp("lockcopy_lockfile");
    const auto lock = sampleLock();

    const auto first = createLockFile(tmp.path(), lock);
    const auto second = createLockFile(tmp.path(), lock);
    const auto third = createLockFile(tmp.path(), lock);

    EXPECT_EQ(first.filename(), "358497345123_0050_Proto-7_Capture-Manager.lock");
    EXPECT_EQ(second.filename(), "358497345123_0050_Proto-7_Capture-Manager-.lock");
    EXPECT_EQ(third.filename(), "358497345123_0050_Proto-7_Capture-Manager--.lock");

    EXPECT_EQ(lc::util::readLines(first), lock.contentLines());
    EXPECT_EQ(lc::test::listFiles(tmp.path()).size(), 3u);
}

TEST(LockFileTest, CreateInMissingDirectoryThrows) {
    const lc::test::TempDir tmp("lockcopy_lockfile");
    EXPECT_THROW(createLockFile(tmp / "missing", sampleLock()), std::runtime_error);
}
