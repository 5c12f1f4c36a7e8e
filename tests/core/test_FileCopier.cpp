#include <gtest/gtest.h>
#include "copy/FileCopier.hpp"
#include "notify/EventQueue.hpp"
#include "support/TestFiles.hpp"

namespace fs = std::filesystem;
using namespace lc::copy;
using lc::test::readTextFile;
using lc::test::writeTextFile;

class FileCopierTest : public ::testing::Test {
protected:
    std::unique_ptr<lc::test::TempDir> tmp;

    void SetUp() override { tmp = std::make_unique<lc::test::TempDir>("lockcopy_filecopier"); }

    void backupRounds(const fs::path& target, const int rounds, const int keep) const {
        for (int i = 1; i <= rounds; ++i) {
            writeTextFile(target, "v" + std::to_string(i));
            FileCopier::backupBeforeCopy(target, keep);
        }
    }
};

TEST_F(FileCopierTest, CopiesIntoNewDirectoriesAndKeepsModificationTime) {
    const auto source = *tmp / "a.txt";
    const auto target = *tmp / "x" / "y" / "a.txt";
    writeTextFile(source, "payload");
    fs::last_write_time(source, fs::last_write_time(source) - std::chrono::hours(5));

    auto notifier = std::make_shared<lc::notify::Notifier>();
    auto events = std::make_shared<lc::notify::EventQueue>();
    notifier->subscribe(events);

    FileCopier(notifier).copy(source, target, false);

    EXPECT_EQ(readTextFile(target), "payload");
    EXPECT_EQ(fs::last_write_time(target), fs::last_write_time(source));
    EXPECT_EQ(events->size(), 1u);
}

TEST_F(FileCopierTest, RefusesToOverwriteUnlessAsked) {
    const auto source = *tmp / "a.txt";
    const auto target = *tmp / "b.txt";
    writeTextFile(source, "new");
    writeTextFile(target, "old");

    const FileCopier copier;
    EXPECT_THROW(copier.copy(source, target, false), fs::filesystem_error);
    EXPECT_EQ(readTextFile(target), "old");

    copier.copy(source, target, true);
    EXPECT_EQ(readTextFile(target), "new");
}

TEST_F(FileCopierTest, BackupBeforeCopyKeepsPreviousVersion) {
    const auto source = *tmp / "a.txt";
    const auto target = *tmp / "b.txt";
    writeTextFile(source, "new");
    writeTextFile(target, "old");

    FileCopier().copy(source, target, true, true, 3);

    EXPECT_EQ(readTextFile(target), "new");
    EXPECT_EQ(readTextFile(*tmp / "b_Old1.txt"), "old");
}

TEST_F(FileCopierTest, BackupSkippedWhenExistingTargetIsKept) {
    const auto source = *tmp / "a.txt";
    const auto target = *tmp / "b.txt";
    writeTextFile(source, "new");
    writeTextFile(target, "old");

    EXPECT_THROW(FileCopier().copy(source, target, false, true, 3), fs::filesystem_error);

    EXPECT_EQ(readTextFile(target), "old");
    EXPECT_FALSE(fs::exists(*tmp / "b_Old1.txt"));
}

TEST_F(FileCopierTest, BackupRotationDropsOldest) {
    const auto target = *tmp / "report.txt";
    backupRounds(target, 4, 3);

    EXPECT_FALSE(fs::exists(target));
    EXPECT_EQ(readTextFile(*tmp / "report_Old1.txt"), "v4");
    EXPECT_EQ(readTextFile(*tmp / "report_Old2.txt"), "v3");
    EXPECT_EQ(readTextFile(*tmp / "report_Old3.txt"), "v2");
    EXPECT_FALSE(fs::exists(*tmp / "report_Old4.txt"));
}

TEST_F(FileCopierTest, BackupVersionLimits) {
    backupRounds(*tmp / "zero.txt", 3, 0);
    EXPECT_TRUE(fs::exists(*tmp / "zero_Old2.txt"));
    EXPECT_FALSE(fs::exists(*tmp / "zero_Old3.txt"));

    backupRounds(*tmp / "neg.txt", 3, -4);
    EXPECT_EQ(readTextFile(*tmp / "neg_Old1.txt"), "v3");
    EXPECT_FALSE(fs::exists(*tmp / "neg_Old2.txt"));
}

TEST_F(FileCopierTest, BackupOfFileWithoutExtensionUsesBak) {
    backupRounds(*tmp / "settings", 2, 9);
    EXPECT_EQ(readTextFile(*tmp / "settings_Old1.bak"), "v2");
    EXPECT_EQ(readTextFile(*tmp / "settings_Old2.bak"), "v1");
}

TEST_F(FileCopierTest, BackupOfMissingFileDoesNothing) {
    EXPECT_NO_THROW(FileCopier::backupBeforeCopy(*tmp / "missing.txt"));
    EXPECT_TRUE(lc::test::listFiles(tmp->path()).empty());
}
