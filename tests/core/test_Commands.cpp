#include <gtest/gtest.h>
#include "shell/Router.hpp"
#include "shell/commands.hpp"
#include "notify/EventQueue.hpp"
#include "queue/LockFile.hpp"
#include "support/TestFiles.hpp"

#include <fmt/format.h>

namespace fs = std::filesystem;
using namespace lc::shell;
using lc::test::readTextFile;
using lc::test::writeTextFile;

class CommandsTest : public ::testing::Test {
protected:
    std::unique_ptr<lc::test::TempDir> tmp;
    std::unique_ptr<lc::test::ShareLayout> layout;
    std::shared_ptr<CommandContext> ctx = std::make_shared<CommandContext>();
    std::shared_ptr<lc::notify::EventQueue> events = std::make_shared<lc::notify::EventQueue>();
    Router router;

    void SetUp() override {
        tmp = std::make_unique<lc::test::TempDir>("lockcopy_commands");
        layout = std::make_unique<lc::test::ShareLayout>(tmp->path());

        ctx->config = layout->config;
        ctx->notifier = std::make_shared<lc::notify::Notifier>();
        ctx->notifier->subscribe(events);
        registerAllCommands(router, ctx);
    }

    CommandResult run(const std::vector<std::string>& args) const { return router.executeArgs(args); }
};

TEST_F(CommandsTest, CopyCommand) {
    const auto source = layout->sourceShare / "a.txt";
    const auto target = layout->targetShare / "out" / "a.txt";
    writeTextFile(source, "payload");

    const auto res = run({"cp", source.string(), target.string()});
    ASSERT_EQ(res.exit_code, 0) << res.stderr_text;
    EXPECT_EQ(readTextFile(target), "payload");
    EXPECT_TRUE(res.has_data);
    EXPECT_EQ(res.data["state"], "done");
}

TEST_F(CommandsTest, CopyWithBackupRotatesExistingTarget) {
    const auto source = layout->local / "a.txt";
    const auto target = layout->local / "b.txt";
    writeTextFile(source, "new");
    writeTextFile(target, "old");

    ASSERT_EQ(run({"copy", "--backup", "--overwrite", source.string(), target.string()}).exit_code, 0);
    EXPECT_EQ(readTextFile(target), "new");
    EXPECT_EQ(readTextFile(layout->local / "b_Old1.txt"), "old");
}

TEST_F(CommandsTest, CopyWithBackupKeepsExistingTargetWithoutOverwrite) {
    const auto source = layout->local / "a.txt";
    const auto target = layout->local / "b.txt";
    writeTextFile(source, "new");
    writeTextFile(target, "old");

    for (int i = 0; i < 2; ++i)
        ASSERT_EQ(run({"copy", "--backup", source.string(), target.string()}).exit_code, 0);

    EXPECT_EQ(readTextFile(target), "old");
    EXPECT_FALSE(fs::exists(layout->local / "b_Old1.txt"));
    EXPECT_FALSE(fs::exists(layout->local / "b_Old2.txt"));
}

TEST_F(CommandsTest, CopyRequiresTwoPaths) {
    const auto res = run({"copy", "only-one"});
    EXPECT_EQ(res.exit_code, 2);
    EXPECT_NE(res.stderr_text.find("Usage: lockcopy copy"), std::string::npos);
}

TEST_F(CommandsTest, ResumeCommand) {
    const auto source = layout->local / "big.raw";
    const auto target = layout->local / "copy" / "big.raw";
    lc::test::writePatternFile(source, 3 * lc::config::MiB);

    const auto res = run({"resume", source.string(), target.string(), "--chunk", "1", "--flush", "1"});
    ASSERT_EQ(res.exit_code, 0) << res.stderr_text;
    EXPECT_EQ(res.data["resumed"], false);
    EXPECT_TRUE(lc::test::sameContents(source, target));

    EXPECT_EQ(run({"resume", source.string(), target.string(), "--chunk", "big"}).exit_code, 2);
}

TEST_F(CommandsTest, ResumeDirCommand) {
    writeTextFile(layout->local / "src" / "a.txt", "alpha");
    writeTextFile(layout->local / "src" / "sub" / "b.txt", "bravo");

    auto res = run({"resumedir", (layout->local / "src").string(), (layout->local / "dst").string(), "-r"});
    ASSERT_EQ(res.exit_code, 0) << res.stderr_text;
    EXPECT_EQ(res.data["copied"], 2);
    EXPECT_EQ(readTextFile(layout->local / "dst" / "sub" / "b.txt"), "bravo");

    res = run({"resumedir", (layout->local / "src").string(), (layout->local / "dst").string(), "--mode", "maybe"});
    EXPECT_EQ(res.exit_code, 2);
    EXPECT_EQ(res.stderr_text, "Invalid --mode value: maybe");
}

TEST_F(CommandsTest, CopyDirCommand) {
    writeTextFile(layout->sourceShare / "run" / "a.txt", "alpha");
    writeTextFile(layout->sourceShare / "run" / "skip.me", "nope");

    const auto res = run({"copydir", (layout->sourceShare / "run").string(), (layout->targetShare / "run").string(),
                          "--skip", "SKIP.ME"});
    ASSERT_EQ(res.exit_code, 0) << res.stderr_text;
    EXPECT_EQ(readTextFile(layout->targetShare / "run" / "a.txt"), "alpha");
    EXPECT_FALSE(fs::exists(layout->targetShare / "run" / "skip.me"));
}

TEST_F(CommandsTest, CopyDirReadOnlyFlags) {
    writeTextFile(layout->local / "src" / "a.txt", "alpha");

    auto res = run({"copydir", (layout->local / "src").string(), (layout->local / "dst").string(), "--readonly"});
    ASSERT_EQ(res.exit_code, 0) << res.stderr_text;
    EXPECT_EQ(fs::status(layout->local / "dst" / "a.txt").permissions() & fs::perms::owner_write, fs::perms::none);

    res = run({"copydir", "--readonly", "--writable", (layout->local / "src").string(), (layout->local / "dst").string()});
    EXPECT_EQ(res.exit_code, 2);
}

TEST_F(CommandsTest, MoveDirCommand) {
    writeTextFile(layout->sourceShare / "run" / "a.txt", "alpha");
    writeTextFile(layout->sourceShare / "run" / "sub" / "b.txt", "bravo");

    const auto res = run({"mvdir", (layout->sourceShare / "run").string(), (layout->targetShare / "run").string()});
    ASSERT_EQ(res.exit_code, 0) << res.stderr_text;
    EXPECT_EQ(readTextFile(layout->targetShare / "run" / "sub" / "b.txt"), "bravo");
    EXPECT_FALSE(fs::exists(layout->sourceShare / "run"));
}

TEST_F(CommandsTest, QueueCommandReportsBacklog) {
    writeTextFile(layout->sourceLocks() / "1000_0100_hostA_mgr.lock", "x");
    writeTextFile(layout->sourceLocks() / "2000_0250_hostB_mgr.lock", "x");
    writeTextFile(layout->sourceLocks() / "9000_0999_hostC_mgr.lock", "x");

    const auto viaShare = run({"queue", (layout->sourceShare / "some" / "file.raw").string(), "--at", "5000"});
    ASSERT_EQ(viaShare.exit_code, 0) << viaShare.stderr_text;
    EXPECT_EQ(viaShare.data["count"], 2);
    EXPECT_EQ(viaShare.data["total_mb"], 350);
    EXPECT_EQ(viaShare.stdout_text, fmt::format("{}: 2 queued transfer(s), 350 MB\n", layout->sourceLocks().string()));

    const auto viaDir = run({"backlog", layout->sourceLocks().string(), "--at", "5000"});
    EXPECT_EQ(viaDir.stdout_text, viaShare.stdout_text);

    EXPECT_EQ(run({"queue", layout->local.string()}).exit_code, 2);
    EXPECT_EQ(run({"queue", layout->sourceLocks().string(), "--at", "soon"}).exit_code, 2);
}

TEST_F(CommandsTest, HashCommand) {
    const auto file = layout->local / "abc.txt";
    writeTextFile(file, "abc");

    auto res = run({"hash", file.string()});
    EXPECT_EQ(res.stdout_text, "a9993e364706816aba3e25717850c26c9cd0d89d  " + file.string() + "\n");

    res = run({"hash", file.string(), "--algo", "MD5"});
    EXPECT_EQ(res.data["hash"], "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(res.data["algorithm"], "md5");

    EXPECT_EQ(run({"hash", file.string(), "--algo", "sha512"}).exit_code, 2);
}

TEST_F(CommandsTest, BackupCommand) {
    const auto file = layout->local / "notes.txt";
    writeTextFile(file, "v1");

    ASSERT_EQ(run({"backup", file.string(), "--keep", "2"}).exit_code, 0);
    EXPECT_EQ(readTextFile(layout->local / "notes_Old1.txt"), "v1");
    EXPECT_EQ(run({"backup", file.string(), "--keep", "two"}).exit_code, 2);
}

TEST_F(CommandsTest, ConfigCommandPrintsEffectiveSettings) {
    const auto res = run({"config"});
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_NE(res.stdout_text.find("lock_directory_name: DMS_LockFiles"), std::string::npos);
    EXPECT_NE(res.stdout_text.find(layout->sourceShare.string()), std::string::npos);
}

TEST_F(CommandsTest, HelpListsEveryCommand) {
    const auto res = run({"help"});
    for (const auto* name : {"copy", "resume", "copydir", "movedir", "resumedir", "queue", "hash", "backup", "config"})
        EXPECT_TRUE(router.knows(name)) << name;
    EXPECT_NE(res.stdout_text.find("resumedir <source> <target>"), std::string::npos);
}
