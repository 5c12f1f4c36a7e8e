#include <gtest/gtest.h>
#include "util/timestamp.hpp"
#include "util/files.hpp"

using namespace lc::util;
using namespace std::chrono;

TEST(TimestampTest, LockEpochIsJanuaryFirst2010) {
    const auto epoch = system_clock::from_time_t(1262304000);
    EXPECT_EQ(lockTimestampMs(epoch), 0);
    EXPECT_EQ(lockTimestampMs(epoch + 90s), 90000);
    EXPECT_EQ(fromLockTimestampMs(1500), epoch + 1500ms);
}

TEST(TimestampTest, UtcFileTimeFormatsTwelveHourClock) {
    // 2021-06-15 13:04:05.123 UTC
    const auto tp = system_clock::from_time_t(1623762245) + 123ms;
    EXPECT_EQ(formatUtcFileTime(tp), "2021-06-15 01:04:05.123 PM");
}

TEST(TimestampTest, UtcFileTimeParsesOwnFormat) {
    const auto tp = system_clock::from_time_t(1623762245) + 123ms;
    const auto parsed = parseUtcFileTime(formatUtcFileTime(tp));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, tp);
}

TEST(TimestampTest, MidnightAndNoonDesignators) {
    const auto midnight = parseUtcFileTime("2020-01-01 12:00:00.000 AM");
    const auto noon = parseUtcFileTime("2020-01-01 12:00:00.000 PM");
    ASSERT_TRUE(midnight && noon);
    EXPECT_EQ(*midnight, system_clock::from_time_t(1577836800));
    EXPECT_EQ(*noon - *midnight, 12h);
}

TEST(TimestampTest, ParsesTwentyFourHourWithoutMillis) {
    const auto parsed = parseUtcFileTime("2020-01-01 17:30:00");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, system_clock::from_time_t(1577836800) + 17h + 30min);
}

TEST(TimestampTest, RejectsGarbage) {
    EXPECT_FALSE(parseUtcFileTime("yesterday").has_value());
    EXPECT_FALSE(parseUtcFileTime("2020-01-01 10:00:00 XM").has_value());
    EXPECT_FALSE(parseUtcFileTime("2020-01-01 13:00:00 PM").has_value());
}

TEST(TimestampTest, FileTimeTolerance) {
    const auto t = system_clock::now();
    EXPECT_TRUE(nearlyEqualFileTimes(t, t + 2050ms));
    EXPECT_TRUE(nearlyEqualFileTimes(t + 2s, t));
    EXPECT_FALSE(nearlyEqualFileTimes(t, t + 2051ms));
}

TEST(FilesUtilTest, BytesToMBRounds) {
    EXPECT_EQ(bytesToMB(0), 0u);
    EXPECT_EQ(bytesToMB(512 * 1024), 1u);
    EXPECT_EQ(bytesToMB(25 * 1024 * 1024), 25u);
    EXPECT_EQ(bytesToMB(1024 * 1024 + 100), 1u);
}

TEST(FilesUtilTest, HumanReadableSizes) {
    EXPECT_EQ(bytesToHumanReadable(100), "100.0 bytes");
    EXPECT_EQ(bytesToHumanReadable(165342), "161.5 KB");
    EXPECT_EQ(bytesToHumanReadable(5ull * 1024 * 1024), "5.0 MB");
}

TEST(FilesUtilTest, CaseInsensitiveHelpers) {
    EXPECT_TRUE(iequals("DMS_LockFiles", "dms_lockfiles"));
    EXPECT_FALSE(iequals("abc", "abcd"));
    EXPECT_TRUE(istartsWith("//Proto-2/share", "//proto-2/"));
    EXPECT_FALSE(istartsWith("//p", "//proto-2/"));
}
