#include "util/format.hpp"

#include <gtest/gtest.h>

namespace {

TEST(FormatBytesTests, Units) {
    EXPECT_EQ(ddi::FormatBytes(0), "0.0 B");
    EXPECT_EQ(ddi::FormatBytes(512), "512.00 B");
    EXPECT_EQ(ddi::FormatBytes(1536), "1.50 KiB");
    EXPECT_EQ(ddi::FormatBytes(10.0 * 1024 * 1024 * 1024), "10.00 GiB");
    EXPECT_EQ(ddi::FormatBytes(2.0 * 1024 * 1024 * 1024 * 1024), "2.00 TiB");
}

TEST(FormatBytesTests, StaysInTiBAboveRange) {
    EXPECT_EQ(ddi::FormatBytes(2048.0 * 1024 * 1024 * 1024 * 1024), "2048.00 TiB");
}

TEST(FormatBytesTests, InvalidRendersNA) {
    EXPECT_EQ(ddi::FormatBytes(-1), "N/A");
}

TEST(FormatDurationTests, HoursMinutesSeconds) {
    EXPECT_EQ(ddi::FormatDuration(0.0), "00:00:00");
    EXPECT_EQ(ddi::FormatDuration(59.9), "00:00:59");
    EXPECT_EQ(ddi::FormatDuration(3661.0), "01:01:01");
    EXPECT_EQ(ddi::FormatDuration(100.0 * 3600), "100:00:00");
}

TEST(FormatDurationTests, UnknownRendersPlaceholder) {
    EXPECT_EQ(ddi::FormatDuration(std::nullopt), "??:??:??");
    EXPECT_EQ(ddi::FormatDuration(-5.0), "??:??:??");
}

TEST(FormatDurationTests, HugeEtaIsClamped) {
    EXPECT_EQ(ddi::FormatDuration(1e30), "99999:59:59");
    EXPECT_EQ(ddi::FormatDuration(2e19), "99999:59:59");
    EXPECT_EQ(ddi::FormatDuration(99999.0 * 3600), "99999:00:00");
}

TEST(BlockSizeTests, ParsesSuffixes) {
    EXPECT_EQ(ddi::ParseBlockSize("512"), 512u);
    EXPECT_EQ(ddi::ParseBlockSize("4K"), 4096u);
    EXPECT_EQ(ddi::ParseBlockSize("64k"), 65536u);
    EXPECT_EQ(ddi::ParseBlockSize("1M"), 1048576u);
    EXPECT_EQ(ddi::ParseBlockSize("1MiB"), 1048576u);
    EXPECT_EQ(ddi::ParseBlockSize("2G"), 2ULL * 1024 * 1024 * 1024);
    EXPECT_EQ(ddi::ParseBlockSize(" 8K "), 8192u);
}

TEST(BlockSizeTests, RejectsInvalid) {
    EXPECT_FALSE(ddi::ParseBlockSize(""));
    EXPECT_FALSE(ddi::ParseBlockSize("0"));
    EXPECT_FALSE(ddi::ParseBlockSize("K"));
    EXPECT_FALSE(ddi::ParseBlockSize("-4K"));
    EXPECT_FALSE(ddi::ParseBlockSize("4X"));
    EXPECT_FALSE(ddi::ParseBlockSize("99999999999999999999G"));
    EXPECT_FALSE(ddi::ParseBlockSize("17179869184G"));
}

TEST(BlockSizeTests, FormatsExactMultiples) {
    EXPECT_EQ(ddi::FormatBlockSize(65536), "64K");
    EXPECT_EQ(ddi::FormatBlockSize(1048576), "1M");
    EXPECT_EQ(ddi::FormatBlockSize(1024ULL * 1024 * 1024), "1G");
    EXPECT_EQ(ddi::FormatBlockSize(512), "512");
    EXPECT_EQ(ddi::FormatBlockSize(1536), "1536");
}

} // namespace
