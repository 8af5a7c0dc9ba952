#include "engine/progress_parser.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

class ProgressParserTests : public ::testing::Test {
  protected:
    void SetUp() override { ddi::Logger::Instance().SetLevel(ddi::LogLevel::None); }
    void TearDown() override { ddi::Logger::Instance().SetLevel(ddi::LogLevel::Info); }

    std::vector<ddi::ProgressSample> Feed(std::string_view text) {
        std::vector<ddi::ProgressSample> out;
        parser.Feed(text, out);
        return out;
    }

    ddi::LogSink log;
    ddi::ProgressParser parser{log, 65536};
};

TEST_F(ProgressParserTests, GnuProgressLine) {
    auto s = parser.ParseLine("1073741824 bytes (1.1 GB, 1.0 GiB) copied, 2.5 s, 429 MB/s");
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->bytes_transferred, 1073741824u);
    EXPECT_DOUBLE_EQ(s->elapsed_seconds, 2.5);
    EXPECT_FALSE(s->error_at_offset.has_value());
    EXPECT_EQ(parser.LastBytes(), 1073741824u);
}

TEST_F(ProgressParserTests, GnuSingleByteAndCommaDecimal) {
    auto s = parser.ParseLine("1 byte copied, 0,000123 s, 8,1 kB/s");
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->bytes_transferred, 1u);
    EXPECT_NEAR(s->elapsed_seconds, 0.000123, 1e-9);
}

TEST_F(ProgressParserTests, BsdAndBusyboxLines) {
    auto bsd = parser.ParseLine("1048576 bytes transferred in 0.500 secs (2097152 bytes/sec)");
    ASSERT_TRUE(bsd.has_value());
    EXPECT_EQ(bsd->bytes_transferred, 1048576u);
    EXPECT_DOUBLE_EQ(bsd->elapsed_seconds, 0.5);

    auto busybox = parser.ParseLine("2097152 bytes (2.0MB) copied, 0.750000 seconds, 2.6MB/s");
    ASSERT_TRUE(busybox.has_value());
    EXPECT_EQ(busybox->bytes_transferred, 2097152u);
    EXPECT_DOUBLE_EQ(busybox->elapsed_seconds, 0.75);
}

TEST_F(ProgressParserTests, CarriageReturnAndPartialChunks) {
    auto a = Feed("1048576 bytes (1.0 MB, 1.0 MiB) copied, 1 s, 1.0 MB/s\r2097");
    ASSERT_EQ(a.size(), 1u);
    EXPECT_EQ(a[0].bytes_transferred, 1048576u);

    auto b = Feed("152 bytes (2.1 MB, 2.0 MiB) copied, 2 s, 1.0 MB/s\r");
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(b[0].bytes_transferred, 2097152u);
    EXPECT_DOUBLE_EQ(b[0].elapsed_seconds, 2.0);
}

TEST_F(ProgressParserTests, FlushParsesUnterminatedTail) {
    EXPECT_TRUE(Feed("4096 bytes copied, 0.1 s, 40 kB/s").empty());
    std::vector<ddi::ProgressSample> out;
    parser.Flush(out);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].bytes_transferred, 4096u);
}

TEST_F(ProgressParserTests, RecordsOutGivesLowerBound) {
    auto out = Feed("16+0 records in\n16+0 records out\n");
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].bytes_transferred, 16u * 65536u);
    EXPECT_EQ(out[0].records_in, 16u);
    EXPECT_EQ(out[0].records_out, 16u);

    // A later byte count above the record estimate still wins.
    auto more = Feed("1100000 bytes (1.1 MB) copied, 3 s, 366 kB/s\n5+1 records out\n");
    ASSERT_EQ(more.size(), 2u);
    EXPECT_EQ(more[0].bytes_transferred, 1100000u);
    EXPECT_EQ(more[1].bytes_transferred, 1100000u);
    EXPECT_EQ(more[1].records_out, 6u);
}

TEST_F(ProgressParserTests, ErrorLineWithOffset) {
    Feed("5000000 bytes copied, 1 s, 5 MB/s\n");
    auto s = parser.ParseLine("dd: error reading '/dev/sdb' at offset 4194304: Input/output error");
    ASSERT_TRUE(s.has_value());
    ASSERT_TRUE(s->error_at_offset.has_value());
    EXPECT_EQ(*s->error_at_offset, 4194304u);
    EXPECT_EQ(s->bytes_transferred, 5000000u);
}

TEST_F(ProgressParserTests, ErrorLineWithoutOffsetUsesLastBytes) {
    Feed("3000 bytes copied, 1 s, 3 kB/s\n");
    auto s = parser.ParseLine("dd: error reading '/dev/sdb': Input/output error");
    ASSERT_TRUE(s.has_value());
    ASSERT_TRUE(s->error_at_offset.has_value());
    EXPECT_EQ(*s->error_at_offset, 3000u);

    auto logged = log.Snapshot();
    ASSERT_FALSE(logged.empty());
    EXPECT_EQ(logged.back().level, ddi::LogLevel::Warn);
    EXPECT_NE(logged.back().message.find("Transfer error near byte 3000"), std::string::npos);
}

TEST_F(ProgressParserTests, AnomaliesAreLoggedAndDropped) {
    Feed("8000 bytes copied, 2 s, 4 kB/s\n");
    const auto before = log.Size();

    EXPECT_FALSE(parser.ParseLine("12x34 bytes copied, 3 s, 1 kB/s").has_value());
    EXPECT_FALSE(parser.ParseLine("-5 bytes copied, 3 s, 1 kB/s").has_value());
    EXPECT_FALSE(parser.ParseLine("4000 bytes copied, 3 s, 1 kB/s").has_value());
    EXPECT_FALSE(parser.ParseLine("9000 bytes copied, 1 s, 9 kB/s").has_value());
    EXPECT_FALSE(parser.ParseLine("9000 bytes copied, 1.2.3 s, 9 kB/s").has_value());
    EXPECT_FALSE(parser.ParseLine("1+x records out").has_value());

    EXPECT_EQ(parser.AnomalyCount(), 6u);
    EXPECT_EQ(parser.LastBytes(), 8000u);
    EXPECT_EQ(log.Size(), before + 6);
    for (const auto& e : log.Tail(6))
        EXPECT_EQ(e.level, ddi::LogLevel::Warn);
}

TEST_F(ProgressParserTests, NoiseLinesBecomeDiagnostics) {
    EXPECT_TRUE(Feed("dd: failed to open '/dev/sdz': No such file or directory\n").empty());
    EXPECT_EQ(parser.AnomalyCount(), 0u);
    auto diag = parser.Diagnostics();
    ASSERT_EQ(diag.size(), 1u);
    EXPECT_EQ(diag[0], "dd: failed to open '/dev/sdz': No such file or directory");
    EXPECT_EQ(log.Snapshot().back().level, ddi::LogLevel::Info);
}

TEST_F(ProgressParserTests, DiagnosticsAreBounded) {
    for (int i = 0; i < 40; ++i)
        Feed("gzip: warning " + std::to_string(i) + "\n");
    auto diag = parser.Diagnostics();
    ASSERT_EQ(diag.size(), ddi::ProgressParser::kMaxDiagnostics);
    EXPECT_EQ(diag.back(), "gzip: warning 39");
}

TEST_F(ProgressParserTests, DetectsFullTarget) {
    EXPECT_FALSE(parser.TargetFull());
    Feed("dd: error writing '/dev/sdb': No space left on device\n");
    EXPECT_TRUE(parser.TargetFull());
}

TEST_F(ProgressParserTests, OversizedUnterminatedLineIsDiscarded) {
    const std::string junk(ddi::ProgressParser::kMaxPendingBytes + 1, 'a');
    EXPECT_TRUE(Feed(junk).empty());
    EXPECT_EQ(parser.AnomalyCount(), 1u);

    auto out = Feed("\n512 bytes copied, 1 s, 512 B/s\n");
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].bytes_transferred, 512u);
}

TEST_F(ProgressParserTests, BlankLinesAreIgnored) {
    EXPECT_TRUE(Feed("\n\r\n   \n").empty());
    EXPECT_EQ(log.Size(), 0u);
}

} // namespace
