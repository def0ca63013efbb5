#include <gtest/gtest.h>

#include <string>
#include <vector>
#include "core/stats_parser/stats_parser.hpp"

using namespace rsprog::core;
using rsprog::infra::ErrorCode;

TEST(StatsShapeTest, RecognisesProgressAndCompletedLines)
{
    const std::vector<std::pair<std::string, bool>> cases = {
        {"    600,417,190 100%  100.56MB/s    0:00:05\r", true},
        {"this.isn't.correct\r", false},
        {"600,417,190 100%  100.56MB/s    nope\r", false},
        {"600,417,190 100%  100.56MB    0:00:05\r", false},
        {"600,417,190 haha  100.56MB/s    0:00:05\r", false},
        {"nope 100%  100.56MB/s    0:00:05\r", false},
        {"/some/path/from/rsync\n", false},
        {"sending incremental file list\n", false},
        {"     264,000,000,000,000 100%   68.57MB/s   10:11:49 (xfr#1545, to-chk=0/1659)\n", true},
    };

    for (const auto& [line, expected] : cases) {
        EXPECT_EQ(is_stats_shape(line), expected) << line;
    }
}

TEST(StatsShapeTest, CompletedLineWithoutGroupStillHasShape)
{
    const std::string line = "  4,260,869,539 100%   95.23MB/s    0:00:42 (xfr#1, ir-chk=1045/1063)\n";
    EXPECT_EQ(strip_summary_group(line), "4,260,869,539 100%   95.23MB/s    0:00:42");
    EXPECT_TRUE(is_stats_shape(strip_summary_group(line)));
}

TEST(StatsParserTest, ParsesProgressLine)
{
    auto stats = parse_stats("600,417,190 11%  100.56MB/s    0:00:05\r", false);
    ASSERT_TRUE(stats.has_value()) << stats.error().message;

    EXPECT_EQ(stats->transferred_bytes, 600'417'190u);
    EXPECT_EQ(stats->percent, 11);
    EXPECT_EQ(stats->time, "0:00:05");
    EXPECT_DOUBLE_EQ(stats->transfer_rate, 100.56);
    EXPECT_EQ(stats->transfer_rate_unit, "MB/s");
    EXPECT_FALSE(stats->is_completed_stats);
}

TEST(StatsParserTest, CompletedLineDropsTrailingGroup)
{
    auto stats = parse_stats("    600,417,190 100%  100.56MB/s    0:00:05 (xfr#1, to-chk=0/2)\n", true);
    ASSERT_TRUE(stats.has_value()) << stats.error().message;

    const TransferStats expected{
        .transferred_bytes = 600'417'190,
        .percent = 100,
        .time = "0:00:05",
        .transfer_rate = 100.56,
        .transfer_rate_unit = "MB/s",
        .is_completed_stats = true,
    };
    EXPECT_EQ(*stats, expected);
    EXPECT_EQ(stats->transfer_rate_bytes().value(), 105444803u);
}

TEST(StatsParserTest, HugeByteCountsFit)
{
    auto stats = parse_stats(
        "     264,000,000,000,000 100%   68.57MB/s   10:11:49 (xfr#1545, to-chk=0/1659)\n", true);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->transferred_bytes, 264'000'000'000'000u);
    EXPECT_EQ(stats->time, "10:11:49");
}

TEST(StatsParserTest, ShapeMatchButBadTokenIsStatsFormatError)
{
    // Форма совпадает (токен заканчивается на %), но число не разбирается
    const std::string line = "600,417,190 x%  100.56MB/s    0:00:05\r";
    ASSERT_TRUE(is_stats_shape(line));

    auto stats = parse_stats(line, false);
    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, ErrorCode::StatsFormat);
    EXPECT_TRUE(stats.error().is_fatal());
}

TEST(StatsParserTest, RateWithoutDecimalPointIsRejected)
{
    auto stats = parse_stats("1,024 5%  100MB/s    0:00:01\r", false);
    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, ErrorCode::StatsFormat);
}

TEST(StatsParserTest, PercentAboveHundredIsRejected)
{
    auto stats = parse_stats("1,024 101%  1.00MB/s    0:00:01\r", false);
    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, ErrorCode::StatsFormat);
}

TEST(SummaryLineTest, ParsesSentAndTotalSizeLines)
{
    const std::string sent = "sent 600,565,034 bytes  received 35 bytes  171,600,171.43 bytes/sec\n";
    const std::string total = "total size is 600,417,190  speedup is 1.00\n";
    EXPECT_TRUE(is_summary_line(sent));
    EXPECT_TRUE(is_summary_line(total));
    EXPECT_FALSE(is_summary_line("/has/dirs/sent bytes\n"));

    auto summary = apply_summary_line(TransferSummary{}, sent);
    ASSERT_TRUE(summary.has_value());
    summary = apply_summary_line(*summary, total);
    ASSERT_TRUE(summary.has_value());

    EXPECT_EQ(summary->sent_bytes, 600'565'034u);
    EXPECT_EQ(summary->received_bytes, 35u);
    EXPECT_DOUBLE_EQ(summary->bytes_per_second.value(), 171600171.43);
    EXPECT_EQ(summary->total_size, 600'417'190u);
    EXPECT_DOUBLE_EQ(summary->speedup.value(), 1.0);
    EXPECT_FALSE(summary->dry_run);
}

TEST(SummaryLineTest, DryRunMarker)
{
    auto summary = apply_summary_line(TransferSummary{},
                                      "total size is 1,024  speedup is 1,024.00 (DRY RUN)\n");
    ASSERT_TRUE(summary.has_value());
    EXPECT_TRUE(summary->dry_run);
    EXPECT_DOUBLE_EQ(summary->speedup.value(), 1024.0);
}
