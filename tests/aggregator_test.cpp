#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>
#include "core/session/aggregator.hpp"

using namespace rsprog::core;
using rsprog::infra::ErrorCode;

namespace {

class AggregatorTest : public ::testing::Test {
protected:
    LineClassifier classifier{"/home/the_source"};
    std::optional<Snapshot> last;

    auto step(const std::string& fragment, const AggregatorOptions& options = {})
        -> rsprog::infra::Result<Snapshot>
    {
        auto line = classifier.classify(fragment);
        if (!line) return std::unexpected(line.error());
        auto next = rsprog::core::advance(last, *line, options);
        if (next) last = *next;
        return next;
    }
};

} // namespace

TEST_F(AggregatorTest, IrrelevantLineKeepsState)
{
    auto first = step("sending incremental file list\n");
    ASSERT_TRUE(first.has_value());
    EXPECT_FALSE(first->transferring_path.has_value());
    EXPECT_EQ(first->total_transferred, 0u);
    EXPECT_TRUE(first->completed_paths().empty());
}

TEST_F(AggregatorTest, StatsBeforeAnyPathIsProtocolViolation)
{
    auto res = step("600,417,190 11%  100.56MB/s    0:00:05\r");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::ProtocolViolation);
}

TEST_F(AggregatorTest, UnclassifiableLineIsProtocolViolation)
{
    auto res = step("???garbage???\r");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::ProtocolViolation);

    ASSERT_TRUE(step("the_source\n").has_value());
    auto newline = step("???garbage???\n");
    ASSERT_FALSE(newline.has_value());
    EXPECT_EQ(newline.error().code, ErrorCode::ProtocolViolation);
}

TEST_F(AggregatorTest, ProgressThenCompletedFile)
{
    ASSERT_TRUE(step("the_source/\n").has_value());
    ASSERT_TRUE(step("/file.iso\n").has_value());

    auto progress = step("    300,000,000  50%  100.56MB/s    0:00:03\r");
    ASSERT_TRUE(progress.has_value());
    ASSERT_TRUE(progress->in_progress_stats.has_value());
    EXPECT_EQ(progress->in_progress_stats->percent, 50);
    EXPECT_EQ(progress->total_transferred, 300'000'000u);
    EXPECT_FALSE(progress->last_completed_path.has_value());

    auto done = step("    600,417,190 100%  100.56MB/s    0:00:05 (xfr#1, to-chk=0/2)\n");
    ASSERT_TRUE(done.has_value());
    EXPECT_FALSE(done->in_progress_stats.has_value());
    EXPECT_EQ(done->total_transferred, 600'417'190u);
    EXPECT_EQ(done->last_completed_path, std::filesystem::path("/home/the_source/file.iso"));
    ASSERT_EQ(done->completed_paths().size(), 1u);
    EXPECT_EQ(done->completed_paths().at("/home/the_source/file.iso").percent, 100);

    // Предыдущий снимок не изменился
    EXPECT_TRUE(progress->completed_paths().empty());
    EXPECT_TRUE(progress->in_progress_stats.has_value());
}

TEST_F(AggregatorTest, LedgerOnlyGrows)
{
    ASSERT_TRUE(step("the_source/\n").has_value());
    ASSERT_TRUE(step("/a\n").has_value());
    ASSERT_TRUE(step("1,000 100%  1.00MB/s    0:00:01 (xfr#1, to-chk=1/3)\n").has_value());
    ASSERT_TRUE(step("/b\n").has_value());
    ASSERT_TRUE(step("500  50%  1.00MB/s    0:00:01\r").has_value());

    auto both = step("1,000 100%  1.00MB/s    0:00:01 (xfr#2, to-chk=0/3)\n");
    ASSERT_TRUE(both.has_value());
    EXPECT_EQ(both->completed_paths().size(), 2u);
    EXPECT_EQ(both->total_transferred, 2'000u);
    EXPECT_EQ(both->last_completed_path, std::filesystem::path("/home/the_source/b"));

    auto summary = step("sent 2,100 bytes  received 35 bytes  4,270.00 bytes/sec\n");
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->completed_paths().size(), 2u);
    EXPECT_EQ(summary->ledger, both->ledger);
    ASSERT_TRUE(summary->summary.has_value());
    EXPECT_EQ(summary->summary->sent_bytes, 2'100u);
}

TEST_F(AggregatorTest, BadStatsPropagateStatsFormat)
{
    ASSERT_TRUE(step("the_source/\n").has_value());
    auto res = step("1,024 x%  1.00MB/s    0:00:01\r");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::StatsFormat);
}

TEST_F(AggregatorTest, RawHistoryFollowsOption)
{
    const AggregatorOptions with_raw{.include_raw_output = true};
    ASSERT_TRUE(step("sending incremental file list\n", with_raw).has_value());
    auto second = step("the_source/\n", with_raw);
    ASSERT_TRUE(second.has_value());

    const std::vector<std::string> expected = {"sending incremental file list\n", "the_source/\n"};
    EXPECT_EQ(second->raw_output(), expected);

    auto without = step("/file\n");
    ASSERT_TRUE(without.has_value());
    EXPECT_TRUE(without->raw_output().empty());
    EXPECT_EQ(second->raw_output().size(), 2u);
}

TEST(AggregatorPureTest, SameInputsGiveEqualSnapshots)
{
    LineClassifier classifier("/home/x");
    auto path = classifier.classify("/dir/file\n");
    ASSERT_TRUE(path.has_value());

    auto a = rsprog::core::advance(std::optional<Snapshot>{}, *path);
    auto b = rsprog::core::advance(std::optional<Snapshot>{}, *path);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*a, *b);
}

TEST(RawHistoryTest, AppendSharesPrefix)
{
    RawHistory empty;
    auto one = empty.append("a\n");
    auto two = one.append("b\n");

    EXPECT_TRUE(empty.empty());
    EXPECT_EQ(one.size(), 1u);
    EXPECT_EQ(two.to_vector(), (std::vector<std::string>{"a\n", "b\n"}));
    EXPECT_EQ(one.to_vector(), (std::vector<std::string>{"a\n"}));
}

TEST(RawHistoryTest, LongHistoryDestroysWithoutRecursion)
{
    RawHistory history;
    for (int i = 0; i < 200'000; ++i) {
        history = history.append("x\r");
    }
    EXPECT_EQ(history.size(), 200'000u);
}
