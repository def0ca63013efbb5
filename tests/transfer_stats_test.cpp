#include <gtest/gtest.h>

#include "core/model/transfer_stats.hpp"

using rsprog::core::TransferStats;
using rsprog::infra::ErrorCode;

namespace {

TransferStats make_stats(double rate, std::string unit)
{
    return TransferStats{
        .transferred_bytes = 600'417'190,
        .percent = 100,
        .time = "0:00:05",
        .transfer_rate = rate,
        .transfer_rate_unit = std::move(unit),
        .is_completed_stats = true,
    };
}

} // namespace

TEST(TransferStatsTest, MegabytesPerSecondRoundsHalfUp)
{
    auto rate = make_stats(100.56, "MB/s").transfer_rate_bytes();
    ASSERT_TRUE(rate.has_value());
    EXPECT_EQ(*rate, 105444803u);
}

TEST(TransferStatsTest, OtherBinaryUnits)
{
    EXPECT_EQ(make_stats(512.0, "B/s").transfer_rate_bytes().value(), 512u);
    EXPECT_EQ(make_stats(1.5, "kB/s").transfer_rate_bytes().value(), 1536u);
    EXPECT_EQ(make_stats(2.0, "GB/s").transfer_rate_bytes().value(), 2147483648u);
}

TEST(TransferStatsTest, UnknownUnitFailsOnlyTheDerivedValue)
{
    const auto stats = make_stats(68.57, "parsecs/s");
    auto rate = stats.transfer_rate_bytes();
    ASSERT_FALSE(rate.has_value());
    EXPECT_EQ(rate.error().code, ErrorCode::UnsupportedUnit);
    EXPECT_FALSE(rate.error().is_fatal());

    // Сами показания остаются доступны
    EXPECT_EQ(stats.transferred_bytes, 600'417'190u);
    EXPECT_EQ(stats.transfer_rate_unit, "parsecs/s");
}

TEST(TransferStatsTest, EqualityComparesAllFields)
{
    auto a = make_stats(100.56, "MB/s");
    auto b = a;
    EXPECT_EQ(a, b);
    b.is_completed_stats = false;
    EXPECT_NE(a, b);
}
