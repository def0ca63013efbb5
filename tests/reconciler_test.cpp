#include <gtest/gtest.h>

#include <cstdint>
#include <vector>
#include "core/reconciler/reconciler.hpp"

using rsprog::core::reconcile;

TEST(ReconcilerTest, FirstReadingIsTheTotal)
{
    EXPECT_EQ(reconcile(0, 100), 100u);
    EXPECT_EQ(reconcile(0, 0), 0u);
}

TEST(ReconcilerTest, SameFileReadingReplacesPrevious)
{
    EXPECT_EQ(reconcile(100, 250, 100, false), 250u);
    EXPECT_EQ(reconcile(1'000, 700, 200, false), 1'500u);
}

TEST(ReconcilerTest, ReadingAfterCompletedStartsNewFile)
{
    EXPECT_EQ(reconcile(250, 50, 250, true), 300u);
}

TEST(ReconcilerTest, ReadingSequence)
{
    struct Reading {
        std::uint64_t bytes;
        bool completed;
    };
    const std::vector<Reading> readings = {
        {100, false}, {250, false}, {250, true}, {50, false}, {120, false},
    };
    const std::vector<std::uint64_t> expected = {100, 250, 250, 300, 370};

    std::uint64_t total = 0;
    std::uint64_t previous = 0;
    bool previous_completed = false;
    for (std::size_t i = 0; i < readings.size(); ++i) {
        total = reconcile(total, readings[i].bytes, previous, previous_completed);
        EXPECT_EQ(total, expected[i]) << "reading #" << i;
        previous = readings[i].bytes;
        previous_completed = readings[i].completed;
    }
}

TEST(ReconcilerTest, PreviousLargerThanTotalFallsBackToCurrent)
{
    EXPECT_EQ(reconcile(10, 40, 500, false), 40u);
}
