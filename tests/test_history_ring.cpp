#include "storage/history_ring.hpp"

#include <gtest/gtest.h>

using benchlog::HistoryRing;

TEST(HistoryRing, KeepsNewestWhenFull) {
    HistoryRing<int> ring(3);
    EXPECT_FALSE(ring.push(1));
    EXPECT_FALSE(ring.push(2));
    EXPECT_FALSE(ring.push(3));
    EXPECT_TRUE(ring.push(4));

    ASSERT_EQ(ring.size(), 3u);
    EXPECT_EQ(ring.to_vector(), (std::vector<int>{2, 3, 4}));
    EXPECT_EQ(ring.oldest(), 2);
    EXPECT_EQ(ring.newest(), 4);
}

TEST(HistoryRing, WrapsManyTimes) {
    HistoryRing<int> ring(4);
    for (int i = 0; i < 103; ++i) ring.push(i);
    EXPECT_EQ(ring.to_vector(), (std::vector<int>{99, 100, 101, 102}));
}

TEST(HistoryRing, ClearResets) {
    HistoryRing<int> ring(2);
    ring.push(1);
    ring.push(2);
    ring.clear();
    EXPECT_TRUE(ring.empty());
    ring.push(7);
    EXPECT_EQ(ring.to_vector(), (std::vector<int>{7}));
}

TEST(HistoryRing, ZeroCapacityHoldsOne) {
    HistoryRing<int> ring(0);
    EXPECT_EQ(ring.capacity(), 1u);
    ring.push(1);
    ring.push(2);
    EXPECT_EQ(ring.to_vector(), (std::vector<int>{2}));
}
