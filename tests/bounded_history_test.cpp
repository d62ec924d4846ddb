// =============================================================================
// bounded_history_test.cpp
// =============================================================================
// Unit tests for arena::BoundedHistory<T>.
//
// Validates:
//   - Capacity is never exceeded; the oldest element is evicted first
//   - push() reports the evicted element (used to keep secondary indexes
//     such as roundId -> analytics consistent)
//   - tail(n) returns the newest n elements, oldest first
// =============================================================================

#include "arena/concurrent/bounded_history.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

// -----------------------------------------------------------------------------
// 1. Below capacity nothing is evicted.
// -----------------------------------------------------------------------------
TEST(BoundedHistoryTest, NoEvictionBelowCapacity) {
  arena::BoundedHistory<int> history(3);

  EXPECT_FALSE(history.push(1).has_value());
  EXPECT_FALSE(history.push(2).has_value());
  EXPECT_FALSE(history.push(3).has_value());

  EXPECT_EQ(history.size(), 3u);
  EXPECT_EQ(history.front(), 1);
  EXPECT_EQ(history.back(), 3);
}

// -----------------------------------------------------------------------------
// 2. Each push past capacity evicts exactly the oldest element.
// -----------------------------------------------------------------------------
TEST(BoundedHistoryTest, EvictsOldestFirst) {
  arena::BoundedHistory<std::string> history(2);
  history.push("r-1");
  history.push("r-2");

  auto evicted = history.push("r-3");
  ASSERT_TRUE(evicted.has_value());
  EXPECT_EQ(*evicted, "r-1");

  evicted = history.push("r-4");
  ASSERT_TRUE(evicted.has_value());
  EXPECT_EQ(*evicted, "r-2");

  EXPECT_EQ(history.size(), 2u);
  EXPECT_EQ(history.toVector(), (std::vector<std::string>{"r-3", "r-4"}));
}

// -----------------------------------------------------------------------------
// 3. tail(n) is the newest n in chronological order, clamped to size().
// -----------------------------------------------------------------------------
TEST(BoundedHistoryTest, TailReturnsNewestOldestFirst) {
  arena::BoundedHistory<int> history(100);
  for (int i = 0; i < 10; ++i) {
    history.push(i);
  }

  EXPECT_EQ(history.tail(3), (std::vector<int>{7, 8, 9}));
  EXPECT_EQ(history.tail(50).size(), 10u);
  EXPECT_TRUE(history.tail(0).empty());
}

// -----------------------------------------------------------------------------
// 4. A long stream keeps size pinned at capacity.
// -----------------------------------------------------------------------------
TEST(BoundedHistoryTest, SizeNeverExceedsCapacity) {
  arena::BoundedHistory<int> history(1000);
  for (int i = 0; i < 1500; ++i) {
    history.push(i);
    ASSERT_LE(history.size(), history.capacity());
  }
  EXPECT_EQ(history.front(), 500);
  EXPECT_EQ(history.back(), 1499);

  history.clear();
  EXPECT_TRUE(history.empty());
}
