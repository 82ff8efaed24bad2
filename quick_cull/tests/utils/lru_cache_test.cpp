//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "utils/cache/lru_cache.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace quickcull {
TEST(LRUCacheTest, EvictsLeastRecentlyUsedByCount) {
  LRUCache<int, std::string> cache(3);
  cache.RecordAccess(1, "one");
  cache.RecordAccess(2, "two");
  cache.RecordAccess(3, "three");

  // Touch 1 so that 2 becomes the oldest
  EXPECT_EQ(cache.AccessElement(1).value(), "one");
  auto evicted = cache.RecordAccess(4, "four");
  ASSERT_EQ(evicted.size(), 1u);
  EXPECT_EQ(evicted[0].first, 2);
  EXPECT_FALSE(cache.Contains(2));
  EXPECT_TRUE(cache.Contains(1));
  EXPECT_EQ(cache.Size(), 3u);
}

TEST(LRUCacheTest, PeekDoesNotTouch) {
  LRUCache<int, int> cache(2);
  cache.RecordAccess(1, 10);
  cache.RecordAccess(2, 20);

  EXPECT_EQ(cache.Peek(1).value(), 10);
  cache.RecordAccess(3, 30);
  EXPECT_FALSE(cache.Contains(1));
  EXPECT_FALSE(cache.Peek(1).has_value());
}

TEST(LRUCacheTest, EvictsToWeightBudget) {
  LRUCache<int, std::vector<char>> cache(100, 10, [](const std::vector<char>& v) { return v.size(); });
  cache.RecordAccess(1, std::vector<char>(4));
  cache.RecordAccess(2, std::vector<char>(4));
  EXPECT_EQ(cache.TotalWeight(), 8u);

  auto evicted = cache.RecordAccess(3, std::vector<char>(4));
  ASSERT_EQ(evicted.size(), 1u);
  EXPECT_EQ(evicted[0].first, 1);
  EXPECT_EQ(cache.TotalWeight(), 8u);

  // A single oversized record is kept alone
  evicted = cache.RecordAccess(4, std::vector<char>(32));
  EXPECT_EQ(evicted.size(), 2u);
  EXPECT_EQ(cache.Size(), 1u);
  EXPECT_TRUE(cache.Contains(4));
}

TEST(LRUCacheTest, ReplaceUpdatesWeightAndOrder) {
  LRUCache<int, std::vector<char>> cache(2, 0, [](const std::vector<char>& v) { return v.size(); });
  cache.RecordAccess(1, std::vector<char>(3));
  cache.RecordAccess(2, std::vector<char>(3));
  cache.RecordAccess(1, std::vector<char>(7));
  EXPECT_EQ(cache.TotalWeight(), 10u);

  std::vector<int> order;
  cache.ForEach([&](const int& key, const std::vector<char>&) { order.push_back(key); });
  EXPECT_EQ(order, (std::vector<int>{1, 2}));

  cache.RemoveRecord(1);
  EXPECT_EQ(cache.TotalWeight(), 3u);
  EXPECT_EQ(cache.Evict()->first, 2);
  EXPECT_FALSE(cache.Evict().has_value());
}

TEST(LRUCacheTest, FlushEmpties) {
  LRUCache<int, int> cache(4);
  for (int i = 0; i < 4; ++i) cache.RecordAccess(i, i);
  cache.Flush();
  EXPECT_FALSE(cache.Contains(3));
  EXPECT_EQ(cache.Size(), 0u);
}
};  // namespace quickcull
