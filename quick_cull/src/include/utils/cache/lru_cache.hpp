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

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace quickcull {
template <typename K>
concept Hashable = std::copy_constructible<K> && std::equality_comparable<K> && requires(K key) {
  { std::hash<K>{}(key) } -> std::convertible_to<std::size_t>;
};

/**
 * @brief Strict LRU map bounded by an entry count and, optionally, by the summed weight of
 *        its values. Not thread-safe, owners guard it with their own lock.
 */
template <Hashable K, typename V>
class LRUCache {
  using ListIterator = typename std::list<std::pair<K, V>>::iterator;

 public:
  using Weigher = std::function<size_t(const V&)>;

 private:
  std::unordered_map<K, ListIterator> cache_map_;
  std::list<std::pair<K, V>>          cache_list_;
  uint32_t                            capacity_;
  size_t                              weight_budget_;
  size_t                              total_weight_ = 0;
  Weigher                             weigher_;

  auto Weight(const V& val) const -> size_t { return weigher_ ? weigher_(val) : 0; }

  auto OverBudget() const -> bool {
    if (cache_list_.size() > capacity_) return true;
    return weight_budget_ != 0 && total_weight_ > weight_budget_;
  }

  auto EvictToBudget() -> std::vector<std::pair<K, V>> {
    std::vector<std::pair<K, V>> evicted;
    // The most recent record always stays, even if it alone exceeds the weight budget
    while (cache_list_.size() > 1 && OverBudget()) {
      auto last = std::prev(cache_list_.end());
      total_weight_ -= Weight(last->second);
      cache_map_.erase(last->first);
      evicted.push_back(std::move(*last));
      cache_list_.pop_back();
    }
    return evicted;
  }

 public:
  static const uint32_t default_capacity_ = 256;

  explicit LRUCache() : capacity_(default_capacity_), weight_budget_(0) {}
  explicit LRUCache(uint32_t capacity, size_t weight_budget = 0, Weigher weigher = nullptr)
      : capacity_(capacity == 0 ? 1 : capacity),
        weight_budget_(weight_budget),
        weigher_(std::move(weigher)) {}

  auto Contains(const K& key) const -> bool { return cache_map_.contains(key); }

  /**
   * @brief Look up and mark as most recently used
   */
  auto AccessElement(const K& key) -> std::optional<V> {
    auto it = cache_map_.find(key);
    if (it == cache_map_.end()) {
      return std::nullopt;
    }
    cache_list_.splice(cache_list_.begin(), cache_list_, it->second);
    return it->second->second;
  }

  /**
   * @brief Look up without touching the recency order
   */
  auto Peek(const K& key) const -> std::optional<V> {
    auto it = cache_map_.find(key);
    if (it == cache_map_.end()) {
      return std::nullopt;
    }
    return it->second->second;
  }

  /**
   * @brief Insert or replace a record as most recently used
   *
   * @return the records evicted to get back under budget, least recent first
   */
  auto RecordAccess(const K& key, V val) -> std::vector<std::pair<K, V>> {
    auto it = cache_map_.find(key);
    if (it != cache_map_.end()) {
      cache_list_.splice(cache_list_.begin(), cache_list_, it->second);
      total_weight_ -= Weight(cache_list_.front().second);
      cache_list_.front().second = std::move(val);
    } else {
      cache_list_.emplace_front(key, std::move(val));
      cache_map_[key] = cache_list_.begin();
    }
    total_weight_ += Weight(cache_list_.front().second);
    return EvictToBudget();
  }

  void RemoveRecord(const K& key) {
    auto it = cache_map_.find(key);
    if (it != cache_map_.end()) {
      total_weight_ -= Weight(it->second->second);
      cache_list_.erase(it->second);
      cache_map_.erase(it);
    }
  }

  auto Evict() -> std::optional<std::pair<K, V>> {
    if (cache_list_.empty()) {
      return std::nullopt;
    }
    auto last = std::prev(cache_list_.end());
    total_weight_ -= Weight(last->second);
    cache_map_.erase(last->first);
    std::pair<K, V> evicted = std::move(*last);
    cache_list_.pop_back();
    return evicted;
  }

  /**
   * @brief Visit records from most to least recently used
   */
  template <typename Fn>
  void ForEach(Fn&& fn) const {
    for (const auto& [key, val] : cache_list_) {
      fn(key, val);
    }
  }

  auto Size() const -> size_t { return cache_list_.size(); }
  auto TotalWeight() const -> size_t { return total_weight_; }

  void Flush() {
    cache_map_.clear();
    cache_list_.clear();
    total_weight_ = 0;
  }
};
};  // namespace quickcull
