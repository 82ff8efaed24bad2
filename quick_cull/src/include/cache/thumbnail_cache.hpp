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

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <future>
#include <limits>
#include <memory>
#include <optional>

#include "cache/cache_key.hpp"
#include "concurrency/thread_pool.hpp"
#include "decoders/image_decoder.hpp"
#include "error/errors.hpp"
#include "image/bitmap.hpp"
#include "index/image_index.hpp"
#include "type/hash_type.hpp"
#include "type/type.hpp"

namespace quickcull {
// Below any priority a live request can get. Cancelled loads still complete eventually.
constexpr PriorityLevel kCancelledPriority = std::numeric_limits<int>::min();

/**
 * @brief Outcome of one lookup. A failed decode still carries a placeholder bitmap.
 */
struct ThumbnailResult {
  BitmapPtr                      bitmap_ = nullptr;
  std::optional<DecodeErrorKind> error_{};

  auto                           Ok() const -> bool { return !error_.has_value(); }
};

/**
 * @brief Handle for an asynchronous lookup. started_ turns true once a worker begins the
 *        load, before that the request may still be re-prioritized.
 */
struct ThumbnailRequest {
  Hash128                                 fingerprint_{};
  std::shared_future<ThumbnailResult>     future_{};
  std::shared_ptr<const std::atomic<bool>> started_ = nullptr;

  auto IsReady() const -> bool {
    return future_.valid() &&
           future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
  }
  auto HasStarted() const -> bool { return started_ && started_->load(); }
};

struct ThumbnailCacheOptions {
  DecodeMode            decode_mode_       = DecodeMode::DRAFT;
  uint32_t              max_entries_       = 512;
  size_t                max_bytes_         = 64ull << 20;
  size_t                disk_budget_bytes_ = 256ull << 20;
  // Empty means DefaultCacheDirectory of the source folder
  std::filesystem::path disk_dir_{};
};

struct CacheStats {
  uint64_t memory_hits_   = 0;
  uint64_t disk_hits_     = 0;
  uint64_t decodes_       = 0;
  uint64_t failures_      = 0;
  uint64_t coalesced_     = 0;
  size_t   memory_entries_ = 0;
  size_t   memory_bytes_  = 0;
  size_t   disk_entries_  = 0;
  size_t   disk_bytes_    = 0;
};

/**
 * @brief Two-tier bitmap cache. At most one load per key is in flight at any time, every
 *        concurrent caller of the same key joins it. Failed loads are reported with a
 *        placeholder and never stored, so the next request retries. The pool is borrowed,
 *        its owner keeps it alive for as long as the cache issues requests.
 */
class ThumbnailCache {
 public:
  ThumbnailCache(std::shared_ptr<ImageDecoder> decoder, std::shared_ptr<ThreadPool> pool,
                 ThumbnailCacheOptions options);
  ~ThumbnailCache();

  ThumbnailCache(const ThumbnailCache&)            = delete;
  ThumbnailCache& operator=(const ThumbnailCache&) = delete;

  /**
   * @brief Blocking lookup, decodes on the calling thread when nobody else is loading the key
   */
  auto GetOrCreate(const ImageEntry& entry, TargetSize target) -> ThumbnailResult;

  /**
   * @brief Non-blocking lookup, the load runs on the pool at the given priority
   */
  auto Request(const ImageEntry& entry, TargetSize target, PriorityLevel priority)
      -> ThumbnailRequest;

  /**
   * @brief Memory tier only, never blocks on a load and never touches the recency order
   */
  auto Peek(const ImageEntry& entry, TargetSize target) const -> BitmapPtr;

  /**
   * @brief Change the priority of a queued load
   *
   * @return false if the load already started or is not in flight
   */
  auto Reprioritize(const Hash128& fingerprint, PriorityLevel priority) -> bool;

  /**
   * @brief Attach the disk tier for a source folder and read its index. An unusable cache
   *        directory leaves the cache memory only.
   */
  void LoadPersisted(const std::filesystem::path& source_folder);

  /**
   * @brief Write memory entries missing from the disk tier, then trim the tier to its budget.
   *        On an IO failure the disk tier is switched off for the rest of the session.
   */
  void Persist();

  auto IsPersistenceEnabled() const -> bool;
  auto PersistenceDirectory() const -> std::optional<std::filesystem::path>;
  auto Stats() const -> CacheStats;
  auto Mode() const -> DecodeMode;

 private:
  struct State;
  struct Claim;
  std::shared_ptr<State> state_;

  static auto ClaimLoad(State& st, const CacheKey& key, bool run_here) -> Claim;
  static auto DecodeOrPlaceholder(State& st, const CacheKey& key, const image_path_t& path)
      -> ThumbnailResult;
  static void RunLoad(const std::shared_ptr<State>& st, const CacheKey& key,
                      const image_path_t& path);
  static void DisablePersistence(State& st, const CacheError& e);
};
};  // namespace quickcull
