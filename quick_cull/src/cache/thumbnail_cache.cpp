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

#include "cache/thumbnail_cache.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <format>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "storage/disk_thumbnail_store.hpp"
#include "utils/cache/lru_cache.hpp"

namespace quickcull {
namespace {
auto NowMs() -> int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}
}  // namespace

struct ThumbnailCache::State {
  struct MemoryEntry {
    CacheKey  key_{};
    BitmapPtr bitmap_         = nullptr;
    int64_t   last_access_ms_ = 0;
  };

  struct InFlight {
    std::shared_future<ThumbnailResult>            future_{};
    std::shared_ptr<std::promise<ThumbnailResult>> promise_ = nullptr;
    std::shared_ptr<std::atomic<bool>>             started_ = nullptr;
    std::optional<task_id_t>                       task_id_{};
    PriorityLevel                                  priority_ = 0;
  };

  std::shared_ptr<ImageDecoder>            decoder_;
  // Owned by the caller, it must outlive the cache
  std::weak_ptr<ThreadPool>                pool_;
  ThumbnailCacheOptions                    options_;

  mutable std::mutex                       cache_lock_;
  LRUCache<Hash128, MemoryEntry>           memory_;
  std::unordered_map<Hash128, InFlight>    in_flight_{};
  std::shared_ptr<DiskThumbnailStore>      disk_         = nullptr;
  bool                                     disk_enabled_ = false;
  CacheStats                               stats_{};
  // Set once the owning cache is gone, queued loads then return without running
  std::atomic<bool>                        closed_{false};

  // Serializes Persist calls, taken before cache_lock_
  std::mutex                               persist_lock_;

  State(std::shared_ptr<ImageDecoder> decoder, std::shared_ptr<ThreadPool> pool,
        ThumbnailCacheOptions options)
      : decoder_(std::move(decoder)),
        pool_(std::move(pool)),
        options_(std::move(options)),
        memory_(options_.max_entries_, options_.max_bytes_,
                [](const MemoryEntry& entry) { return entry.bitmap_ ? entry.bitmap_->ByteSize() : 0; }) {}
};

struct ThumbnailCache::Claim {
  enum class Role { HIT, JOIN, OWN };

  Role                               role_ = Role::OWN;
  ThumbnailResult                    hit_{};
  std::shared_future<ThumbnailResult> future_{};
  std::shared_ptr<std::atomic<bool>> started_ = nullptr;
};

/**
 * @brief Resolve a key against the memory tier and the in-flight table. The caller holds
 *        cache_lock_. An OWN claim registers a new in-flight load that the caller must run,
 *        marked started right away when the caller runs it on its own thread.
 */
auto ThumbnailCache::ClaimLoad(State& st, const CacheKey& key, bool run_here) -> Claim {
  Claim claim;
  auto  cached = st.memory_.AccessElement(key.fingerprint_);
  if (cached.has_value() && cached->bitmap_) {
    cached->last_access_ms_ = NowMs();
    claim.role_             = Claim::Role::HIT;
    claim.hit_.bitmap_      = cached->bitmap_;
    st.memory_.RecordAccess(key.fingerprint_, std::move(*cached));
    ++st.stats_.memory_hits_;
    return claim;
  }

  auto it = st.in_flight_.find(key.fingerprint_);
  if (it != st.in_flight_.end()) {
    claim.role_    = Claim::Role::JOIN;
    claim.future_  = it->second.future_;
    claim.started_ = it->second.started_;
    ++st.stats_.coalesced_;
    return claim;
  }

  State::InFlight flight;
  flight.promise_ = std::make_shared<std::promise<ThumbnailResult>>();
  flight.future_  = flight.promise_->get_future().share();
  flight.started_ = std::make_shared<std::atomic<bool>>(run_here);

  claim.role_     = Claim::Role::OWN;
  claim.future_   = flight.future_;
  claim.started_  = flight.started_;
  st.in_flight_.emplace(key.fingerprint_, std::move(flight));
  return claim;
}

auto ThumbnailCache::DecodeOrPlaceholder(State& st, const CacheKey& key,
                                         const image_path_t& path) -> ThumbnailResult {
  ThumbnailResult result;
  try {
    auto bitmap    = st.decoder_->Decode(path, key.target_, st.options_.decode_mode_);
    result.bitmap_ = std::make_shared<const Bitmap>(std::move(bitmap));
  } catch (const DecodeError& e) {
    spdlog::warn("[ThumbnailCache] Cannot decode {} ({}): {}", path.string(), ToString(e.Kind()),
                 e.what());
    result.error_ = e.Kind();
  } catch (const std::exception& e) {
    spdlog::error("[ThumbnailCache] Decoder failed on {}: {}", path.string(), e.what());
    result.error_ = DecodeErrorKind::CORRUPT;
  }
  if (!result.Ok()) {
    result.bitmap_ = std::make_shared<const Bitmap>(Bitmap::MakePlaceholder(key.target_));
  }
  return result;
}

/**
 * @brief Run a claimed load: disk tier first, then the decoder. Publishes the result to the
 *        memory tier and to every joined waiter. Never holds cache_lock_ across IO.
 */
void ThumbnailCache::RunLoad(const std::shared_ptr<State>& st, const CacheKey& key,
                             const image_path_t& path) {
  std::shared_ptr<DiskThumbnailStore> disk;
  std::optional<DiskRecord>           record;
  {
    std::unique_lock lock(st->cache_lock_);
    if (st->disk_enabled_ && st->disk_) {
      disk   = st->disk_;
      record = disk->Find(key.fingerprint_, NowMs());
    }
  }

  ThumbnailResult result;
  bool            from_disk  = false;
  bool            stale_blob = false;
  if (record.has_value()) {
    if (record->key_.SameParameters(key)) {
      if (auto bitmap = disk->ReadBlob(*record); bitmap.has_value()) {
        result.bitmap_ = std::make_shared<const Bitmap>(std::move(*bitmap));
        from_disk      = true;
      }
    }
    if (!from_disk) {
      stale_blob = true;
      spdlog::debug("[ThumbnailCache] Disk entry for {} unusable, decoding", path.string());
    }
  }

  if (!from_disk) {
    result = DecodeOrPlaceholder(*st, key, path);
  }

  std::shared_ptr<std::promise<ThumbnailResult>> promise;
  {
    std::unique_lock lock(st->cache_lock_);
    auto             it = st->in_flight_.find(key.fingerprint_);
    if (it != st->in_flight_.end()) {
      promise = std::move(it->second.promise_);
      st->in_flight_.erase(it);
    }
    if (stale_blob && disk) {
      disk->Forget(key.fingerprint_);
    }
    if (from_disk) {
      ++st->stats_.disk_hits_;
    } else {
      ++st->stats_.decodes_;
    }
    if (result.Ok()) {
      st->memory_.RecordAccess(key.fingerprint_,
                               State::MemoryEntry{key, result.bitmap_, NowMs()});
    } else {
      ++st->stats_.failures_;
    }
  }

  if (promise) {
    promise->set_value(result);
  }
}

void ThumbnailCache::DisablePersistence(State& st, const CacheError& e) {
  std::unique_lock lock(st.cache_lock_);
  st.disk_enabled_ = false;
  spdlog::warn("[ThumbnailCache] Disk tier disabled for this session: {}", e.what());
}

ThumbnailCache::ThumbnailCache(std::shared_ptr<ImageDecoder> decoder,
                               std::shared_ptr<ThreadPool> pool, ThumbnailCacheOptions options)
    : state_(std::make_shared<State>(std::move(decoder), std::move(pool), std::move(options))) {
  if (!state_->decoder_) {
    throw std::runtime_error("[ERROR] ThumbnailCache: Decoder not provided.");
  }
}

// Queued loads keep the state alive until the pool has run or drained them
ThumbnailCache::~ThumbnailCache() { state_->closed_.store(true); }

auto ThumbnailCache::GetOrCreate(const ImageEntry& entry, TargetSize target) -> ThumbnailResult {
  auto  st  = state_;
  auto  key = CacheKey::FromFile(entry, target);
  Claim claim;
  {
    std::unique_lock lock(st->cache_lock_);
    claim = ClaimLoad(*st, key, true);
  }

  switch (claim.role_) {
    case Claim::Role::HIT:
      return claim.hit_;
    case Claim::Role::JOIN:
      // A load still waiting in the pool is taken over by this thread
      if (!claim.started_->exchange(true)) {
        RunLoad(st, key, entry.path_);
      }
      return claim.future_.get();
    case Claim::Role::OWN:
      RunLoad(st, key, entry.path_);
      return claim.future_.get();
  }
  return claim.future_.get();
}

auto ThumbnailCache::Request(const ImageEntry& entry, TargetSize target, PriorityLevel priority)
    -> ThumbnailRequest {
  auto st   = state_;
  auto pool = st->pool_.lock();
  if (!pool) {
    throw std::runtime_error("[ERROR] ThumbnailCache: Asynchronous request without a pool.");
  }

  auto             key = CacheKey::FromFile(entry, target);
  ThumbnailRequest request;
  request.fingerprint_ = key.fingerprint_;

  std::unique_lock lock(st->cache_lock_);
  Claim            claim = ClaimLoad(*st, key, false);
  switch (claim.role_) {
    case Claim::Role::HIT: {
      std::promise<ThumbnailResult> ready;
      ready.set_value(claim.hit_);
      request.future_  = ready.get_future().share();
      request.started_ = std::make_shared<const std::atomic<bool>>(true);
      return request;
    }
    case Claim::Role::JOIN: {
      auto& flight = st->in_flight_.at(key.fingerprint_);
      if (priority > flight.priority_ && flight.task_id_.has_value() &&
          pool->Reprioritize(*flight.task_id_, priority)) {
        flight.priority_ = priority;
      }
      break;
    }
    case Claim::Role::OWN: {
      auto& flight     = st->in_flight_.at(key.fingerprint_);
      auto  started    = claim.started_;
      auto  path       = entry.path_;
      flight.priority_ = priority;
      flight.task_id_  = pool->Submit(
          [st, key, path, started]() {
            // Someone else may have taken the load over while it was queued
            if (started->exchange(true) || st->closed_.load()) return;
            RunLoad(st, key, path);
          },
          priority);
      break;
    }
  }
  request.future_  = claim.future_;
  request.started_ = claim.started_;
  return request;
}

auto ThumbnailCache::Peek(const ImageEntry& entry, TargetSize target) const -> BitmapPtr {
  auto             key = CacheKey::FromFile(entry, target);
  std::unique_lock lock(state_->cache_lock_);
  auto             cached = state_->memory_.Peek(key.fingerprint_);
  return cached.has_value() ? cached->bitmap_ : nullptr;
}

auto ThumbnailCache::Reprioritize(const Hash128& fingerprint, PriorityLevel priority) -> bool {
  auto             st   = state_;
  auto             pool = st->pool_.lock();
  std::unique_lock lock(st->cache_lock_);
  auto             it = st->in_flight_.find(fingerprint);
  if (!pool || it == st->in_flight_.end() || !it->second.task_id_.has_value() ||
      it->second.started_->load()) {
    return false;
  }
  if (!pool->Reprioritize(*it->second.task_id_, priority)) {
    return false;
  }
  it->second.priority_ = priority;
  return true;
}

void ThumbnailCache::LoadPersisted(const std::filesystem::path& source_folder) {
  auto       st        = state_;
  const auto directory = st->options_.disk_dir_.empty() ? DefaultCacheDirectory(source_folder)
                                                        : st->options_.disk_dir_;
  auto       store = std::make_shared<DiskThumbnailStore>(directory, st->options_.disk_budget_bytes_);

  std::vector<DiskRecord> records;
  try {
    store->PrepareDirectory();
    records = store->ReadIndexFile();
  } catch (const CacheError& e) {
    std::unique_lock lock(st->cache_lock_);
    st->disk_.reset();
    st->disk_enabled_ = false;
    spdlog::warn("[ThumbnailCache] Running without a disk tier: {}", e.what());
    return;
  }

  const auto count = records.size();
  store->Install(std::move(records));
  {
    std::unique_lock lock(st->cache_lock_);
    st->disk_         = store;
    st->disk_enabled_ = true;
  }
  spdlog::info("[ThumbnailCache] Loaded {} persisted thumbnails from {}", count,
               directory.string());
}

void ThumbnailCache::Persist() {
  auto                                st = state_;
  std::lock_guard<std::mutex>         persist_guard(st->persist_lock_);

  std::shared_ptr<DiskThumbnailStore> disk;
  std::vector<State::MemoryEntry>     unsaved;
  {
    std::unique_lock lock(st->cache_lock_);
    if (!st->disk_enabled_ || !st->disk_) {
      return;
    }
    disk = st->disk_;
    st->memory_.ForEach([&](const Hash128& fingerprint, const State::MemoryEntry& entry) {
      if (disk->Contains(fingerprint)) {
        disk->Touch(fingerprint, entry.last_access_ms_);
      } else {
        unsaved.push_back(entry);
      }
    });
  }

  std::vector<DiskRecord> written;
  written.reserve(unsaved.size());
  try {
    for (const auto& entry : unsaved) {
      written.push_back(disk->WriteBlob(entry.key_, *entry.bitmap_, entry.last_access_ms_));
    }
  } catch (const CacheError& e) {
    disk->RemoveBlobs(written);
    DisablePersistence(*st, e);
    return;
  }

  const auto              written_count = written.size();
  std::vector<DiskRecord> reclaimed;
  std::string             serialized;
  size_t                  disk_entries = 0;
  {
    std::unique_lock lock(st->cache_lock_);
    reclaimed    = disk->Commit(std::move(written));
    serialized   = disk->SerializeIndex();
    disk_entries = disk->Size();
  }

  try {
    disk->WriteIndexFile(serialized);
  } catch (const CacheError& e) {
    DisablePersistence(*st, e);
    return;
  }
  // Only after the new index no longer references them
  disk->RemoveBlobs(reclaimed);

  spdlog::info("[ThumbnailCache] Persisted {} thumbnails, reclaimed {}, {} on disk",
               written_count, reclaimed.size(), disk_entries);
}

auto ThumbnailCache::IsPersistenceEnabled() const -> bool {
  std::unique_lock lock(state_->cache_lock_);
  return state_->disk_enabled_;
}

auto ThumbnailCache::PersistenceDirectory() const -> std::optional<std::filesystem::path> {
  std::unique_lock lock(state_->cache_lock_);
  if (!state_->disk_enabled_ || !state_->disk_) {
    return std::nullopt;
  }
  return state_->disk_->Directory();
}

auto ThumbnailCache::Stats() const -> CacheStats {
  std::unique_lock lock(state_->cache_lock_);
  CacheStats       stats = state_->stats_;
  stats.memory_entries_  = state_->memory_.Size();
  stats.memory_bytes_    = state_->memory_.TotalWeight();
  if (state_->disk_enabled_ && state_->disk_) {
    stats.disk_entries_ = state_->disk_->Size();
    stats.disk_bytes_   = state_->disk_->TotalBytes();
  }
  return stats;
}

auto ThumbnailCache::Mode() const -> DecodeMode { return state_->options_.decode_mode_; }
};  // namespace quickcull
