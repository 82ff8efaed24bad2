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

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "fixtures/fake_decoders.hpp"
#include "fixtures/image_folder_test_fixation.hpp"
#include "fixtures/pool_test_helpers.hpp"
#include "index/image_index.hpp"

namespace quickcull {
namespace {
constexpr TargetSize kThumb{24, 24};

auto MemoryOnly() -> ThumbnailCacheOptions {
  ThumbnailCacheOptions options;
  options.max_entries_ = 16;
  options.max_bytes_   = 0;
  return options;
}
}  // namespace

class ThumbnailCacheTests : public ImageFolderTests {
 protected:
  std::shared_ptr<CountingDecoder> decoder_ = std::make_shared<CountingDecoder>();
};

TEST_F(ThumbnailCacheTests, RepeatedLookupDecodesOnce) {
  WriteImage("a.jpg", 64, 48);
  auto           index = ImageIndex::Build(folder_);
  ThumbnailCache cache(decoder_, nullptr, MemoryOnly());

  auto           first  = cache.GetOrCreate(index.Lookup(0), kThumb);
  auto           second = cache.GetOrCreate(index.Lookup(0), kThumb);
  ASSERT_TRUE(first.Ok());
  ASSERT_TRUE(second.Ok());
  EXPECT_EQ(first.bitmap_, second.bitmap_);
  EXPECT_EQ(first.bitmap_->Width(), kThumb.width_);
  EXPECT_EQ(decoder_->calls_.load(), 1);
  EXPECT_EQ(decoder_->LastMode(), DecodeMode::DRAFT);

  auto stats = cache.Stats();
  EXPECT_EQ(stats.decodes_, 1u);
  EXPECT_EQ(stats.memory_hits_, 1u);
  EXPECT_EQ(stats.memory_entries_, 1u);
  EXPECT_EQ(cache.Peek(index.Lookup(0), kThumb), first.bitmap_);
}

TEST_F(ThumbnailCacheTests, ModifiedFileOrTargetIsDecodedAgain) {
  const auto path  = WriteImage("a.jpg", 64, 48);
  auto       index = ImageIndex::Build(folder_);
  ThumbnailCache cache(decoder_, nullptr, MemoryOnly());

  cache.GetOrCreate(index.Lookup(0), kThumb);
  cache.GetOrCreate(index.Lookup(0), TargetSize{48, 48});
  EXPECT_EQ(decoder_->calls_.load(), 2);

  // Same size, newer modification time
  std::filesystem::last_write_time(
      path, std::filesystem::last_write_time(path) + std::chrono::hours(1));
  cache.GetOrCreate(index.Lookup(0), kThumb);
  EXPECT_EQ(decoder_->calls_.load(), 3);

  // Different content and size
  WriteImage("a.jpg", 160, 120, 7);
  cache.GetOrCreate(index.Lookup(0), kThumb);
  EXPECT_EQ(decoder_->calls_.load(), 4);
  cache.GetOrCreate(index.Lookup(0), kThumb);
  EXPECT_EQ(decoder_->calls_.load(), 4);
}

TEST_F(ThumbnailCacheTests, ConcurrentCallersShareOneDecode) {
  WriteImage("a.jpg", 64, 48);
  auto           index   = ImageIndex::Build(folder_);
  auto           gated   = std::make_shared<GatedDecoder>();
  ThumbnailCache cache(gated, nullptr, MemoryOnly());

  constexpr int                   kCallers = 4;
  std::vector<ThumbnailResult>    results(kCallers);
  std::vector<std::thread>        callers;
  for (int i = 0; i < kCallers; ++i) {
    callers.emplace_back([&, i]() { results[i] = cache.GetOrCreate(index.Lookup(0), kThumb); });
  }

  EXPECT_TRUE(gated->WaitForWaiting(1, std::chrono::seconds(5)));
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (cache.Stats().coalesced_ < kCallers - 1 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  EXPECT_EQ(cache.Stats().coalesced_, static_cast<uint64_t>(kCallers - 1));
  gated->Open();
  for (auto& caller : callers) caller.join();

  EXPECT_EQ(gated->calls_.load(), 1);
  for (const auto& result : results) {
    ASSERT_TRUE(result.Ok());
    EXPECT_EQ(result.bitmap_, results[0].bitmap_);
  }
}

TEST_F(ThumbnailCacheTests, FailureYieldsPlaceholderAndIsRetried) {
  WriteImage("bad.jpg", 64, 48);
  auto           index = ImageIndex::Build(folder_);
  decoder_->FailOn("bad.jpg");
  ThumbnailCache cache(decoder_, nullptr, MemoryOnly());

  auto           result = cache.GetOrCreate(index.Lookup(0), kThumb);
  EXPECT_FALSE(result.Ok());
  ASSERT_TRUE(result.error_.has_value());
  EXPECT_EQ(*result.error_, DecodeErrorKind::CORRUPT);
  ASSERT_NE(result.bitmap_, nullptr);
  EXPECT_TRUE(result.bitmap_->IsPlaceholder());
  EXPECT_EQ(cache.Peek(index.Lookup(0), kThumb), nullptr);

  cache.GetOrCreate(index.Lookup(0), kThumb);
  EXPECT_EQ(decoder_->CallsFor("bad.jpg"), 2);
  auto stats = cache.Stats();
  EXPECT_EQ(stats.failures_, 2u);
  EXPECT_EQ(stats.memory_entries_, 0u);
}

TEST_F(ThumbnailCacheTests, MemoryTierEvictsByEntryCount) {
  WriteImage("a.jpg", 32, 32);
  WriteImage("b.jpg", 32, 32);
  WriteImage("c.jpg", 32, 32);
  auto                  index   = ImageIndex::Build(folder_);
  ThumbnailCacheOptions options = MemoryOnly();
  options.max_entries_          = 2;
  ThumbnailCache cache(decoder_, nullptr, options);

  cache.GetOrCreate(index.Lookup(0), kThumb);
  cache.GetOrCreate(index.Lookup(1), kThumb);
  cache.GetOrCreate(index.Lookup(0), kThumb);
  cache.GetOrCreate(index.Lookup(2), kThumb);

  EXPECT_NE(cache.Peek(index.Lookup(0), kThumb), nullptr);
  EXPECT_EQ(cache.Peek(index.Lookup(1), kThumb), nullptr);
  EXPECT_NE(cache.Peek(index.Lookup(2), kThumb), nullptr);
  EXPECT_EQ(cache.Stats().memory_entries_, 2u);
}

TEST_F(ThumbnailCacheTests, MemoryTierEvictsByBytes) {
  for (int i = 0; i < 4; ++i) WriteImage(std::format("{}.jpg", i), 32, 32, i);
  auto                  index   = ImageIndex::Build(folder_);
  ThumbnailCacheOptions options = MemoryOnly();
  // Two 10x10 BGR bitmaps fit, three do not
  options.max_bytes_            = 700;
  ThumbnailCache cache(decoder_, nullptr, options);

  for (image_id_t id = 0; id < 4; ++id) {
    cache.GetOrCreate(index.Lookup(id), TargetSize{10, 10});
  }
  auto stats = cache.Stats();
  EXPECT_EQ(stats.memory_entries_, 2u);
  EXPECT_LE(stats.memory_bytes_, 700u);
  EXPECT_NE(cache.Peek(index.Lookup(3), TargetSize{10, 10}), nullptr);
  EXPECT_EQ(cache.Peek(index.Lookup(0), TargetSize{10, 10}), nullptr);
}

TEST_F(ThumbnailCacheTests, PersistedThumbnailsSurviveRestart) {
  WriteImage("a.jpg", 64, 48);
  WriteImage("b.jpg", 48, 64);
  auto                  index   = ImageIndex::Build(folder_);
  ThumbnailCacheOptions options = MemoryOnly();
  options.disk_dir_             = cache_dir_;

  std::vector<BitmapPtr> originals;
  {
    ThumbnailCache cache(decoder_, nullptr, options);
    cache.LoadPersisted(folder_);
    ASSERT_TRUE(cache.IsPersistenceEnabled());
    EXPECT_EQ(cache.PersistenceDirectory().value(), cache_dir_);
    originals.push_back(cache.GetOrCreate(index.Lookup(0), kThumb).bitmap_);
    originals.push_back(cache.GetOrCreate(index.Lookup(1), kThumb).bitmap_);
    cache.Persist();
    EXPECT_EQ(cache.Stats().disk_entries_, 2u);
    // A second persist has nothing new to write
    cache.Persist();
    EXPECT_EQ(cache.Stats().disk_entries_, 2u);
  }
  EXPECT_TRUE(std::filesystem::exists(cache_dir_ / "index.json"));

  auto           fresh = std::make_shared<CountingDecoder>();
  ThumbnailCache reopened(fresh, nullptr, options);
  reopened.LoadPersisted(folder_);
  auto a = reopened.GetOrCreate(index.Lookup(0), kThumb);
  auto b = reopened.GetOrCreate(index.Lookup(1), kThumb);
  ASSERT_TRUE(a.Ok());
  ASSERT_TRUE(b.Ok());
  EXPECT_EQ(fresh->calls_.load(), 0);
  EXPECT_EQ(reopened.Stats().disk_hits_, 2u);
  EXPECT_TRUE(a.bitmap_->SamePixels(*originals[0]));
  EXPECT_TRUE(b.bitmap_->SamePixels(*originals[1]));
}

TEST_F(ThumbnailCacheTests, PersistReclaimsTheLeastRecentThumbnail) {
  WriteImage("a.jpg", 64, 48);
  WriteImage("b.jpg", 64, 48);
  auto                  index  = ImageIndex::Build(folder_);

  // Learn the blob size with a budget that fits both
  ThumbnailCacheOptions sizing = MemoryOnly();
  sizing.disk_dir_             = root_ / "sizing";
  size_t largest               = 0;
  {
    ThumbnailCache cache(decoder_, nullptr, sizing);
    cache.LoadPersisted(folder_);
    cache.GetOrCreate(index.Lookup(0), kThumb);
    cache.GetOrCreate(index.Lookup(1), kThumb);
    cache.Persist();
    for (const auto& file : std::filesystem::directory_iterator(sizing.disk_dir_)) {
      if (file.path().extension() == ".png") {
        largest = std::max(largest, static_cast<size_t>(file.file_size()));
      }
    }
  }
  ASSERT_GT(largest, 0u);

  ThumbnailCacheOptions options = MemoryOnly();
  options.disk_dir_             = cache_dir_;
  options.disk_budget_bytes_    = largest;
  {
    ThumbnailCache cache(decoder_, nullptr, options);
    cache.LoadPersisted(folder_);
    cache.GetOrCreate(index.Lookup(0), kThumb);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    cache.GetOrCreate(index.Lookup(1), kThumb);
    cache.Persist();
    EXPECT_EQ(cache.Stats().disk_entries_, 1u);
  }

  auto           fresh = std::make_shared<CountingDecoder>();
  ThumbnailCache reopened(fresh, nullptr, options);
  reopened.LoadPersisted(folder_);
  reopened.GetOrCreate(index.Lookup(1), kThumb);
  EXPECT_EQ(fresh->calls_.load(), 0);
  reopened.GetOrCreate(index.Lookup(0), kThumb);
  EXPECT_EQ(fresh->CallsFor("a.jpg"), 1);
}

TEST_F(ThumbnailCacheTests, CorruptBlobFallsBackToDecode) {
  WriteImage("a.jpg", 64, 48);
  auto                  index   = ImageIndex::Build(folder_);
  ThumbnailCacheOptions options = MemoryOnly();
  options.disk_dir_             = cache_dir_;
  {
    ThumbnailCache cache(decoder_, nullptr, options);
    cache.LoadPersisted(folder_);
    cache.GetOrCreate(index.Lookup(0), kThumb);
    cache.Persist();
  }
  for (const auto& file : std::filesystem::directory_iterator(cache_dir_)) {
    if (file.path().extension() == ".png") {
      std::ofstream(file.path(), std::ios::binary | std::ios::trunc) << "garbage";
    }
  }

  auto           fresh = std::make_shared<CountingDecoder>();
  ThumbnailCache reopened(fresh, nullptr, options);
  reopened.LoadPersisted(folder_);
  auto result = reopened.GetOrCreate(index.Lookup(0), kThumb);
  EXPECT_TRUE(result.Ok());
  EXPECT_EQ(fresh->calls_.load(), 1);
  EXPECT_EQ(reopened.Stats().disk_hits_, 0u);
}

TEST_F(ThumbnailCacheTests, UnusableCacheDirectoryKeepsMemoryTier) {
  WriteImage("a.jpg", 64, 48);
  WriteBytes("occupied", "a regular file");
  auto                  index   = ImageIndex::Build(folder_);
  ThumbnailCacheOptions options = MemoryOnly();
  options.disk_dir_             = folder_ / "occupied" / "cache";

  ThumbnailCache        cache(decoder_, nullptr, options);
  cache.LoadPersisted(folder_);
  EXPECT_FALSE(cache.IsPersistenceEnabled());
  EXPECT_FALSE(cache.PersistenceDirectory().has_value());

  EXPECT_TRUE(cache.GetOrCreate(index.Lookup(0), kThumb).Ok());
  cache.Persist();
  EXPECT_EQ(cache.Stats().memory_entries_, 1u);
  EXPECT_EQ(cache.Stats().disk_entries_, 0u);
}

TEST_F(ThumbnailCacheTests, RequestCompletesOnPool) {
  WriteImage("a.jpg", 64, 48);
  auto           index = ImageIndex::Build(folder_);
  auto           pool  = std::make_shared<ThreadPool>(2);
  ThumbnailCache cache(decoder_, pool, MemoryOnly());

  auto           request = cache.Request(index.Lookup(0), kThumb, 0);
  ASSERT_EQ(request.future_.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_TRUE(request.future_.get().Ok());
  EXPECT_TRUE(request.HasStarted());

  auto again = cache.Request(index.Lookup(0), kThumb, 0);
  EXPECT_TRUE(again.IsReady());
  EXPECT_EQ(again.future_.get().bitmap_, request.future_.get().bitmap_);
  EXPECT_EQ(decoder_->calls_.load(), 1);

  ThumbnailCache no_pool(decoder_, nullptr, MemoryOnly());
  EXPECT_THROW(no_pool.Request(index.Lookup(0), kThumb, 0), std::runtime_error);
  EXPECT_THROW(ThumbnailCache(nullptr, pool, MemoryOnly()), std::runtime_error);
}

TEST_F(ThumbnailCacheTests, QueuedRequestCanBeReprioritizedOrTakenOver) {
  WriteImage("a.jpg", 64, 48);
  WriteImage("b.jpg", 64, 48);
  auto           index = ImageIndex::Build(folder_);
  auto           pool  = std::make_shared<ThreadPool>(1);
  ThumbnailCache cache(decoder_, pool, MemoryOnly());

  auto           release = HoldPool(*pool);
  auto           a = cache.Request(index.Lookup(0), kThumb, 0);
  auto           b = cache.Request(index.Lookup(1), kThumb, 0);
  EXPECT_FALSE(a.HasStarted());
  EXPECT_TRUE(cache.Reprioritize(b.fingerprint_, 5));
  EXPECT_FALSE(cache.Reprioritize(Hash128(1, 2), 5));

  // A second request for a queued key joins the same load
  auto a_again = cache.Request(index.Lookup(0), kThumb, 3);
  EXPECT_EQ(cache.Stats().coalesced_, 1u);

  // A blocking lookup does not wait behind the busy worker
  auto direct = cache.GetOrCreate(index.Lookup(0), kThumb);
  EXPECT_TRUE(direct.Ok());
  EXPECT_TRUE(a.IsReady());
  EXPECT_TRUE(a_again.IsReady());
  EXPECT_FALSE(cache.Reprioritize(a.fingerprint_, 9));

  release.set_value();
  ASSERT_EQ(b.future_.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  DrainPool(*pool);
  EXPECT_EQ(decoder_->CallsFor("a.jpg"), 1);
  EXPECT_EQ(decoder_->CallsFor("b.jpg"), 1);
}
};  // namespace quickcull
