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

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cache/cache_key.hpp"
#include "image/bitmap.hpp"
#include "type/hash_type.hpp"
#include "utils/cache/lru_cache.hpp"

namespace quickcull {
struct DiskRecord {
  CacheKey key_{};
  int      width_          = 0;
  int      height_         = 0;
  size_t   blob_bytes_     = 0;
  int64_t  last_access_ms_ = 0;
};

/**
 * @brief Pick the on-disk cache location for a source folder: XDG cache home, then
 *        ~/.cache, then a hidden directory inside the folder itself.
 */
auto DefaultCacheDirectory(const std::filesystem::path& source_folder) -> std::filesystem::path;

/**
 * @brief The persistent thumbnail tier. One PNG blob per key plus a self-describing JSON
 *        index. Record bookkeeping is not synchronized, the owner serializes it. Methods
 *        marked IO only touch the filesystem and may run outside the owner's lock.
 */
class DiskThumbnailStore {
 public:
  static constexpr int     format_version_ = 1;
  static constexpr const char* index_file_name_ = "index.json";

  DiskThumbnailStore(std::filesystem::path directory, size_t byte_budget);

  auto Directory() const -> const std::filesystem::path& { return directory_; }

  // IO. Creates the cache directory, throws CacheError if it is not writable
  void PrepareDirectory() const;
  // IO. Missing index yields no records, a corrupt index or entry is skipped with a warning
  auto ReadIndexFile() const -> std::vector<DiskRecord>;
  // IO. nullopt if the blob is missing, unreadable or does not match the record
  auto ReadBlob(const DiskRecord& record) const -> std::optional<Bitmap>;
  // IO. Throws CacheError
  auto WriteBlob(const CacheKey& key, const Bitmap& bitmap, int64_t last_access_ms) const
      -> DiskRecord;
  // IO. Atomic replace through a temporary file, throws CacheError
  void WriteIndexFile(const std::string& serialized) const;
  // IO. Best effort
  void RemoveBlobs(const std::vector<DiskRecord>& records) const;

  void Install(std::vector<DiskRecord>&& records);
  auto Contains(const Hash128& fingerprint) const -> bool;
  auto Find(const Hash128& fingerprint, int64_t now_ms) -> std::optional<DiskRecord>;
  void Touch(const Hash128& fingerprint, int64_t last_access_ms);
  void Forget(const Hash128& fingerprint) { records_.RemoveRecord(fingerprint); }

  /**
   * @brief Add freshly written records, then reclaim the records with the oldest last_access
   *        until the tier fits its byte budget
   *
   * @return reclaimed records, their blobs still need RemoveBlobs
   */
  auto Commit(std::vector<DiskRecord>&& records) -> std::vector<DiskRecord>;
  auto SerializeIndex() const -> std::string;

  auto Size() const -> size_t { return records_.Size(); }
  auto TotalBytes() const -> size_t { return records_.TotalWeight(); }

 private:
  std::filesystem::path           directory_;
  size_t                          byte_budget_;
  LRUCache<Hash128, DiskRecord>   records_;

  auto BlobPath(const Hash128& fingerprint) const -> std::filesystem::path;
};
};  // namespace quickcull
