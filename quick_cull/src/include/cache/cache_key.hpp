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

#include <cstdint>
#include <string>

#include "index/image_index.hpp"
#include "type/hash_type.hpp"
#include "type/type.hpp"

namespace quickcull {
/**
 * @brief Identifies one cached variant of one file. Any change to the file size, its
 *        modification time or the requested dimensions produces a different fingerprint.
 */
struct CacheKey {
  std::string path_;
  uintmax_t   size_bytes_     = 0;
  // Ticks of std::filesystem::file_time_type since its epoch
  int64_t     modified_ticks_ = 0;
  TargetSize  target_{};
  Hash128     fingerprint_{};

  static auto Make(std::string path, uintmax_t size_bytes, int64_t modified_ticks,
                   TargetSize target) -> CacheKey;

  /**
   * @brief Key from the metadata recorded when the index was built
   */
  static auto FromEntry(const ImageEntry& entry, TargetSize target) -> CacheKey;

  /**
   * @brief Key from the file's current metadata, falls back to the entry's record if the
   *        file cannot be inspected
   */
  static auto FromFile(const ImageEntry& entry, TargetSize target) -> CacheKey;

  /**
   * @brief Whether every field matches, not only the fingerprint
   */
  auto        SameParameters(const CacheKey& other) const -> bool;

  bool        operator==(const CacheKey& other) const { return fingerprint_ == other.fingerprint_; }
};
};  // namespace quickcull
