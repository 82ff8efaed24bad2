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

#include "cache/cache_key.hpp"

#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

namespace quickcull {
namespace {
template <typename T>
void AppendRaw(std::vector<char>& buffer, const T& value) {
  const auto offset = buffer.size();
  buffer.resize(offset + sizeof(T));
  std::memcpy(buffer.data() + offset, &value, sizeof(T));
}
}  // namespace

auto CacheKey::Make(std::string path, uintmax_t size_bytes, int64_t modified_ticks,
                    TargetSize target) -> CacheKey {
  CacheKey key;
  key.path_           = std::move(path);
  key.size_bytes_     = size_bytes;
  key.modified_ticks_ = modified_ticks;
  key.target_         = target;

  std::vector<char> buffer;
  buffer.reserve(key.path_.size() + 32);
  buffer.insert(buffer.end(), key.path_.begin(), key.path_.end());
  // Separates the path from the fixed-width fields
  buffer.push_back('\0');
  AppendRaw(buffer, static_cast<uint64_t>(key.size_bytes_));
  AppendRaw(buffer, key.modified_ticks_);
  AppendRaw(buffer, static_cast<int32_t>(key.target_.width_));
  AppendRaw(buffer, static_cast<int32_t>(key.target_.height_));
  key.fingerprint_ = Hash128::Compute(buffer.data(), buffer.size());
  return key;
}

auto CacheKey::FromEntry(const ImageEntry& entry, TargetSize target) -> CacheKey {
  return Make(entry.path_.string(), entry.size_bytes_,
              static_cast<int64_t>(entry.modified_time_.time_since_epoch().count()), target);
}

auto CacheKey::FromFile(const ImageEntry& entry, TargetSize target) -> CacheKey {
  std::error_code ec;
  const auto      size = std::filesystem::file_size(entry.path_, ec);
  if (ec) {
    return FromEntry(entry, target);
  }
  const auto modified = std::filesystem::last_write_time(entry.path_, ec);
  if (ec) {
    return FromEntry(entry, target);
  }
  return Make(entry.path_.string(), size,
              static_cast<int64_t>(modified.time_since_epoch().count()), target);
}

auto CacheKey::SameParameters(const CacheKey& other) const -> bool {
  return path_ == other.path_ && size_bytes_ == other.size_bytes_ &&
         modified_ticks_ == other.modified_ticks_ && target_ == other.target_;
}
};  // namespace quickcull
