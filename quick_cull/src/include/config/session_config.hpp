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
#include <string>

#include "grid/grid_canvas.hpp"
#include "type/type.hpp"

namespace quickcull {
/**
 * @brief Tunables of one culling session. Every field has a default, a config file only
 *        overrides the keys it names.
 */
struct SessionConfig {
  int                   thumbnail_size_        = 120;
  int                   cell_width_            = 140;
  int                   cell_height_           = 160;
  int                   grid_width_            = 840;
  int                   viewport_height_       = 620;
  int                   prefetch_margin_rows_  = 1;
  int                   worker_threads_        = 8;
  int                   preload_count_         = 3;
  int                   preview_max_dimension_ = 4096;
  uint32_t              memory_cache_entries_  = 512;
  size_t                memory_cache_bytes_    = 64ull << 20;
  uint32_t              preview_cache_entries_ = 6;
  size_t                disk_cache_bytes_      = 256ull << 20;
  std::filesystem::path cache_dir_{};
  std::string           log_level_             = "info";

  /**
   * @throws ConfigError if the file cannot be read, is not JSON, or holds an invalid value
   */
  static auto LoadFromFile(const std::filesystem::path& path) -> SessionConfig;

  /**
   * @throws ConfigError on malformed JSON or an invalid value
   */
  static auto LoadFromString(const std::string& text) -> SessionConfig;

  auto        ThumbnailTarget() const -> TargetSize { return {thumbnail_size_, thumbnail_size_}; }
  auto        PreviewTarget() const -> TargetSize {
    return {preview_max_dimension_, preview_max_dimension_};
  }
  auto        Layout(size_t count) const -> GridLayout;
};
};  // namespace quickcull
