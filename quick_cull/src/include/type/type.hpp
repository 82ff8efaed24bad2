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
#include <filesystem>

namespace quickcull {

#define image_path_t  std::filesystem::path

// Position of an image in the sorted folder listing, also the grid and cache key
#define image_id_t    uint32_t

// Used by the worker pool to address queued tasks
#define task_id_t     uint64_t

// Larger runs first
#define PriorityLevel int

// Pixel dimensions requested from the decoder, 0 on an axis means unbounded
struct TargetSize {
  int  width_  = 0;
  int  height_ = 0;

  auto IsUnbounded() const -> bool { return width_ <= 0 && height_ <= 0; }
  bool operator==(const TargetSize& other) const = default;
};

enum class Decision { PENDING, KEPT, SKIPPED };
};  // namespace quickcull
