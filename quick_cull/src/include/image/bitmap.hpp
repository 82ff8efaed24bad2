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
#include <memory>
#include <opencv2/core.hpp>

#include "type/type.hpp"

namespace quickcull {
/**
 * @brief A decoded, upright 8-bit BGR image. Shared read-only once handed out by a cache.
 *
 */
class Bitmap {
 private:
  cv::Mat data_;
  bool    placeholder_ = false;

 public:
  Bitmap() = default;
  explicit Bitmap(cv::Mat&& data);
  Bitmap(Bitmap&& other) noexcept;
  Bitmap& operator=(Bitmap&& other) noexcept;

  Bitmap(const Bitmap&)            = delete;
  Bitmap& operator=(const Bitmap&) = delete;

  auto    Width() const -> int { return data_.cols; }
  auto    Height() const -> int { return data_.rows; }
  auto    ByteSize() const -> size_t;
  auto    Empty() const -> bool { return data_.empty(); }
  auto    IsPlaceholder() const -> bool { return placeholder_; }

  auto    GetData() const -> const cv::Mat&;

  /**
   * @brief Compare dimensions, type and every pixel byte
   */
  auto    SamePixels(const Bitmap& other) const -> bool;

  static auto MakePlaceholder(TargetSize size) -> Bitmap;
};

using BitmapPtr = std::shared_ptr<const Bitmap>;
};  // namespace quickcull
