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

#include "image/bitmap.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace quickcull {
namespace {
constexpr int kPlaceholderEdge = 16;
const auto    kPlaceholderGray = cv::Scalar(0x3a, 0x3a, 0x3a);
}  // namespace

Bitmap::Bitmap(cv::Mat&& data) : data_(std::move(data)) {}

Bitmap::Bitmap(Bitmap&& other) noexcept
    : data_(std::move(other.data_)), placeholder_(other.placeholder_) {}

Bitmap& Bitmap::operator=(Bitmap&& other) noexcept {
  if (this != &other) {
    data_        = std::move(other.data_);
    placeholder_ = other.placeholder_;
  }
  return *this;
}

auto Bitmap::ByteSize() const -> size_t { return data_.total() * data_.elemSize(); }

auto Bitmap::GetData() const -> const cv::Mat& {
  if (data_.empty()) {
    throw std::runtime_error("Bitmap: No valid image data to be returned");
  }
  return data_;
}

auto Bitmap::SamePixels(const Bitmap& other) const -> bool {
  if (data_.rows != other.data_.rows || data_.cols != other.data_.cols ||
      data_.type() != other.data_.type()) {
    return false;
  }
  const size_t row_bytes = static_cast<size_t>(data_.cols) * data_.elemSize();
  for (int r = 0; r < data_.rows; ++r) {
    if (std::memcmp(data_.ptr(r), other.data_.ptr(r), row_bytes) != 0) {
      return false;
    }
  }
  return true;
}

auto Bitmap::MakePlaceholder(TargetSize size) -> Bitmap {
  const int width  = size.width_ > 0 ? size.width_ : kPlaceholderEdge;
  const int height = size.height_ > 0 ? size.height_ : kPlaceholderEdge;
  Bitmap    placeholder{cv::Mat(std::max(height, 1), std::max(width, 1), CV_8UC3, kPlaceholderGray)};
  placeholder.placeholder_ = true;
  return placeholder;
}
};  // namespace quickcull
