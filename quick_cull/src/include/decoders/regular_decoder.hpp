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
#include <opencv2/core.hpp>
#include <vector>

#include "decoders/image_decoder.hpp"

namespace quickcull {
enum class ImageFormat { UNKNOWN, JPEG, PNG, BMP, GIF, TIFF, WEBP };

/**
 * @brief Identify the container from its leading bytes
 */
auto SniffFormat(const std::vector<uint8_t>& bytes) -> ImageFormat;

/**
 * @brief Largest JPEG DCT reduction (1, 2, 4 or 8) whose output still covers target
 */
auto SelectDraftScale(int src_width, int src_height, TargetSize target) -> int;

/**
 * @brief Downsize to fit inside target preserving aspect ratio. Never upscales.
 */
auto FitInside(cv::Mat&& src, TargetSize target, int interpolation) -> cv::Mat;

/**
 * @brief Decoder for the regular raster formats, OpenCV for pixels and Exiv2 for the header
 *        dimensions and the EXIF orientation.
 */
class RegularDecoder : public ImageDecoder {
 public:
  RegularDecoder() = default;

  auto Decode(const image_path_t& path, TargetSize target, DecodeMode mode) -> Bitmap override;
};
};  // namespace quickcull
