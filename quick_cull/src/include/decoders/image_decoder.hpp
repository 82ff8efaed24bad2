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

#include "image/bitmap.hpp"
#include "type/type.hpp"

namespace quickcull {

/**
 * @brief FULL always decodes the native resolution before resizing. DRAFT may use a
 *        format-native reduced decode (JPEG DCT scaling) when only a small image is needed.
 */
enum class DecodeMode { FULL, DRAFT };

class ImageDecoder {
 public:
  virtual ~ImageDecoder() = default;

  /**
   * @brief Decode the file at path into an upright bitmap that fits inside target
   *
   * @throws DecodeError
   */
  virtual auto Decode(const image_path_t& path, TargetSize target, DecodeMode mode) -> Bitmap = 0;
};
};  // namespace quickcull
