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

#include <opencv2/core.hpp>

namespace quickcull {
// EXIF Orientation tag values, 1 is upright
constexpr int kOrientationNormal = 1;

/**
 * @brief Whether the orientation swaps width and height (values 5 to 8)
 */
inline bool SwapsAxes(int orientation) { return orientation >= 5 && orientation <= 8; }

/**
 * @brief Rotate or flip src so that it displays upright. Unknown values leave src unchanged.
 */
auto ApplyOrientation(cv::Mat&& src, int orientation) -> cv::Mat;
};  // namespace quickcull
