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

#include "decoders/regular_decoder.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <exiv2/exiv2.hpp>
#include <format>
#include <fstream>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <utility>

#include "error/errors.hpp"
#include "image/orientation.hpp"

namespace quickcull {
namespace {
struct HeaderInfo {
  int width_       = 0;
  int height_      = 0;
  int orientation_ = kOrientationNormal;
};

auto ReadFileBytes(const image_path_t& path) -> std::vector<uint8_t> {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file.is_open()) {
    throw DecodeError(DecodeErrorKind::IO_FAILURE,
                      std::format("[ERROR] RegularDecoder: File not exists or no read permission: {}",
                                  path.string()));
  }

  std::streamsize file_size = file.tellg();
  if (file_size < 0) {
    throw DecodeError(DecodeErrorKind::IO_FAILURE,
                      std::format("[ERROR] RegularDecoder: Cannot determine size of {}",
                                  path.string()));
  }
  file.seekg(0, std::ios::beg);
  std::vector<uint8_t> buffer(static_cast<size_t>(file_size));
  if (file_size > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), file_size)) {
    throw DecodeError(DecodeErrorKind::IO_FAILURE,
                      std::format("[ERROR] RegularDecoder: Short read on {}", path.string()));
  }
  return buffer;
}

auto ReadHeaderInfo(const std::vector<uint8_t>& bytes, const image_path_t& path) -> HeaderInfo {
  HeaderInfo info;
  try {
    auto image = Exiv2::ImageFactory::open(reinterpret_cast<const Exiv2::byte*>(bytes.data()),
                                           bytes.size());
    image->readMetadata();
    info.width_       = static_cast<int>(image->pixelWidth());
    info.height_      = static_cast<int>(image->pixelHeight());

    auto& exif_data   = image->exifData();
    auto  orientation = exif_data.findKey(Exiv2::ExifKey("Exif.Image.Orientation"));
    if (orientation != exif_data.end() && orientation->count() > 0) {
      const auto value = orientation->toInt64();
      if (value >= 1 && value <= 8) {
        info.orientation_ = static_cast<int>(value);
      }
    }
  } catch (const std::exception& e) {
    // Metadata is optional, the pixels may still decode
    spdlog::debug("[RegularDecoder] No readable metadata in {}: {}", path.string(), e.what());
  }
  return info;
}

auto DraftFlag(int scale) -> int {
  switch (scale) {
    case 8:
      return cv::IMREAD_REDUCED_COLOR_8;
    case 4:
      return cv::IMREAD_REDUCED_COLOR_4;
    case 2:
      return cv::IMREAD_REDUCED_COLOR_2;
    default:
      return cv::IMREAD_COLOR;
  }
}

auto StartsWith(const std::vector<uint8_t>& bytes, size_t offset, const char* magic,
                size_t length) -> bool {
  return bytes.size() >= offset + length && std::memcmp(bytes.data() + offset, magic, length) == 0;
}
}  // namespace

auto SniffFormat(const std::vector<uint8_t>& bytes) -> ImageFormat {
  if (StartsWith(bytes, 0, "\xFF\xD8\xFF", 3)) return ImageFormat::JPEG;
  if (StartsWith(bytes, 0, "\x89PNG\r\n\x1A\n", 8)) return ImageFormat::PNG;
  if (StartsWith(bytes, 0, "GIF87a", 6) || StartsWith(bytes, 0, "GIF89a", 6))
    return ImageFormat::GIF;
  if (StartsWith(bytes, 0, "II*\0", 4) || StartsWith(bytes, 0, "MM\0*", 4))
    return ImageFormat::TIFF;
  if (StartsWith(bytes, 0, "RIFF", 4) && StartsWith(bytes, 8, "WEBP", 4)) return ImageFormat::WEBP;
  if (StartsWith(bytes, 0, "BM", 2)) return ImageFormat::BMP;
  return ImageFormat::UNKNOWN;
}

auto SelectDraftScale(int src_width, int src_height, TargetSize target) -> int {
  if (src_width <= 0 || src_height <= 0 || target.IsUnbounded()) {
    return 1;
  }
  for (int scale : {8, 4, 2}) {
    const int  reduced_w = (src_width + scale - 1) / scale;
    const int  reduced_h = (src_height + scale - 1) / scale;
    const bool covers_w  = target.width_ <= 0 || reduced_w >= target.width_;
    const bool covers_h  = target.height_ <= 0 || reduced_h >= target.height_;
    if (covers_w && covers_h) {
      return scale;
    }
  }
  return 1;
}

auto FitInside(cv::Mat&& src, TargetSize target, int interpolation) -> cv::Mat {
  if (src.empty() || target.IsUnbounded()) {
    return std::move(src);
  }
  double scale = 1.0;
  if (target.width_ > 0) {
    scale = std::min(scale, static_cast<double>(target.width_) / src.cols);
  }
  if (target.height_ > 0) {
    scale = std::min(scale, static_cast<double>(target.height_) / src.rows);
  }
  if (scale >= 1.0) {
    return std::move(src);
  }

  const int width  = std::max(1, static_cast<int>(std::lround(src.cols * scale)));
  const int height = std::max(1, static_cast<int>(std::lround(src.rows * scale)));
  cv::Mat   dst;
  cv::resize(src, dst, cv::Size(width, height), 0, 0, interpolation);
  return dst;
}

auto RegularDecoder::Decode(const image_path_t& path, TargetSize target, DecodeMode mode)
    -> Bitmap {
  auto       bytes  = ReadFileBytes(path);
  const auto format = SniffFormat(bytes);
  if (format == ImageFormat::UNKNOWN || !cv::haveImageReader(path.string())) {
    throw DecodeError(DecodeErrorKind::UNSUPPORTED_FORMAT,
                      std::format("[ERROR] RegularDecoder: Unsupported image format: {}",
                                  path.string()));
  }

  const auto header = ReadHeaderInfo(bytes, path);

  int        flags  = cv::IMREAD_COLOR;
  if (mode == DecodeMode::DRAFT && format == ImageFormat::JPEG) {
    // The header reports stored dimensions, compare against the stored orientation
    TargetSize stored_target = target;
    if (SwapsAxes(header.orientation_)) {
      std::swap(stored_target.width_, stored_target.height_);
    }
    flags = DraftFlag(SelectDraftScale(header.width_, header.height_, stored_target));
  }
  // Orientation is applied below for every format
  flags |= cv::IMREAD_IGNORE_ORIENTATION;

  cv::Mat encoded(1, static_cast<int>(bytes.size()), CV_8UC1, bytes.data());
  cv::Mat decoded;
  try {
    decoded = cv::imdecode(encoded, flags);
  } catch (const cv::Exception& e) {
    throw DecodeError(DecodeErrorKind::CORRUPT,
                      std::format("[ERROR] RegularDecoder: Failed to decode {}: {}", path.string(),
                                  e.what()));
  }
  if (decoded.empty()) {
    throw DecodeError(DecodeErrorKind::CORRUPT,
                      std::format("[ERROR] RegularDecoder: Failed to decode {}", path.string()));
  }

  decoded                 = ApplyOrientation(std::move(decoded), header.orientation_);
  const int interpolation = mode == DecodeMode::DRAFT ? cv::INTER_AREA : cv::INTER_LANCZOS4;
  return Bitmap{FitInside(std::move(decoded), target, interpolation)};
}
};  // namespace quickcull
