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

#include <stdexcept>
#include <string>
#include <string_view>

namespace quickcull {
enum class IndexErrorKind { FOLDER_NOT_FOUND };
enum class DecodeErrorKind { CORRUPT, UNSUPPORTED_FORMAT, IO_FAILURE };
enum class CacheErrorKind { PERSISTENCE_IO_FAILURE };

inline auto ToString(DecodeErrorKind kind) -> std::string_view {
  switch (kind) {
    case DecodeErrorKind::CORRUPT:
      return "corrupt";
    case DecodeErrorKind::UNSUPPORTED_FORMAT:
      return "unsupported format";
    case DecodeErrorKind::IO_FAILURE:
      return "io failure";
  }
  return "unknown";
}

/**
 * @brief Raised when the source folder cannot be indexed. Fatal for the session.
 */
class IndexError : public std::runtime_error {
 public:
  IndexError(IndexErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  auto Kind() const -> IndexErrorKind { return kind_; }

 private:
  IndexErrorKind kind_;
};

/**
 * @brief Raised by decoders. Recovered by the cache with a placeholder bitmap.
 */
class DecodeError : public std::runtime_error {
 public:
  DecodeError(DecodeErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  auto Kind() const -> DecodeErrorKind { return kind_; }

 private:
  DecodeErrorKind kind_;
};

/**
 * @brief Raised by the on-disk cache tier. Recovered by falling back to memory only.
 */
class CacheError : public std::runtime_error {
 public:
  CacheError(CacheErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  auto Kind() const -> CacheErrorKind { return kind_; }

 private:
  CacheErrorKind kind_;
};

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ExportError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};
};  // namespace quickcull
