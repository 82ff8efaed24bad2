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

#include <filesystem>
#include <memory>
#include <optional>
#include <unordered_map>

#include "index/image_index.hpp"
#include "type/type.hpp"

namespace quickcull {
struct ExportResult {
  // False when the entry had already been kept in this session
  bool                  copied_ = false;
  std::filesystem::path destination_{};
};

/**
 * @brief Records review decisions and copies kept originals into the destination folder
 */
class KeepExportService {
 private:
  std::shared_ptr<ImageIndex>                           index_;
  std::filesystem::path                                 destination_;
  std::unordered_map<image_id_t, std::filesystem::path> exported_{};

 public:
  /**
   * @throws ExportError if the destination folder cannot be created
   */
  KeepExportService(std::shared_ptr<ImageIndex> index, std::filesystem::path destination);

  KeepExportService(const KeepExportService&)            = delete;
  KeepExportService& operator=(const KeepExportService&) = delete;

  /**
   * @brief Copy the original, timestamps included, and mark it kept. Name collisions in the
   *        destination get a numeric suffix.
   *
   * @throws ExportError if the copy fails, the decision is left unchanged
   */
  auto Keep(image_id_t identity) -> ExportResult;
  void Skip(image_id_t identity);

  auto ExportedPath(image_id_t identity) const -> std::optional<std::filesystem::path>;
  auto Destination() const -> const std::filesystem::path& { return destination_; }

  /**
   * @brief First free name for file_name in directory: the name itself, then
   *        stem_1.ext, stem_2.ext and so on
   */
  static auto FreeDestinationName(const std::filesystem::path& directory,
                                  const std::filesystem::path& file_name) -> std::filesystem::path;
};
};  // namespace quickcull
