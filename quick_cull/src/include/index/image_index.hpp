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
#include <vector>

#include "type/type.hpp"

namespace quickcull {
struct ImageEntry {
  image_id_t                      identity_      = 0;
  image_path_t                    path_{};
  uintmax_t                       size_bytes_    = 0;
  std::filesystem::file_time_type modified_time_{};
  Decision                        decision_      = Decision::PENDING;
};

/**
 * @brief Sorted, filtered listing of the images in one folder. Identities are positions in
 *        the listing and stay valid for the whole session.
 *
 */
class ImageIndex {
 private:
  std::filesystem::path   folder_;
  std::vector<ImageEntry> entries_;

  ImageIndex(std::filesystem::path folder, std::vector<ImageEntry>&& entries);

 public:
  /**
   * @brief Enumerate the supported images directly inside folder (not recursive)
   *
   * @throws IndexError FOLDER_NOT_FOUND if folder is missing or is not a directory
   */
  static auto Build(const std::filesystem::path& folder) -> ImageIndex;

  auto        Folder() const -> const std::filesystem::path& { return folder_; }
  auto        Size() const -> size_t { return entries_.size(); }
  auto        Empty() const -> bool { return entries_.empty(); }
  auto        Contains(image_id_t identity) const -> bool { return identity < entries_.size(); }
  auto        Lookup(image_id_t identity) const -> const ImageEntry&;
  auto        Entries() const -> const std::vector<ImageEntry>& { return entries_; }

  void        SetDecision(image_id_t identity, Decision decision);
  auto        CountByDecision(Decision decision) const -> size_t;
};
};  // namespace quickcull
