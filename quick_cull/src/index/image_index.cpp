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

#include "index/image_index.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "error/errors.hpp"
#include "type/supported_file_type.hpp"

namespace quickcull {
ImageIndex::ImageIndex(std::filesystem::path folder, std::vector<ImageEntry>&& entries)
    : folder_(std::move(folder)), entries_(std::move(entries)) {}

auto ImageIndex::Build(const std::filesystem::path& folder) -> ImageIndex {
  std::error_code ec;
  if (!std::filesystem::is_directory(folder, ec)) {
    throw IndexError(IndexErrorKind::FOLDER_NOT_FOUND,
                     std::format("[ERROR] ImageIndex: Source folder does not exist: {}",
                                 folder.string()));
  }

  std::vector<image_path_t> paths;
  auto                      it = std::filesystem::directory_iterator(folder, ec);
  if (ec) {
    throw IndexError(IndexErrorKind::FOLDER_NOT_FOUND,
                     std::format("[ERROR] ImageIndex: Cannot list folder {}: {}", folder.string(),
                                 ec.message()));
  }
  for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_regular_file(type_ec) && is_supported_extension(it->path())) {
      paths.push_back(it->path());
    }
  }
  if (ec) {
    throw IndexError(IndexErrorKind::FOLDER_NOT_FOUND,
                     std::format("[ERROR] ImageIndex: Listing {} failed: {}", folder.string(),
                                 ec.message()));
  }

  // Native string order, so identities do not depend on the directory iteration order
  std::sort(paths.begin(), paths.end(),
            [](const image_path_t& a, const image_path_t& b) { return a.native() < b.native(); });

  std::vector<ImageEntry> entries;
  entries.reserve(paths.size());
  for (auto& path : paths) {
    ImageEntry entry;
    entry.identity_ = static_cast<image_id_t>(entries.size());

    std::error_code meta_ec;
    entry.size_bytes_ = std::filesystem::file_size(path, meta_ec);
    if (meta_ec) {
      entry.size_bytes_ = 0;
    }
    entry.modified_time_ = std::filesystem::last_write_time(path, meta_ec);
    if (meta_ec) {
      entry.modified_time_ = {};
    }
    entry.path_ = std::move(path);
    entries.push_back(std::move(entry));
  }

  spdlog::info("[ImageIndex] Indexed {} images in {}", entries.size(), folder.string());
  return ImageIndex(folder, std::move(entries));
}

auto ImageIndex::Lookup(image_id_t identity) const -> const ImageEntry& {
  if (identity >= entries_.size()) {
    throw std::out_of_range(std::format("ImageIndex: Unknown identity {}", identity));
  }
  return entries_[identity];
}

void ImageIndex::SetDecision(image_id_t identity, Decision decision) {
  if (identity >= entries_.size()) {
    throw std::out_of_range(std::format("ImageIndex: Unknown identity {}", identity));
  }
  entries_[identity].decision_ = decision;
}

auto ImageIndex::CountByDecision(Decision decision) const -> size_t {
  return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                           [decision](const ImageEntry& entry) {
                                             return entry.decision_ == decision;
                                           }));
}
};  // namespace quickcull
