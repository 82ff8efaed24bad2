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

#include "app/keep_export_service.hpp"

#include <spdlog/spdlog.h>

#include <format>
#include <system_error>
#include <utility>

#include "error/errors.hpp"

namespace quickcull {
KeepExportService::KeepExportService(std::shared_ptr<ImageIndex> index,
                                     std::filesystem::path       destination)
    : index_(std::move(index)), destination_(std::move(destination)) {
  if (!index_) {
    throw ExportError("[ERROR] KeepExportService: Index not provided.");
  }
  std::error_code ec;
  std::filesystem::create_directories(destination_, ec);
  if (ec || !std::filesystem::is_directory(destination_)) {
    throw ExportError(std::format("[ERROR] KeepExportService: Cannot create destination {}: {}",
                                  destination_.string(), ec.message()));
  }
}

auto KeepExportService::FreeDestinationName(const std::filesystem::path& directory,
                                            const std::filesystem::path& file_name)
    -> std::filesystem::path {
  auto candidate = directory / file_name;
  if (!std::filesystem::exists(candidate)) {
    return candidate;
  }
  const auto stem      = file_name.stem().string();
  const auto extension = file_name.extension().string();
  for (int counter = 1;; ++counter) {
    candidate = directory / std::format("{}_{}{}", stem, counter, extension);
    if (!std::filesystem::exists(candidate)) {
      return candidate;
    }
  }
}

auto KeepExportService::Keep(image_id_t identity) -> ExportResult {
  const auto& entry = index_->Lookup(identity);
  if (auto it = exported_.find(identity); it != exported_.end()) {
    index_->SetDecision(identity, Decision::KEPT);
    return {false, it->second};
  }

  const auto      target = FreeDestinationName(destination_, entry.path_.filename());
  std::error_code ec;
  std::filesystem::copy_file(entry.path_, target, std::filesystem::copy_options::none, ec);
  if (ec) {
    throw ExportError(std::format("[ERROR] KeepExportService: Failed to copy {} to {}: {}",
                                  entry.path_.string(), target.string(), ec.message()));
  }

  // Timestamps and permission bits follow the original
  const auto modified = std::filesystem::last_write_time(entry.path_, ec);
  if (!ec) {
    std::filesystem::last_write_time(target, modified, ec);
  }
  std::filesystem::file_status source_status;
  if (!ec) {
    source_status = std::filesystem::status(entry.path_, ec);
  }
  if (!ec) {
    std::filesystem::permissions(target, source_status.permissions(),
                                 std::filesystem::perm_options::replace, ec);
  }
  if (ec) {
    spdlog::warn("[KeepExportService] Copied {} but could not preserve its metadata: {}",
                 target.string(), ec.message());
  }

  exported_.emplace(identity, target);
  index_->SetDecision(identity, Decision::KEPT);
  spdlog::info("[KeepExportService] Kept {} as {}", entry.path_.filename().string(),
               target.filename().string());
  return {true, target};
}

void KeepExportService::Skip(image_id_t identity) { index_->SetDecision(identity, Decision::SKIPPED); }

auto KeepExportService::ExportedPath(image_id_t identity) const
    -> std::optional<std::filesystem::path> {
  auto it = exported_.find(identity);
  if (it == exported_.end()) {
    return std::nullopt;
  }
  return it->second;
}
};  // namespace quickcull
