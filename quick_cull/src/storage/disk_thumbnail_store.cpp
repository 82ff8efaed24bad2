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

#include "storage/disk_thumbnail_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <format>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <opencv2/imgcodecs.hpp>
#include <system_error>

#include "error/errors.hpp"

namespace quickcull {
namespace {
constexpr const char* kFormatName = "quickcull-thumbnail-cache";

auto FolderTag(const std::filesystem::path& folder) -> std::string {
  std::error_code ec;
  auto            canonical = std::filesystem::weakly_canonical(folder, ec);
  const auto      text      = (ec ? folder : canonical).string();
  return Hash128::Compute(text.data(), text.size()).ToString().substr(0, 16);
}

auto ReadWholeFile(const std::filesystem::path& path) -> std::optional<std::vector<uchar>> {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file.is_open()) {
    return std::nullopt;
  }
  const auto size = file.tellg();
  if (size <= 0) {
    return std::nullopt;
  }
  std::vector<uchar> buffer(static_cast<size_t>(size));
  file.seekg(0, std::ios::beg);
  if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
    return std::nullopt;
  }
  return buffer;
}

void WriteWholeFile(const std::filesystem::path& path, const char* data, size_t size) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    throw CacheError(CacheErrorKind::PERSISTENCE_IO_FAILURE,
                     std::format("[ERROR] DiskThumbnailStore: Cannot open {} for writing",
                                 path.string()));
  }
  file.write(data, static_cast<std::streamsize>(size));
  file.close();
  if (!file) {
    throw CacheError(CacheErrorKind::PERSISTENCE_IO_FAILURE,
                     std::format("[ERROR] DiskThumbnailStore: Short write to {}", path.string()));
  }
}

auto RecordToJson(const DiskRecord& record) -> nlohmann::json {
  nlohmann::json entry;
  entry["fingerprint"]    = record.key_.fingerprint_.ToString();
  entry["path"]           = record.key_.path_;
  entry["size_bytes"]     = static_cast<uint64_t>(record.key_.size_bytes_);
  entry["modified_ticks"] = record.key_.modified_ticks_;
  entry["target_width"]   = record.key_.target_.width_;
  entry["target_height"]  = record.key_.target_.height_;
  entry["width"]          = record.width_;
  entry["height"]         = record.height_;
  entry["blob_bytes"]     = static_cast<uint64_t>(record.blob_bytes_);
  entry["last_access_ms"] = record.last_access_ms_;
  return entry;
}

auto RecordFromJson(const nlohmann::json& entry) -> DiskRecord {
  DiskRecord record;
  record.key_ = CacheKey::Make(
      entry.at("path").get<std::string>(), entry.at("size_bytes").get<uint64_t>(),
      entry.at("modified_ticks").get<int64_t>(),
      TargetSize{entry.at("target_width").get<int>(), entry.at("target_height").get<int>()});
  const auto stored = Hash128::FromString(entry.at("fingerprint").get<std::string>());
  if (stored != record.key_.fingerprint_) {
    throw std::invalid_argument("fingerprint does not match key fields");
  }
  record.width_          = entry.at("width").get<int>();
  record.height_         = entry.at("height").get<int>();
  record.blob_bytes_     = entry.at("blob_bytes").get<uint64_t>();
  record.last_access_ms_ = entry.at("last_access_ms").get<int64_t>();
  return record;
}
}  // namespace

auto DefaultCacheDirectory(const std::filesystem::path& source_folder) -> std::filesystem::path {
  const auto tag = FolderTag(source_folder);
  if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg != nullptr && *xdg != '\0') {
    return std::filesystem::path(xdg) / "quickcull" / tag;
  }
  if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return std::filesystem::path(home) / ".cache" / "quickcull" / tag;
  }
  return source_folder / ".quickcull_cache";
}

DiskThumbnailStore::DiskThumbnailStore(std::filesystem::path directory, size_t byte_budget)
    : directory_(std::move(directory)),
      byte_budget_(byte_budget),
      records_(UINT32_MAX, 0, [](const DiskRecord& record) { return record.blob_bytes_; }) {}

auto DiskThumbnailStore::BlobPath(const Hash128& fingerprint) const -> std::filesystem::path {
  return directory_ / (fingerprint.ToString() + ".png");
}

void DiskThumbnailStore::PrepareDirectory() const {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec || !std::filesystem::is_directory(directory_)) {
    throw CacheError(CacheErrorKind::PERSISTENCE_IO_FAILURE,
                     std::format("[ERROR] DiskThumbnailStore: Cannot create cache directory {}: {}",
                                 directory_.string(), ec.message()));
  }
}

auto DiskThumbnailStore::ReadIndexFile() const -> std::vector<DiskRecord> {
  std::vector<DiskRecord> records;
  const auto              index_path = directory_ / index_file_name_;
  if (!std::filesystem::exists(index_path)) {
    return records;
  }

  std::ifstream file(index_path);
  if (!file.is_open()) {
    spdlog::warn("[DiskThumbnailStore] Cannot open {}, starting with an empty disk tier",
                 index_path.string());
    return records;
  }

  nlohmann::json index;
  bool           recognized = false;
  try {
    file >> index;
    recognized = index.is_object() && index.value("format", std::string{}) == kFormatName &&
                 index.value("version", 0) == format_version_ && index.contains("entries") &&
                 index["entries"].is_array();
  } catch (const nlohmann::json::exception& e) {
    spdlog::warn("[DiskThumbnailStore] Corrupt index {} ({}), starting with an empty disk tier",
                 index_path.string(), e.what());
    return records;
  }
  if (!recognized) {
    spdlog::warn("[DiskThumbnailStore] Unrecognized index {}, starting with an empty disk tier",
                 index_path.string());
    return records;
  }

  for (const auto& entry : index["entries"]) {
    try {
      records.push_back(RecordFromJson(entry));
    } catch (const std::exception& e) {
      spdlog::debug("[DiskThumbnailStore] Skipping index entry: {}", e.what());
    }
  }
  return records;
}

auto DiskThumbnailStore::ReadBlob(const DiskRecord& record) const -> std::optional<Bitmap> {
  auto bytes = ReadWholeFile(BlobPath(record.key_.fingerprint_));
  if (!bytes.has_value()) {
    return std::nullopt;
  }
  cv::Mat decoded;
  try {
    decoded = cv::imdecode(*bytes, cv::IMREAD_COLOR);
  } catch (const cv::Exception& e) {
    spdlog::debug("[DiskThumbnailStore] Blob for {} does not decode: {}", record.key_.path_,
                  e.what());
    return std::nullopt;
  }
  if (decoded.empty() || decoded.cols != record.width_ || decoded.rows != record.height_) {
    return std::nullopt;
  }
  return Bitmap(std::move(decoded));
}

auto DiskThumbnailStore::WriteBlob(const CacheKey& key, const Bitmap& bitmap,
                                   int64_t last_access_ms) const -> DiskRecord {
  std::vector<uchar> encoded;
  bool               ok = false;
  try {
    ok = cv::imencode(".png", bitmap.GetData(), encoded);
  } catch (const cv::Exception& e) {
    throw CacheError(CacheErrorKind::PERSISTENCE_IO_FAILURE,
                     std::format("[ERROR] DiskThumbnailStore: Cannot encode {}: {}", key.path_,
                                 e.what()));
  }
  if (!ok) {
    throw CacheError(CacheErrorKind::PERSISTENCE_IO_FAILURE,
                     std::format("[ERROR] DiskThumbnailStore: Cannot encode {}", key.path_));
  }
  WriteWholeFile(BlobPath(key.fingerprint_), reinterpret_cast<const char*>(encoded.data()),
                 encoded.size());

  DiskRecord record;
  record.key_            = key;
  record.width_          = bitmap.Width();
  record.height_         = bitmap.Height();
  record.blob_bytes_     = encoded.size();
  record.last_access_ms_ = last_access_ms;
  return record;
}

void DiskThumbnailStore::WriteIndexFile(const std::string& serialized) const {
  const auto index_path = directory_ / index_file_name_;
  auto       temp_path  = index_path;
  temp_path += ".tmp";
  WriteWholeFile(temp_path, serialized.data(), serialized.size());

  std::error_code ec;
  std::filesystem::rename(temp_path, index_path, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    throw CacheError(CacheErrorKind::PERSISTENCE_IO_FAILURE,
                     std::format("[ERROR] DiskThumbnailStore: Cannot replace {}",
                                 index_path.string()));
  }
}

void DiskThumbnailStore::RemoveBlobs(const std::vector<DiskRecord>& records) const {
  for (const auto& record : records) {
    std::error_code ec;
    std::filesystem::remove(BlobPath(record.key_.fingerprint_), ec);
    if (ec) {
      spdlog::debug("[DiskThumbnailStore] Cannot remove blob for {}: {}", record.key_.path_,
                    ec.message());
    }
  }
}

void DiskThumbnailStore::Install(std::vector<DiskRecord>&& records) {
  records_.Flush();
  // Oldest first, so the most recently used record ends up at the front
  std::stable_sort(records.begin(), records.end(), [](const DiskRecord& a, const DiskRecord& b) {
    return a.last_access_ms_ < b.last_access_ms_;
  });
  for (auto& record : records) {
    const auto fingerprint = record.key_.fingerprint_;
    records_.RecordAccess(fingerprint, std::move(record));
  }
}

auto DiskThumbnailStore::Contains(const Hash128& fingerprint) const -> bool {
  return records_.Contains(fingerprint);
}

auto DiskThumbnailStore::Find(const Hash128& fingerprint, int64_t now_ms)
    -> std::optional<DiskRecord> {
  auto record = records_.AccessElement(fingerprint);
  if (!record.has_value()) {
    return std::nullopt;
  }
  record->last_access_ms_ = now_ms;
  records_.RecordAccess(fingerprint, *record);
  return record;
}

void DiskThumbnailStore::Touch(const Hash128& fingerprint, int64_t last_access_ms) {
  auto record = records_.Peek(fingerprint);
  if (!record.has_value() || record->last_access_ms_ >= last_access_ms) {
    return;
  }
  record->last_access_ms_ = last_access_ms;
  records_.RecordAccess(fingerprint, std::move(*record));
}

auto DiskThumbnailStore::Commit(std::vector<DiskRecord>&& records) -> std::vector<DiskRecord> {
  for (auto& record : records) {
    const auto fingerprint = record.key_.fingerprint_;
    records_.RecordAccess(fingerprint, std::move(record));
  }

  // Callers merge in arbitrary order, recency is whatever last_access says
  std::vector<DiskRecord> merged;
  merged.reserve(records_.Size());
  records_.ForEach([&](const Hash128&, const DiskRecord& record) { merged.push_back(record); });
  std::reverse(merged.begin(), merged.end());
  Install(std::move(merged));

  std::vector<DiskRecord> reclaimed;
  while (records_.Size() > 0 && records_.TotalWeight() > byte_budget_) {
    auto victim = records_.Evict();
    if (!victim.has_value()) break;
    reclaimed.push_back(std::move(victim->second));
  }
  return reclaimed;
}

auto DiskThumbnailStore::SerializeIndex() const -> std::string {
  nlohmann::json index;
  index["format"]  = kFormatName;
  index["version"] = format_version_;
  auto entries     = nlohmann::json::array();
  records_.ForEach([&](const Hash128&, const DiskRecord& record) {
    entries.push_back(RecordToJson(record));
  });
  index["entries"] = std::move(entries);
  // Paths need not be valid UTF-8, such entries fail their fingerprint check on reload
  return index.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}
};  // namespace quickcull
