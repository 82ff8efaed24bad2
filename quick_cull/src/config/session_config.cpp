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

#include "config/session_config.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string_view>

#include "error/errors.hpp"

namespace quickcull {
namespace {
template <typename T>
void ReadPositive(const nlohmann::json& config, std::string_view key, T& field) {
  auto it = config.find(std::string(key));
  if (it == config.end()) {
    return;
  }
  if (!it->is_number_integer()) {
    throw ConfigError(std::format("[ERROR] SessionConfig: \"{}\" must be an integer", key));
  }
  const auto value = it->get<int64_t>();
  if (value <= 0) {
    throw ConfigError(std::format("[ERROR] SessionConfig: \"{}\" must be positive, got {}", key,
                                  value));
  }
  if (static_cast<uint64_t>(value) > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
    throw ConfigError(std::format("[ERROR] SessionConfig: \"{}\" is out of range, got {}", key,
                                  value));
  }
  field = static_cast<T>(value);
}

void ReadString(const nlohmann::json& config, std::string_view key, std::string& field) {
  auto it = config.find(std::string(key));
  if (it == config.end()) {
    return;
  }
  if (!it->is_string()) {
    throw ConfigError(std::format("[ERROR] SessionConfig: \"{}\" must be a string", key));
  }
  field = it->get<std::string>();
}

constexpr std::array<std::string_view, 7> kLogLevels = {"trace", "debug", "info",    "warn",
                                                        "error", "critical", "off"};
}  // namespace

auto SessionConfig::LoadFromString(const std::string& text) -> SessionConfig {
  nlohmann::json config;
  try {
    config = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(std::format("[ERROR] SessionConfig: Malformed JSON: {}", e.what()));
  }
  if (!config.is_object()) {
    throw ConfigError("[ERROR] SessionConfig: Top level must be an object");
  }

  SessionConfig result;
  ReadPositive(config, "thumbnail_size", result.thumbnail_size_);
  ReadPositive(config, "cell_width", result.cell_width_);
  ReadPositive(config, "cell_height", result.cell_height_);
  ReadPositive(config, "grid_width", result.grid_width_);
  ReadPositive(config, "viewport_height", result.viewport_height_);
  ReadPositive(config, "worker_threads", result.worker_threads_);
  ReadPositive(config, "preload_count", result.preload_count_);
  ReadPositive(config, "preview_max_dimension", result.preview_max_dimension_);
  ReadPositive(config, "memory_cache_entries", result.memory_cache_entries_);
  ReadPositive(config, "memory_cache_bytes", result.memory_cache_bytes_);
  ReadPositive(config, "preview_cache_entries", result.preview_cache_entries_);
  ReadPositive(config, "disk_cache_bytes", result.disk_cache_bytes_);

  // Zero is a valid margin
  if (auto it = config.find("prefetch_margin_rows"); it != config.end()) {
    if (!it->is_number_integer() || it->get<int64_t>() < 0 ||
        it->get<int64_t>() > std::numeric_limits<int>::max()) {
      throw ConfigError("[ERROR] SessionConfig: \"prefetch_margin_rows\" must be a non-negative integer");
    }
    result.prefetch_margin_rows_ = it->get<int>();
  }

  std::string cache_dir;
  ReadString(config, "cache_dir", cache_dir);
  result.cache_dir_ = cache_dir;

  ReadString(config, "log_level", result.log_level_);
  if (std::find(kLogLevels.begin(), kLogLevels.end(), result.log_level_) == kLogLevels.end()) {
    throw ConfigError(
        std::format("[ERROR] SessionConfig: Unknown log_level \"{}\"", result.log_level_));
  }
  return result;
}

auto SessionConfig::LoadFromFile(const std::filesystem::path& path) -> SessionConfig {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError(
        std::format("[ERROR] SessionConfig: Failed to open config file {}", path.string()));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return LoadFromString(buffer.str());
}

auto SessionConfig::Layout(size_t count) const -> GridLayout {
  GridLayout layout;
  layout.available_width_ = grid_width_;
  layout.viewport_height_ = viewport_height_;
  layout.cell_width_      = cell_width_;
  layout.cell_height_     = cell_height_;
  layout.count_           = count;
  return layout;
}
};  // namespace quickcull
