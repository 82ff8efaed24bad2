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

#include <gtest/gtest.h>

#include <fstream>
#include <string>

#include "error/errors.hpp"
#include "fixtures/image_folder_test_fixation.hpp"

namespace quickcull {
TEST(SessionConfigTest, EmptyObjectKeepsDefaults) {
  auto config = SessionConfig::LoadFromString("{}");
  EXPECT_EQ(config.thumbnail_size_, 120);
  EXPECT_EQ(config.prefetch_margin_rows_, 1);
  EXPECT_EQ(config.preload_count_, 3);
  EXPECT_EQ(config.memory_cache_bytes_, 64ull << 20);
  EXPECT_TRUE(config.cache_dir_.empty());
  EXPECT_EQ(config.log_level_, "info");
  EXPECT_EQ(config.ThumbnailTarget(), (TargetSize{120, 120}));

  auto layout = config.Layout(25);
  EXPECT_EQ(layout.available_width_, 840);
  EXPECT_EQ(layout.cell_height_, 160);
  EXPECT_EQ(layout.count_, 25u);
}

TEST(SessionConfigTest, NamedKeysOverride) {
  auto config = SessionConfig::LoadFromString(R"({
    "thumbnail_size": 200,
    "prefetch_margin_rows": 0,
    "worker_threads": 2,
    "preload_count": 5,
    "preview_max_dimension": 1024,
    "disk_cache_bytes": 1048576,
    "cache_dir": "/tmp/thumbs",
    "log_level": "debug",
    "something_new": [1, 2, 3]
  })");
  EXPECT_EQ(config.thumbnail_size_, 200);
  EXPECT_EQ(config.prefetch_margin_rows_, 0);
  EXPECT_EQ(config.worker_threads_, 2);
  EXPECT_EQ(config.preload_count_, 5);
  EXPECT_EQ(config.PreviewTarget(), (TargetSize{1024, 1024}));
  EXPECT_EQ(config.disk_cache_bytes_, 1048576u);
  EXPECT_EQ(config.cache_dir_, std::filesystem::path("/tmp/thumbs"));
  EXPECT_EQ(config.log_level_, "debug");
  EXPECT_EQ(config.cell_width_, 140);
}

TEST(SessionConfigTest, InvalidValuesAreConfigErrors) {
  EXPECT_THROW(SessionConfig::LoadFromString("{ not json"), ConfigError);
  EXPECT_THROW(SessionConfig::LoadFromString("[1, 2]"), ConfigError);
  EXPECT_THROW(SessionConfig::LoadFromString(R"({"thumbnail_size": 0})"), ConfigError);
  EXPECT_THROW(SessionConfig::LoadFromString(R"({"worker_threads": -4})"), ConfigError);
  EXPECT_THROW(SessionConfig::LoadFromString(R"({"cell_width": "wide"})"), ConfigError);
  EXPECT_THROW(SessionConfig::LoadFromString(R"({"preload_count": 2.5})"), ConfigError);
  EXPECT_THROW(SessionConfig::LoadFromString(R"({"prefetch_margin_rows": -1})"), ConfigError);
  EXPECT_THROW(SessionConfig::LoadFromString(R"({"cache_dir": 12})"), ConfigError);
  EXPECT_THROW(SessionConfig::LoadFromString(R"({"cell_width": 3000000000})"), ConfigError);
  EXPECT_THROW(SessionConfig::LoadFromString(R"({"preview_cache_entries": 5000000000})"),
               ConfigError);
  EXPECT_THROW(SessionConfig::LoadFromString(R"({"prefetch_margin_rows": 2147483648})"),
               ConfigError);
  EXPECT_EQ(SessionConfig::LoadFromString(R"({"disk_cache_bytes": 5000000000})").disk_cache_bytes_,
            5000000000ull);
  EXPECT_THROW(SessionConfig::LoadFromString(R"({"log_level": "loud"})"), ConfigError);
}

TEST_F(ImageFolderTests, ConfigLoadsFromFile) {
  const auto path = root_ / "quickcull.json";
  std::ofstream(path) << R"({"grid_width": 500, "cell_width": 100})";

  auto config = SessionConfig::LoadFromFile(path);
  EXPECT_EQ(config.Layout(0).available_width_, 500);
  EXPECT_EQ(config.Layout(0).cell_width_, 100);
  EXPECT_THROW(SessionConfig::LoadFromFile(root_ / "missing.json"), ConfigError);
}
};  // namespace quickcull
