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

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <exiv2/exiv2.hpp>
#include <filesystem>
#include <format>
#include <fstream>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <string>
#include <system_error>

namespace quickcull {
/**
 * @brief Gives every test its own scratch tree: a photo folder to index, a cache directory and
 *        a destination for kept files
 */
class ImageFolderTests : public ::testing::Test {
 protected:
  std::filesystem::path root_;
  std::filesystem::path folder_;
  std::filesystem::path cache_dir_;
  std::filesystem::path destination_;

  void                  SetUp() override {
    Exiv2::LogMsg::setLevel(Exiv2::LogMsg::Level::mute);
    spdlog::set_level(spdlog::level::warn);

    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    root_        = std::filesystem::temp_directory_path() /
            std::format("quickcull_{}_{}", info->test_suite_name(), info->name());
    folder_      = root_ / "photos";
    cache_dir_   = root_ / "cache";
    destination_ = root_ / "kept";

    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    std::filesystem::create_directories(folder_);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  /**
   * @brief Write a horizontal gradient so that resizes and encodes produce varied pixels
   */
  auto WriteImage(const std::string& name, int width, int height, int seed = 0)
      -> std::filesystem::path {
    cv::Mat image(height, width, CV_8UC3);
    for (int y = 0; y < height; ++y) {
      for (int x = 0; x < width; ++x) {
        image.at<cv::Vec3b>(y, x) = cv::Vec3b(static_cast<uchar>((x * 255 / width + seed) % 256),
                                              static_cast<uchar>((y * 255 / height) % 256),
                                              static_cast<uchar>((seed * 37) % 256));
      }
    }
    const auto path = folder_ / name;
    EXPECT_TRUE(cv::imwrite(path.string(), image));
    return path;
  }

  auto WriteBytes(const std::string& name, const std::string& content) -> std::filesystem::path {
    const auto    path = folder_ / name;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << content;
    return path;
  }
};
};  // namespace quickcull
