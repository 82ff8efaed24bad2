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

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <opencv2/core.hpp>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "decoders/image_decoder.hpp"
#include "error/errors.hpp"

namespace quickcull {
/**
 * @brief Synthesizes a bitmap of exactly the target size and counts calls per file name.
 *        Files named in failing_ raise CORRUPT.
 */
class CountingDecoder : public ImageDecoder {
 public:
  std::atomic<int> calls_{0};

  void             FailOn(const std::string& file_name) {
    std::lock_guard<std::mutex> lock(mtx_);
    failing_.insert(file_name);
  }

  auto CallsFor(const std::string& file_name) -> int {
    std::lock_guard<std::mutex> lock(mtx_);
    auto                        it = per_file_.find(file_name);
    return it == per_file_.end() ? 0 : it->second;
  }

  auto LastMode() -> DecodeMode {
    std::lock_guard<std::mutex> lock(mtx_);
    return last_mode_;
  }

  auto Decode(const image_path_t& path, TargetSize target, DecodeMode mode) -> Bitmap override {
    const auto name = path.filename().string();
    bool       fail = false;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      ++per_file_[name];
      last_mode_ = mode;
      fail       = failing_.contains(name);
    }
    ++calls_;
    BeforeDecode(name);
    if (fail) {
      throw DecodeError(DecodeErrorKind::CORRUPT, "[ERROR] CountingDecoder: " + name);
    }
    const int  width  = target.width_ > 0 ? target.width_ : 32;
    const int  height = target.height_ > 0 ? target.height_ : 32;
    const auto shade  = static_cast<double>(std::hash<std::string>{}(name) % 200);
    return Bitmap(cv::Mat(height, width, CV_8UC3, cv::Scalar(shade, 255 - shade, 40)));
  }

 protected:
  virtual void BeforeDecode(const std::string&) {}

 private:
  std::mutex                 mtx_;
  std::set<std::string>      failing_;
  std::map<std::string, int> per_file_;
  DecodeMode                 last_mode_ = DecodeMode::FULL;
};

/**
 * @brief Holds every decode until Open() is called, to keep loads in flight on purpose
 */
class GatedDecoder : public CountingDecoder {
 public:
  GatedDecoder() : gate_future_(gate_.get_future().share()) {}

  void Open() { gate_.set_value(); }

  // Wait until at least n decodes are blocked on the gate
  auto WaitForWaiting(int n, std::chrono::milliseconds timeout) -> bool {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (waiting_.load() < n) {
      if (std::chrono::steady_clock::now() > deadline) return false;
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
  }

 protected:
  void BeforeDecode(const std::string&) override {
    ++waiting_;
    gate_future_.wait();
  }

 private:
  std::promise<void>       gate_;
  std::shared_future<void> gate_future_;
  std::atomic<int>         waiting_{0};
};

// Records the order in which decodes begin
class OrderRecordingDecoder : public CountingDecoder {
 public:
  auto Order() -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(order_mtx_);
    return order_;
  }

 protected:
  void BeforeDecode(const std::string& name) override {
    std::lock_guard<std::mutex> lock(order_mtx_);
    order_.push_back(name);
  }

 private:
  std::mutex               order_mtx_;
  std::vector<std::string> order_;
};
};  // namespace quickcull
