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

#include <chrono>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

#include "app/background_preloader.hpp"
#include "app/keep_export_service.hpp"
#include "app/viewport_scheduler.hpp"
#include "cache/thumbnail_cache.hpp"
#include "concurrency/thread_pool.hpp"
#include "config/session_config.hpp"
#include "decoders/image_decoder.hpp"
#include "index/image_index.hpp"

namespace quickcull {
/**
 * @brief One culling session over a source folder: the index, the worker pool, the grid and
 *        preview caches, and the review state that drives them from the coordinating thread.
 */
class ReviewSession {
 private:
  SessionConfig                        config_;
  std::shared_ptr<ImageIndex>          index_;
  std::shared_ptr<ThreadPool>          pool_;
  std::shared_ptr<ImageDecoder>        decoder_;
  std::shared_ptr<ThumbnailCache>      grid_cache_;
  std::shared_ptr<ThumbnailCache>      preview_cache_;
  std::unique_ptr<ViewportScheduler>   scheduler_;
  std::unique_ptr<BackgroundPreloader> preloader_;
  std::unique_ptr<KeepExportService>   exporter_;

  std::optional<image_id_t>            current_{};

  void                                 Show(std::ostream& out);

 public:
  /**
   * @throws IndexError if the source folder cannot be indexed
   * @throws ExportError if the destination folder cannot be created
   */
  ReviewSession(const std::filesystem::path& source, const std::filesystem::path& destination,
                SessionConfig config, std::shared_ptr<ImageDecoder> decoder = nullptr);
  ~ReviewSession();

  ReviewSession(const ReviewSession&)            = delete;
  ReviewSession& operator=(const ReviewSession&) = delete;

  /**
   * @brief Scroll the grid through every page so all thumbnails are cached
   *
   * @return number of thumbnails that loaded
   */
  auto WarmGrid(std::chrono::milliseconds page_timeout) -> size_t;

  /**
   * @brief Point the grid at a scroll offset and collect whatever finished
   */
  void ScrollGrid(int offset);

  /**
   * @brief Make identity the reviewed image and fetch its preview
   */
  auto Open(image_id_t identity) -> ThumbnailResult;
  auto Next() -> std::optional<image_id_t>;
  auto Previous() -> std::optional<image_id_t>;
  auto KeepCurrent() -> ExportResult;
  void SkipCurrent();

  /**
   * @brief Line-driven review loop, returns the process exit code
   */
  auto Run(std::istream& in, std::ostream& out) -> int;

  void Persist();
  auto Summary() const -> std::string;

  auto Index() const -> const ImageIndex& { return *index_; }
  auto Current() const -> std::optional<image_id_t> { return current_; }
  auto Scheduler() -> ViewportScheduler& { return *scheduler_; }
  auto Preloader() -> BackgroundPreloader& { return *preloader_; }
  auto GridCache() -> ThumbnailCache& { return *grid_cache_; }
  auto PreviewCache() -> ThumbnailCache& { return *preview_cache_; }
};
};  // namespace quickcull
