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
#include <map>
#include <memory>
#include <vector>

#include "cache/thumbnail_cache.hpp"
#include "grid/grid_canvas.hpp"
#include "index/image_index.hpp"
#include "type/type.hpp"

namespace quickcull {
enum class LoadState { NOT_REQUESTED, REQUESTED, LOADED, FAILED };

/**
 * @brief Keeps the thumbnails of the visible grid rows, plus a prefetch margin, requested and
 *        nothing else. Owned by the coordinating thread, not thread-safe.
 */
class ViewportScheduler {
 private:
  struct Tracking {
    LoadState        state_ = LoadState::NOT_REQUESTED;
    ThumbnailRequest request_{};
    ThumbnailResult  result_{};
  };

  std::shared_ptr<const ImageIndex>    index_;
  std::shared_ptr<ThumbnailCache>      cache_;
  GridCanvas                           canvas_;
  TargetSize                           target_;

  std::map<image_id_t, Tracking>       tracked_{};
  RowRange                             desired_rows_{};

 public:
  ViewportScheduler(std::shared_ptr<const ImageIndex> index, std::shared_ptr<ThumbnailCache> cache,
                    GridCanvas canvas, TargetSize target);

  /**
   * @brief Recompute the desired identities, request the new ones nearest to the viewport
   *        centre first, and cancel the ones that left the range
   */
  void Update(const ViewportState& viewport);

  /**
   * @brief Collect finished loads in whatever order they completed
   *
   * @return identities whose state changed
   */
  auto Poll() -> std::vector<image_id_t>;

  /**
   * @brief Poll until nothing is in flight or the timeout elapses
   *
   * @return true if idle
   */
  auto WaitIdle(std::chrono::milliseconds timeout) -> bool;

  auto StateOf(image_id_t identity) const -> LoadState;
  auto BitmapFor(image_id_t identity) const -> BitmapPtr;
  auto Tracked() const -> std::vector<image_id_t>;
  auto InFlightCount() const -> size_t;
  auto DesiredRows() const -> RowRange { return desired_rows_; }
  auto Canvas() const -> const GridCanvas& { return canvas_; }
  void Relayout(GridLayout layout) { canvas_.Relayout(layout); }
};
};  // namespace quickcull
