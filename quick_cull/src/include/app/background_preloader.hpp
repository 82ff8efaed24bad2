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
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "cache/thumbnail_cache.hpp"
#include "index/image_index.hpp"
#include "type/type.hpp"

namespace quickcull {
enum class SlotState { QUEUED, LOADING, READY, FAILED };

struct PreloadSlot {
  image_id_t       identity_ = 0;
  SlotState        state_    = SlotState::QUEUED;
  ThumbnailRequest request_{};
  ThumbnailResult  result_{};
};

/**
 * @brief Look-ahead for single-image review. Keeps the next N full-size previews after the
 *        reviewed image loading in the background. Owned by the coordinating thread.
 */
class BackgroundPreloader {
 private:
  std::shared_ptr<const ImageIndex> index_;
  std::shared_ptr<ThumbnailCache>   preview_cache_;
  size_t                            window_size_;
  TargetSize                        preview_target_;

  std::optional<image_id_t>         current_{};
  std::vector<PreloadSlot>          window_{};
  // Preview of current_, carried over from its slot so a cache eviction cannot lose it
  std::optional<ThumbnailResult>    current_result_{};

  void                              Rebuild(image_id_t identity);
  auto                              FindSlot(image_id_t identity) -> PreloadSlot*;

 public:
  BackgroundPreloader(std::shared_ptr<const ImageIndex> index,
                      std::shared_ptr<ThumbnailCache> preview_cache, size_t window_size,
                      TargetSize preview_target);

  /**
   * @brief Start reviewing at identity, the window becomes the next N identities
   */
  void Enter(image_id_t identity);

  /**
   * @brief Move review to identity, single step or jump. Slots present in both windows keep
   *        their state, slots that fell out are cancelled.
   */
  void Advance(image_id_t identity);

  /**
   * @brief Refresh slot states from their loads
   *
   * @return identities whose slot state changed
   */
  auto Poll() -> std::vector<image_id_t>;

  /**
   * @brief The preview for identity. Served from a ready slot or the cache when possible,
   *        decoded on the calling thread otherwise.
   */
  auto Acquire(image_id_t identity) -> ThumbnailResult;

  auto WaitIdle(std::chrono::milliseconds timeout) -> bool;

  auto Window() const -> const std::vector<PreloadSlot>& { return window_; }
  auto WindowIdentities() const -> std::vector<image_id_t>;
  auto StateOf(image_id_t identity) const -> std::optional<SlotState>;
  auto Current() const -> std::optional<image_id_t> { return current_; }
  auto WindowCapacity() const -> size_t { return window_size_; }
};
};  // namespace quickcull
