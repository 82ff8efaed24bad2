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

#include "app/viewport_scheduler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace quickcull {
ViewportScheduler::ViewportScheduler(std::shared_ptr<const ImageIndex> index,
                                     std::shared_ptr<ThumbnailCache> cache, GridCanvas canvas,
                                     TargetSize target)
    : index_(std::move(index)), cache_(std::move(cache)), canvas_(std::move(canvas)), target_(target) {
  if (!index_ || !cache_) {
    throw std::runtime_error("[ERROR] ViewportScheduler: Index or cache not provided.");
  }
}

void ViewportScheduler::Update(const ViewportState& viewport) {
  auto layout = canvas_.Layout();
  if (viewport.cell_width_ > 0 && viewport.cell_height_ > 0 &&
      (viewport.cell_width_ != layout.cell_width_ || viewport.cell_height_ != layout.cell_height_)) {
    layout.cell_width_  = viewport.cell_width_;
    layout.cell_height_ = viewport.cell_height_;
    canvas_.Relayout(layout);
    spdlog::debug("[ViewportScheduler] Cell size {}x{}, {} columns", layout.cell_width_,
                  layout.cell_height_, canvas_.Columns());
  }

  desired_rows_       = canvas_.DesiredRows(viewport);
  const auto desired  = canvas_.IdentitiesInRows(desired_rows_.first_, desired_rows_.last_);
  const std::unordered_set<image_id_t> desired_set(desired.begin(), desired.end());

  size_t cancelled = 0;
  for (auto it = tracked_.begin(); it != tracked_.end();) {
    if (desired_set.contains(it->first)) {
      ++it;
      continue;
    }
    if (it->second.state_ == LoadState::REQUESTED &&
        cache_->Reprioritize(it->second.request_.fingerprint_, kCancelledPriority)) {
      ++cancelled;
    }
    it = tracked_.erase(it);
  }

  // Twice the centre row, keeps the distance integral for even row counts
  const int centre2 = 2 * viewport.first_visible_row_ + std::max(viewport.visible_row_count_, 1) - 1;
  size_t    issued  = 0;
  for (const auto identity : desired) {
    const int  row         = canvas_.CellOf(identity).row_;
    const auto priority    = -std::abs(2 * row - centre2);
    auto [it, inserted]    = tracked_.try_emplace(identity);
    auto& tracking         = it->second;
    if (!inserted) {
      if (tracking.state_ == LoadState::REQUESTED) {
        cache_->Reprioritize(tracking.request_.fingerprint_, priority);
      }
      continue;
    }
    tracking.request_ = cache_->Request(index_->Lookup(identity), target_, priority);
    tracking.state_   = LoadState::REQUESTED;
    ++issued;
  }

  spdlog::debug("[ViewportScheduler] Rows [{}, {}): {} tracked, {} issued, {} cancelled",
                desired_rows_.first_, desired_rows_.last_, tracked_.size(), issued, cancelled);
}

auto ViewportScheduler::Poll() -> std::vector<image_id_t> {
  std::vector<image_id_t> changed;
  for (auto& [identity, tracking] : tracked_) {
    if (tracking.state_ != LoadState::REQUESTED || !tracking.request_.IsReady()) {
      continue;
    }
    tracking.result_ = tracking.request_.future_.get();
    tracking.state_  = tracking.result_.Ok() ? LoadState::LOADED : LoadState::FAILED;
    changed.push_back(identity);
  }
  return changed;
}

auto ViewportScheduler::WaitIdle(std::chrono::milliseconds timeout) -> bool {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    Poll();
    auto pending = std::find_if(tracked_.begin(), tracked_.end(), [](const auto& item) {
      return item.second.state_ == LoadState::REQUESTED;
    });
    if (pending == tracked_.end()) {
      return true;
    }
    if (pending->second.request_.future_.wait_until(deadline) == std::future_status::timeout) {
      Poll();
      return InFlightCount() == 0;
    }
  }
}

auto ViewportScheduler::StateOf(image_id_t identity) const -> LoadState {
  auto it = tracked_.find(identity);
  return it == tracked_.end() ? LoadState::NOT_REQUESTED : it->second.state_;
}

auto ViewportScheduler::BitmapFor(image_id_t identity) const -> BitmapPtr {
  auto it = tracked_.find(identity);
  if (it == tracked_.end()) {
    return nullptr;
  }
  const auto state = it->second.state_;
  if (state == LoadState::LOADED || state == LoadState::FAILED) {
    return it->second.result_.bitmap_;
  }
  return nullptr;
}

auto ViewportScheduler::Tracked() const -> std::vector<image_id_t> {
  std::vector<image_id_t> identities;
  identities.reserve(tracked_.size());
  for (const auto& [identity, tracking] : tracked_) {
    identities.push_back(identity);
  }
  return identities;
}

auto ViewportScheduler::InFlightCount() const -> size_t {
  return static_cast<size_t>(std::count_if(tracked_.begin(), tracked_.end(), [](const auto& item) {
    return item.second.state_ == LoadState::REQUESTED;
  }));
}
};  // namespace quickcull
