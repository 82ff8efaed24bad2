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

#include "app/background_preloader.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>
#include <stdexcept>
#include <utility>

namespace quickcull {
BackgroundPreloader::BackgroundPreloader(std::shared_ptr<const ImageIndex> index,
                                         std::shared_ptr<ThumbnailCache>   preview_cache,
                                         size_t window_size, TargetSize preview_target)
    : index_(std::move(index)),
      preview_cache_(std::move(preview_cache)),
      window_size_(window_size),
      preview_target_(preview_target) {
  if (!index_ || !preview_cache_) {
    throw std::runtime_error("[ERROR] BackgroundPreloader: Index or preview cache not provided.");
  }
}

void BackgroundPreloader::Enter(image_id_t identity) {
  spdlog::debug("[BackgroundPreloader] Enter review at {}", identity);
  Rebuild(identity);
}

void BackgroundPreloader::Advance(image_id_t identity) {
  if (current_ == identity) {
    return;
  }
  spdlog::debug("[BackgroundPreloader] Advance to {}", identity);
  Rebuild(identity);
}

void BackgroundPreloader::Rebuild(image_id_t identity) {
  if (!index_->Contains(identity)) {
    throw std::out_of_range(
        std::format("[ERROR] BackgroundPreloader: Identity {} not in index of {}", identity,
                    index_->Size()));
  }
  current_ = identity;
  current_result_.reset();
  if (auto* reviewed = FindSlot(identity); reviewed != nullptr) {
    if (reviewed->state_ == SlotState::READY || reviewed->state_ == SlotState::FAILED) {
      current_result_ = reviewed->result_;
    } else if (reviewed->request_.IsReady()) {
      current_result_ = reviewed->request_.future_.get();
    }
  }

  const size_t remaining = index_->Size() - identity - 1;
  const size_t count     = std::min(window_size_, remaining);

  std::vector<PreloadSlot> next;
  next.reserve(count);
  for (size_t k = 0; k < count; ++k) {
    const auto id       = static_cast<image_id_t>(identity + 1 + k);
    // Nearer slots first
    const auto priority = static_cast<PriorityLevel>(count - k);
    if (auto* kept = FindSlot(id); kept != nullptr) {
      if (kept->state_ == SlotState::QUEUED || kept->state_ == SlotState::LOADING) {
        preview_cache_->Reprioritize(kept->request_.fingerprint_, priority);
      }
      next.push_back(std::move(*kept));
      continue;
    }
    PreloadSlot slot;
    slot.identity_ = id;
    slot.state_    = SlotState::QUEUED;
    slot.request_  = preview_cache_->Request(index_->Lookup(id), preview_target_, priority);
    next.push_back(std::move(slot));
  }

  for (const auto& slot : window_) {
    const bool survives = std::any_of(next.begin(), next.end(), [&](const PreloadSlot& s) {
      return s.identity_ == slot.identity_;
    });
    if (!survives && (slot.state_ == SlotState::QUEUED || slot.state_ == SlotState::LOADING) &&
        slot.request_.future_.valid()) {
      preview_cache_->Reprioritize(slot.request_.fingerprint_, kCancelledPriority);
    }
  }
  window_ = std::move(next);
}

auto BackgroundPreloader::FindSlot(image_id_t identity) -> PreloadSlot* {
  auto it = std::find_if(window_.begin(), window_.end(),
                         [identity](const PreloadSlot& slot) { return slot.identity_ == identity; });
  return it == window_.end() ? nullptr : &*it;
}

auto BackgroundPreloader::Poll() -> std::vector<image_id_t> {
  std::vector<image_id_t> changed;
  for (auto& slot : window_) {
    if (slot.state_ == SlotState::READY || slot.state_ == SlotState::FAILED) {
      continue;
    }
    if (slot.request_.IsReady()) {
      slot.result_ = slot.request_.future_.get();
      slot.state_  = slot.result_.Ok() ? SlotState::READY : SlotState::FAILED;
      changed.push_back(slot.identity_);
    } else if (slot.state_ == SlotState::QUEUED && slot.request_.HasStarted()) {
      slot.state_ = SlotState::LOADING;
      changed.push_back(slot.identity_);
    }
  }
  return changed;
}

auto BackgroundPreloader::Acquire(image_id_t identity) -> ThumbnailResult {
  const bool reviewed = current_ == identity;
  if (reviewed && current_result_.has_value()) {
    return *current_result_;
  }
  if (auto* slot = FindSlot(identity); slot != nullptr) {
    if (slot->state_ == SlotState::READY || slot->state_ == SlotState::FAILED) {
      return slot->result_;
    }
    if (slot->request_.IsReady()) {
      slot->result_ = slot->request_.future_.get();
      slot->state_  = slot->result_.Ok() ? SlotState::READY : SlotState::FAILED;
      return slot->result_;
    }
  }
  // Joins a queued or running load of the same key instead of decoding twice
  auto result = preview_cache_->GetOrCreate(index_->Lookup(identity), preview_target_);
  if (reviewed) {
    current_result_ = result;
  }
  return result;
}

auto BackgroundPreloader::WaitIdle(std::chrono::milliseconds timeout) -> bool {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (auto& slot : window_) {
    if (slot.state_ == SlotState::READY || slot.state_ == SlotState::FAILED) {
      continue;
    }
    if (slot.request_.future_.wait_until(deadline) == std::future_status::timeout) {
      Poll();
      return false;
    }
  }
  Poll();
  return true;
}

auto BackgroundPreloader::WindowIdentities() const -> std::vector<image_id_t> {
  std::vector<image_id_t> identities;
  identities.reserve(window_.size());
  for (const auto& slot : window_) {
    identities.push_back(slot.identity_);
  }
  return identities;
}

auto BackgroundPreloader::StateOf(image_id_t identity) const -> std::optional<SlotState> {
  auto it = std::find_if(window_.begin(), window_.end(),
                         [identity](const PreloadSlot& slot) { return slot.identity_ == identity; });
  if (it == window_.end()) {
    return std::nullopt;
  }
  return it->state_;
}
};  // namespace quickcull
