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

#include "grid/grid_canvas.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace quickcull {
GridCanvas::GridCanvas(GridLayout layout) : layout_(layout) { Recompute(); }

void GridCanvas::Relayout(GridLayout layout) {
  layout_ = layout;
  Recompute();
}

void GridCanvas::Recompute() {
  if (layout_.cell_width_ <= 0 || layout_.cell_height_ <= 0) {
    throw std::invalid_argument(std::format("[ERROR] GridCanvas: Invalid cell size {}x{}",
                                            layout_.cell_width_, layout_.cell_height_));
  }
  columns_ = std::max(1, layout_.available_width_ / layout_.cell_width_);
  rows_    = static_cast<int>((layout_.count_ + columns_ - 1) / columns_);
}

auto GridCanvas::CellOf(image_id_t identity) const -> GridCell {
  if (identity >= layout_.count_) {
    throw std::out_of_range(
        std::format("[ERROR] GridCanvas: Identity {} outside grid of {}", identity,
                    layout_.count_));
  }
  const auto columns = static_cast<image_id_t>(columns_);
  return {static_cast<int>(identity / columns), static_cast<int>(identity % columns)};
}

auto GridCanvas::IdentityAt(int row, int column) const -> std::optional<image_id_t> {
  if (row < 0 || column < 0 || column >= columns_) {
    return std::nullopt;
  }
  const auto identity = static_cast<size_t>(row) * columns_ + column;
  if (identity >= layout_.count_) {
    return std::nullopt;
  }
  return static_cast<image_id_t>(identity);
}

auto GridCanvas::CellOrigin(image_id_t identity) const -> GridPoint {
  const auto cell = CellOf(identity);
  return {layout_.padding_ + cell.column_ * layout_.cell_width_, cell.row_ * layout_.cell_height_};
}

auto GridCanvas::IdentityAtPoint(int x, int y) const -> std::optional<image_id_t> {
  if (x < layout_.padding_ || y < 0) {
    return std::nullopt;
  }
  return IdentityAt(y / layout_.cell_height_, (x - layout_.padding_) / layout_.cell_width_);
}

auto GridCanvas::RowRangeForScroll(int offset) const -> RowRange {
  offset          = std::clamp(offset, 0, std::max(0, ContentHeight() - 1));
  const int first = offset / layout_.cell_height_;
  const int last  = (offset + std::max(layout_.viewport_height_, 1) + layout_.cell_height_ - 1) /
                   layout_.cell_height_;
  return {std::min(first, rows_), std::min(last, rows_)};
}

auto GridCanvas::IdentitiesInRows(int first, int last_exclusive) const
    -> std::vector<image_id_t> {
  first          = std::max(first, 0);
  last_exclusive = std::min(last_exclusive, rows_);
  std::vector<image_id_t> identities;
  if (last_exclusive <= first) {
    return identities;
  }
  const size_t begin = static_cast<size_t>(first) * columns_;
  const size_t end   = std::min(static_cast<size_t>(last_exclusive) * columns_, layout_.count_);
  identities.reserve(end - begin);
  for (size_t id = begin; id < end; ++id) {
    identities.push_back(static_cast<image_id_t>(id));
  }
  return identities;
}

auto GridCanvas::ViewportAt(int offset, int margin_rows) const -> ViewportState {
  const auto rows = RowRangeForScroll(offset);
  return {rows.first_, rows.Count(), std::max(margin_rows, 0), layout_.cell_width_,
          layout_.cell_height_};
}

auto GridCanvas::DesiredRows(const ViewportState& viewport) const -> RowRange {
  const int margin = std::max(viewport.prefetch_margin_rows_, 0);
  const int count  = std::max(viewport.visible_row_count_, 0);
  const int first  = std::clamp(viewport.first_visible_row_ - margin, 0, rows_);
  const int last   = std::clamp(viewport.first_visible_row_ + count + margin, 0, rows_);
  return {first, std::max(first, last)};
}
};  // namespace quickcull
