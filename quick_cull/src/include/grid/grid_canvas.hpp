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

#include <cstddef>
#include <optional>
#include <vector>

#include "type/type.hpp"

namespace quickcull {
struct GridLayout {
  int    available_width_ = 840;
  int    viewport_height_ = 620;
  int    cell_width_      = 140;
  int    cell_height_     = 160;
  // Left inset of the first column
  int    padding_         = 10;
  size_t count_           = 0;
};

struct GridCell {
  int  row_    = 0;
  int  column_ = 0;

  bool operator==(const GridCell& other) const = default;
};

struct GridPoint {
  int  x_ = 0;
  int  y_ = 0;

  bool operator==(const GridPoint& other) const = default;
};

/**
 * @brief Half-open row interval [first_, last_)
 */
struct RowRange {
  int  first_ = 0;
  int  last_  = 0;

  auto Empty() const -> bool { return last_ <= first_; }
  auto Count() const -> int { return Empty() ? 0 : last_ - first_; }
  bool operator==(const RowRange& other) const = default;
};

struct ViewportState {
  int  first_visible_row_    = 0;
  int  visible_row_count_    = 0;
  int  prefetch_margin_rows_ = 0;
  int  cell_width_           = 0;
  int  cell_height_          = 0;

  bool operator==(const ViewportState& other) const = default;
};

/**
 * @brief Geometry of the virtual thumbnail grid. Only the visible slice is ever materialized,
 *        everything here is arithmetic over the layout.
 */
class GridCanvas {
 private:
  GridLayout layout_;
  int        columns_ = 1;
  int        rows_    = 0;

  void       Recompute();

 public:
  /**
   * @throws std::invalid_argument if a cell dimension is not positive
   */
  explicit GridCanvas(GridLayout layout);

  void Relayout(GridLayout layout);
  auto Layout() const -> const GridLayout& { return layout_; }
  auto Columns() const -> int { return columns_; }
  auto RowCount() const -> int { return rows_; }
  auto Count() const -> size_t { return layout_.count_; }
  auto ContentHeight() const -> int { return rows_ * layout_.cell_height_; }

  /**
   * @throws std::out_of_range for an identity past the end of the grid
   */
  auto CellOf(image_id_t identity) const -> GridCell;
  auto IdentityAt(int row, int column) const -> std::optional<image_id_t>;
  auto CellOrigin(image_id_t identity) const -> GridPoint;

  /**
   * @brief Hit test a point in canvas coordinates, scroll offset already applied
   */
  auto IdentityAtPoint(int x, int y) const -> std::optional<image_id_t>;

  /**
   * @brief Rows intersecting the viewport when scrolled down by offset pixels
   */
  auto RowRangeForScroll(int offset) const -> RowRange;
  auto IdentitiesInRows(int first, int last_exclusive) const -> std::vector<image_id_t>;
  auto ViewportAt(int offset, int margin_rows) const -> ViewportState;

  /**
   * @brief Visible rows widened by the prefetch margin on both sides, clamped to the grid
   */
  auto DesiredRows(const ViewportState& viewport) const -> RowRange;
};
};  // namespace quickcull
