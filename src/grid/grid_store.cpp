/// @file
/// @brief GridStore append/evict and resize implementation.

#include "grid/grid_store.h"

#include <algorithm>
#include <utility>

namespace tonegrid {

GridStore::GridStore() : cells_(layout_.capacity()) {}

GridStore::GridStore(int cols, int rows) {
  layout_.cols = std::max(cols, 1);
  layout_.rows = std::max(rows, 1);
  cells_.resize(layout_.capacity());
}

const GridLayout& GridStore::resize(int width, int height) {
  GridLayout next = computeGridLayout(width, height);
  resizeCells(next.cols, next.rows);
  layout_.cell_size = next.cell_size;
  layout_.gap = next.gap;
  return layout_;
}

void GridStore::resizeCells(int cols, int rows) {
  layout_.cols = std::max(cols, 1);
  layout_.rows = std::max(rows, 1);

  size_t total = layout_.capacity();
  if (total == cells_.size()) return;

  std::vector<Cell> resized(total);
  size_t keep = std::min(cells_.size(), total);
  std::copy(cells_.begin(), cells_.begin() + static_cast<std::ptrdiff_t>(keep),
            resized.begin());
  cells_ = std::move(resized);
  cursor_ = std::min(cursor_, total);
}

RgbColor GridStore::advance(ColorSource& source) {
  RgbColor color = source.nextColor();
  write(color);
  return color;
}

void GridStore::write(const RgbColor& color) {
  if (cells_.empty()) return;

  if (isFull()) {
    // Eviction-shift: drop index 0, keep order, append at the end.
    std::move(cells_.begin() + 1, cells_.end(), cells_.begin());
    cells_.back() = color;
    return;
  }
  cells_[cursor_] = color;
  ++cursor_;
}

Cell GridStore::cellAt(size_t index) const {
  if (index >= cells_.size()) return std::nullopt;
  return cells_[index];
}

}  // namespace tonegrid
