// Fixed-capacity FIFO grid of optional color cells.

#ifndef TONEGRID_GRID_GRID_STORE_H
#define TONEGRID_GRID_GRID_STORE_H

#include <cstddef>
#include <optional>
#include <vector>

#include "core/rgb_color.h"
#include "core/rng_util.h"
#include "grid/grid_layout.h"

namespace tonegrid {

/// A grid position: empty, or one color.
using Cell = std::optional<RgbColor>;

/// @brief Ordered row-major cell storage with append/evict semantics.
///
/// Cells fill from index 0 while the cursor is below capacity. Once full,
/// every write shifts all cells one position left (discarding index 0) and
/// places the new color at the last index.
///
/// Invariants: cells().size() == layout().capacity() and
/// 0 <= cursor() <= capacity().
class GridStore {
 public:
  /// @brief Create an empty 10x10 grid.
  GridStore();

  /// @brief Create an empty grid with explicit dimensions.
  /// @param cols Column count (values below 1 become 1).
  /// @param rows Row count (values below 1 become 1).
  GridStore(int cols, int rows);

  /// @brief Re-derive the layout from a display size, keeping cells.
  /// @param width Display width in px.
  /// @param height Display height in px.
  /// @return The new layout.
  const GridLayout& resize(int width, int height);

  /// @brief Change the dimensions directly, keeping cells.
  ///
  /// Cells [0, min(old, new)) keep their indices; the rest are dropped or
  /// start empty. The cursor is clamped to the new capacity.
  void resizeCells(int cols, int rows);

  /// @brief Draw a color from the source and write it.
  /// @param source Injected color capability.
  /// @return The color written.
  RgbColor advance(ColorSource& source);

  /// @brief Append a color, evicting the oldest cell when full.
  void write(const RgbColor& color);

  /// @brief Cell at a row-major index.
  /// @return Empty cell for out-of-range indices.
  Cell cellAt(size_t index) const;

  const std::vector<Cell>& cells() const { return cells_; }
  const GridLayout& layout() const { return layout_; }
  size_t capacity() const { return cells_.size(); }
  size_t cursor() const { return cursor_; }
  bool isFull() const { return cursor_ >= cells_.size(); }

 private:
  GridLayout layout_;
  std::vector<Cell> cells_;
  size_t cursor_ = 0;
};

}  // namespace tonegrid

#endif  // TONEGRID_GRID_GRID_STORE_H
