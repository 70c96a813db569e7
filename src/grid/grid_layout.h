// Grid sizing: derive square cell dimensions from a display size.

#ifndef TONEGRID_GRID_GRID_LAYOUT_H
#define TONEGRID_GRID_GRID_LAYOUT_H

#include <cstddef>

namespace tonegrid {

// ---------------------------------------------------------------------------
// Sizing constants (pixels)
// ---------------------------------------------------------------------------

namespace grid_sizing {

constexpr int kGap = 2;               // Space between adjacent cells
constexpr double kMinCellSize = 20.0;  // Lower bound for the target cell size
constexpr double kShortSideDivisor = 30.0;
constexpr int kMinDimension = 10;     // Minimum rows and columns

}  // namespace grid_sizing

/// @brief Grid dimensions and cell geometry for one display size.
struct GridLayout {
  int cols = grid_sizing::kMinDimension;
  int rows = grid_sizing::kMinDimension;
  double cell_size = grid_sizing::kMinCellSize;  ///< Square cell side in px.
  int gap = grid_sizing::kGap;

  /// @brief Total number of cells (cols * rows).
  size_t capacity() const {
    return static_cast<size_t>(cols) * static_cast<size_t>(rows);
  }
};

/// @brief Compute the grid layout for a display.
///
/// Target cell size is max(20, min(w, h) / 30). Columns and rows are the
/// number of target cells (plus gaps) that fit, each at least 10. The cell
/// size is then recomputed so the cells exactly fill the tighter axis.
/// Non-positive dimensions are treated as 1 px, and the cell size never
/// drops below 1 px.
///
/// @param width Display width in px.
/// @param height Display height in px.
/// @return Layout with cols, rows >= 10.
GridLayout computeGridLayout(int width, int height);

}  // namespace tonegrid

#endif  // TONEGRID_GRID_GRID_LAYOUT_H
