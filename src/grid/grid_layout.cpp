/// @file
/// @brief Grid sizing from display dimensions.

#include "grid/grid_layout.h"

#include <algorithm>

namespace tonegrid {

GridLayout computeGridLayout(int width, int height) {
  const int gap = grid_sizing::kGap;
  width = std::max(width, 1);
  height = std::max(height, 1);

  double short_side = static_cast<double>(std::min(width, height));
  double target = std::max(grid_sizing::kMinCellSize,
                           short_side / grid_sizing::kShortSideDivisor);

  GridLayout layout;
  layout.gap = gap;
  layout.cols = static_cast<int>((width + gap) / (target + gap));
  layout.rows = static_cast<int>((height + gap) / (target + gap));
  layout.cols = std::max(grid_sizing::kMinDimension, layout.cols);
  layout.rows = std::max(grid_sizing::kMinDimension, layout.rows);

  double cell_width =
      static_cast<double>(width - (layout.cols - 1) * gap) / layout.cols;
  double cell_height =
      static_cast<double>(height - (layout.rows - 1) * gap) / layout.rows;
  layout.cell_size = std::max(1.0, std::min(cell_width, cell_height));
  return layout;
}

}  // namespace tonegrid
