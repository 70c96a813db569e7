// Tests for grid/grid_layout.h -- cell sizing from display dimensions.

#include "grid/grid_layout.h"

#include <gtest/gtest.h>

namespace tonegrid {
namespace {

TEST(GridLayoutTest, FullHdDisplay) {
  // Target 1080 / 30 = 36 px: cols = 1922 / 38 = 50, rows = 1082 / 38 = 28.
  GridLayout layout = computeGridLayout(1920, 1080);
  EXPECT_EQ(layout.cols, 50);
  EXPECT_EQ(layout.rows, 28);
  EXPECT_EQ(layout.gap, 2);
  // Width is the tighter axis: (1920 - 49 * 2) / 50.
  EXPECT_NEAR(layout.cell_size, 36.44, 1e-9);
  EXPECT_EQ(layout.capacity(), 1400u);
}

TEST(GridLayoutTest, SmallDisplayUsesMinimumTargetSize) {
  // 600 / 30 = 20 == min cell size.
  GridLayout layout = computeGridLayout(800, 600);
  EXPECT_EQ(layout.cols, 36);
  EXPECT_EQ(layout.rows, 27);
  EXPECT_NEAR(layout.cell_size, 730.0 / 36.0, 1e-9);
}

TEST(GridLayoutTest, CellsFitBothAxes) {
  const int sizes[][2] = {{1920, 1080}, {1080, 1920}, {2560, 1440}, {800, 600},
                          {3840, 1600}, {1366, 768}};
  for (const auto& size : sizes) {
    GridLayout layout = computeGridLayout(size[0], size[1]);
    double used_w = layout.cols * layout.cell_size + (layout.cols - 1) * layout.gap;
    double used_h = layout.rows * layout.cell_size + (layout.rows - 1) * layout.gap;
    EXPECT_LE(used_w, size[0] + 1e-6);
    EXPECT_LE(used_h, size[1] + 1e-6);
  }
}

TEST(GridLayoutTest, TinyDisplayClampsToMinimumGrid) {
  GridLayout layout = computeGridLayout(100, 100);
  EXPECT_EQ(layout.cols, 10);
  EXPECT_EQ(layout.rows, 10);
  EXPECT_NEAR(layout.cell_size, 8.2, 1e-9);
}

TEST(GridLayoutTest, DegenerateDimensionsNeverZeroCapacity) {
  const int sizes[][2] = {{0, 0}, {-5, 600}, {800, -1}, {1, 1}};
  for (const auto& size : sizes) {
    GridLayout layout = computeGridLayout(size[0], size[1]);
    EXPECT_GE(layout.cols, 10);
    EXPECT_GE(layout.rows, 10);
    EXPECT_GE(layout.cell_size, 1.0);
  }
}

}  // namespace
}  // namespace tonegrid
