// Tests for grid/grid_store.h -- append, eviction-shift and resize.

#include "grid/grid_store.h"

#include <gtest/gtest.h>

#include <vector>

#include "test_helpers.h"

namespace tonegrid {
namespace {

/// @brief Distinct color for an index (unique for idx < 65536).
RgbColor colorForIndex(size_t idx) {
  return {static_cast<uint8_t>(idx % 256), static_cast<uint8_t>(idx / 256), 7};
}

/// @brief Write `count` distinct colors starting from `first`.
void fillDistinct(GridStore& grid, size_t count, size_t first = 0) {
  for (size_t idx = 0; idx < count; ++idx) grid.write(colorForIndex(first + idx));
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

TEST(GridStoreTest, DefaultIsEmptyTenByTen) {
  GridStore grid;
  EXPECT_EQ(grid.capacity(), 100u);
  EXPECT_EQ(grid.cursor(), 0u);
  EXPECT_FALSE(grid.isFull());
  for (const auto& cell : grid.cells()) EXPECT_FALSE(cell.has_value());
}

TEST(GridStoreTest, ExplicitDimensionsClampToOne) {
  GridStore grid(0, -3);
  EXPECT_EQ(grid.layout().cols, 1);
  EXPECT_EQ(grid.layout().rows, 1);
  EXPECT_EQ(grid.capacity(), 1u);
}

// ---------------------------------------------------------------------------
// advance / write
// ---------------------------------------------------------------------------

TEST(GridStoreTest, FirstAdvanceFillsIndexZero) {
  GridStore grid(10, 10);
  test_helpers::FixedColorSource source({{255, 0, 0}});

  RgbColor written = grid.advance(source);

  EXPECT_EQ(written, (RgbColor{255, 0, 0}));
  ASSERT_TRUE(grid.cellAt(0).has_value());
  EXPECT_EQ(*grid.cellAt(0), (RgbColor{255, 0, 0}));
  EXPECT_FALSE(grid.cellAt(1).has_value());
  EXPECT_EQ(grid.cursor(), 1u);
  EXPECT_EQ(source.drawCount(), 1u);
}

TEST(GridStoreTest, FifthAdvanceEvictsOldest) {
  const RgbColor a = {1, 0, 0};
  const RgbColor b = {2, 0, 0};
  const RgbColor c = {3, 0, 0};
  const RgbColor d = {4, 0, 0};
  const RgbColor e = {5, 0, 0};
  GridStore grid(2, 2);
  test_helpers::FixedColorSource source({a, b, c, d, e});

  for (int idx = 0; idx < 4; ++idx) grid.advance(source);
  EXPECT_TRUE(grid.isFull());
  EXPECT_EQ(grid.cells(), (std::vector<Cell>{a, b, c, d}));

  grid.advance(source);
  EXPECT_EQ(grid.cells(), (std::vector<Cell>{b, c, d, e}));
  EXPECT_EQ(grid.cursor(), 4u);
}

TEST(GridStoreTest, EvictionShiftsLeftPreservingOrder) {
  GridStore grid(10, 10);
  const size_t capacity = grid.capacity();
  fillDistinct(grid, capacity);
  std::vector<Cell> before = grid.cells();

  const RgbColor newest = {200, 100, 50};
  grid.write(newest);

  for (size_t idx = 0; idx + 1 < capacity; ++idx) {
    EXPECT_EQ(grid.cellAt(idx), before[idx + 1]) << "index " << idx;
  }
  EXPECT_EQ(grid.cellAt(capacity - 1), Cell(newest));
}

TEST(GridStoreTest, CursorNeverExceedsCapacity) {
  GridStore grid(3, 3);
  fillDistinct(grid, 50);
  EXPECT_EQ(grid.cursor(), grid.capacity());
  // Last nine written colors, oldest first.
  for (size_t idx = 0; idx < 9; ++idx) {
    EXPECT_EQ(grid.cellAt(idx), Cell(colorForIndex(41 + idx)));
  }
}

TEST(GridStoreTest, CellAtOutOfRangeIsEmpty) {
  GridStore grid(2, 2);
  fillDistinct(grid, 4);
  EXPECT_FALSE(grid.cellAt(4).has_value());
  EXPECT_FALSE(grid.cellAt(1000).has_value());
}

// ---------------------------------------------------------------------------
// resizeCells
// ---------------------------------------------------------------------------

TEST(GridStoreTest, GrowPreservesCellsAtOriginalIndices) {
  GridStore grid(2, 2);
  fillDistinct(grid, 4);
  std::vector<Cell> before = grid.cells();

  grid.resizeCells(3, 2);

  ASSERT_EQ(grid.capacity(), 6u);
  for (size_t idx = 0; idx < 4; ++idx) EXPECT_EQ(grid.cellAt(idx), before[idx]);
  EXPECT_FALSE(grid.cellAt(4).has_value());
  EXPECT_FALSE(grid.cellAt(5).has_value());
  EXPECT_EQ(grid.cursor(), 4u);
  EXPECT_FALSE(grid.isFull());

  // Appending resumes at the first new slot.
  grid.write({9, 9, 9});
  EXPECT_EQ(grid.cellAt(4), Cell(RgbColor{9, 9, 9}));
  EXPECT_EQ(grid.cellAt(0), before[0]);
}

TEST(GridStoreTest, ShrinkKeepsLeadingCellsAndClampsCursor) {
  GridStore grid(3, 3);
  fillDistinct(grid, 9);
  std::vector<Cell> before = grid.cells();

  grid.resizeCells(2, 2);

  ASSERT_EQ(grid.capacity(), 4u);
  for (size_t idx = 0; idx < 4; ++idx) EXPECT_EQ(grid.cellAt(idx), before[idx]);
  EXPECT_EQ(grid.cursor(), 4u);
  EXPECT_TRUE(grid.isFull());

  grid.write({9, 9, 9});
  EXPECT_EQ(grid.cellAt(0), before[1]);
  EXPECT_EQ(grid.cellAt(3), Cell(RgbColor{9, 9, 9}));
}

TEST(GridStoreTest, ShrinkBelowCursorOfPartialGrid) {
  GridStore grid(3, 3);
  fillDistinct(grid, 5);
  grid.resizeCells(2, 1);
  EXPECT_EQ(grid.capacity(), 2u);
  EXPECT_EQ(grid.cursor(), 2u);
}

TEST(GridStoreTest, ShrinkAboveCursorKeepsCursor) {
  GridStore grid(4, 4);
  fillDistinct(grid, 3);
  grid.resizeCells(2, 2);
  EXPECT_EQ(grid.cursor(), 3u);
  EXPECT_FALSE(grid.isFull());
}

TEST(GridStoreTest, SameCapacityKeepsCellsAndUpdatesShape) {
  GridStore grid(2, 3);
  fillDistinct(grid, 5);
  std::vector<Cell> before = grid.cells();
  grid.resizeCells(3, 2);
  EXPECT_EQ(grid.layout().cols, 3);
  EXPECT_EQ(grid.layout().rows, 2);
  EXPECT_EQ(grid.cells(), before);
  EXPECT_EQ(grid.cursor(), 5u);
}

// ---------------------------------------------------------------------------
// resize (pixels)
// ---------------------------------------------------------------------------

TEST(GridStoreTest, PixelResizeDerivesLayoutAndKeepsCells) {
  GridStore grid;
  fillDistinct(grid, 30);
  std::vector<Cell> before = grid.cells();

  const GridLayout& layout = grid.resize(1920, 1080);

  EXPECT_EQ(layout.cols, 50);
  EXPECT_EQ(layout.rows, 28);
  EXPECT_NEAR(layout.cell_size, 36.44, 1e-9);
  EXPECT_EQ(grid.capacity(), layout.capacity());
  for (size_t idx = 0; idx < 30; ++idx) EXPECT_EQ(grid.cellAt(idx), before[idx]);
  EXPECT_EQ(grid.cursor(), 30u);
}

TEST(GridStoreTest, DegeneratePixelResizeKeepsMinimumGrid) {
  GridStore grid(20, 20);
  fillDistinct(grid, 400);
  grid.resize(0, 0);
  EXPECT_EQ(grid.capacity(), 100u);
  EXPECT_EQ(grid.cursor(), 100u);
  EXPECT_GE(grid.layout().cell_size, 1.0);
}

TEST(GridStoreTest, CapacityMatchesLayoutAfterResizes) {
  GridStore grid;
  const int sizes[][2] = {{1920, 1080}, {640, 480}, {0, 0}, {2560, 1600}};
  for (const auto& size : sizes) {
    grid.resize(size[0], size[1]);
    EXPECT_EQ(grid.capacity(), grid.layout().capacity());
    EXPECT_LE(grid.cursor(), grid.capacity());
  }
}

}  // namespace
}  // namespace tonegrid
