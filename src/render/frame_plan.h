// Grid presentation: turns grid state into an ordered list of draw commands.

#ifndef TONEGRID_RENDER_FRAME_PLAN_H
#define TONEGRID_RENDER_FRAME_PLAN_H

#include <optional>
#include <string>
#include <vector>

#include "core/rgb_color.h"
#include "grid/grid_store.h"
#include "render/display_sink.h"

namespace tonegrid {

// ---------------------------------------------------------------------------
// Label thresholds (cell size in px, strictly greater than)
// ---------------------------------------------------------------------------

namespace label_threshold {

constexpr double kAnyText = 15.0;
constexpr double kHexText = 25.0;
constexpr double kTripletText = 40.0;

}  // namespace label_threshold

/// @brief Text drawn on top of a cell.
struct CellLabel {
  std::string text;
  FontClass font = FontClass::Medium;
  RgbColor color;
};

/// @brief Draw commands for one cell.
struct CellDraw {
  PixelRect rect;
  RgbColor fill;
  RgbColor border;
  std::optional<CellLabel> label;
};

/// @brief Draw commands for one full frame, in drawing order.
struct FramePlan {
  RgbColor background = palette::kBlack;
  std::vector<CellDraw> cells;
};

/// @brief Pixel rectangle of the cell at a row-major index.
PixelRect cellRect(const GridLayout& layout, size_t index);

/// @brief Label for a colored cell, by cell size.
///
/// Above 40 px the label is "R,G,B" in the large font, above 25 px the
/// uppercase "#RRGGBB" in the medium font, otherwise no label.
///
/// @param color Cell color.
/// @param cell_size Cell side in px.
/// @return Label, or std::nullopt when the cell is too small.
std::optional<CellLabel> labelForCell(const RgbColor& color, double cell_size);

/// @brief Build the frame for the current grid state.
FramePlan buildFramePlan(const GridStore& grid);

/// @brief Submit a frame to the display and present it.
void presentFrame(const FramePlan& plan, DisplaySink& display);

}  // namespace tonegrid

#endif  // TONEGRID_RENDER_FRAME_PLAN_H
