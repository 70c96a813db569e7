/// @file
/// @brief Frame plan construction and submission.

#include "render/frame_plan.h"

#include <utility>

namespace tonegrid {

PixelRect cellRect(const GridLayout& layout, size_t index) {
  int cols = layout.cols > 0 ? layout.cols : 1;
  int row = static_cast<int>(index / static_cast<size_t>(cols));
  int col = static_cast<int>(index % static_cast<size_t>(cols));
  double pitch = layout.cell_size + layout.gap;

  PixelRect rect;
  rect.x = static_cast<int>(col * pitch);
  rect.y = static_cast<int>(row * pitch);
  rect.width = static_cast<int>(layout.cell_size);
  rect.height = rect.width;
  return rect;
}

std::optional<CellLabel> labelForCell(const RgbColor& color, double cell_size) {
  if (cell_size <= label_threshold::kAnyText) return std::nullopt;

  CellLabel label;
  label.color = contrastingTextColor(color);
  if (cell_size > label_threshold::kTripletText) {
    label.text = toTripletString(color);
    label.font = FontClass::Large;
  } else if (cell_size > label_threshold::kHexText) {
    label.text = toUpperHexString(color);
    label.font = FontClass::Medium;
  } else {
    return std::nullopt;
  }
  return label;
}

FramePlan buildFramePlan(const GridStore& grid) {
  FramePlan plan;
  const GridLayout& layout = grid.layout();
  const auto& cells = grid.cells();
  plan.cells.reserve(cells.size());

  for (size_t idx = 0; idx < cells.size(); ++idx) {
    CellDraw draw;
    draw.rect = cellRect(layout, idx);
    if (cells[idx].has_value()) {
      const RgbColor& color = *cells[idx];
      draw.fill = color;
      draw.border = color;
      draw.label = labelForCell(color, layout.cell_size);
    } else {
      draw.fill = palette::kEmptyCellFill;
      draw.border = palette::kEmptyCellBorder;
    }
    plan.cells.push_back(std::move(draw));
  }
  return plan;
}

void presentFrame(const FramePlan& plan, DisplaySink& display) {
  display.clear(plan.background);
  for (const auto& cell : plan.cells) {
    display.fillRect(cell.rect, cell.fill);
    display.strokeRect(cell.rect, cell.border);
    if (cell.label.has_value()) {
      const CellLabel& label = *cell.label;
      // Integer half-size, matching the cell's own truncated geometry.
      int half = cell.rect.width / 2;
      display.drawText(label.text, label.font, cell.rect.x + half,
                       cell.rect.y + half, label.color);
    }
  }
  display.present();
}

}  // namespace tonegrid
