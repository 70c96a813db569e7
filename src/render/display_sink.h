// Display output interface: rectangles, centered text, frame flip.

#ifndef TONEGRID_RENDER_DISPLAY_SINK_H
#define TONEGRID_RENDER_DISPLAY_SINK_H

#include <cstdint>
#include <string>

#include "core/rgb_color.h"

namespace tonegrid {

/// @brief Axis-aligned rectangle in pixels.
struct PixelRect {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;
};

/// @brief Font size class for cell labels.
enum class FontClass : uint8_t {
  Medium,  ///< 10 pt, hex labels.
  Large    ///< 12 pt, decimal triplet labels.
};

/// @brief Point size for a font class.
constexpr int fontPointSize(FontClass font) {
  return font == FontClass::Large ? 12 : 10;
}

/// @brief Abstract drawing target. Concrete implementation: SdlDisplaySink.
class DisplaySink {
 public:
  virtual ~DisplaySink() = default;

  /// @brief Fill the whole frame with one color.
  virtual void clear(const RgbColor& color) = 0;

  /// @brief Draw a filled rectangle.
  virtual void fillRect(const PixelRect& rect, const RgbColor& color) = 0;

  /// @brief Draw a 1 px rectangle outline.
  virtual void strokeRect(const PixelRect& rect, const RgbColor& color) = 0;

  /// @brief Draw text centered on (center_x, center_y).
  virtual void drawText(const std::string& text, FontClass font, int center_x,
                        int center_y, const RgbColor& color) = 0;

  /// @brief Flip the finished frame to the screen.
  virtual void present() = 0;
};

}  // namespace tonegrid

#endif  // TONEGRID_RENDER_DISPLAY_SINK_H
