// RGB color type for grid cells -- hex formatting and contrast helpers.

#ifndef TONEGRID_CORE_RGB_COLOR_H
#define TONEGRID_CORE_RGB_COLOR_H

#include <cstdint>
#include <string>

namespace tonegrid {

/// @brief 8-bit-per-channel RGB triple.
struct RgbColor {
  uint8_t red = 0;
  uint8_t green = 0;
  uint8_t blue = 0;

  constexpr bool operator==(const RgbColor& other) const {
    return red == other.red && green == other.green && blue == other.blue;
  }
  constexpr bool operator!=(const RgbColor& other) const {
    return !(*this == other);
  }
};

// ---------------------------------------------------------------------------
// Fixed palette
// ---------------------------------------------------------------------------

namespace palette {

constexpr RgbColor kBlack = {0, 0, 0};
constexpr RgbColor kWhite = {255, 255, 255};
constexpr RgbColor kEmptyCellFill = {10, 10, 10};    // #0a0a0a
constexpr RgbColor kEmptyCellBorder = {26, 26, 26};  // #1a1a1a

}  // namespace palette

/// @brief Format a color as a lowercase hex string.
/// @param color Input color.
/// @return String of the form "#rrggbb".
std::string toHexString(const RgbColor& color);

/// @brief Format a color as an uppercase hex string ("#RRGGBB").
std::string toUpperHexString(const RgbColor& color);

/// @brief Format a color as comma-separated decimal channels ("R,G,B").
std::string toTripletString(const RgbColor& color);

/// @brief Perceived brightness using ITU-R BT.601 luma weights.
/// @param color Input color.
/// @return (299*R + 587*G + 114*B) / 1000, in [0.0, 255.0].
double perceivedBrightness(const RgbColor& color);

/// @brief Pick black or white text for legibility on the given background.
/// @param background Cell fill color.
/// @return Black if brightness > 128, otherwise white.
RgbColor contrastingTextColor(const RgbColor& background);

}  // namespace tonegrid

#endif  // TONEGRID_CORE_RGB_COLOR_H
