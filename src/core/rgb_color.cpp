/// @file
/// @brief RGB color formatting and contrast helpers.

#include "core/rgb_color.h"

#include <cstdio>

namespace tonegrid {

std::string toHexString(const RgbColor& color) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", color.red, color.green,
                color.blue);
  return std::string(buf);
}

std::string toUpperHexString(const RgbColor& color) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", color.red, color.green,
                color.blue);
  return std::string(buf);
}

std::string toTripletString(const RgbColor& color) {
  char buf[12];
  std::snprintf(buf, sizeof(buf), "%u,%u,%u",
                static_cast<unsigned>(color.red),
                static_cast<unsigned>(color.green),
                static_cast<unsigned>(color.blue));
  return std::string(buf);
}

double perceivedBrightness(const RgbColor& color) {
  int weighted = static_cast<int>(color.red) * 299 +
                 static_cast<int>(color.green) * 587 +
                 static_cast<int>(color.blue) * 114;
  return static_cast<double>(weighted) / 1000.0;
}

RgbColor contrastingTextColor(const RgbColor& background) {
  return perceivedBrightness(background) > 128.0 ? palette::kBlack
                                                 : palette::kWhite;
}

}  // namespace tonegrid
