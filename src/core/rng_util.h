// Random number utilities -- seeding and injectable color sources.

#ifndef TONEGRID_CORE_RNG_UTIL_H
#define TONEGRID_CORE_RNG_UTIL_H

#include <cstdint>
#include <random>

#include "core/rgb_color.h"

namespace tonegrid {
namespace rng {

/// @brief Generate a random integer in [min, max] inclusive.
/// @param rng Mersenne Twister RNG instance.
/// @param min Minimum value (inclusive).
/// @param max Maximum value (inclusive).
/// @return Random integer in the specified range.
inline int rollRange(std::mt19937& rng, int min, int max) {
  std::uniform_int_distribution<int> dist(min, max);
  return dist(rng);
}

/// @brief Draw one color with each channel independently uniform in [0, 255].
/// @param rng Mersenne Twister RNG instance.
/// @return Random color.
inline RgbColor rollColor(std::mt19937& rng) {
  RgbColor color;
  color.red = static_cast<uint8_t>(rollRange(rng, 0, 255));
  color.green = static_cast<uint8_t>(rollRange(rng, 0, 255));
  color.blue = static_cast<uint8_t>(rollRange(rng, 0, 255));
  return color;
}

/// @brief Generate a random seed using the system random device.
/// @return A non-zero random seed (suitable for seeding mt19937).
inline uint32_t generateRandomSeed() {
  std::random_device device;
  uint32_t result = device();
  if (result == 0) result = 1;
  return result;
}

}  // namespace rng

// ---------------------------------------------------------------------------
// Color sources
// ---------------------------------------------------------------------------

/// @brief Abstract source of cell colors, injected into GridStore::advance().
///
/// Production code uses MtColorSource; tests supply fixed sequences.
class ColorSource {
 public:
  virtual ~ColorSource() = default;

  /// @brief Produce the next color.
  virtual RgbColor nextColor() = 0;
};

/// @brief Seedable color source backed by std::mt19937.
class MtColorSource : public ColorSource {
 public:
  /// @param seed RNG seed (0 = draw one from std::random_device).
  explicit MtColorSource(uint32_t seed)
      : seed_(seed == 0 ? rng::generateRandomSeed() : seed), rng_(seed_) {}

  RgbColor nextColor() override { return rng::rollColor(rng_); }

  /// @brief Seed actually used (after resolving 0 = auto).
  uint32_t seed() const { return seed_; }

 private:
  uint32_t seed_;
  std::mt19937 rng_;
};

}  // namespace tonegrid

#endif  // TONEGRID_CORE_RNG_UTIL_H
