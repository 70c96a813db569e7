// Screensaver configuration and the explicit state passed to each component.

#ifndef TONEGRID_SCREENSAVER_CONTEXT_H
#define TONEGRID_SCREENSAVER_CONTEXT_H

#include <cstdint>

#include "audio/audio_sink.h"
#include "audio/tone_synth.h"
#include "core/rng_util.h"
#include "grid/grid_store.h"

namespace tonegrid {

/// @brief Fixed behavior constants plus the few run-time choices from the CLI.
struct ScreensaverConfig {
  uint32_t interval_ms = 500;  ///< One cell per beat at 120 BPM.
  uint32_t frames_per_second = 60;
  double tone_duration_seconds = tone::kDurationSeconds;
  int sample_rate = tone::kSampleRate;
  uint32_t seed = 0;  ///< 0 = auto (random).
  bool fullscreen = true;
  int window_width = 1280;   ///< Used when fullscreen is false.
  int window_height = 720;
  bool verbose = false;  ///< Log one line per triggered cell.
};

/// @brief All mutable screensaver state, owned by the run loop's thread.
///
/// The color source and audio sink are borrowed; the caller keeps them
/// alive for the lifetime of the context.
struct ScreensaverContext {
  ScreensaverConfig config;
  GridStore grid;
  ColorSource* colors = nullptr;
  AudioSink* audio = nullptr;
};

}  // namespace tonegrid

#endif  // TONEGRID_SCREENSAVER_CONTEXT_H
