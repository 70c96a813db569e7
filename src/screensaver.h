// Screensaver run loop: input, scheduled fill, full redraw, frame pacing.

#ifndef TONEGRID_SCREENSAVER_H
#define TONEGRID_SCREENSAVER_H

#include <cstdint>

#include "grid/fill_scheduler.h"
#include "platform/platform.h"
#include "render/display_sink.h"
#include "screensaver_context.h"

namespace tonegrid {

/// @brief Summary of a finished run.
struct RunResult {
  int exit_code = 0;
  uint64_t frames = 0;     ///< Loop iterations completed.
  uint32_t triggers = 0;   ///< Cells added.
  uint32_t silent_triggers = 0;  ///< Cells added whose tone failed.
};

/// @brief Size the context's grid from the platform's display.
/// @return The resulting layout.
const GridLayout& initGridFromDisplay(ScreensaverContext& ctx,
                                      Platform& platform);

/// @brief Run one loop iteration (events, fill, redraw).
///
/// Does not wait for the next frame.
///
/// @param ctx Screensaver state.
/// @param scheduler Fill scheduler.
/// @param platform Clock and event source.
/// @param display Draw target.
/// @param result Counters updated in place.
/// @return False once an exit event was seen.
bool runFrame(ScreensaverContext& ctx, FillScheduler& scheduler,
              Platform& platform, DisplaySink& display, RunResult& result);

/// @brief Run until a quit, key press or pointer press.
///
/// @param ctx Screensaver state; the grid should already be sized.
/// @param platform Clock, event source and frame pacing.
/// @param display Draw target.
/// @param max_frames Stop after this many frames (0 = unlimited).
/// @return Run summary; exit_code is 0 on a clean exit.
RunResult runScreensaver(ScreensaverContext& ctx, Platform& platform,
                         DisplaySink& display, uint64_t max_frames = 0);

}  // namespace tonegrid

#endif  // TONEGRID_SCREENSAVER_H
