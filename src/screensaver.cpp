/// @file
/// @brief Cooperative screensaver loop.

#include "screensaver.h"

#include <cstdio>

#include "render/frame_plan.h"

namespace tonegrid {

const GridLayout& initGridFromDisplay(ScreensaverContext& ctx,
                                      Platform& platform) {
  DisplaySize size = platform.displaySize();
  return ctx.grid.resize(size.width, size.height);
}

bool runFrame(ScreensaverContext& ctx, FillScheduler& scheduler,
              Platform& platform, DisplaySink& display, RunResult& result) {
  for (InputEvent event = platform.pollEvent();
       event.type != InputEventType::None; event = platform.pollEvent()) {
    if (isExitEvent(event)) return false;
    if (event.type == InputEventType::Resize) {
      const GridLayout& layout = ctx.grid.resize(event.width, event.height);
      if (ctx.config.verbose) {
        std::printf("[screensaver] resized to %dx%d: grid %dx%d, cell %.1fpx\n",
                    event.width, event.height, layout.cols, layout.rows,
                    layout.cell_size);
      }
    }
  }

  auto event = scheduler.tick(platform.nowMs(), ctx);
  if (event.has_value()) {
    ++result.triggers;
    if (!event->played) ++result.silent_triggers;
  }

  presentFrame(buildFramePlan(ctx.grid), display);
  ++result.frames;
  return true;
}

RunResult runScreensaver(ScreensaverContext& ctx, Platform& platform,
                         DisplaySink& display, uint64_t max_frames) {
  RunResult result;
  FillScheduler scheduler(ctx.config.interval_ms);

  while (runFrame(ctx, scheduler, platform, display, result)) {
    if (max_frames > 0 && result.frames >= max_frames) break;
    platform.waitForNextFrame(ctx.config.frames_per_second);
  }

  if (ctx.audio != nullptr) ctx.audio->stop();
  result.exit_code = 0;
  return result;
}

}  // namespace tonegrid
