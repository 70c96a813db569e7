// Time-driven grid fill: one new cell and tone per fixed interval.

#ifndef TONEGRID_GRID_FILL_SCHEDULER_H
#define TONEGRID_GRID_FILL_SCHEDULER_H

#include <cstdint>
#include <optional>

#include "core/rgb_color.h"
#include "screensaver_context.h"

namespace tonegrid {

/// @brief Description of one triggered advance.
struct ToneEvent {
  RgbColor color;
  int note = 0;
  uint8_t velocity = 0;
  double frequency_hz = 0.0;
  bool played = false;  ///< False if synthesis or playback failed.
};

/// @brief Level-triggered scheduler driven by a monotonic millisecond clock.
///
/// Idle until at least interval_ms has elapsed since the last trigger, then
/// advances the grid once, maps the new color to a pitch, synthesizes the
/// tone and hands it to the audio sink. Frame rate does not affect the fill
/// rate.
class FillScheduler {
 public:
  /// @param interval_ms Minimum time between triggers.
  explicit FillScheduler(uint32_t interval_ms = 500);

  /// @brief Check the clock and trigger at most one advance.
  /// @param now_ms Current clock sample in milliseconds.
  /// @param ctx Screensaver state (grid, color source, audio sink).
  /// @return The triggered event, or std::nullopt if still idle.
  std::optional<ToneEvent> tick(uint32_t now_ms, ScreensaverContext& ctx);

  /// @brief True if tick(now_ms) would trigger.
  bool isDue(uint32_t now_ms) const;

  uint32_t intervalMs() const { return interval_ms_; }
  uint32_t lastTriggerMs() const { return last_trigger_ms_; }

 private:
  uint32_t interval_ms_;
  uint32_t last_trigger_ms_ = 0;

  /// Synthesize and submit the tone; failures are logged, not propagated.
  bool playTone(ToneEvent& event, ScreensaverContext& ctx) const;
};

}  // namespace tonegrid

#endif  // TONEGRID_GRID_FILL_SCHEDULER_H
