/// @file
/// @brief FillScheduler trigger logic and tone submission.

#include "grid/fill_scheduler.h"

#include <cstdio>
#include <string>
#include <utility>

#include "audio/pitch_mapper.h"
#include "audio/tone_synth.h"

namespace tonegrid {

FillScheduler::FillScheduler(uint32_t interval_ms) : interval_ms_(interval_ms) {}

bool FillScheduler::isDue(uint32_t now_ms) const {
  // Unsigned subtraction stays correct across clock wraparound.
  return now_ms - last_trigger_ms_ >= interval_ms_;
}

std::optional<ToneEvent> FillScheduler::tick(uint32_t now_ms,
                                             ScreensaverContext& ctx) {
  if (!isDue(now_ms)) return std::nullopt;
  if (ctx.colors == nullptr) {
    std::fprintf(stderr, "[scheduler] WARNING: no color source, skipping\n");
    last_trigger_ms_ = now_ms;
    return std::nullopt;
  }

  ToneEvent event;
  event.color = ctx.grid.advance(*ctx.colors);
  event.note = noteForColor(event.color);
  event.velocity = velocityForColor(event.color);
  event.frequency_hz = frequencyForNote(event.note);
  event.played = playTone(event, ctx);
  last_trigger_ms_ = now_ms;

  if (ctx.config.verbose) {
    std::printf("[scheduler] %s note=%d vel=%u freq=%.2fHz cursor=%zu/%zu%s\n",
                toHexString(event.color).c_str(), event.note,
                static_cast<unsigned>(event.velocity), event.frequency_hz,
                ctx.grid.cursor(), ctx.grid.capacity(),
                event.played ? "" : " (silent)");
  }
  return event;
}

bool FillScheduler::playTone(ToneEvent& event, ScreensaverContext& ctx) const {
  if (ctx.audio == nullptr) return false;

  ToneBuffer buffer = synthesizeTone(event.frequency_hz,
                                     ctx.config.tone_duration_seconds,
                                     ctx.config.sample_rate);
  if (buffer.empty()) {
    std::fprintf(stderr, "[scheduler] WARNING: empty tone for %s (%.2fHz)\n",
                 toHexString(event.color).c_str(), event.frequency_hz);
    return false;
  }
  if (!ctx.audio->replace(std::move(buffer))) {
    std::fprintf(stderr, "[scheduler] WARNING: playback failed for %s\n",
                 toHexString(event.color).c_str());
    return false;
  }
  return true;
}

}  // namespace tonegrid
