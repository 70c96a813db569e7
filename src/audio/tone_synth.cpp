/// @file
/// @brief Sine tone synthesis.

#include "audio/tone_synth.h"

#include <cmath>

namespace tonegrid {

namespace {

constexpr double kTwoPi = 6.283185307179586476925286766559;

}  // namespace

size_t toneFrameCount(double duration_seconds, int sample_rate) {
  if (sample_rate <= 0 || !std::isfinite(duration_seconds) ||
      duration_seconds <= 0.0) {
    return 0;
  }
  double frames = std::round(duration_seconds * static_cast<double>(sample_rate));
  return static_cast<size_t>(frames);
}

double fadeEnvelope(size_t frame, size_t total_frames, int sample_rate) {
  double fade_frames = static_cast<double>(sample_rate) * tone::kFadeSeconds;
  if (fade_frames <= 0.0) return 1.0;

  double index = static_cast<double>(frame);
  double total = static_cast<double>(total_frames);
  if (index < fade_frames) {
    return index / fade_frames;
  }
  if (index > total - fade_frames) {
    return (total - index) / fade_frames;
  }
  return 1.0;
}

ToneBuffer synthesizeTone(double frequency_hz, double duration_seconds,
                          int sample_rate) {
  ToneBuffer buffer;
  buffer.sample_rate = sample_rate;
  buffer.channels = tone::kChannels;

  if (!std::isfinite(frequency_hz) || frequency_hz <= 0.0) return buffer;
  size_t frames = toneFrameCount(duration_seconds, sample_rate);
  if (frames == 0) return buffer;

  buffer.samples.resize(frames * tone::kChannels);
  const double step = kTwoPi * frequency_hz / static_cast<double>(sample_rate);

  for (size_t idx = 0; idx < frames; ++idx) {
    double wave = std::sin(step * static_cast<double>(idx));
    double envelope = fadeEnvelope(idx, frames, sample_rate);
    // Truncation toward zero keeps |sample| <= 0.3 * peak.
    auto sample = static_cast<int16_t>(wave * tone::kPeakAmplitude * envelope *
                                       tone::kGain);
    buffer.samples[idx * 2] = sample;      // Left
    buffer.samples[idx * 2 + 1] = sample;  // Right
  }
  return buffer;
}

}  // namespace tonegrid
