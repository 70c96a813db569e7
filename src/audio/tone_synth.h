// Procedural sine tone synthesis with click-free fade envelope.

#ifndef TONEGRID_AUDIO_TONE_SYNTH_H
#define TONEGRID_AUDIO_TONE_SYNTH_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace tonegrid {

// ---------------------------------------------------------------------------
// Synthesis constants
// ---------------------------------------------------------------------------

namespace tone {

constexpr int kSampleRate = 44100;
constexpr double kDurationSeconds = 0.2;
constexpr double kFadeSeconds = 0.01;
constexpr double kGain = 0.3;
constexpr int16_t kPeakAmplitude = 32767;  // 2^15 - 1
constexpr uint8_t kChannels = 2;

}  // namespace tone

/// @brief Interleaved 16-bit PCM buffer produced by synthesizeTone().
///
/// Stereo with identical left and right samples. The buffer is immutable
/// once built and is handed to the audio sink by move.
struct ToneBuffer {
  int sample_rate = tone::kSampleRate;
  uint8_t channels = tone::kChannels;
  std::vector<int16_t> samples;  ///< Interleaved L,R,L,R,...

  /// @brief Number of frames (one sample per channel).
  size_t frameCount() const { return channels == 0 ? 0 : samples.size() / channels; }

  /// @brief True if the buffer holds no audio.
  bool empty() const { return samples.empty(); }

  /// @brief Size of the sample data in bytes.
  size_t byteSize() const { return samples.size() * sizeof(int16_t); }
};

/// @brief Number of frames for a duration: round(duration * sample_rate).
/// @return 0 for non-positive or non-finite input.
size_t toneFrameCount(double duration_seconds, int sample_rate);

/// @brief Envelope gain at a frame index.
///
/// Linear fade-in over the first 0.01 s, linear fade-out over the last
/// 0.01 s, 1.0 in between.
///
/// @param frame Frame index in [0, total_frames).
/// @param total_frames Buffer length in frames.
/// @param sample_rate Sample rate in Hz.
/// @return Envelope multiplier in [0.0, 1.0].
double fadeEnvelope(size_t frame, size_t total_frames, int sample_rate);

/// @brief Synthesize a sine tone.
///
/// Each sample is sin(2*pi*f*i/sr) * 32767 * envelope * 0.3, truncated to
/// int16 and duplicated to both channels. Pure function, safe to call
/// concurrently.
///
/// @param frequency_hz Tone frequency.
/// @param duration_seconds Tone length.
/// @param sample_rate Sample rate in Hz.
/// @return Stereo buffer; empty when any argument is non-positive.
ToneBuffer synthesizeTone(double frequency_hz,
                          double duration_seconds = tone::kDurationSeconds,
                          int sample_rate = tone::kSampleRate);

}  // namespace tonegrid

#endif  // TONEGRID_AUDIO_TONE_SYNTH_H
