// Tests for audio/tone_synth.h -- frame count, envelope, stereo layout.

#include "audio/tone_synth.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace tonegrid {
namespace {

constexpr int kRate = 44100;
constexpr size_t kFadeFrames = 441;  // 0.01 s at 44.1 kHz

// ---------------------------------------------------------------------------
// toneFrameCount
// ---------------------------------------------------------------------------

TEST(ToneSynthTest, FrameCountRoundsDurationTimesRate) {
  EXPECT_EQ(toneFrameCount(0.2, kRate), 8820u);
  EXPECT_EQ(toneFrameCount(0.1, 8000), 800u);
  EXPECT_EQ(toneFrameCount(2.6 / kRate, kRate), 3u);
  EXPECT_EQ(toneFrameCount(0.4 / kRate, kRate), 0u);
}

TEST(ToneSynthTest, FrameCountRejectsDegenerateInput) {
  EXPECT_EQ(toneFrameCount(0.0, kRate), 0u);
  EXPECT_EQ(toneFrameCount(-1.0, kRate), 0u);
  EXPECT_EQ(toneFrameCount(0.2, 0), 0u);
  EXPECT_EQ(toneFrameCount(std::nan(""), kRate), 0u);
}

// ---------------------------------------------------------------------------
// synthesizeTone -- layout
// ---------------------------------------------------------------------------

TEST(ToneSynthTest, BufferHasExactFrameCount) {
  ToneBuffer buffer = synthesizeTone(440.0, 0.2, kRate);
  EXPECT_EQ(buffer.frameCount(), 8820u);
  EXPECT_EQ(buffer.samples.size(), 8820u * 2);
  EXPECT_EQ(buffer.channels, 2);
  EXPECT_EQ(buffer.sample_rate, kRate);
  EXPECT_EQ(buffer.byteSize(), 8820u * 2 * sizeof(int16_t));
}

TEST(ToneSynthTest, DefaultsMatchToneConstants) {
  ToneBuffer buffer = synthesizeTone(261.63);
  EXPECT_EQ(buffer.frameCount(), toneFrameCount(tone::kDurationSeconds, tone::kSampleRate));
}

TEST(ToneSynthTest, LeftEqualsRight) {
  ToneBuffer buffer = synthesizeTone(523.25, 0.05, kRate);
  for (size_t idx = 0; idx < buffer.frameCount(); ++idx) {
    ASSERT_EQ(buffer.samples[idx * 2], buffer.samples[idx * 2 + 1]) << "frame " << idx;
  }
}

TEST(ToneSynthTest, PeakRespectsGain) {
  ToneBuffer buffer = synthesizeTone(440.0, 0.2, kRate);
  const int limit = static_cast<int>(tone::kPeakAmplitude * tone::kGain);
  int peak = 0;
  for (int16_t sample : buffer.samples) {
    peak = std::max(peak, std::abs(static_cast<int>(sample)));
  }
  EXPECT_LE(peak, limit);
  // A 440 Hz sine crosses its crest many times in the steady region.
  EXPECT_GE(peak, limit - 5);
}

TEST(ToneSynthTest, DegenerateInputGivesEmptyBuffer) {
  EXPECT_TRUE(synthesizeTone(0.0, 0.2, kRate).empty());
  EXPECT_TRUE(synthesizeTone(-10.0, 0.2, kRate).empty());
  EXPECT_TRUE(synthesizeTone(440.0, 0.0, kRate).empty());
  EXPECT_TRUE(synthesizeTone(440.0, 0.2, 0).empty());
}

TEST(ToneSynthTest, Deterministic) {
  ToneBuffer first = synthesizeTone(330.0, 0.1, kRate);
  ToneBuffer second = synthesizeTone(330.0, 0.1, kRate);
  EXPECT_EQ(first.samples, second.samples);
}

// ---------------------------------------------------------------------------
// fadeEnvelope
// ---------------------------------------------------------------------------

TEST(ToneSynthTest, EnvelopeStartsAtZero) {
  EXPECT_DOUBLE_EQ(fadeEnvelope(0, 8820, kRate), 0.0);
  ToneBuffer buffer = synthesizeTone(440.0, 0.2, kRate);
  EXPECT_EQ(buffer.samples[0], 0);
}

TEST(ToneSynthTest, EnvelopeRisesThroughFadeIn) {
  for (size_t idx = 1; idx < kFadeFrames; ++idx) {
    EXPECT_GT(fadeEnvelope(idx, 8820, kRate), fadeEnvelope(idx - 1, 8820, kRate));
  }
  EXPECT_NEAR(fadeEnvelope(220, 8820, kRate), 220.0 / 441.0, 1e-12);
}

TEST(ToneSynthTest, EnvelopeFallsThroughFadeOut) {
  const size_t total = 8820;
  for (size_t idx = total - kFadeFrames + 1; idx + 1 < total; ++idx) {
    EXPECT_GT(fadeEnvelope(idx, total, kRate), fadeEnvelope(idx + 1, total, kRate));
  }
  EXPECT_NEAR(fadeEnvelope(total - 1, total, kRate), 1.0 / 441.0, 1e-12);
}

TEST(ToneSynthTest, EnvelopeIsFlatInMiddle) {
  for (size_t idx = kFadeFrames; idx <= 8820 - kFadeFrames; idx += 97) {
    EXPECT_DOUBLE_EQ(fadeEnvelope(idx, 8820, kRate), 1.0);
  }
}

TEST(ToneSynthTest, FadedSamplesAreScaledRawWave) {
  const double freq = 440.0;
  ToneBuffer buffer = synthesizeTone(freq, 0.2, kRate);
  const size_t total = buffer.frameCount();
  const double two_pi = 2.0 * std::acos(-1.0);
  for (size_t idx = 0; idx < total; ++idx) {
    bool in_fade = idx < kFadeFrames || idx > total - kFadeFrames;
    if (!in_fade) continue;
    double raw = std::sin(two_pi * freq * static_cast<double>(idx) / kRate) *
                 tone::kPeakAmplitude * tone::kGain;
    double expected = raw * fadeEnvelope(idx, total, kRate);
    EXPECT_NEAR(static_cast<double>(buffer.samples[idx * 2]), expected, 1.5)
        << "frame " << idx;
    EXPECT_LE(std::abs(static_cast<double>(buffer.samples[idx * 2])),
              std::abs(raw) + 1.0);
  }
}

}  // namespace
}  // namespace tonegrid
