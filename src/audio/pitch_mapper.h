// Color-to-pitch mapping: RGB -> note number -> equal-tempered frequency.

#ifndef TONEGRID_AUDIO_PITCH_MAPPER_H
#define TONEGRID_AUDIO_PITCH_MAPPER_H

#include <cstdint>

#include "core/rgb_color.h"

namespace tonegrid {

// ---------------------------------------------------------------------------
// Note range and reference pitch
// ---------------------------------------------------------------------------

namespace note_range {

constexpr int kLowest = 36;   // C2
constexpr int kHighest = 96;  // C7

// Base note of each channel band (12 semitones per band).
constexpr int kRedBase = 36;    // C2
constexpr int kGreenBase = 48;  // C3
constexpr int kBlueBase = 60;   // C4
constexpr int kBandWidth = 12;

}  // namespace note_range

constexpr int kReferenceNote = 69;           // A4
constexpr double kReferenceFrequency = 440.0;

/// @brief A color with a fixed note, bypassing the channel-band mapping.
struct ReservedColorNote {
  RgbColor color;
  int note = 0;
};

/// Background and foreground colors with recognizable fixed pitches.
constexpr ReservedColorNote kReservedColorNotes[] = {
    {{0, 0, 0}, 36},        // Black       -> C2
    {{10, 10, 10}, 38},     // #0a0a0a     -> D2
    {{26, 26, 26}, 40},     // #1a1a1a     -> E2
    {{255, 255, 255}, 60},  // White       -> C4
};

/// @brief Scale one 8-bit channel to a semitone offset.
/// @param channel Channel value in [0, 255].
/// @return floor(channel / 255 * 12); 255 maps to 12.
int channelToSemitoneOffset(uint8_t channel);

/// @brief Map a color to a note number.
///
/// Reserved colors return their fixed note. Any other color maps red, green
/// and blue into 12-semitone bands starting at C2, C3 and C4 respectively,
/// averages the three notes and rounds half away from zero. The mean of
/// three integers never lands exactly on .5, so the rounding mode does not
/// change any result.
///
/// @param color Cell color.
/// @return Note number in [36, 96].
int noteForColor(const RgbColor& color);

/// @brief Equal-tempered frequency of a note (A4 = 69 = 440 Hz).
/// @param note Note number.
/// @return Frequency in Hz.
double frequencyForNote(int note);

/// @brief Velocity derived from the mean channel value.
/// @param color Cell color.
/// @return floor(mean / 255 * 127), at least 1.
uint8_t velocityForColor(const RgbColor& color);

}  // namespace tonegrid

#endif  // TONEGRID_AUDIO_PITCH_MAPPER_H
