/// @file
/// @brief Color-to-note and note-to-frequency mapping.

#include "audio/pitch_mapper.h"

#include <algorithm>
#include <cmath>

namespace tonegrid {

int channelToSemitoneOffset(uint8_t channel) {
  double ratio = static_cast<double>(channel) / 255.0;
  return static_cast<int>(ratio * note_range::kBandWidth);
}

int noteForColor(const RgbColor& color) {
  for (const auto& reserved : kReservedColorNotes) {
    if (reserved.color == color) return reserved.note;
  }

  int red_note = note_range::kRedBase + channelToSemitoneOffset(color.red);
  int green_note = note_range::kGreenBase + channelToSemitoneOffset(color.green);
  int blue_note = note_range::kBlueBase + channelToSemitoneOffset(color.blue);

  double mean = static_cast<double>(red_note + green_note + blue_note) / 3.0;
  int avg_note = static_cast<int>(std::lround(mean));
  return std::clamp(avg_note, note_range::kLowest, note_range::kHighest);
}

double frequencyForNote(int note) {
  double semitones = static_cast<double>(note - kReferenceNote);
  return kReferenceFrequency * std::pow(2.0, semitones / 12.0);
}

uint8_t velocityForColor(const RgbColor& color) {
  int sum = static_cast<int>(color.red) + static_cast<int>(color.green) +
            static_cast<int>(color.blue);
  double scaled = static_cast<double>(sum) / 3.0 / 255.0 * 127.0;
  int velocity = static_cast<int>(scaled);
  return static_cast<uint8_t>(std::clamp(velocity, 1, 127));
}

}  // namespace tonegrid
