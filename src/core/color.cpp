/// @file
/// @brief Note/velocity to HSL color and pitch bend to Kelvin conversions.

#include "core/color.h"

#include <cmath>
#include <cstdio>

namespace midilight {

std::string colorToString(const Color& color) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "hsl(%u, %.1f%%, %.1f%%)",
                static_cast<unsigned>(color.hue),
                static_cast<double>(color.saturation),
                static_cast<double>(color.lightness));
  return buf;
}

Color noteToColor(uint8_t note, uint8_t velocity) {
  int pitch_class = note % kNotesPerOctave;
  int octave = note / kNotesPerOctave + 1;

  Color color;
  color.hue = kPitchClassHues[pitch_class];
  color.saturation = static_cast<float>(velocity) / 127.0f * 100.0f;
  color.lightness = static_cast<float>(octave) / static_cast<float>(kMidiOctaves) * 100.0f;
  return color;
}

const char* noteName(uint8_t note) {
  return kPitchClassNames[note % kNotesPerOctave];
}

std::optional<int> pitchToTemperature(int pitch, int min_kelvin, int max_kelvin) {
  if (pitch < kPitchBendMin || pitch > kPitchBendMax) {
    return std::nullopt;
  }

  constexpr double kPitchSpan = static_cast<double>(kPitchBendMax - kPitchBendMin);  // 16384
  double position = static_cast<double>(pitch - kPitchBendMin) / kPitchSpan;
  double kelvin_span = static_cast<double>(max_kelvin - min_kelvin);
  return max_kelvin - static_cast<int>(std::lround(position * kelvin_span));
}

}  // namespace midilight
