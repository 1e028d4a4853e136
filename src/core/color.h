// Color mapping for the light: MIDI notes to HSL colors, pitch bend to
// color temperature.

#ifndef MIDILIGHT_CORE_COLOR_H
#define MIDILIGHT_CORE_COLOR_H

#include <cstdint>
#include <optional>
#include <string>

namespace midilight {

// ---------------------------------------------------------------------------
// Hues
// ---------------------------------------------------------------------------

/// Named HSL hues of Newton's colour circle (degrees).
namespace hue {

constexpr uint16_t kRed = 0;
constexpr uint16_t kRedOrange = 15;
constexpr uint16_t kOrange = 30;
constexpr uint16_t kOrangeYellow = 45;
constexpr uint16_t kYellow = 60;
constexpr uint16_t kYellowGreen = 90;
constexpr uint16_t kGreen = 120;
constexpr uint16_t kGreenBlue = 180;
constexpr uint16_t kBlue = 240;
constexpr uint16_t kBlueIndigo = 255;
constexpr uint16_t kIndigoViolet = 285;
constexpr uint16_t kViolet = 300;
constexpr uint16_t kVioletRed = 330;

}  // namespace hue

constexpr int kNotesPerOctave = 12;

/// Number of octaves covered by MIDI notes 0-127 (octave 1..11).
constexpr int kMidiOctaves = 11;

/// Hue assigned to each pitch class (C=0). Follows Newton's colour circle,
/// so the angles are not evenly spaced.
constexpr uint16_t kPitchClassHues[kNotesPerOctave] = {
    hue::kIndigoViolet,  // C
    hue::kViolet,        // C#
    hue::kVioletRed,     // D
    hue::kRed,           // D#
    hue::kRedOrange,     // E
    hue::kOrangeYellow,  // F
    hue::kYellow,        // F#
    hue::kYellowGreen,   // G
    hue::kGreen,         // G#
    hue::kGreenBlue,     // A
    hue::kBlue,          // A#
    hue::kBlueIndigo,    // B
};

/// Pitch class names (C=0).
constexpr const char* kPitchClassNames[kNotesPerOctave] = {
    "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"};

// ---------------------------------------------------------------------------
// Color
// ---------------------------------------------------------------------------

/// @brief HSL color value sent to the light.
struct Color {
  uint16_t hue = 0;         ///< Degrees, 0-360.
  float saturation = 0.0f;  ///< Percent, 0-100.
  float lightness = 0.0f;   ///< Percent, 0-100.

  bool operator==(const Color& other) const {
    return hue == other.hue && saturation == other.saturation &&
           lightness == other.lightness;
  }
  bool operator!=(const Color& other) const { return !(*this == other); }
};

/// Color used when no note is playing (brightness 0).
constexpr Color kOffColor = {hue::kRed, 0.0f, 0.0f};

/// @brief Format a color as "hsl(h, s%, l%)" for logs.
std::string colorToString(const Color& color);

// ---------------------------------------------------------------------------
// Note to color
// ---------------------------------------------------------------------------

/// @brief Convert a MIDI note and velocity to an HSL color.
///
/// Hue comes from the pitch class, lightness from the octave
/// (octave / 11 * 100, octave = note / 12 + 1) and saturation from the
/// velocity (velocity / 127 * 100).
///
/// @param note MIDI note number (0-127).
/// @param velocity Note velocity (0-127).
/// @return The corresponding color.
Color noteToColor(uint8_t note, uint8_t velocity);

/// @brief Get the pitch class name of a MIDI note ("C", "F#", ...).
const char* noteName(uint8_t note);

// ---------------------------------------------------------------------------
// Pitch bend to temperature
// ---------------------------------------------------------------------------

constexpr int kPitchBendMin = -8192;
constexpr int kPitchBendMax = 8192;

constexpr int kDefaultMinKelvin = 2500;
constexpr int kDefaultMaxKelvin = 9000;

/// @brief Convert a pitch bend value to a color temperature.
///
/// The mapping is linear and inverted: -8192 gives max_kelvin, +8192 gives
/// min_kelvin and 0 gives the midpoint.
///
/// @param pitch Pitch bend value in [-8192, 8192].
/// @param min_kelvin Lowest temperature the light accepts.
/// @param max_kelvin Highest temperature the light accepts.
/// @return Temperature in Kelvin, or std::nullopt if pitch is out of range.
std::optional<int> pitchToTemperature(int pitch,
                                      int min_kelvin = kDefaultMinKelvin,
                                      int max_kelvin = kDefaultMaxKelvin);

}  // namespace midilight

#endif  // MIDILIGHT_CORE_COLOR_H
