// Tests for core/color.h -- note to color and pitch bend to temperature.

#include "core/color.h"

#include <gtest/gtest.h>

namespace midilight {
namespace {

// ---------------------------------------------------------------------------
// noteToColor
// ---------------------------------------------------------------------------

TEST(NoteToColorTest, MiddleCIsIndigoViolet) {
  Color color = noteToColor(60, 127);
  EXPECT_EQ(color.hue, hue::kIndigoViolet);
  EXPECT_FLOAT_EQ(color.saturation, 100.0f);
  // Note 60: octave 6 -> 6 / 11 * 100.
  EXPECT_NEAR(color.lightness, 54.545f, 0.01f);
}

TEST(NoteToColorTest, PitchClassHuesFollowNewtonCircle) {
  const uint16_t expected[12] = {285, 300, 330, 0, 15, 45, 60, 90, 120, 180, 240, 255};
  for (uint8_t pc = 0; pc < 12; ++pc) {
    EXPECT_EQ(noteToColor(static_cast<uint8_t>(48 + pc), 64).hue, expected[pc])
        << "pitch class " << static_cast<int>(pc);
  }
}

TEST(NoteToColorTest, SameHueAcrossOctaves) {
  EXPECT_EQ(noteToColor(0, 100).hue, noteToColor(120, 100).hue);
  EXPECT_EQ(noteToColor(64, 100).hue, hue::kRedOrange);  // E
}

TEST(NoteToColorTest, LightnessRisesWithOctave) {
  EXPECT_NEAR(noteToColor(0, 100).lightness, 100.0f / 11.0f, 0.001f);
  EXPECT_LT(noteToColor(36, 100).lightness, noteToColor(48, 100).lightness);
  EXPECT_FLOAT_EQ(noteToColor(127, 100).lightness, 100.0f);  // octave 11
}

TEST(NoteToColorTest, SaturationFollowsVelocity) {
  EXPECT_FLOAT_EQ(noteToColor(60, 0).saturation, 0.0f);
  EXPECT_NEAR(noteToColor(60, 64).saturation, 50.39f, 0.01f);
  EXPECT_LT(noteToColor(60, 40).saturation, noteToColor(60, 90).saturation);
}

TEST(NoteToColorTest, Deterministic) {
  EXPECT_EQ(noteToColor(61, 33), noteToColor(61, 33));
  EXPECT_NE(noteToColor(61, 33), noteToColor(61, 34));
}

TEST(NoteToColorTest, NoteNames) {
  EXPECT_STREQ(noteName(60), "C");
  EXPECT_STREQ(noteName(61), "C#");
  EXPECT_STREQ(noteName(71), "B");
}

TEST(ColorTest, OffColorIsBlack) {
  EXPECT_EQ(kOffColor.hue, 0);
  EXPECT_FLOAT_EQ(kOffColor.saturation, 0.0f);
  EXPECT_FLOAT_EQ(kOffColor.lightness, 0.0f);
}

TEST(ColorTest, ToString) {
  Color color{240, 50.0f, 25.5f};
  EXPECT_EQ(colorToString(color), "hsl(240, 50.0%, 25.5%)");
}

// ---------------------------------------------------------------------------
// pitchToTemperature
// ---------------------------------------------------------------------------

TEST(PitchToTemperatureTest, CenterIsMidpoint) {
  EXPECT_EQ(pitchToTemperature(0, 2500, 9000), 5750);
}

TEST(PitchToTemperatureTest, ExtremesAreInverted) {
  EXPECT_EQ(pitchToTemperature(8192, 2500, 9000), 2500);
  EXPECT_EQ(pitchToTemperature(-8192, 2500, 9000), 9000);
}

TEST(PitchToTemperatureTest, DefaultRange) {
  EXPECT_EQ(pitchToTemperature(0), 5750);
  EXPECT_EQ(pitchToTemperature(-8192), kDefaultMaxKelvin);
}

TEST(PitchToTemperatureTest, MonotonicallyDecreasing) {
  int previous = *pitchToTemperature(-8192, 1500, 9000);
  for (int pitch = -8192 + 512; pitch <= 8192; pitch += 512) {
    int kelvin = *pitchToTemperature(pitch, 1500, 9000);
    EXPECT_LE(kelvin, previous) << "pitch " << pitch;
    previous = kelvin;
  }
}

TEST(PitchToTemperatureTest, CustomRangeRounds) {
  // 8191 is the highest value a 14-bit pitch bend can carry.
  // (16383 / 16384) * 6500 = 6499.6 -> rounds to 6500.
  EXPECT_EQ(pitchToTemperature(8191, 2500, 9000), 2500);
  EXPECT_EQ(pitchToTemperature(0, 2000, 3001), 2500);  // 3001 - round(500.5)
}

TEST(PitchToTemperatureTest, OutOfRangeIsRejected) {
  EXPECT_FALSE(pitchToTemperature(8193, 2500, 9000).has_value());
  EXPECT_FALSE(pitchToTemperature(-8193, 2500, 9000).has_value());
}

}  // namespace
}  // namespace midilight
