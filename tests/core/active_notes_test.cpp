// Tests for core/active_notes.h -- polyphony tie-break ordering.

#include "core/active_notes.h"

#include <gtest/gtest.h>

namespace midilight {
namespace {

TEST(ActiveNoteTrackerTest, EmptyHasNoActiveNote) {
  ActiveNoteTracker tracker;
  EXPECT_TRUE(tracker.empty());
  EXPECT_FALSE(tracker.activeNote().has_value());
}

TEST(ActiveNoteTrackerTest, EarliestHeldNoteIsActive) {
  ActiveNoteTracker tracker;
  tracker.noteOn(60, 100);
  tracker.noteOn(64, 80);

  auto active = tracker.activeNote();
  ASSERT_TRUE(active.has_value());
  EXPECT_EQ(active->note, 60);
  EXPECT_EQ(active->velocity, 100);

  tracker.noteOff(60);
  active = tracker.activeNote();
  ASSERT_TRUE(active.has_value());
  EXPECT_EQ(active->note, 64);
  EXPECT_EQ(active->velocity, 80);

  tracker.noteOff(64);
  EXPECT_FALSE(tracker.activeNote().has_value());
}

TEST(ActiveNoteTrackerTest, RetriggerKeepsPositionAndUpdatesVelocity) {
  ActiveNoteTracker tracker;
  tracker.noteOn(60, 100);
  tracker.noteOn(64, 80);
  tracker.noteOn(60, 30);

  EXPECT_EQ(tracker.size(), 2u);
  auto active = tracker.activeNote();
  ASSERT_TRUE(active.has_value());
  EXPECT_EQ(active->note, 60);
  EXPECT_EQ(active->velocity, 30);
  EXPECT_EQ(tracker.toString(), "{60:30, 64:80}");
}

TEST(ActiveNoteTrackerTest, ReleasedNoteRejoinsAtBack) {
  ActiveNoteTracker tracker;
  tracker.noteOn(60, 100);
  tracker.noteOn(64, 80);
  tracker.noteOff(60);
  tracker.noteOn(60, 90);

  EXPECT_EQ(tracker.activeNote()->note, 64);
  EXPECT_EQ(tracker.toString(), "{64:80, 60:90}");
}

TEST(ActiveNoteTrackerTest, ReleasingMiddleNoteKeepsOrder) {
  ActiveNoteTracker tracker;
  tracker.noteOn(48, 10);
  tracker.noteOn(52, 20);
  tracker.noteOn(55, 30);
  tracker.noteOff(52);

  EXPECT_FALSE(tracker.contains(52));
  EXPECT_EQ(tracker.toString(), "{48:10, 55:30}");
  tracker.noteOff(48);
  EXPECT_EQ(tracker.activeNote()->note, 55);
}

TEST(ActiveNoteTrackerTest, VelocityZeroIsNotInserted) {
  ActiveNoteTracker tracker;
  tracker.noteOn(60, 0);
  EXPECT_TRUE(tracker.empty());
}

TEST(ActiveNoteTrackerTest, NoteOffForUnheldNoteIsHarmless) {
  ActiveNoteTracker tracker;
  tracker.noteOff(61);
  tracker.noteOn(60, 100);
  tracker.noteOff(61);
  EXPECT_EQ(tracker.size(), 1u);
}

TEST(ActiveNoteTrackerTest, Clear) {
  ActiveNoteTracker tracker;
  tracker.noteOn(60, 100);
  tracker.noteOn(62, 100);
  tracker.clear();
  EXPECT_TRUE(tracker.empty());
  EXPECT_FALSE(tracker.contains(60));
  EXPECT_EQ(tracker.toString(), "{}");
}

}  // namespace
}  // namespace midilight
