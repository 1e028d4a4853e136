// Tests for midi/midi_input.h -- reading MIDI bytes from a descriptor.

#include "midi/midi_input.h"

#include <gtest/gtest.h>
#include <unistd.h>

#include <atomic>
#include <vector>

namespace midilight {
namespace {

class FdMidiInputTest : public ::testing::Test {
 protected:
  void SetUp() override { ASSERT_EQ(::pipe(fds_), 0); }
  void TearDown() override {
    if (fds_[0] >= 0) ::close(fds_[0]);
    if (fds_[1] >= 0) ::close(fds_[1]);
  }

  void writeBytes(const std::vector<uint8_t>& bytes) {
    ASSERT_EQ(::write(fds_[1], bytes.data(), bytes.size()),
              static_cast<ssize_t>(bytes.size()));
  }
  void closeWriter() {
    ::close(fds_[1]);
    fds_[1] = -1;
  }

  int fds_[2] = {-1, -1};
};

TEST_F(FdMidiInputTest, ReadsEventsUntilEndOfStream) {
  writeBytes({0x90, 60, 100, 64, 80, 0xE0, 0x00, 0x40, 0x80, 60, 0});
  closeWriter();

  FdMidiInput input;
  input.attach(fds_[0]);

  std::vector<MidiEvent> events;
  MidiEvent evt;
  while (input.next(evt)) events.push_back(evt);

  ASSERT_EQ(events.size(), 4u);
  EXPECT_EQ(events[0].kind, MidiEventKind::NoteOn);
  EXPECT_EQ(events[1].note, 64);
  EXPECT_EQ(events[2].kind, MidiEventKind::PitchBend);
  EXPECT_EQ(events[3].kind, MidiEventKind::NoteOff);
}

TEST_F(FdMidiInputTest, StopFlagEndsStream) {
  std::atomic<bool> stop{true};
  FdMidiInput input;
  input.attach(fds_[0]);
  input.setStopFlag(&stop);

  MidiEvent evt;
  EXPECT_FALSE(input.next(evt));
}

TEST_F(FdMidiInputTest, AttachDoesNotTakeOwnership) {
  {
    FdMidiInput input;
    input.attach(fds_[0]);
  }
  // Descriptor still valid after the input is destroyed.
  writeBytes({0x90, 60, 100});
  uint8_t buf[3];
  EXPECT_EQ(::read(fds_[0], buf, sizeof(buf)), 3);
}

TEST(FdMidiInputOpenTest, MissingPathFails) {
  FdMidiInput input;
  EXPECT_FALSE(input.open("/nonexistent/midi-light-test-device"));
  EXPECT_NE(input.getError().find("/nonexistent/midi-light-test-device"), std::string::npos);

  MidiEvent evt;
  EXPECT_FALSE(input.next(evt));
}

}  // namespace
}  // namespace midilight
