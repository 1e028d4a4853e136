// Tests for midi/virtual_midi_input.h -- message queueing and stream end.
// Messages are injected through enqueue() so no MIDI system is needed.

#include "midi/virtual_midi_input.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace midilight {
namespace {

void enqueueBytes(VirtualMidiInput& input, const std::vector<uint8_t>& bytes) {
  input.enqueue(bytes.data(), bytes.size());
}

TEST(VirtualMidiInputTest, QueuedMessagesDrainAfterClose) {
  VirtualMidiInput input;
  enqueueBytes(input, {0x90, 60, 100});
  enqueueBytes(input, {0xE1, 0x00, 0x40});
  enqueueBytes(input, {0xB0, 1, 25});
  input.close();

  MidiEvent evt;
  ASSERT_TRUE(input.next(evt));
  EXPECT_EQ(evt.kind, MidiEventKind::NoteOn);
  EXPECT_EQ(evt.note, 60);
  ASSERT_TRUE(input.next(evt));
  EXPECT_EQ(evt.kind, MidiEventKind::PitchBend);
  EXPECT_EQ(evt.channel, 1);
  EXPECT_EQ(evt.pitch, 0);
  ASSERT_TRUE(input.next(evt));
  EXPECT_EQ(evt.kind, MidiEventKind::ControlChange);
  EXPECT_EQ(evt.value, 25);
  EXPECT_FALSE(input.next(evt));
}

TEST(VirtualMidiInputTest, RealtimeMessagesProduceNoEvents) {
  VirtualMidiInput input;
  enqueueBytes(input, {0xF8});
  enqueueBytes(input, {0xFE});
  input.close();

  MidiEvent evt;
  EXPECT_FALSE(input.next(evt));
}

TEST(VirtualMidiInputTest, MessageFromAnotherThreadWakesReader) {
  VirtualMidiInput input;
  std::thread sender([&input] {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    enqueueBytes(input, {0x80, 64, 0});
  });

  MidiEvent evt;
  ASSERT_TRUE(input.next(evt));
  EXPECT_EQ(evt.kind, MidiEventKind::NoteOff);
  EXPECT_EQ(evt.note, 64);
  sender.join();
}

TEST(VirtualMidiInputTest, StopFlagEndsWaitingReader) {
  VirtualMidiInput input;
  std::atomic<bool> stop{false};
  input.setStopFlag(&stop);

  std::thread stopper([&stop] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    stop.store(true);
  });

  MidiEvent evt;
  EXPECT_FALSE(input.next(evt));
  stopper.join();
}

TEST(VirtualMidiInputTest, EmptyPortNameRejected) {
  VirtualMidiInput input;
  EXPECT_FALSE(input.open(""));
  EXPECT_FALSE(input.isOpen());
  EXPECT_NE(input.getError().find("name"), std::string::npos);
}

}  // namespace
}  // namespace midilight
