// Incremental parser for a live MIDI 1.0 byte stream.

#ifndef MIDILIGHT_MIDI_MIDI_PARSER_H
#define MIDILIGHT_MIDI_MIDI_PARSER_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "midi/midi_event.h"

namespace midilight {

/// Pitch bend center value of the 14-bit wire encoding.
constexpr int kPitchBendCenter = 8192;

/// @brief Decodes channel messages from raw MIDI bytes, one byte at a time.
///
/// Handles running status, system real-time bytes interleaved anywhere
/// (ignored, running status kept), and SysEx / system common messages
/// (skipped, running status cancelled). Data bytes with no status are dropped.
class MidiStreamParser {
 public:
  MidiStreamParser() = default;

  /// @brief Feed one byte.
  /// @param byte Next byte of the stream.
  /// @param out Filled with the decoded event when a message completes.
  /// @return True if `out` holds a new event.
  bool feed(uint8_t byte, MidiEvent& out);

  /// @brief Feed a buffer, appending every completed event to `out`.
  /// @return Number of events appended.
  size_t feed(const uint8_t* data, size_t size, std::vector<MidiEvent>& out);

  /// @brief Forget running status and any partial message.
  void reset();

  /// @brief Count of bytes dropped because they could not be attributed to a message.
  size_t droppedBytes() const { return dropped_bytes_; }

 private:
  uint8_t running_status_ = 0;
  uint8_t data_[2] = {0, 0};
  uint8_t data_count_ = 0;
  bool in_sysex_ = false;
  size_t dropped_bytes_ = 0;

  /// Build the event for the current status and collected data bytes.
  MidiEvent buildEvent() const;
};

/// @brief Number of data bytes following a channel status byte (1 or 2).
uint8_t channelMessageDataLength(uint8_t status);

}  // namespace midilight

#endif  // MIDILIGHT_MIDI_MIDI_PARSER_H
