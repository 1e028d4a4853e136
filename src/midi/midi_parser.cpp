/// @file
/// @brief Live MIDI byte stream parser implementation.

#include "midi/midi_parser.h"

namespace midilight {

uint8_t channelMessageDataLength(uint8_t status) {
  uint8_t msg_type = status & 0xF0;
  // Program Change / Channel Pressure: 1 data byte, everything else 2.
  return (msg_type == 0xC0 || msg_type == 0xD0) ? 1 : 2;
}

bool MidiStreamParser::feed(uint8_t byte, MidiEvent& out) {
  // System real-time: single byte, may appear between data bytes.
  if (byte >= 0xF8) {
    return false;
  }

  if (byte & 0x80) {
    data_count_ = 0;
    if (byte == 0xF0) {
      in_sysex_ = true;
      running_status_ = 0;
    } else if (byte >= 0xF1) {
      // End of SysEx or system common: cancels running status, its data
      // bytes (if any) are dropped below.
      in_sysex_ = false;
      running_status_ = 0;
    } else {
      in_sysex_ = false;
      running_status_ = byte;
    }
    return false;
  }

  if (in_sysex_) {
    return false;
  }
  if (running_status_ == 0) {
    ++dropped_bytes_;
    return false;
  }

  data_[data_count_++] = byte;
  if (data_count_ < channelMessageDataLength(running_status_)) {
    return false;
  }

  out = buildEvent();
  data_count_ = 0;  // Running status: next data byte starts a new message.
  return true;
}

size_t MidiStreamParser::feed(const uint8_t* data, size_t size,
                              std::vector<MidiEvent>& out) {
  size_t count = 0;
  MidiEvent evt;
  for (size_t idx = 0; idx < size; ++idx) {
    if (feed(data[idx], evt)) {
      out.push_back(evt);
      ++count;
    }
  }
  return count;
}

void MidiStreamParser::reset() {
  running_status_ = 0;
  data_count_ = 0;
  in_sysex_ = false;
}

MidiEvent MidiStreamParser::buildEvent() const {
  uint8_t msg_type = running_status_ & 0xF0;
  uint8_t channel = running_status_ & 0x0F;

  switch (msg_type) {
    case 0x80:
      return MidiEvent::noteOff(channel, data_[0], data_[1]);
    case 0x90:
      return MidiEvent::noteOn(channel, data_[0], data_[1]);
    case 0xB0:
      return MidiEvent::controlChange(channel, data_[0], data_[1]);
    case 0xE0: {
      // 14-bit value, LSB first.
      int raw = (static_cast<int>(data_[1]) << 7) | static_cast<int>(data_[0]);
      return MidiEvent::pitchBend(channel, static_cast<int16_t>(raw - kPitchBendCenter));
    }
    default:
      // Key Pressure (0xA0), Program Change (0xC0), Channel Pressure (0xD0).
      return MidiEvent::other(channel, msg_type);
  }
}

}  // namespace midilight
