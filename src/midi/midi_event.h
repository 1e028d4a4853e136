// Live MIDI channel events consumed by the event router.

#ifndef MIDILIGHT_MIDI_MIDI_EVENT_H
#define MIDILIGHT_MIDI_MIDI_EVENT_H

#include <cstdint>

namespace midilight {

/// MIDI controller number for the modulation wheel.
constexpr uint8_t kMidiCcModulation = 1;

/// @brief Kind of a channel event.
enum class MidiEventKind : uint8_t {
  NoteOn,
  NoteOff,
  PitchBend,
  ControlChange,
  Other  ///< Key pressure, program change, channel pressure.
};

/// @brief Convert MidiEventKind to a log-friendly string.
const char* midiEventKindToString(MidiEventKind kind);

/// @brief A decoded MIDI channel message.
///
/// Only the fields belonging to `kind` are meaningful:
///   - NoteOn / NoteOff: note, velocity
///   - PitchBend: pitch (-8192..8191)
///   - ControlChange: controller, value
///   - Other: status (raw status nibble, 0xA0 / 0xC0 / 0xD0)
struct MidiEvent {
  MidiEventKind kind = MidiEventKind::Other;
  uint8_t channel = 0;
  uint8_t note = 0;
  uint8_t velocity = 0;
  int16_t pitch = 0;
  uint8_t controller = 0;
  uint8_t value = 0;
  uint8_t status = 0;

  static MidiEvent noteOn(uint8_t channel, uint8_t note, uint8_t velocity) {
    MidiEvent evt;
    evt.kind = MidiEventKind::NoteOn;
    evt.channel = channel;
    evt.note = note;
    evt.velocity = velocity;
    evt.status = 0x90;
    return evt;
  }

  static MidiEvent noteOff(uint8_t channel, uint8_t note, uint8_t velocity = 0) {
    MidiEvent evt;
    evt.kind = MidiEventKind::NoteOff;
    evt.channel = channel;
    evt.note = note;
    evt.velocity = velocity;
    evt.status = 0x80;
    return evt;
  }

  static MidiEvent pitchBend(uint8_t channel, int16_t pitch) {
    MidiEvent evt;
    evt.kind = MidiEventKind::PitchBend;
    evt.channel = channel;
    evt.pitch = pitch;
    evt.status = 0xE0;
    return evt;
  }

  static MidiEvent controlChange(uint8_t channel, uint8_t controller, uint8_t value) {
    MidiEvent evt;
    evt.kind = MidiEventKind::ControlChange;
    evt.channel = channel;
    evt.controller = controller;
    evt.value = value;
    evt.status = 0xB0;
    return evt;
  }

  static MidiEvent other(uint8_t channel, uint8_t status) {
    MidiEvent evt;
    evt.kind = MidiEventKind::Other;
    evt.channel = channel;
    evt.status = status;
    return evt;
  }
};

}  // namespace midilight

#endif  // MIDILIGHT_MIDI_MIDI_EVENT_H
