/// @file
/// @brief MidiEvent helpers.

#include "midi/midi_event.h"

namespace midilight {

const char* midiEventKindToString(MidiEventKind kind) {
  switch (kind) {
    case MidiEventKind::NoteOn:        return "note_on";
    case MidiEventKind::NoteOff:       return "note_off";
    case MidiEventKind::PitchBend:     return "pitchwheel";
    case MidiEventKind::ControlChange: return "control_change";
    case MidiEventKind::Other:         return "other";
  }
  return "unknown";
}

}  // namespace midilight
