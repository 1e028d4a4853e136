/// @file
/// @brief EventRouter implementation.

#include "event_router.h"

#include <utility>

#include "core/log.h"

namespace midilight {

EventRouter::EventRouter(ILightControl& light, RouterConfig config)
    : light_(light), config_(std::move(config)) {}

bool EventRouter::handle(const MidiEvent& event) {
  if (config_.channels.count(event.channel) == 0) {
    ++events_dropped_;
    return false;
  }
  ++events_handled_;
  logDebug("%s received on channel %u", midiEventKindToString(event.kind),
           static_cast<unsigned>(event.channel));

  switch (event.kind) {
    case MidiEventKind::NoteOn:
      if (event.velocity > 0) {
        notes_.noteOn(event.note, event.velocity);
      } else {
        // Running-status convention: note-on with velocity 0 releases the note.
        notes_.noteOff(event.note);
      }
      break;

    case MidiEventKind::NoteOff:
      notes_.noteOff(event.note);
      break;

    case MidiEventKind::PitchBend: {
      std::optional<int> kelvin =
          pitchToTemperature(event.pitch, config_.min_kelvin, config_.max_kelvin);
      if (!kelvin) {
        logWarn("Pitch bend %d out of range, ignored", event.pitch);
        return true;
      }
      // A temperature change already updates the light; color is unchanged.
      light_.setTemperature(*kelvin);
      return true;
    }

    case MidiEventKind::ControlChange:
      if (event.controller == kMidiCcModulation) {
        // Applies to the next color change; triggers nothing by itself.
        light_.setTransitionDuration(event.value * kModulationDurationStepMs);
        return true;
      }
      break;

    case MidiEventKind::Other:
      break;
  }

  recomputeColor();
  return true;
}

size_t EventRouter::run(IEventSource& source) {
  size_t handled = 0;
  MidiEvent event;
  while (source.next(event)) {
    if (handle(event)) {
      ++handled;
    }
  }
  return handled;
}

void EventRouter::recomputeColor() {
  if (isLogEnabled(LogLevel::Debug)) {
    logDebug("Currently playing notes: %s", notes_.toString().c_str());
  }

  std::optional<HeldNote> active = notes_.activeNote();
  if (active) {
    light_.setColor(noteToColor(active->note, active->velocity));
  } else {
    // No note held: brightness 0.
    light_.setColor(std::nullopt);
  }
}

}  // namespace midilight
