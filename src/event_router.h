// Event router: translates MIDI events into light state changes.

#ifndef MIDILIGHT_EVENT_ROUTER_H
#define MIDILIGHT_EVENT_ROUTER_H

#include <cstddef>
#include <cstdint>
#include <set>

#include "core/active_notes.h"
#include "core/color.h"
#include "light/actuator_scheduler.h"
#include "midi/midi_event.h"
#include "midi/midi_input.h"

namespace midilight {

/// Transition duration per modulation wheel step (ms).
constexpr uint32_t kModulationDurationStepMs = 4;

/// @brief Router settings.
struct RouterConfig {
  std::set<uint8_t> channels = {0};  ///< Channels to listen on.
  int min_kelvin = kDefaultMinKelvin;
  int max_kelvin = kDefaultMaxKelvin;
};

/// @brief Drives a light from MIDI events.
///
/// Events on channels outside the configured set are dropped. For the rest:
///   - note-on (velocity > 0): note becomes held
///   - note-on (velocity 0) / note-off: note is released
///   - pitch bend: sets the color temperature (color untouched)
///   - modulation (CC 1): sets the transition duration to value * 4 ms
///   - anything else: no state change
/// After every event except pitch bend and modulation the color is
/// recomputed from the earliest held note, or turned off if none is held.
class EventRouter {
 public:
  EventRouter(ILightControl& light, RouterConfig config);

  /// @brief Route one event.
  /// @return False if the event was dropped by the channel filter.
  bool handle(const MidiEvent& event);

  /// @brief Route events until the source ends.
  /// @return Number of events that passed the channel filter.
  size_t run(IEventSource& source);

  const ActiveNoteTracker& activeNotes() const { return notes_; }
  size_t eventsHandled() const { return events_handled_; }
  size_t eventsDropped() const { return events_dropped_; }

 private:
  ILightControl& light_;
  RouterConfig config_;
  ActiveNoteTracker notes_;
  size_t events_handled_ = 0;
  size_t events_dropped_ = 0;

  /// Set the color from the active note, or off.
  void recomputeColor();
};

}  // namespace midilight

#endif  // MIDILIGHT_EVENT_ROUTER_H
