// Ordered set of currently held notes, used to pick the note that colors
// the light when several are held at once.

#ifndef MIDILIGHT_CORE_ACTIVE_NOTES_H
#define MIDILIGHT_CORE_ACTIVE_NOTES_H

#include <cstddef>
#include <cstdint>
#include <list>
#include <optional>
#include <string>
#include <unordered_map>

namespace midilight {

/// @brief A held note and its latest velocity.
struct HeldNote {
  uint8_t note = 0;
  uint8_t velocity = 0;
};

/// @brief Insertion-ordered map of held notes (note -> velocity).
///
/// The earliest note still held is the active one. Re-triggering a held
/// note updates its velocity in place without moving it to the back.
class ActiveNoteTracker {
 public:
  ActiveNoteTracker() = default;
  ActiveNoteTracker(const ActiveNoteTracker&) = delete;
  ActiveNoteTracker& operator=(const ActiveNoteTracker&) = delete;

  /// @brief Record a note-on. Velocity 0 is not inserted.
  void noteOn(uint8_t note, uint8_t velocity);

  /// @brief Remove a note. No-op if the note is not held.
  void noteOff(uint8_t note);

  /// @brief Earliest note still held, or std::nullopt if none.
  std::optional<HeldNote> activeNote() const;

  bool contains(uint8_t note) const { return index_.count(note) > 0; }
  size_t size() const { return order_.size(); }
  bool empty() const { return order_.empty(); }
  void clear();

  /// @brief Render held notes in order, e.g. "{60:100, 64:80}".
  std::string toString() const;

 private:
  std::list<HeldNote> order_;
  std::unordered_map<uint8_t, std::list<HeldNote>::iterator> index_;
};

}  // namespace midilight

#endif  // MIDILIGHT_CORE_ACTIVE_NOTES_H
