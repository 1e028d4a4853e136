/// @file
/// @brief ActiveNoteTracker implementation.

#include "core/active_notes.h"

#include <iterator>

namespace midilight {

void ActiveNoteTracker::noteOn(uint8_t note, uint8_t velocity) {
  if (velocity == 0) {
    return;
  }

  auto found = index_.find(note);
  if (found != index_.end()) {
    found->second->velocity = velocity;  // Keep insertion position.
    return;
  }

  order_.push_back({note, velocity});
  index_[note] = std::prev(order_.end());
}

void ActiveNoteTracker::noteOff(uint8_t note) {
  auto found = index_.find(note);
  if (found == index_.end()) {
    return;
  }
  order_.erase(found->second);
  index_.erase(found);
}

std::optional<HeldNote> ActiveNoteTracker::activeNote() const {
  if (order_.empty()) {
    return std::nullopt;
  }
  return order_.front();
}

void ActiveNoteTracker::clear() {
  order_.clear();
  index_.clear();
}

std::string ActiveNoteTracker::toString() const {
  std::string out = "{";
  bool first = true;
  for (const auto& held : order_) {
    if (!first) out += ", ";
    out += std::to_string(held.note) + ":" + std::to_string(held.velocity);
    first = false;
  }
  out += "}";
  return out;
}

}  // namespace midilight
