/// @file
/// @brief Virtual MIDI input port implementation (RtMidi).

#include "midi/virtual_midi_input.h"

#include <RtMidi.h>

#include <chrono>
#include <utility>

#include "core/log.h"

namespace midilight {

namespace {

void onMidiMessage(double /*time_stamp*/, std::vector<unsigned char>* message,
                   void* user_data) {
  if (message == nullptr || message->empty()) {
    return;
  }
  auto* input = static_cast<VirtualMidiInput*>(user_data);
  input->enqueue(message->data(), message->size());
}

}  // namespace

VirtualMidiInput::VirtualMidiInput() = default;

VirtualMidiInput::~VirtualMidiInput() { close(); }

bool VirtualMidiInput::open(const std::string& port_name) {
  close();
  error_.clear();
  if (port_name.empty()) {
    error_ = "Virtual MIDI port name must not be empty";
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
    ready_.clear();
    parser_.reset();
  }

  try {
    auto midi_in = std::make_unique<RtMidiIn>(RtMidi::UNSPECIFIED, "midi-light");
    // Sysex, timing clock and active sensing carry nothing we map to light.
    midi_in->ignoreTypes(true, true, true);
    midi_in->setCallback(&onMidiMessage, this);
    midi_in->openVirtualPort(port_name);
    midi_in_ = std::move(midi_in);
  } catch (const RtMidiError& err) {
    error_ = "Failed to open virtual MIDI port " + port_name + ": " + err.getMessage();
    return false;
  }

  port_name_ = port_name;
  logInfo("Opened virtual MIDI port '%s'", port_name_.c_str());
  return true;
}

void VirtualMidiInput::close() {
  if (midi_in_) {
    midi_in_->cancelCallback();
    midi_in_->closePort();
    midi_in_.reset();
    logDebug("Closed virtual MIDI port '%s'", port_name_.c_str());
  }
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  arrived_.notify_all();
}

void VirtualMidiInput::enqueue(const uint8_t* data, size_t size) {
  std::vector<MidiEvent> events;
  std::lock_guard<std::mutex> lock(mutex_);
  parser_.feed(data, size, events);
  if (events.empty()) {
    return;
  }
  ready_.insert(ready_.end(), events.begin(), events.end());
  arrived_.notify_all();
}

bool VirtualMidiInput::next(MidiEvent& out) {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    if (stopRequested()) {
      logDebug("Virtual MIDI input stop requested");
      return false;
    }
    if (!ready_.empty()) {
      break;
    }
    if (closed_) {
      logDebug("Virtual MIDI input closed");
      return false;
    }
    arrived_.wait_for(lock, std::chrono::milliseconds(kWaitSliceMs));
  }
  out = ready_.front();
  ready_.pop_front();
  return true;
}

}  // namespace midilight
