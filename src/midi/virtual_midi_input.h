// Named virtual MIDI input port that other applications (DAWs, sequencers,
// keyboards routed through the system MIDI graph) can connect to.

#ifndef MIDILIGHT_MIDI_VIRTUAL_MIDI_INPUT_H
#define MIDILIGHT_MIDI_VIRTUAL_MIDI_INPUT_H

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "midi/midi_event.h"
#include "midi/midi_input.h"
#include "midi/midi_parser.h"

class RtMidiIn;

namespace midilight {

/// @brief Creates a virtual MIDI input port through RtMidi.
///
/// RtMidi delivers complete messages on its own thread; they are queued and
/// handed out by next(), which waits in short slices so a stop flag can end
/// the stream.
class VirtualMidiInput : public IEventSource {
 public:
  VirtualMidiInput();
  ~VirtualMidiInput() override;

  VirtualMidiInput(const VirtualMidiInput&) = delete;
  VirtualMidiInput& operator=(const VirtualMidiInput&) = delete;

  /// @brief Create the virtual port.
  /// @param port_name Name shown to other MIDI clients. Must not be empty.
  /// @return True on success. On failure, call getError() for details.
  bool open(const std::string& port_name);

  /// @brief Stop reading once this flag becomes true.
  void setStopFlag(const std::atomic<bool>* stop) { stop_ = stop; }

  bool next(MidiEvent& out) override;

  /// @brief Close the port. Messages already queued are still returned.
  void close();

  /// @brief Queue one incoming MIDI message (called from RtMidi's thread).
  void enqueue(const uint8_t* data, size_t size);

  const std::string& getError() const { return error_; }
  const std::string& portName() const { return port_name_; }
  bool isOpen() const { return midi_in_ != nullptr; }

 private:
  static constexpr int kWaitSliceMs = 100;

  std::unique_ptr<RtMidiIn> midi_in_;
  const std::atomic<bool>* stop_ = nullptr;
  std::string port_name_;
  std::string error_;

  std::mutex mutex_;
  std::condition_variable arrived_;
  MidiStreamParser parser_;
  std::deque<MidiEvent> ready_;
  bool closed_ = false;

  bool stopRequested() const { return stop_ != nullptr && stop_->load(); }
};

}  // namespace midilight

#endif  // MIDILIGHT_MIDI_VIRTUAL_MIDI_INPUT_H
