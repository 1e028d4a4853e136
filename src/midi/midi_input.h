// MIDI event sources: the pull interface consumed by the router and a
// file-descriptor backed implementation for raw MIDI devices, FIFOs and stdin.

#ifndef MIDILIGHT_MIDI_MIDI_INPUT_H
#define MIDILIGHT_MIDI_MIDI_INPUT_H

#include <atomic>
#include <cstdint>
#include <deque>
#include <string>

#include "midi/midi_event.h"
#include "midi/midi_parser.h"

namespace midilight {

/// @brief Ordered, pull-based source of MIDI events.
class IEventSource {
 public:
  virtual ~IEventSource() = default;

  /// @brief Block until the next event is available.
  /// @param out Filled with the next event.
  /// @return False when the stream has ended.
  virtual bool next(MidiEvent& out) = 0;
};

/// @brief Reads raw MIDI bytes from a file descriptor.
///
/// Works with ALSA raw MIDI devices (/dev/snd/midiC*D*), named pipes and
/// stdin. The descriptor is polled with a short timeout so that a stop flag
/// (typically set from a signal handler) can end the stream.
class FdMidiInput : public IEventSource {
 public:
  FdMidiInput() = default;
  ~FdMidiInput() override;

  FdMidiInput(const FdMidiInput&) = delete;
  FdMidiInput& operator=(const FdMidiInput&) = delete;

  /// @brief Open a path for reading. "-" uses stdin (not closed on destruction).
  /// @return True on success. On failure, call getError() for details.
  bool open(const std::string& path);

  /// @brief Use an already open descriptor. Ownership is not taken.
  void attach(int fd);

  /// @brief Stop reading once this flag becomes true.
  void setStopFlag(const std::atomic<bool>* stop) { stop_ = stop; }

  bool next(MidiEvent& out) override;

  /// @brief Close the descriptor if owned.
  void close();

  const std::string& getError() const { return error_; }
  const std::string& path() const { return path_; }

 private:
  static constexpr int kPollTimeoutMs = 100;

  int fd_ = -1;
  bool owns_fd_ = false;
  const std::atomic<bool>* stop_ = nullptr;
  std::string path_;
  std::string error_;
  MidiStreamParser parser_;
  std::deque<MidiEvent> ready_;

  /// Read what is available into ready_. False at end of stream or on stop.
  bool fill();
  bool stopRequested() const { return stop_ != nullptr && stop_->load(); }
};

}  // namespace midilight

#endif  // MIDILIGHT_MIDI_MIDI_INPUT_H
