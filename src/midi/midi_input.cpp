/// @file
/// @brief File descriptor MIDI input implementation.

#include "midi/midi_input.h"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <vector>

#include "core/log.h"

namespace midilight {

FdMidiInput::~FdMidiInput() { close(); }

bool FdMidiInput::open(const std::string& path) {
  close();
  error_.clear();
  path_ = path;

  if (path == "-") {
    attach(STDIN_FILENO);
    return true;
  }

  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    error_ = "Failed to open MIDI input " + path + ": " + std::strerror(errno);
    return false;
  }
  fd_ = fd;
  owns_fd_ = true;
  parser_.reset();
  return true;
}

void FdMidiInput::attach(int fd) {
  close();
  fd_ = fd;
  owns_fd_ = false;
  parser_.reset();
}

void FdMidiInput::close() {
  if (fd_ >= 0 && owns_fd_) {
    ::close(fd_);
  }
  fd_ = -1;
  owns_fd_ = false;
  ready_.clear();
}

bool FdMidiInput::next(MidiEvent& out) {
  while (ready_.empty()) {
    if (!fill()) {
      return false;
    }
  }
  out = ready_.front();
  ready_.pop_front();
  return true;
}

bool FdMidiInput::fill() {
  if (fd_ < 0) {
    return false;
  }

  while (!stopRequested()) {
    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ready = ::poll(&pfd, 1, kPollTimeoutMs);
    if (ready < 0) {
      if (errno == EINTR) continue;
      logError("poll() on MIDI input failed: %s", std::strerror(errno));
      return false;
    }
    if (ready == 0) {
      continue;
    }

    uint8_t buf[256];
    ssize_t bytes_read = ::read(fd_, buf, sizeof(buf));
    if (bytes_read < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      logError("Read from MIDI input failed: %s", std::strerror(errno));
      return false;
    }
    if (bytes_read == 0) {
      logDebug("MIDI input reached end of stream");
      return false;
    }

    std::vector<MidiEvent> events;
    parser_.feed(buf, static_cast<size_t>(bytes_read), events);
    ready_.insert(ready_.end(), events.begin(), events.end());
    if (!ready_.empty()) {
      return true;
    }
  }
  logDebug("MIDI input stop requested");
  return false;
}

}  // namespace midilight
