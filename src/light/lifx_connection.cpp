/// @file
/// @brief LIFX UDP connection and discovery.

#include "light/lifx_connection.h"

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <random>
#include <utility>
#include <vector>

#include "core/log.h"
#include "light/lifx_protocol.h"

namespace midilight {

namespace {

using SteadyClock = std::chrono::steady_clock;

/// Closes a socket on scope exit unless released.
class SocketGuard {
 public:
  explicit SocketGuard(int fd) : fd_(fd) {}
  ~SocketGuard() {
    if (fd_ >= 0) ::close(fd_);
  }
  SocketGuard(const SocketGuard&) = delete;
  SocketGuard& operator=(const SocketGuard&) = delete;

  int get() const { return fd_; }
  int release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }

 private:
  int fd_;
};

std::string formatAddress(const sockaddr_in& addr) {
  char ip[INET_ADDRSTRLEN] = {};
  ::inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
  return ip;
}

bool sendPacket(int socket_fd, const std::vector<uint8_t>& packet, const sockaddr_in& to) {
  ssize_t sent = ::sendto(socket_fd, packet.data(), packet.size(), 0,
                          reinterpret_cast<const sockaddr*>(&to), sizeof(to));
  return sent == static_cast<ssize_t>(packet.size());
}

int remainingMs(SteadyClock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - SteadyClock::now());
  return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

/// Receive one datagram, waiting at most `wait_ms`. Returns its size or -1.
ssize_t receivePacket(int socket_fd, uint8_t* buf, size_t size, int wait_ms,
                      sockaddr_in& from) {
  struct pollfd pfd;
  pfd.fd = socket_fd;
  pfd.events = POLLIN;
  pfd.revents = 0;
  int ready = ::poll(&pfd, 1, wait_ms);
  if (ready <= 0) {
    return -1;
  }
  socklen_t from_len = sizeof(from);
  return ::recvfrom(socket_fd, buf, size, 0, reinterpret_cast<sockaddr*>(&from),
                    &from_len);
}

uint32_t makeSourceId() {
  std::random_device device;
  std::uniform_int_distribution<uint32_t> dist(2, 0xFFFFFFFFu);
  return dist(device);
}

}  // namespace

// ---------------------------------------------------------------------------
// LifxConnection
// ---------------------------------------------------------------------------

LifxConnection::LifxConnection(int socket_fd, const sockaddr_in& address,
                               uint64_t target, uint32_t source, std::string label)
    : socket_fd_(socket_fd),
      address_(address),
      target_(target),
      source_(source),
      label_(std::move(label)) {}

LifxConnection::~LifxConnection() { close(); }

void LifxConnection::sendColor(const LightCommand& command) {
  if (socket_fd_ < 0) {
    logDebug("Dropping color command, connection closed");
    return;
  }
  lifx::Hsbk hsbk = lifx::toHsbk(command.color, command.kelvin);
  std::vector<uint8_t> packet =
      lifx::encodeSetColor(source_, target_, sequence_++, hsbk, command.duration_ms);
  if (!sendPacket(socket_fd_, packet, address_)) {
    logDebug("SetColor send failed: %s", std::strerror(errno));
  }
}

void LifxConnection::close() {
  if (socket_fd_ >= 0) {
    ::close(socket_fd_);
    socket_fd_ = -1;
  }
}

std::string LifxConnection::address() const { return formatAddress(address_); }

std::string LifxConnection::mac() const { return lifx::targetToMac(target_); }

// ---------------------------------------------------------------------------
// LifxDiscovery
// ---------------------------------------------------------------------------

LifxDiscovery::LifxDiscovery(std::string broadcast_address, int timeout_ms, uint16_t port)
    : broadcast_address_(std::move(broadcast_address)), timeout_ms_(timeout_ms), port_(port) {}

std::unique_ptr<LifxConnection> LifxDiscovery::connect() {
  error_.clear();
  cancelled_ = false;
  if (stopRequested()) {
    return cancel();
  }

  sockaddr_in broadcast = {};
  broadcast.sin_family = AF_INET;
  broadcast.sin_port = htons(port_);
  if (::inet_pton(AF_INET, broadcast_address_.c_str(), &broadcast.sin_addr) != 1) {
    error_ = "Invalid broadcast address: " + broadcast_address_;
    return nullptr;
  }

  SocketGuard socket(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
  if (socket.get() < 0) {
    error_ = std::string("Failed to create UDP socket: ") + std::strerror(errno);
    return nullptr;
  }
  int enable = 1;
  if (::setsockopt(socket.get(), SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable)) != 0) {
    error_ = std::string("Failed to enable broadcast: ") + std::strerror(errno);
    return nullptr;
  }

  uint32_t source = makeSourceId();
  uint8_t sequence = 0;
  std::vector<uint8_t> get_service = lifx::encodeGetService(source, sequence);

  logDebug("Waiting for a light to be detected...");
  auto deadline = SteadyClock::now() + std::chrono::milliseconds(timeout_ms_);
  auto next_send = SteadyClock::now();

  while (SteadyClock::now() < deadline) {
    if (stopRequested()) {
      return cancel();
    }
    if (SteadyClock::now() >= next_send) {
      if (!sendPacket(socket.get(), get_service, broadcast)) {
        logWarn("GetService broadcast failed: %s", std::strerror(errno));
      }
      next_send = SteadyClock::now() + std::chrono::milliseconds(kResendIntervalMs);
    }

    uint8_t buf[128];
    sockaddr_in from = {};
    int wait_ms = std::min({remainingMs(deadline), remainingMs(next_send), kStopCheckMs});
    ssize_t received = receivePacket(socket.get(), buf, sizeof(buf), wait_ms, from);
    if (received <= 0) {
      continue;
    }

    lifx::Header header;
    lifx::StateService service;
    size_t packet_size = static_cast<size_t>(received);
    if (!lifx::decodeHeader(buf, packet_size, header) || header.source != source) {
      continue;  // Not ours, or an answer to another client.
    }
    if (!lifx::decodeStateService(buf, packet_size, service) ||
        service.service != lifx::kServiceUdp) {
      continue;
    }

    from.sin_port = htons(static_cast<uint16_t>(service.port));
    logInfo("Found light at %s", lifx::targetToMac(header.target).c_str());

    std::string label = queryLabel(socket.get(), from, header.target, source);
    if (stopRequested()) {
      return cancel();
    }
    return std::make_unique<LifxConnection>(socket.release(), from, header.target,
                                            source, std::move(label));
  }

  error_ = "No light found on " + broadcast_address_ + " after " +
           std::to_string(timeout_ms_) + " ms";
  return nullptr;
}

std::unique_ptr<LifxConnection> LifxDiscovery::cancel() {
  cancelled_ = true;
  error_ = "Light discovery cancelled";
  logDebug("%s", error_.c_str());
  return nullptr;
}

std::string LifxDiscovery::queryLabel(int socket_fd, const sockaddr_in& from,
                                      uint64_t target, uint32_t source) {
  if (!sendPacket(socket_fd, lifx::encodeGetLabel(source, target, 1), from)) {
    logWarn("GetLabel send failed: %s", std::strerror(errno));
    return "";
  }

  auto deadline = SteadyClock::now() + std::chrono::milliseconds(kLabelWaitMs);
  while (SteadyClock::now() < deadline && !stopRequested()) {
    uint8_t buf[128];
    sockaddr_in reply_from = {};
    int wait_ms = std::min(remainingMs(deadline), kStopCheckMs);
    ssize_t received = receivePacket(socket_fd, buf, sizeof(buf), wait_ms, reply_from);
    if (received <= 0) {
      continue;
    }
    std::string label;
    if (lifx::decodeStateLabel(buf, static_cast<size_t>(received), label)) {
      return label;
    }
  }
  logWarn("Failed to get label from light after %d ms", kLabelWaitMs);
  return "";
}

}  // namespace midilight
