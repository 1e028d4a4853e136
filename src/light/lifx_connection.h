// UDP connection to a LIFX light and LAN discovery of the first light.

#ifndef MIDILIGHT_LIGHT_LIFX_CONNECTION_H
#define MIDILIGHT_LIGHT_LIFX_CONNECTION_H

#include <netinet/in.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "light/lifx_protocol.h"
#include "light/light_connection.h"

namespace midilight {

/// @brief Sends SetColor packets to one LIFX light over UDP.
class LifxConnection : public ILightConnection {
 public:
  /// @brief Take ownership of a bound UDP socket.
  /// @param socket_fd Socket used for sending.
  /// @param address Light address (IPv4 + port).
  /// @param target Light MAC as carried in packet headers.
  /// @param source Client identifier put in every packet.
  /// @param label Light label (may be empty).
  LifxConnection(int socket_fd, const sockaddr_in& address, uint64_t target,
                 uint32_t source, std::string label);
  ~LifxConnection() override;

  LifxConnection(const LifxConnection&) = delete;
  LifxConnection& operator=(const LifxConnection&) = delete;

  void sendColor(const LightCommand& command) override;
  void close() override;
  std::string label() const override { return label_; }
  std::string address() const override;

  /// @brief MAC address of the light, "d0:73:d5:..".
  std::string mac() const;

 private:
  int socket_fd_;
  sockaddr_in address_;
  uint64_t target_;
  uint32_t source_;
  std::string label_;
  uint8_t sequence_ = 0;
};

/// @brief Finds a light on the local network.
///
/// Broadcasts GetService and connects to the first light that answers.
class LifxDiscovery {
 public:
  /// @param broadcast_address IPv4 address GetService is sent to.
  /// @param timeout_ms How long to wait for a light to answer.
  /// @param port UDP port GetService is sent to.
  LifxDiscovery(std::string broadcast_address, int timeout_ms,
                uint16_t port = lifx::kPort);

  /// @brief Give up as soon as this flag becomes true.
  void setStopFlag(const std::atomic<bool>* stop) { stop_ = stop; }

  /// @brief Discover a light and open a connection to it.
  /// @return The connection, or nullptr if no light was found in time or the
  ///         stop flag was raised. On failure, call getError() for details.
  std::unique_ptr<LifxConnection> connect();

  const std::string& getError() const { return error_; }

  /// @brief True if the last connect() ended because of the stop flag.
  bool wasCancelled() const { return cancelled_; }

 private:
  static constexpr int kResendIntervalMs = 1000;
  static constexpr int kLabelWaitMs = 1000;
  static constexpr int kStopCheckMs = 100;

  std::string broadcast_address_;
  int timeout_ms_;
  uint16_t port_;
  const std::atomic<bool>* stop_ = nullptr;
  bool cancelled_ = false;
  std::string error_;

  bool stopRequested() const { return stop_ != nullptr && stop_->load(); }

  /// Record a cancellation. Always returns nullptr.
  std::unique_ptr<LifxConnection> cancel();

  /// Wait for a StateLabel from `from`. Returns an empty label on timeout.
  std::string queryLabel(int socket_fd, const sockaddr_in& from, uint64_t target,
                         uint32_t source);
};

}  // namespace midilight

#endif  // MIDILIGHT_LIGHT_LIFX_CONNECTION_H
