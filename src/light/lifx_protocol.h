// LIFX LAN protocol: packet header and the few messages needed to find a
// light and set its color.
//
// All integers are little-endian. Every packet starts with a 36-byte header:
//   frame          (8)  size, protocol/addressable/tagged, source
//   frame address (16)  target, reserved, ack/res flags, sequence
//   protocol      (12)  reserved, message type, reserved

#ifndef MIDILIGHT_LIGHT_LIFX_PROTOCOL_H
#define MIDILIGHT_LIGHT_LIFX_PROTOCOL_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/color.h"

namespace midilight {
namespace lifx {

constexpr uint16_t kPort = 56700;
constexpr uint16_t kProtocolNumber = 1024;
constexpr size_t kHeaderSize = 36;
constexpr size_t kLabelSize = 32;

/// Message types.
namespace msg {

constexpr uint16_t kGetService = 2;
constexpr uint16_t kStateService = 3;
constexpr uint16_t kGetLabel = 23;
constexpr uint16_t kStateLabel = 25;
constexpr uint16_t kSetColor = 102;

}  // namespace msg

/// StateService service id for UDP.
constexpr uint8_t kServiceUdp = 1;

/// @brief Decoded packet header.
struct Header {
  uint16_t size = 0;
  bool tagged = false;
  uint32_t source = 0;
  uint64_t target = 0;  ///< Device MAC in the low 6 bytes (wire order), 0 = all.
  bool ack_required = false;
  bool res_required = false;
  uint8_t sequence = 0;
  uint16_t type = 0;
};

/// @brief Hue/saturation/brightness/kelvin, each scaled to 16 bits.
struct Hsbk {
  uint16_t hue = 0;
  uint16_t saturation = 0;
  uint16_t brightness = 0;
  uint16_t kelvin = 0;
};

/// @brief StateService payload.
struct StateService {
  uint8_t service = 0;
  uint32_t port = 0;
};

/// @brief Scale an HSL color and temperature to the wire HSBK format.
///
/// hue * 65535 / 360, saturation and lightness * 65535 / 100, rounded.
/// Lightness is sent as brightness.
Hsbk toHsbk(const Color& color, int kelvin);

/// @brief Write a 36-byte header to buf. `size` is the full packet length.
void writeHeader(std::vector<uint8_t>& buf, const Header& header);

/// @brief Broadcast discovery request (tagged, no payload, res_required).
std::vector<uint8_t> encodeGetService(uint32_t source, uint8_t sequence);

/// @brief Label query addressed to one device.
std::vector<uint8_t> encodeGetLabel(uint32_t source, uint64_t target, uint8_t sequence);

/// @brief SetColor (102): 13-byte payload {reserved, hsbk, duration_ms}.
std::vector<uint8_t> encodeSetColor(uint32_t source, uint64_t target, uint8_t sequence,
                                    const Hsbk& hsbk, uint32_t duration_ms);

/// @brief Parse a packet header.
/// @return False if the data is shorter than the header, the declared size
///         does not match, or the protocol number is wrong.
bool decodeHeader(const uint8_t* data, size_t size, Header& out);

/// @brief Parse a StateService packet (header included).
bool decodeStateService(const uint8_t* data, size_t size, StateService& out);

/// @brief Parse a StateLabel packet (header included). Trailing NULs are dropped.
bool decodeStateLabel(const uint8_t* data, size_t size, std::string& label);

/// @brief Format a target as "d0:73:d5:01:02:03".
std::string targetToMac(uint64_t target);

}  // namespace lifx
}  // namespace midilight

#endif  // MIDILIGHT_LIGHT_LIFX_PROTOCOL_H
