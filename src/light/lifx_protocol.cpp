/// @file
/// @brief LIFX LAN packet encoding and decoding.

#include "light/lifx_protocol.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "light/byte_stream.h"

namespace midilight {
namespace lifx {

namespace {

constexpr uint16_t kAddressableBit = 1 << 12;
constexpr uint16_t kTaggedBit = 1 << 13;
constexpr uint8_t kResRequiredBit = 0x01;
constexpr uint8_t kAckRequiredBit = 0x02;

constexpr size_t kSetColorPayloadSize = 13;

uint16_t scaleTo16(double value, double range) {
  double scaled = std::round(value * 65535.0 / range);
  return static_cast<uint16_t>(std::clamp(scaled, 0.0, 65535.0));
}

Header makeHeader(size_t payload_size, bool tagged, uint32_t source,
                  uint64_t target, uint8_t sequence, uint16_t type) {
  Header header;
  header.size = static_cast<uint16_t>(kHeaderSize + payload_size);
  header.tagged = tagged;
  header.source = source;
  header.target = target;
  header.sequence = sequence;
  header.type = type;
  return header;
}

}  // namespace

Hsbk toHsbk(const Color& color, int kelvin) {
  Hsbk hsbk;
  hsbk.hue = scaleTo16(color.hue, 360.0);
  hsbk.saturation = scaleTo16(color.saturation, 100.0);
  hsbk.brightness = scaleTo16(color.lightness, 100.0);
  hsbk.kelvin = static_cast<uint16_t>(std::clamp(kelvin, 0, 65535));
  return hsbk;
}

void writeHeader(std::vector<uint8_t>& buf, const Header& header) {
  // Frame
  writeLE16(buf, header.size);
  uint16_t protocol = kProtocolNumber | kAddressableBit;
  if (header.tagged) protocol |= kTaggedBit;
  writeLE16(buf, protocol);
  writeLE32(buf, header.source);

  // Frame address
  writeLE64(buf, header.target);
  writeZeros(buf, 6);
  uint8_t flags = 0;
  if (header.res_required) flags |= kResRequiredBit;
  if (header.ack_required) flags |= kAckRequiredBit;
  writeU8(buf, flags);
  writeU8(buf, header.sequence);

  // Protocol header
  writeLE64(buf, 0);
  writeLE16(buf, header.type);
  writeLE16(buf, 0);
}

std::vector<uint8_t> encodeGetService(uint32_t source, uint8_t sequence) {
  Header header = makeHeader(0, true, source, 0, sequence, msg::kGetService);
  header.res_required = true;
  std::vector<uint8_t> buf;
  buf.reserve(kHeaderSize);
  writeHeader(buf, header);
  return buf;
}

std::vector<uint8_t> encodeGetLabel(uint32_t source, uint64_t target, uint8_t sequence) {
  Header header = makeHeader(0, false, source, target, sequence, msg::kGetLabel);
  header.res_required = true;
  std::vector<uint8_t> buf;
  buf.reserve(kHeaderSize);
  writeHeader(buf, header);
  return buf;
}

std::vector<uint8_t> encodeSetColor(uint32_t source, uint64_t target, uint8_t sequence,
                                    const Hsbk& hsbk, uint32_t duration_ms) {
  Header header = makeHeader(kSetColorPayloadSize, false, source, target, sequence,
                             msg::kSetColor);
  std::vector<uint8_t> buf;
  buf.reserve(kHeaderSize + kSetColorPayloadSize);
  writeHeader(buf, header);
  writeU8(buf, 0);  // reserved
  writeLE16(buf, hsbk.hue);
  writeLE16(buf, hsbk.saturation);
  writeLE16(buf, hsbk.brightness);
  writeLE16(buf, hsbk.kelvin);
  writeLE32(buf, duration_ms);
  return buf;
}

bool decodeHeader(const uint8_t* data, size_t size, Header& out) {
  if (size < kHeaderSize) {
    return false;
  }
  Header header;
  header.size = readLE16(data, 0);
  if (header.size != size) {
    return false;
  }
  uint16_t protocol = readLE16(data, 2);
  if ((protocol & 0x0FFF) != kProtocolNumber) {
    return false;
  }
  header.tagged = (protocol & kTaggedBit) != 0;
  header.source = readLE32(data, 4);
  header.target = readLE64(data, 8);
  uint8_t flags = data[22];
  header.res_required = (flags & kResRequiredBit) != 0;
  header.ack_required = (flags & kAckRequiredBit) != 0;
  header.sequence = data[23];
  header.type = readLE16(data, 32);
  out = header;
  return true;
}

bool decodeStateService(const uint8_t* data, size_t size, StateService& out) {
  Header header;
  if (!decodeHeader(data, size, header) || header.type != msg::kStateService ||
      size < kHeaderSize + 5) {
    return false;
  }
  out.service = data[kHeaderSize];
  out.port = readLE32(data, kHeaderSize + 1);
  return true;
}

bool decodeStateLabel(const uint8_t* data, size_t size, std::string& label) {
  Header header;
  if (!decodeHeader(data, size, header) || header.type != msg::kStateLabel ||
      size < kHeaderSize + kLabelSize) {
    return false;
  }
  const char* text = reinterpret_cast<const char*>(data + kHeaderSize);
  size_t len = 0;
  while (len < kLabelSize && text[len] != '\0') ++len;
  label.assign(text, len);
  return true;
}

std::string targetToMac(uint64_t target) {
  char buf[18];
  std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                static_cast<unsigned>(target & 0xFF),
                static_cast<unsigned>((target >> 8) & 0xFF),
                static_cast<unsigned>((target >> 16) & 0xFF),
                static_cast<unsigned>((target >> 24) & 0xFF),
                static_cast<unsigned>((target >> 32) & 0xFF),
                static_cast<unsigned>((target >> 40) & 0xFF));
  return buf;
}

}  // namespace lifx
}  // namespace midilight
