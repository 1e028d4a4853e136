/// @file
/// @brief Little-endian packet helpers.

#include "light/byte_stream.h"

namespace midilight {

void writeU8(std::vector<uint8_t>& buf, uint8_t value) { buf.push_back(value); }

void writeLE16(std::vector<uint8_t>& buf, uint16_t value) {
  buf.push_back(static_cast<uint8_t>(value & 0xFF));
  buf.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void writeLE32(std::vector<uint8_t>& buf, uint32_t value) {
  for (int shift = 0; shift < 32; shift += 8) {
    buf.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
  }
}

void writeLE64(std::vector<uint8_t>& buf, uint64_t value) {
  for (int shift = 0; shift < 64; shift += 8) {
    buf.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
  }
}

void writeZeros(std::vector<uint8_t>& buf, size_t count) {
  buf.insert(buf.end(), count, 0);
}

uint16_t readLE16(const uint8_t* data, size_t offset) {
  return static_cast<uint16_t>(
      static_cast<uint16_t>(data[offset]) |
      (static_cast<uint16_t>(data[offset + 1]) << 8));
}

uint32_t readLE32(const uint8_t* data, size_t offset) {
  return static_cast<uint32_t>(data[offset]) |
         (static_cast<uint32_t>(data[offset + 1]) << 8) |
         (static_cast<uint32_t>(data[offset + 2]) << 16) |
         (static_cast<uint32_t>(data[offset + 3]) << 24);
}

uint64_t readLE64(const uint8_t* data, size_t offset) {
  return static_cast<uint64_t>(readLE32(data, offset)) |
         (static_cast<uint64_t>(readLE32(data, offset + 4)) << 32);
}

}  // namespace midilight
