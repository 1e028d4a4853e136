// Helpers for reading/writing little-endian integers in LIFX packets.

#ifndef MIDILIGHT_LIGHT_BYTE_STREAM_H
#define MIDILIGHT_LIGHT_BYTE_STREAM_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace midilight {

/// @brief Append a uint8 to a byte buffer.
void writeU8(std::vector<uint8_t>& buf, uint8_t value);

/// @brief Append a little-endian uint16 to a byte buffer.
/// @param buf Destination buffer (2 bytes appended).
/// @param value The 16-bit value.
void writeLE16(std::vector<uint8_t>& buf, uint16_t value);

/// @brief Append a little-endian uint32 to a byte buffer.
/// @param buf Destination buffer (4 bytes appended).
/// @param value The 32-bit value.
void writeLE32(std::vector<uint8_t>& buf, uint32_t value);

/// @brief Append a little-endian uint64 to a byte buffer.
/// @param buf Destination buffer (8 bytes appended).
/// @param value The 64-bit value.
void writeLE64(std::vector<uint8_t>& buf, uint64_t value);

/// @brief Append `count` zero bytes.
void writeZeros(std::vector<uint8_t>& buf, size_t count);

/// @brief Read a little-endian uint16 from raw data at a given offset.
uint16_t readLE16(const uint8_t* data, size_t offset);

/// @brief Read a little-endian uint32 from raw data at a given offset.
uint32_t readLE32(const uint8_t* data, size_t offset);

/// @brief Read a little-endian uint64 from raw data at a given offset.
uint64_t readLE64(const uint8_t* data, size_t offset);

}  // namespace midilight

#endif  // MIDILIGHT_LIGHT_BYTE_STREAM_H
