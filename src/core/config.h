// Runtime configuration for the MIDI to light bridge.

#ifndef MIDILIGHT_CORE_CONFIG_H
#define MIDILIGHT_CORE_CONFIG_H

#include <cstdint>
#include <set>
#include <string>

#include "core/color.h"

namespace midilight {

constexpr uint8_t kMidiChannelCount = 16;

/// Devices accept about 20 messages per second.
constexpr int kDefaultRateIntervalMs = 50;

constexpr int kDefaultDiscoveryTimeoutMs = 5000;

/// Virtual MIDI port name used when none is given on the command line.
constexpr const char* kDefaultVirtualPortName = "midilifx";

/// @brief Bridge configuration (from the command line).
struct BridgeConfig {
  std::string port_name = kDefaultVirtualPortName;  ///< Used when input_path is empty.
  std::string input_path;                  ///< Raw MIDI byte source; "-" = stdin.
  std::set<uint8_t> channels = {0};        ///< MIDI channels to listen on (0-15).
  int initial_transition_ms = 0;           ///< Color transition duration at start.
  int rate_interval_ms = kDefaultRateIntervalMs;
  int min_kelvin = kDefaultMinKelvin;
  int max_kelvin = kDefaultMaxKelvin;
  int discovery_timeout_ms = kDefaultDiscoveryTimeoutMs;
  std::string broadcast_address = "255.255.255.255";
  bool debug = false;
};

/// @brief Parse a comma separated channel list such as "0,1,9".
/// @param text Input text.
/// @param channels Output set, replaced on success.
/// @param error Set to a message on failure.
/// @return False if any entry is empty, not a number, or outside 0-15.
bool parseChannelList(const std::string& text, std::set<uint8_t>& channels,
                      std::string& error);

/// @brief Check a configuration before any device is contacted.
/// @param config Configuration to check.
/// @param error Set to a message describing the first problem found.
/// @return True if the configuration is usable.
bool validateConfig(const BridgeConfig& config, std::string& error);

/// @brief Render a channel set as "0, 1, 9".
std::string channelsToString(const std::set<uint8_t>& channels);

}  // namespace midilight

#endif  // MIDILIGHT_CORE_CONFIG_H
