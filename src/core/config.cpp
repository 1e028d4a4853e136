/// @file
/// @brief BridgeConfig parsing and validation.

#include "core/config.h"

#include <cctype>
#include <cstdlib>
#include <utility>

namespace midilight {

bool parseChannelList(const std::string& text, std::set<uint8_t>& channels,
                      std::string& error) {
  std::set<uint8_t> parsed;
  size_t start = 0;

  while (start <= text.size()) {
    size_t comma = text.find(',', start);
    if (comma == std::string::npos) comma = text.size();
    std::string item = text.substr(start, comma - start);

    if (item.empty()) {
      error = "Empty channel in list: '" + text + "'";
      return false;
    }
    for (char chr : item) {
      if (!std::isdigit(static_cast<unsigned char>(chr))) {
        error = "Invalid channel '" + item + "'";
        return false;
      }
    }
    long value = std::strtol(item.c_str(), nullptr, 10);
    if (item.size() > 3 || value >= kMidiChannelCount) {
      error = "Channel out of range (0-15): " + item;
      return false;
    }
    parsed.insert(static_cast<uint8_t>(value));
    start = comma + 1;
  }

  channels = std::move(parsed);
  return true;
}

bool validateConfig(const BridgeConfig& config, std::string& error) {
  if (config.input_path.empty() && config.port_name.empty()) {
    error = "Either a virtual port name or an input path is required";
    return false;
  }
  if (config.channels.empty()) {
    error = "At least one MIDI channel is required";
    return false;
  }
  for (uint8_t channel : config.channels) {
    if (channel >= kMidiChannelCount) {
      error = "Channel out of range (0-15): " + std::to_string(channel);
      return false;
    }
  }
  if (config.initial_transition_ms < 0) {
    error = "Transition duration must be positive, got " +
            std::to_string(config.initial_transition_ms);
    return false;
  }
  if (config.rate_interval_ms <= 0) {
    error = "Rate interval must be greater than 0 ms, got " +
            std::to_string(config.rate_interval_ms);
    return false;
  }
  if (config.min_kelvin <= 0 || config.min_kelvin >= config.max_kelvin) {
    error = "Invalid Kelvin range " + std::to_string(config.min_kelvin) + "-" +
            std::to_string(config.max_kelvin);
    return false;
  }
  if (config.max_kelvin > 65535) {
    error = "Max Kelvin must fit 16 bits, got " + std::to_string(config.max_kelvin);
    return false;
  }
  if (config.discovery_timeout_ms <= 0) {
    error = "Discovery timeout must be greater than 0 ms";
    return false;
  }
  return true;
}

std::string channelsToString(const std::set<uint8_t>& channels) {
  std::string out;
  for (uint8_t channel : channels) {
    if (!out.empty()) out += ", ";
    out += std::to_string(channel);
  }
  return out;
}

}  // namespace midilight
