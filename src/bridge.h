// Bridge runner: wires MIDI input, event router, scheduler and light.

#ifndef MIDILIGHT_BRIDGE_H
#define MIDILIGHT_BRIDGE_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "core/config.h"
#include "light/light_connection.h"
#include "midi/midi_input.h"

namespace midilight {

/// @brief Outcome category of a bridge run.
enum class BridgeStatus : uint8_t {
  Ok,
  InvalidConfiguration,  ///< Rejected before any connection attempt.
  DeviceNotFound,        ///< No light answered discovery in time.
  InputError             ///< MIDI input or virtual port could not be opened.
};

/// @brief Convert BridgeStatus to a string.
const char* bridgeStatusToString(BridgeStatus status);

/// @brief Result of a bridge run.
struct BridgeResult {
  bool success = false;
  BridgeStatus status = BridgeStatus::Ok;
  std::string error_message;
  size_t events_handled = 0;   ///< Events that passed the channel filter.
  size_t events_dropped = 0;   ///< Events on other channels.
  uint64_t commands_sent = 0;  ///< Commands sent to the light, final "off" included.
};

/// @brief Run the bridge with explicit collaborators.
///
/// Validates the configuration, routes every event from `source` to the
/// light, then shuts the scheduler down (light off, connection closed).
///
/// @param config Bridge configuration.
/// @param source MIDI event source, read until it ends.
/// @param connection Connected light; owned for the duration of the run.
/// @return Run result.
BridgeResult runBridge(const BridgeConfig& config, IEventSource& source,
                       std::unique_ptr<ILightConnection> connection);

/// @brief Run the bridge end to end: open the MIDI input, discover a light
/// on the network, and route events until the input ends or `stop` is set.
///
/// The input is the raw byte source `config.input_path` when set, otherwise
/// a virtual MIDI port named `config.port_name`. If `stop` is raised while
/// discovery is still running, the run ends with status Ok and the light is
/// never contacted.
BridgeResult runBridge(const BridgeConfig& config, const std::atomic<bool>* stop);

}  // namespace midilight

#endif  // MIDILIGHT_BRIDGE_H
