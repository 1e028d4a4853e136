// Interface to a connected color light.

#ifndef MIDILIGHT_LIGHT_LIGHT_CONNECTION_H
#define MIDILIGHT_LIGHT_LIGHT_CONNECTION_H

#include <cstdint>
#include <string>

#include "core/color.h"

namespace midilight {

/// @brief One color command: the full target state of the light.
struct LightCommand {
  Color color;
  int kelvin = 0;
  uint32_t duration_ms = 0;
};

/// @brief A connected light accepting fire-and-forget color commands.
class ILightConnection {
 public:
  virtual ~ILightConnection() = default;

  /// @brief Send a color command. Does not wait for any acknowledgement.
  virtual void sendColor(const LightCommand& command) = 0;

  /// @brief Release the connection. Further sends are ignored.
  virtual void close() = 0;

  /// @brief Human-readable name of the light (may be empty).
  virtual std::string label() const = 0;

  /// @brief Network address of the light.
  virtual std::string address() const = 0;
};

}  // namespace midilight

#endif  // MIDILIGHT_LIGHT_LIGHT_CONNECTION_H
