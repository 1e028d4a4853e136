// Rate-limited, coalescing dispatcher of light state changes.

#ifndef MIDILIGHT_LIGHT_ACTUATOR_SCHEDULER_H
#define MIDILIGHT_LIGHT_ACTUATOR_SCHEDULER_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "core/color.h"
#include "light/light_connection.h"

namespace midilight {

/// @brief Target state of the light as requested by the router.
struct ActuatorState {
  Color color = kOffColor;
  int temperature = 0;                ///< Kelvin.
  uint32_t transition_duration_ms = 0;
  std::chrono::steady_clock::time_point last_send_time;  ///< Last dispatched command.
};

/// @brief Operations the event router uses to change the light.
class ILightControl {
 public:
  virtual ~ILightControl() = default;

  /// @brief Set the color. std::nullopt turns the light "off" (brightness 0).
  virtual void setColor(const std::optional<Color>& color) = 0;

  /// @brief Set the color temperature in Kelvin.
  virtual void setTemperature(int kelvin) = 0;

  /// @brief Set the transition duration used by the next command.
  virtual void setTransitionDuration(uint32_t duration_ms) = 0;
};

/// @brief Scheduler construction options.
struct SchedulerOptions {
  int rate_interval_ms = 50;          ///< Minimum spacing between commands.
  int initial_temperature = 5750;     ///< Kelvin.
  uint32_t initial_transition_ms = 0;
};

/// @brief Owns the light's target state and sends it at most once per interval.
///
/// Mutations only update the state and request a dispatch. A request made
/// while one is pending is coalesced into it. The worker thread wakes when
/// the pending dispatch is due (last send + rate interval), reads the state
/// as it is at that moment, and sends it as one command. A burst of changes
/// therefore produces one command carrying the latest values.
///
/// shutdown() turns the light off and waits for that command to go out
/// before closing the connection, so the last command is always "off".
class ActuatorScheduler : public ILightControl {
 public:
  /// @brief Take ownership of a connection and start the dispatch thread.
  ///
  /// A null connection is accepted: the state is still tracked but nothing
  /// is ever dispatched and shutdown() has nothing to close.
  ActuatorScheduler(std::unique_ptr<ILightConnection> connection,
                    const SchedulerOptions& options);

  /// @brief Calls shutdown().
  ~ActuatorScheduler() override;

  ActuatorScheduler(const ActuatorScheduler&) = delete;
  ActuatorScheduler& operator=(const ActuatorScheduler&) = delete;

  void setColor(const std::optional<Color>& color) override;
  void setTemperature(int kelvin) override;
  void setTransitionDuration(uint32_t duration_ms) override;

  /// @brief Turn the light off, drain the pending dispatch, stop and close.
  ///
  /// Further mutations are ignored. Safe to call more than once.
  void shutdown();

  /// @brief Copy of the current target state.
  ActuatorState state() const;

  /// @brief True while a dispatch is scheduled but not yet sent.
  bool hasPendingUpdate() const;

  /// @brief Number of commands handed to the connection so far.
  uint64_t commandsSent() const;

  /// @brief The connection, or nullptr if none was given.
  const ILightConnection* connection() const { return connection_.get(); }

 private:
  using Clock = std::chrono::steady_clock;

  std::unique_ptr<ILightConnection> connection_;
  const Clock::duration rate_interval_;

  mutable std::mutex mutex_;
  std::condition_variable wake_;
  ActuatorState state_;
  bool pending_ = false;       ///< A dispatch is scheduled.
  Clock::time_point due_;      ///< When the pending dispatch may fire.
  bool accepting_ = true;      ///< Mutations allowed.
  bool running_ = true;        ///< Dispatch loop should keep waiting.
  bool shut_down_ = false;
  uint64_t commands_sent_ = 0;

  std::thread worker_;

  /// Apply a color change. Caller holds mutex_.
  void applyColorLocked(const Color& color);

  /// Schedule a dispatch unless one is pending. Caller holds mutex_.
  void requestDispatchLocked();

  /// Worker thread body.
  void dispatchLoop();
};

}  // namespace midilight

#endif  // MIDILIGHT_LIGHT_ACTUATOR_SCHEDULER_H
