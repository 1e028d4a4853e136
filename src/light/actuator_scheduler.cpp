/// @file
/// @brief ActuatorScheduler implementation.

#include "light/actuator_scheduler.h"

#include <algorithm>
#include <string>
#include <utility>

#include "core/log.h"

namespace midilight {

ActuatorScheduler::ActuatorScheduler(std::unique_ptr<ILightConnection> connection,
                                     const SchedulerOptions& options)
    : connection_(std::move(connection)),
      rate_interval_(std::chrono::milliseconds(options.rate_interval_ms)) {
  state_.color = kOffColor;
  state_.temperature = options.initial_temperature;
  state_.transition_duration_ms = options.initial_transition_ms;
  state_.last_send_time = Clock::now();
  if (!connection_) {
    // Nothing to send to: state is tracked, no dispatch thread is started.
    logWarn("Light scheduler created without a connection, commands are dropped");
    return;
  }
  worker_ = std::thread(&ActuatorScheduler::dispatchLoop, this);
}

ActuatorScheduler::~ActuatorScheduler() { shutdown(); }

// ---------------------------------------------------------------------------
// Mutations
// ---------------------------------------------------------------------------

void ActuatorScheduler::setColor(const std::optional<Color>& color) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!accepting_) {
    logDebug("Ignoring color change, scheduler is shutting down");
    return;
  }
  applyColorLocked(color.value_or(kOffColor));
}

void ActuatorScheduler::setTemperature(int kelvin) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!accepting_) {
    logDebug("Ignoring temperature change, scheduler is shutting down");
    return;
  }
  if (kelvin == state_.temperature) {
    return;
  }
  logDebug("Requesting temperature change to %dK", kelvin);
  state_.temperature = kelvin;
  requestDispatchLocked();
}

void ActuatorScheduler::setTransitionDuration(uint32_t duration_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!accepting_) {
    return;
  }
  // Only affects the next command; does not trigger one.
  logDebug("Changing color transition duration to %ums", duration_ms);
  state_.transition_duration_ms = duration_ms;
}

void ActuatorScheduler::applyColorLocked(const Color& color) {
  if (color == state_.color) {
    return;
  }
  if (isLogEnabled(LogLevel::Debug)) {
    logDebug("Requesting color change to %s", colorToString(color).c_str());
  }
  state_.color = color;
  requestDispatchLocked();
}

void ActuatorScheduler::requestDispatchLocked() {
  if (pending_) {
    logDebug("Update already scheduled");
    return;
  }
  if (!connection_) {
    return;
  }
  Clock::time_point now = Clock::now();
  due_ = std::max(now, state_.last_send_time + rate_interval_);
  pending_ = true;
  wake_.notify_all();
}

// ---------------------------------------------------------------------------
// Dispatch loop
// ---------------------------------------------------------------------------

void ActuatorScheduler::dispatchLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    if (!pending_) {
      if (!running_) {
        break;
      }
      wake_.wait(lock);
      continue;
    }
    if (Clock::now() < due_) {
      wake_.wait_until(lock, due_);
      continue;
    }

    // Read the state as it is now, not as it was when the dispatch was
    // requested: every change made while waiting is included.
    pending_ = false;
    LightCommand command;
    command.color = state_.color;
    command.kelvin = state_.temperature;
    command.duration_ms = state_.transition_duration_ms;
    state_.last_send_time = Clock::now();
    ++commands_sent_;
    lock.unlock();

    if (isLogEnabled(LogLevel::Debug)) {
      logDebug("Sending %s %dK over %ums", colorToString(command.color).c_str(),
               command.kelvin, command.duration_ms);
    }
    connection_->sendColor(command);

    lock.lock();
  }
  logDebug("Exiting light update loop");
}

// ---------------------------------------------------------------------------
// Shutdown and queries
// ---------------------------------------------------------------------------

void ActuatorScheduler::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
      return;
    }
    shut_down_ = true;
    accepting_ = false;
    applyColorLocked(kOffColor);
    running_ = false;
    wake_.notify_all();
  }

  // The loop only exits once no dispatch is pending, so the off command
  // has been sent when join() returns.
  if (worker_.joinable()) {
    worker_.join();
  }
  if (!connection_) {
    return;
  }
  connection_->close();
  logDebug("Light connection closed after %llu commands",
           static_cast<unsigned long long>(commandsSent()));
}

ActuatorState ActuatorScheduler::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool ActuatorScheduler::hasPendingUpdate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_;
}

uint64_t ActuatorScheduler::commandsSent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return commands_sent_;
}

}  // namespace midilight
