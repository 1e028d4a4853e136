/// @file
/// @brief Bridge runner implementation.

#include "bridge.h"

#include <utility>

#include "core/color.h"
#include "core/log.h"
#include "event_router.h"
#include "light/actuator_scheduler.h"
#include "light/lifx_connection.h"
#include "midi/virtual_midi_input.h"

namespace midilight {

namespace {

BridgeResult makeFailure(BridgeStatus status, std::string message) {
  BridgeResult result;
  result.success = false;
  result.status = status;
  result.error_message = std::move(message);
  return result;
}

}  // namespace

const char* bridgeStatusToString(BridgeStatus status) {
  switch (status) {
    case BridgeStatus::Ok:                   return "ok";
    case BridgeStatus::InvalidConfiguration: return "invalid configuration";
    case BridgeStatus::DeviceNotFound:       return "device not found";
    case BridgeStatus::InputError:           return "input error";
  }
  return "unknown";
}

BridgeResult runBridge(const BridgeConfig& config, IEventSource& source,
                       std::unique_ptr<ILightConnection> connection) {
  std::string error;
  if (!validateConfig(config, error)) {
    return makeFailure(BridgeStatus::InvalidConfiguration, error);
  }
  if (!connection) {
    return makeFailure(BridgeStatus::DeviceNotFound, "No light connection");
  }

  SchedulerOptions options;
  options.rate_interval_ms = config.rate_interval_ms;
  options.initial_transition_ms = static_cast<uint32_t>(config.initial_transition_ms);
  options.initial_temperature =
      pitchToTemperature(0, config.min_kelvin, config.max_kelvin).value_or(config.min_kelvin);

  logInfo("Connected to '%s' at %s", connection->label().c_str(),
          connection->address().c_str());

  ActuatorScheduler scheduler(std::move(connection), options);

  RouterConfig router_config;
  router_config.channels = config.channels;
  router_config.min_kelvin = config.min_kelvin;
  router_config.max_kelvin = config.max_kelvin;
  EventRouter router(scheduler, router_config);

  logInfo("Listening for MIDI events on channel(s) %s",
          channelsToString(config.channels).c_str());
  router.run(source);

  scheduler.shutdown();

  BridgeResult result;
  result.success = true;
  result.status = BridgeStatus::Ok;
  result.events_handled = router.eventsHandled();
  result.events_dropped = router.eventsDropped();
  result.commands_sent = scheduler.commandsSent();
  logInfo("Stopped: %zu events handled, %zu dropped, %llu commands sent",
          result.events_handled, result.events_dropped,
          static_cast<unsigned long long>(result.commands_sent));
  return result;
}

BridgeResult runBridge(const BridgeConfig& config, const std::atomic<bool>* stop) {
  std::string error;
  if (!validateConfig(config, error)) {
    return makeFailure(BridgeStatus::InvalidConfiguration, error);
  }

  // A raw input path takes precedence over the virtual port.
  std::unique_ptr<IEventSource> source;
  if (!config.input_path.empty()) {
    auto input = std::make_unique<FdMidiInput>();
    if (!input->open(config.input_path)) {
      return makeFailure(BridgeStatus::InputError, input->getError());
    }
    input->setStopFlag(stop);
    logInfo("Reading MIDI from %s",
            config.input_path == "-" ? "stdin" : config.input_path.c_str());
    source = std::move(input);
  } else {
    auto port = std::make_unique<VirtualMidiInput>();
    if (!port->open(config.port_name)) {
      return makeFailure(BridgeStatus::InputError, port->getError());
    }
    port->setStopFlag(stop);
    source = std::move(port);
  }

  LifxDiscovery discovery(config.broadcast_address, config.discovery_timeout_ms);
  discovery.setStopFlag(stop);
  std::unique_ptr<LifxConnection> light = discovery.connect();
  if (!light) {
    if (discovery.wasCancelled()) {
      logInfo("Stopped before a light was found");
      BridgeResult result;
      result.success = true;
      result.status = BridgeStatus::Ok;
      return result;
    }
    return makeFailure(BridgeStatus::DeviceNotFound, discovery.getError());
  }

  return runBridge(config, *source, std::move(light));
}

}  // namespace midilight
