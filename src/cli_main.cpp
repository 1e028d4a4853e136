/// @file
/// @brief CLI entry point: drive a LIFX light from a MIDI input.

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include "bridge.h"
#include "core/config.h"
#include "core/log.h"

namespace {

/// Exit codes.
constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitInvalidConfig = 2;
constexpr int kExitDeviceNotFound = 3;
constexpr int kExitInputError = 4;

std::atomic<bool> g_stop_requested{false};

void handleStopSignal(int /*signum*/) { g_stop_requested.store(true); }

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("midi-light - Use a LIFX light as a MIDI note visualizer\n\n");
  std::printf("Usage: midi-light [options]\n\n");
  std::printf("Options:\n");
  std::printf("  -p, --port NAME       Name of the virtual MIDI port to create (default %s)\n",
              midilight::kDefaultVirtualPortName);
  std::printf("  -i, --input PATH      Read raw MIDI instead (/dev/snd/midiC1D0, FIFO, - = stdin)\n");
  std::printf("  -c, --channels LIST   Channel(s) to listen on, comma separated (default 0)\n");
  std::printf("  -t, --transition MS   Initial transition duration for color changes\n");
  std::printf("      --rate MS         Minimum interval between light commands (default 50)\n");
  std::printf("      --min-kelvin K    Lowest color temperature (default 2500)\n");
  std::printf("      --max-kelvin K    Highest color temperature (default 9000)\n");
  std::printf("      --timeout MS      Light discovery timeout (default 5000)\n");
  std::printf("      --broadcast ADDR  Discovery broadcast address (default 255.255.255.255)\n");
  std::printf("  -d, --debug           Show debug logs\n");
  std::printf("  -h, --help            Show this help\n");
  std::printf("\nHue depends on notes, lightness on octaves and saturation on velocity.\n");
  std::printf("Pitch bend changes the color temperature, modulation (CC 1) the\n");
  std::printf("transition duration (value * 4 ms).\n");
}

/// @brief Parse an integer option value.
/// @return False if the text is not a whole decimal integer.
bool parseInt(const char* text, int& out) {
  char* end = nullptr;
  long value = std::strtol(text, &end, 10);
  if (end == text || *end != '\0' || value < -1000000000L || value > 1000000000L) {
    return false;
  }
  out = static_cast<int>(value);
  return true;
}

/// @brief Parse command-line arguments into a BridgeConfig.
/// @param argc Argument count from main().
/// @param argv Argument vector from main().
/// @param config Output configuration.
/// @param exit_code Set when the caller should exit immediately.
/// @return False if the program should exit (help or usage error).
bool parseArgs(int argc, char* argv[], midilight::BridgeConfig& config, int& exit_code) {
  for (int idx = 1; idx < argc; ++idx) {
    const char* arg = argv[idx];
    bool has_value = idx + 1 < argc;

    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      printUsage();
      exit_code = kExitOk;
      return false;
    }
    if (std::strcmp(arg, "--debug") == 0 || std::strcmp(arg, "-d") == 0) {
      config.debug = true;
      continue;
    }

    int* int_target = nullptr;
    if (std::strcmp(arg, "--transition") == 0 || std::strcmp(arg, "-t") == 0) {
      int_target = &config.initial_transition_ms;
    } else if (std::strcmp(arg, "--rate") == 0) {
      int_target = &config.rate_interval_ms;
    } else if (std::strcmp(arg, "--min-kelvin") == 0) {
      int_target = &config.min_kelvin;
    } else if (std::strcmp(arg, "--max-kelvin") == 0) {
      int_target = &config.max_kelvin;
    } else if (std::strcmp(arg, "--timeout") == 0) {
      int_target = &config.discovery_timeout_ms;
    }

    if (int_target != nullptr) {
      if (!has_value || !parseInt(argv[idx + 1], *int_target)) {
        std::fprintf(stderr, "Error: %s expects an integer\n", arg);
        exit_code = kExitUsage;
        return false;
      }
      ++idx;
    } else if ((std::strcmp(arg, "--channels") == 0 || std::strcmp(arg, "-c") == 0) &&
               has_value) {
      std::string error;
      if (!midilight::parseChannelList(argv[++idx], config.channels, error)) {
        std::fprintf(stderr, "Error: %s\n", error.c_str());
        exit_code = kExitUsage;
        return false;
      }
    } else if ((std::strcmp(arg, "--port") == 0 || std::strcmp(arg, "-p") == 0) &&
               has_value) {
      config.port_name = argv[++idx];
    } else if ((std::strcmp(arg, "--input") == 0 || std::strcmp(arg, "-i") == 0) &&
               has_value) {
      config.input_path = argv[++idx];
    } else if (std::strcmp(arg, "--broadcast") == 0 && has_value) {
      config.broadcast_address = argv[++idx];
    } else {
      std::fprintf(stderr, "Error: unknown or incomplete option '%s' (see --help)\n", arg);
      exit_code = kExitUsage;
      return false;
    }
  }
  return true;
}

int exitCodeFor(midilight::BridgeStatus status) {
  switch (status) {
    case midilight::BridgeStatus::Ok:                   return kExitOk;
    case midilight::BridgeStatus::InvalidConfiguration: return kExitInvalidConfig;
    case midilight::BridgeStatus::DeviceNotFound:       return kExitDeviceNotFound;
    case midilight::BridgeStatus::InputError:           return kExitInputError;
  }
  return kExitUsage;
}

}  // namespace

int main(int argc, char* argv[]) {
  midilight::BridgeConfig config;
  int exit_code = kExitOk;
  if (!parseArgs(argc, argv, config, exit_code)) {
    return exit_code;
  }

  midilight::setLogLevel(config.debug ? midilight::LogLevel::Debug
                                      : midilight::LogLevel::Info);

  std::signal(SIGINT, handleStopSignal);
  std::signal(SIGTERM, handleStopSignal);

  midilight::BridgeResult result = midilight::runBridge(config, &g_stop_requested);
  if (!result.success) {
    std::fprintf(stderr, "Error (%s): %s\n", midilight::bridgeStatusToString(result.status),
                 result.error_message.c_str());
    return exitCodeFor(result.status);
  }
  return kExitOk;
}
