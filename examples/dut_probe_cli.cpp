/**
 * @file dut_probe_cli.cpp
 * @brief Operator command line: find devices and run tests against them
 *
 * Usage:
 *   ./dut_probe_cli [--multicast ADDRESS:PORT] [-t SECONDS] [-v] discover
 *   ./dut_probe_cli [--multicast ADDRESS:PORT] [-t SECONDS] [-v] test [-d SECONDS] [-r MS] ADDRESS:PORT
 *
 * Example:
 *   ./dut_probe_cli discover
 *   ./dut_probe_cli -v test -d 5 -r 250 192.168.0.10:6062
 *
 * Ctrl+C during a test sends TEST;CMD=STOP; and the test ends once the device reports idle.
 */

#include "dut_probe/common/logging.hpp"
#include "dut_probe/common/network_options.hpp"
#include "dut_probe/discovery/discovery_client.hpp"
#include "dut_probe/protocol/discovery_record.hpp"
#include "dut_probe/protocol/status_sample.hpp"
#include "dut_probe/session/telemetry_summary.hpp"
#include "dut_probe/session/test_runner.hpp"
#include "dut_probe/session/test_session.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <charconv>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using dutprobe::ConfigureLogging;
using dutprobe::DiscoveryClient;
using dutprobe::Endpoint;
using dutprobe::FormatQuantity;
using dutprobe::NetworkOptions;
using dutprobe::ParseEndpoint;
using dutprobe::ParseTimeoutMs;
using dutprobe::SessionState;
using dutprobe::SortRecords;
using dutprobe::StatusSample;
using dutprobe::Summarize;
using dutprobe::TestParameters;
using dutprobe::TestRunner;

volatile std::sig_atomic_t g_stop_requested = 0;

void signal_handler([[maybe_unused]] int signal) {
  g_stop_requested = 1;
}

namespace {

void PrintUsage(char const *program) {
  std::cerr << "Usage: " << program << " [options] discover\n";
  std::cerr << "       " << program << " [options] test [-d SECONDS] [-r MS] ADDRESS:PORT\n";
  std::cerr << "\n";
  std::cerr << "Options:\n";
  std::cerr << "  --multicast ADDRESS:PORT  Discovery group (default: " << dutprobe::kDefaultMulticastAddress << ":"
            << dutprobe::kDefaultMulticastPort << ")\n";
  std::cerr << "  -t, --timeout SECONDS     Receive timeout (default: 1.0)\n";
  std::cerr << "  -v, --verbose             Log every datagram\n";
  std::cerr << "\n";
  std::cerr << "Test options:\n";
  std::cerr << "  -d, --duration SECONDS    Test duration (default: 2)\n";
  std::cerr << "  -r, --rate MS             Status report interval (default: 100)\n";
}

std::optional<uint32_t> ParseUnsigned(std::string_view text) {
  uint32_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return {};
  }
  return value;
}

int RunDiscover(NetworkOptions const &options) {
  DiscoveryClient client(options);
  auto devices = client.Discover(options.timeout_ms);
  if (!devices.has_value()) {
    std::cerr << "Error: " << devices.error().message << "\n";
    return 1;
  }

  SortRecords(*devices);
  std::cout << devices->size() << " devices responded to discovery:\n";
  for (auto const &device : *devices) {
    std::cout << fmt::format("{:<6} {:<12} {}:{}\n", device.model, device.serial, device.address, device.port);
  }
  return 0;
}

int RunTest(NetworkOptions const &options, Endpoint const &device, TestParameters const &parameters) {
  std::cout << "Start test on " << dutprobe::ToString(device) << " for " << parameters.duration_s
            << "s, status every " << parameters.rate_ms << "ms\n";
  TestRunner runner(device, parameters, options);
  auto connected = runner.Connect();
  if (!connected.ok()) {
    std::cerr << "Error: " << connected.error().message << "\n";
    return 1;
  }

  std::vector<StatusSample> samples;
  bool stop_sent = false;
  while (auto sample = runner.Next()) {
    std::string milliseconds = FormatQuantity(sample->elapsed_seconds * 1000.0, 0);
    std::cout << fmt::format("{:>6} milliseconds: {:>12} {:>12}\n", milliseconds,
                             FormatQuantity(sample->milliamps) + "mA", FormatQuantity(sample->millivolts) + "mV");
    samples.push_back(*sample);
    if (g_stop_requested != 0 && !stop_sent) {
      stop_sent = true;
      if (!runner.RequestStop()) {
        break;
      }
    }
  }

  if (auto summary = Summarize(samples)) {
    std::cout << fmt::format("Current mean {}mA, max {}mA, min {}mA\n", FormatQuantity(summary->milliamps.mean),
                             FormatQuantity(summary->milliamps.max), FormatQuantity(summary->milliamps.min));
    std::cout << fmt::format("Voltage mean  {}mV, max {}mV, min {}mV\n", FormatQuantity(summary->millivolts.mean),
                             FormatQuantity(summary->millivolts.max), FormatQuantity(summary->millivolts.min));
  } else {
    std::cout << "No status data received\n";
  }

  if (runner.GetState() == SessionState::kError) {
    std::cerr << "Error: " << runner.GetLastError()->message << "\n";
    return 1;
  }
  return 0;
}

}  // namespace

int main(int argc, const char *argv[]) {
  NetworkOptions options;
  TestParameters parameters;
  bool verbose = false;
  std::string command;
  std::optional<Endpoint> device;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    bool has_value = i + 1 < argc;

    if (arg == "-h" || arg == "--help") {
      PrintUsage(argv[0]);
      return 0;
    }
    if (arg == "-v" || arg == "--verbose") {
      verbose = true;
    } else if (arg == "--multicast" && has_value) {
      auto group = ParseEndpoint(argv[++i]);
      if (!group.has_value()) {
        std::cerr << "Error: " << group.error().message << "\n";
        return 2;
      }
      options.multicast = *group;
    } else if ((arg == "-t" || arg == "--timeout") && has_value) {
      auto timeout_ms = ParseTimeoutMs(argv[++i]);
      if (!timeout_ms.has_value()) {
        std::cerr << "Error: " << timeout_ms.error().message << "\n";
        return 2;
      }
      options.timeout_ms = *timeout_ms;
    } else if ((arg == "-d" || arg == "--duration") && has_value && command == "test") {
      auto value = ParseUnsigned(argv[++i]);
      if (!value.has_value()) {
        std::cerr << "Error: invalid duration '" << argv[i] << "'\n";
        return 2;
      }
      parameters.duration_s = *value;
    } else if ((arg == "-r" || arg == "--rate") && has_value && command == "test") {
      auto value = ParseUnsigned(argv[++i]);
      if (!value.has_value()) {
        std::cerr << "Error: invalid rate '" << argv[i] << "'\n";
        return 2;
      }
      parameters.rate_ms = *value;
    } else if (command.empty() && (arg == "discover" || arg == "test")) {
      command = arg;
    } else if (command == "test" && !device.has_value()) {
      auto endpoint = ParseEndpoint(arg);
      if (!endpoint.has_value()) {
        std::cerr << "Error: " << endpoint.error().message << "\n";
        return 2;
      }
      device = *endpoint;
    } else {
      std::cerr << "Error: unexpected argument '" << arg << "'\n";
      PrintUsage(argv[0]);
      return 2;
    }
  }

  ConfigureLogging(verbose);
  parameters.timeout_ms = options.timeout_ms;

  if (command == "discover") {
    return RunDiscover(options);
  }
  if (command == "test" && device.has_value()) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    return RunTest(options, *device, parameters);
  }

  PrintUsage(argv[0]);
  return 2;
}
