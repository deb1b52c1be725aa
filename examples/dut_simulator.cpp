/**
 * @file dut_simulator.cpp
 * @brief Runnable DUT simulator for use with dut_probe_cli
 *
 * Joins the discovery multicast group, answers "ID;" with its model and serial, and runs
 * timed tests on TEST;CMD=START.
 *
 * Usage:
 *   ./dut_simulator [model] [serial] [bind_address] [port]
 *
 * Example:
 *   ./dut_simulator M001 SN0123457
 *   ./dut_simulator M002 SN9000001 0.0.0.0 31115
 */

#include "device_simulator.hpp"
#include "dut_probe/common/logging.hpp"
#include "dut_probe/common/network_options.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

using dutprobe::ConfigureLogging;
using dutprobe::DeviceSimulator;
using dutprobe::kDefaultMulticastAddress;
using dutprobe::kDefaultMulticastPort;

volatile std::sig_atomic_t g_running = 1;

void signal_handler([[maybe_unused]] int signal) {
  g_running = 0;
}

int main(int argc, const char *argv[]) {
  if (argc >= 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
    std::cerr << "Usage: " << argv[0] << " [model] [serial] [bind_address] [port]\n";
    std::cerr << "\n";
    std::cerr << "Arguments:\n";
    std::cerr << "  model         Model reported in the ID reply (default: M001)\n";
    std::cerr << "  serial        Serial reported in the ID reply (default: SN0123456)\n";
    std::cerr << "  bind_address  Address to bind (default: 0.0.0.0)\n";
    std::cerr << "  port          UDP port (default: " << kDefaultMulticastPort << ")\n";
    std::cerr << "\n";
    std::cerr << "Find it with:\n";
    std::cerr << "  dut_probe_cli discover\n";
    return 0;
  }

  DeviceSimulator::Identity identity;
  if (argc >= 2) {
    identity.model = argv[1];
  }
  if (argc >= 3) {
    identity.serial = argv[2];
  }
  const std::string bind_address = (argc >= 4) ? argv[3] : "0.0.0.0";
  const uint16_t port = (argc >= 5) ? static_cast<uint16_t>(std::atoi(argv[4])) : kDefaultMulticastPort;

  ConfigureLogging(false);
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  DeviceSimulator device(identity);
  auto opened = device.Open(bind_address, port);
  if (!opened.ok()) {
    std::cerr << "Error: " << opened.error().message << "\n";
    std::cerr << "  Check that the port is not in use.\n";
    return 1;
  }
  auto joined = device.JoinGroup(std::string(kDefaultMulticastAddress));
  if (!joined.ok()) {
    spdlog::warn("Not joined to {}: {}", kDefaultMulticastAddress, joined.error().message);
  }

  std::cout << "DUT Simulator\n";
  std::cout << "  Model: " << identity.model << "\n";
  std::cout << "  Serial: " << identity.serial << "\n";
  std::cout << "  Bind: " << bind_address << ":" << device.GetEndpoint().port << "\n";
  std::cout << "  Group: " << kDefaultMulticastAddress << "\n";
  std::cout << "\n";
  std::cout << "Waiting for requests... Press Ctrl+C to stop\n\n";

  device.Start();
  while (g_running != 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  device.Stop();

  std::cout << "\nShutdown. Messages received: " << device.GetReceived().size() << "\n";
  return 0;
}
