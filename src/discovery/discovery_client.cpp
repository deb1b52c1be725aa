#include "discovery/discovery_client.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>
#include "common/network_options.hpp"
#include "common/result.hpp"
#include "protocol/commands.hpp"
#include "protocol/discovery_record.hpp"
#include "protocol/message_codec.hpp"
#include "transport/datagram.hpp"

namespace dutprobe {

Result<std::vector<DiscoveryRecord>> DiscoveryClient::Discover(uint32_t timeout_ms) const {
  return Discover(options_.multicast, timeout_ms);
}

Result<std::vector<DiscoveryRecord>> DiscoveryClient::Discover(Endpoint const &group, uint32_t timeout_ms) const {
  spdlog::info("Send multicast UDP discovery message to find devices");
  auto probe = MessageCodec::Encode(MakeDiscoveryProbe());
  auto found = multicast_.BroadcastAndCollect(group, probe, timeout_ms);
  if (!found.has_value()) {
    spdlog::error("Discovery failed: {}", found.error().message);
    return std::move(found).error();
  }

  auto devices = ParseResponses(*found);
  spdlog::info("{} devices found after waiting {}ms", devices.size(), timeout_ms);
  return devices;
}

std::vector<DiscoveryRecord> DiscoveryClient::ParseResponses(std::span<const Datagram> datagrams) {
  std::vector<DiscoveryRecord> devices;
  devices.reserve(datagrams.size());
  for (auto const &datagram : datagrams) {
    auto device = DiscoveryRecord::FromDatagram(datagram);
    if (!device.has_value()) {
      spdlog::error("{} (from {}:{})", device.error().message, datagram.address, datagram.port);
      continue;
    }
    devices.push_back(std::move(device).value());
  }
  return devices;
}

}  // namespace dutprobe
