#pragma once

#include <cstdint>
#include <span>
#include <utility>
#include <vector>
#include "../common/network_options.hpp"
#include "../common/result.hpp"
#include "../protocol/discovery_record.hpp"
#include "../transport/datagram.hpp"
#include "../transport/multicast_client.hpp"

namespace dutprobe {

/**
 * @brief Find device simulators on the network with the multicast "ID;" probe
 *
 * Discovery is best effort: a responder that sends garbage is logged and skipped, and
 * the devices that answered properly are still returned. No ordering is applied; use
 * SortRecords() for presentation.
 */
class DiscoveryClient {
 public:
  explicit DiscoveryClient(NetworkOptions options = {})
      : multicast_(options),
        options_(std::move(options)) {}

  /**
   * @brief Probe the configured multicast group (NetworkOptions::multicast)
   * @param timeout_ms How long to collect replies; blocks for the whole window
   */
  [[nodiscard]] Result<std::vector<DiscoveryRecord>> Discover(uint32_t timeout_ms) const;

  /**
   * @brief Probe an explicit group address and port
   * @return Devices found (possibly none), or the transport failure
   */
  [[nodiscard]] Result<std::vector<DiscoveryRecord>> Discover(Endpoint const &group, uint32_t timeout_ms) const;

  /**
   * @brief Convert raw replies to records, logging and dropping the invalid ones
   */
  [[nodiscard]] static std::vector<DiscoveryRecord> ParseResponses(std::span<const Datagram> datagrams);

 private:
  MulticastClient multicast_;
  NetworkOptions options_;
};

}  // namespace dutprobe
