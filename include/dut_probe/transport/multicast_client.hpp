#pragma once

#include <cstdint>
#include <span>
#include <utility>
#include <vector>
#include "../common/network_options.hpp"
#include "../common/result.hpp"
#include "datagram.hpp"
#include "udp_socket.hpp"

namespace dutprobe {

/**
 * @brief Send one datagram to a multicast group and collect every reply
 *
 * Sender only: no group is joined. The outbound TTL (hop limit for IPv6) comes from
 * NetworkOptions::multicast_ttl. Replies are collected for one bounded window; the
 * window closing is the normal end of collection, not an error.
 */
class MulticastClient {
 public:
  explicit MulticastClient(NetworkOptions options = {})
      : options_(std::move(options)) {}

  /**
   * @brief Send message to group, then gather replies for timeout_ms
   * @param group Multicast address and port (a unicast address also works)
   * @param message Payload to send
   * @param timeout_ms Length of the collection window
   * @return Every datagram received in the window (possibly none), or kInvalidEndpoint / kSocketError
   */
  [[nodiscard]] Result<std::vector<Datagram>> BroadcastAndCollect(Endpoint const &group,
                                                                  std::span<const uint8_t> message,
                                                                  uint32_t timeout_ms) const;

  /**
   * @brief Open the sending socket with the configured multicast TTL (hop limit for AF_INET6)
   */
  [[nodiscard]] Result<UdpSocket> OpenSocket(int family) const;

  [[nodiscard]] NetworkOptions const &GetOptions() const noexcept { return options_; }

 private:
  NetworkOptions options_;
};

}  // namespace dutprobe
