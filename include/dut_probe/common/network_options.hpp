#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include "result.hpp"

namespace dutprobe {

inline constexpr std::string_view kDefaultMulticastAddress = "224.3.11.15";
inline constexpr uint16_t kDefaultMulticastPort = 31115;
inline constexpr int kDefaultMulticastTtl = 2;
inline constexpr size_t kMaxDatagramSize = 65535;
inline constexpr uint32_t kDefaultTimeoutMs = 1000;

/**
 * @brief IP address (or host name) and UDP port of a peer
 */
struct Endpoint {
  std::string address{};
  uint16_t port{0};

  friend bool operator==(Endpoint const &, Endpoint const &) = default;
};

/**
 * @brief Parse "address:port", splitting on the last colon
 *
 * The address part is not validated here; resolution happens when a socket is opened.
 * "::1:6060" therefore yields {"::1", 6060}.
 *
 * @return Endpoint, or kInvalidEndpoint when the port is missing or not an integer in 0-65535
 */
[[nodiscard]] Result<Endpoint> ParseEndpoint(std::string_view text);

[[nodiscard]] std::string ToString(Endpoint const &endpoint);

/**
 * @brief Parse a timeout given in (possibly fractional) seconds, e.g. "1.5"
 * @return Whole milliseconds, or kInvalidField when the text is not a finite, non-negative
 *         number of seconds that fits in uint32_t milliseconds
 */
[[nodiscard]] Result<uint32_t> ParseTimeoutMs(std::string_view seconds);

/**
 * @brief Network settings threaded into the discovery client and transports
 */
struct NetworkOptions {
  /** Group the discovery probe is sent to */
  Endpoint multicast{std::string(kDefaultMulticastAddress), kDefaultMulticastPort};
  /** Outbound multicast hop limit for the discovery probe */
  int multicast_ttl{kDefaultMulticastTtl};
  /** Receive buffer size; larger datagrams are truncated by the OS */
  size_t max_datagram_size{kMaxDatagramSize};
  /** Default receive timeout for discovery windows and test sessions */
  uint32_t timeout_ms{kDefaultTimeoutMs};
};

}  // namespace dutprobe
