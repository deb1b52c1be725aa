#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace dutprobe {

/**
 * @brief One received UDP datagram and its sender
 */
struct Datagram {
  std::string address{};
  uint16_t port{0};
  std::vector<uint8_t> payload{};

  friend bool operator==(Datagram const &, Datagram const &) = default;
};

}  // namespace dutprobe
