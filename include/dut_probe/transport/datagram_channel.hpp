#pragma once

#include <cstdint>
#include <span>
#include <vector>
#include "../common/result.hpp"

namespace dutprobe {

/**
 * @brief Abstract point-to-point datagram exchange with a single peer
 *
 * This interface lets the test session work against a real UDP socket or an in-memory
 * script without knowing which. Each Receive() returns exactly one datagram payload;
 * repeated calls form a lazy, non-restartable sequence.
 */
class DatagramChannel {
 public:
  virtual ~DatagramChannel() = default;

  /**
   * @brief Send one datagram to the peer
   * @return Ok, kConnectionRefused if the OS reported the peer unreachable, kSocketError otherwise
   */
  [[nodiscard]] virtual Status Send(std::span<const uint8_t> payload) = 0;

  /**
   * @brief Block for the next datagram from the peer
   * @param timeout_ms Maximum time to wait
   * @return Payload, kTimeout when nothing arrived in time, kConnectionRefused, or kSocketError
   */
  [[nodiscard]] virtual Result<std::vector<uint8_t>> Receive(uint32_t timeout_ms) = 0;

  /**
   * @brief Release the underlying resource; safe to call more than once
   */
  virtual void Close() = 0;

  [[nodiscard]] virtual bool IsOpen() const = 0;
};

}  // namespace dutprobe
