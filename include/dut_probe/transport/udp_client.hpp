#pragma once

#include <cstdint>
#include <span>
#include <utility>
#include <vector>
#include "../common/network_options.hpp"
#include "../common/result.hpp"
#include "datagram_channel.hpp"
#include "udp_socket.hpp"

namespace dutprobe {

/**
 * @brief DatagramChannel over a connected UDP socket (client - one fixed peer)
 *
 * Connect() binds an ephemeral local port and sets the peer as default destination, so
 * the kernel only delivers datagrams from that peer. An ICMP port-unreachable from the
 * peer surfaces as kConnectionRefused on the next Send() or Receive().
 *
 * Usage:
 *   UdpClient client({"192.168.0.10", 6062});
 *   if (client.Connect()) {
 *     (void)client.Send(payload);
 *     auto reply = client.Receive(1000);
 *   }
 */
class UdpClient : public DatagramChannel {
 public:
  explicit UdpClient(Endpoint peer, NetworkOptions const &options = {})
      : peer_(std::move(peer)),
        buffer_(options.max_datagram_size) {}

  ~UdpClient() override { Close(); }

  UdpClient(const UdpClient &) = delete;
  UdpClient &operator=(const UdpClient &) = delete;

  /**
   * @brief Resolve the peer, open and connect the socket
   * @return Ok, kInvalidEndpoint, or kSocketError
   */
  [[nodiscard]] Status Connect();

  // DatagramChannel interface
  [[nodiscard]] Status Send(std::span<const uint8_t> payload) override;
  [[nodiscard]] Result<std::vector<uint8_t>> Receive(uint32_t timeout_ms) override;
  void Close() override;
  [[nodiscard]] bool IsOpen() const override { return socket_.IsOpen(); }

  [[nodiscard]] Endpoint const &GetPeer() const noexcept { return peer_; }

 private:
  [[nodiscard]] Error SocketFailure(char const *operation, int error_number) const;

  Endpoint peer_;
  UdpSocket socket_{};
  std::vector<uint8_t> buffer_;
};

}  // namespace dutprobe
