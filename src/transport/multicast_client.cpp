#include "transport/multicast_client.hpp"
#include <netinet/in.h>
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <span>
#include <vector>
#include "common/byte_helpers.hpp"
#include "common/error_code.hpp"
#include "common/result.hpp"
#include "transport/datagram.hpp"
#include "transport/udp_socket.hpp"

namespace dutprobe {

namespace {

Status SetMulticastTtl(UdpSocket const &socket, int family, int ttl) {
  int rc = (family == AF_INET6) ? ::setsockopt(socket.GetFd(), IPPROTO_IPV6, IPV6_MULTICAST_HOPS, &ttl, sizeof(ttl))
                                : ::setsockopt(socket.GetFd(), IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));
  if (rc != 0) {
    return MakeError(ErrorCode::kSocketError, "setsockopt(multicast ttl) failed: " + ErrnoMessage(errno));
  }
  return Status::Ok();
}

}  // namespace

Result<UdpSocket> MulticastClient::OpenSocket(int family) const {
  auto opened = UdpSocket::Open(family);
  if (!opened.has_value()) {
    return std::move(opened).error();
  }
  UdpSocket socket = std::move(opened).value();

  auto ttl_set = SetMulticastTtl(socket, family, options_.multicast_ttl);
  if (!ttl_set.ok()) {
    return std::move(ttl_set).error();
  }
  return socket;
}

Result<std::vector<Datagram>> MulticastClient::BroadcastAndCollect(Endpoint const &group,
                                                                   std::span<const uint8_t> message,
                                                                   uint32_t timeout_ms) const {
  auto address = ResolveEndpoint(group);
  if (!address.has_value()) {
    return std::move(address).error();
  }

  auto opened = OpenSocket(address->GetFamily());
  if (!opened.has_value()) {
    return std::move(opened).error();
  }
  UdpSocket socket = std::move(opened).value();

  ssize_t sent = ::sendto(socket.GetFd(), message.data(), message.size(), 0, address->Get(), address->length);
  if (sent < 0) {
    return MakeError(ErrorCode::kSocketError, "sendto() " + ToString(group) + " failed: " + ErrnoMessage(errno));
  }
  spdlog::debug("Sent {} to {}", FormatBytes(message), ToString(group));

  // One window for all replies, not a fresh timeout per datagram
  std::vector<Datagram> datagrams;
  std::vector<uint8_t> buffer(options_.max_datagram_size);
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (true) {
    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      break;
    }

    auto readable = socket.WaitReadable(static_cast<uint32_t>(remaining.count()));
    if (!readable.has_value()) {
      return std::move(readable).error();
    }
    if (!*readable) {
      break;
    }

    SocketAddress sender;
    sender.length = sizeof(sender.storage);
    ssize_t n = ::recvfrom(socket.GetFd(), buffer.data(), buffer.size(), 0, sender.Get(), &sender.length);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return MakeError(ErrorCode::kSocketError, "recvfrom() failed: " + ErrnoMessage(errno));
    }

    Endpoint source = ToEndpoint(sender);
    Datagram datagram{source.address, source.port, std::vector<uint8_t>(buffer.begin(), buffer.begin() + n)};
    spdlog::debug("Got {} from {}", FormatBytes(datagram.payload), ToString(source));
    datagrams.push_back(std::move(datagram));
  }

  return datagrams;
}

}  // namespace dutprobe
