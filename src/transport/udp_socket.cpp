#include "transport/udp_socket.hpp"
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include "common/error_code.hpp"
#include "common/network_options.hpp"
#include "common/result.hpp"

namespace dutprobe {

std::string ErrnoMessage(int error_number) {
  return std::string(std::strerror(error_number));
}

Result<SocketAddress> ResolveEndpoint(Endpoint const &endpoint) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_DGRAM;
  hints.ai_protocol = IPPROTO_UDP;
  hints.ai_flags = AI_NUMERICSERV;

  std::string port = std::to_string(endpoint.port);
  addrinfo *results = nullptr;
  int rc = ::getaddrinfo(endpoint.address.c_str(), port.c_str(), &hints, &results);
  if (rc != 0 || results == nullptr) {
    return MakeError(ErrorCode::kInvalidEndpoint,
                     "Could not resolve " + ToString(endpoint) + ": " + std::string(::gai_strerror(rc)));
  }

  SocketAddress address;
  std::memcpy(&address.storage, results->ai_addr, results->ai_addrlen);
  address.length = results->ai_addrlen;
  ::freeaddrinfo(results);
  return address;
}

Endpoint ToEndpoint(SocketAddress const &address) {
  char host[NI_MAXHOST] = {0};
  char service[NI_MAXSERV] = {0};
  if (::getnameinfo(address.Get(), address.length, host, sizeof(host), service, sizeof(service),
                    NI_NUMERICHOST | NI_NUMERICSERV) != 0) {
    return {};
  }
  return Endpoint{host, static_cast<uint16_t>(std::strtoul(service, nullptr, 10))};
}

Result<UdpSocket> UdpSocket::Open(int family) {
  int fd = ::socket(family, SOCK_DGRAM, IPPROTO_UDP);
  if (fd < 0) {
    return MakeError(ErrorCode::kSocketError, "socket() failed: " + ErrnoMessage(errno));
  }
  return UdpSocket(fd);
}

Status UdpSocket::Bind(SocketAddress const &address) {
  if (::bind(fd_, address.Get(), address.length) != 0) {
    return MakeError(ErrorCode::kSocketError, "bind() failed: " + ErrnoMessage(errno));
  }
  return Status::Ok();
}

Status UdpSocket::BindAny(int family, uint16_t port) {
  SocketAddress local;
  if (family == AF_INET6) {
    auto *in6 = reinterpret_cast<sockaddr_in6 *>(&local.storage);
    in6->sin6_family = AF_INET6;
    in6->sin6_addr = in6addr_any;
    in6->sin6_port = htons(port);
    local.length = sizeof(sockaddr_in6);
  } else {
    auto *in4 = reinterpret_cast<sockaddr_in *>(&local.storage);
    in4->sin_family = AF_INET;
    in4->sin_addr.s_addr = htonl(INADDR_ANY);
    in4->sin_port = htons(port);
    local.length = sizeof(sockaddr_in);
  }

  return Bind(local);
}

Result<bool> UdpSocket::WaitReadable(uint32_t timeout_ms) const {
  if (fd_ < 0) {
    return MakeError(ErrorCode::kSocketError, "Socket closed");
  }

  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (true) {
    auto remaining =
        std::chrono::duration_cast<std::chrono::microseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() < 0) {
      remaining = std::chrono::microseconds(0);
    }

    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(fd_, &fds);
    struct timeval tv {};
    tv.tv_sec = static_cast<time_t>(remaining.count() / 1000000);
    tv.tv_usec = static_cast<suseconds_t>(remaining.count() % 1000000);

    int ret = ::select(fd_ + 1, &fds, nullptr, nullptr, &tv);
    if (ret > 0) {
      return true;
    }
    if (ret == 0) {
      return false;
    }
    if (errno != EINTR) {
      return MakeError(ErrorCode::kSocketError, "select() failed: " + ErrnoMessage(errno));
    }
  }
}

Result<Endpoint> UdpSocket::GetLocalEndpoint() const {
  SocketAddress local;
  local.length = sizeof(local.storage);
  if (::getsockname(fd_, local.Get(), &local.length) != 0) {
    return MakeError(ErrorCode::kSocketError, "getsockname() failed: " + ErrnoMessage(errno));
  }
  return ToEndpoint(local);
}

void UdpSocket::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

}  // namespace dutprobe
