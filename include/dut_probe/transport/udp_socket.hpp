#pragma once

#include <cstdint>
#include <string>
#include <sys/socket.h>
#include "../common/network_options.hpp"
#include "../common/result.hpp"

namespace dutprobe {

/**
 * @brief Resolved socket address (IPv4 or IPv6)
 */
struct SocketAddress {
  sockaddr_storage storage{};
  socklen_t length{0};

  [[nodiscard]] int GetFamily() const noexcept { return storage.ss_family; }
  [[nodiscard]] sockaddr const *Get() const noexcept { return reinterpret_cast<sockaddr const *>(&storage); }
  [[nodiscard]] sockaddr *Get() noexcept { return reinterpret_cast<sockaddr *>(&storage); }
};

/**
 * @brief Resolve a numeric address or host name for UDP
 * @return First usable address, or kInvalidEndpoint
 */
[[nodiscard]] Result<SocketAddress> ResolveEndpoint(Endpoint const &endpoint);

/**
 * @brief Numeric address and port of a socket address
 */
[[nodiscard]] Endpoint ToEndpoint(SocketAddress const &address);

/**
 * @brief Text for the current errno, for error messages
 */
[[nodiscard]] std::string ErrnoMessage(int error_number);

/**
 * @brief Owning wrapper for a UDP socket file descriptor
 *
 * Takes ownership of the descriptor; closes it in the destructor. Move-only.
 */
class UdpSocket {
 public:
  UdpSocket() = default;

  explicit UdpSocket(int fd)
      : fd_(fd) {}

  ~UdpSocket() { Close(); }

  UdpSocket(const UdpSocket &) = delete;
  UdpSocket &operator=(const UdpSocket &) = delete;

  UdpSocket(UdpSocket &&other) noexcept
      : fd_(other.fd_) {
    other.fd_ = -1;
  }

  UdpSocket &operator=(UdpSocket &&other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  /**
   * @brief Create a datagram socket
   * @param family AF_INET or AF_INET6
   */
  [[nodiscard]] static Result<UdpSocket> Open(int family);

  [[nodiscard]] Status Bind(SocketAddress const &address);

  /**
   * @brief Bind to the wildcard address of the socket's family
   * @param port Local port, 0 for an ephemeral one
   */
  [[nodiscard]] Status BindAny(int family, uint16_t port = 0);

  /**
   * @brief Wait until a datagram can be read
   * @param timeout_ms Maximum time to wait
   * @return true when readable, false on timeout, kSocketError if the wait failed
   */
  [[nodiscard]] Result<bool> WaitReadable(uint32_t timeout_ms) const;

  /**
   * @brief Local address the socket is bound to
   */
  [[nodiscard]] Result<Endpoint> GetLocalEndpoint() const;

  [[nodiscard]] int GetFd() const noexcept { return fd_; }
  [[nodiscard]] bool IsOpen() const noexcept { return fd_ >= 0; }

  void Close();

 private:
  int fd_{-1};
};

}  // namespace dutprobe
