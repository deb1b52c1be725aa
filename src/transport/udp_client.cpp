#include "transport/udp_client.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <cerrno>
#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "common/byte_helpers.hpp"
#include "common/error_code.hpp"
#include "common/result.hpp"
#include "transport/udp_socket.hpp"

namespace dutprobe {

Error UdpClient::SocketFailure(char const *operation, int error_number) const {
  if (error_number == ECONNREFUSED) {
    return MakeError(ErrorCode::kConnectionRefused, "Connection refused by " + ToString(peer_));
  }
  return MakeError(ErrorCode::kSocketError, std::string(operation) + "() failed: " + ErrnoMessage(error_number));
}

Status UdpClient::Connect() {
  auto address = ResolveEndpoint(peer_);
  if (!address.has_value()) {
    return std::move(address).error();
  }

  auto socket = UdpSocket::Open(address->GetFamily());
  if (!socket.has_value()) {
    return std::move(socket).error();
  }
  socket_ = std::move(socket).value();

  auto bound = socket_.BindAny(address->GetFamily());
  if (!bound.ok()) {
    Close();
    return bound;
  }

  if (::connect(socket_.GetFd(), address->Get(), address->length) != 0) {
    Error error = SocketFailure("connect", errno);
    Close();
    return error;
  }

  spdlog::debug("Connected to {}", ToString(peer_));
  return Status::Ok();
}

Status UdpClient::Send(std::span<const uint8_t> payload) {
  if (!socket_.IsOpen()) {
    return MakeError(ErrorCode::kSocketError, "Socket closed");
  }

  ssize_t n = ::send(socket_.GetFd(), payload.data(), payload.size(), 0);
  if (n < 0) {
    return SocketFailure("send", errno);
  }
  if (static_cast<size_t>(n) != payload.size()) {
    return MakeError(ErrorCode::kSocketError, "Short send to " + ToString(peer_));
  }

  spdlog::debug("Sent: {}", FormatBytes(payload));
  return Status::Ok();
}

Result<std::vector<uint8_t>> UdpClient::Receive(uint32_t timeout_ms) {
  auto readable = socket_.WaitReadable(timeout_ms);
  if (!readable.has_value()) {
    return std::move(readable).error();
  }
  if (!*readable) {
    return MakeError(ErrorCode::kTimeout, "No response from " + ToString(peer_) + " within " +
                                              std::to_string(timeout_ms) + "ms");
  }

  ssize_t n;
  do {
    n = ::recv(socket_.GetFd(), buffer_.data(), buffer_.size(), 0);
  } while (n < 0 && errno == EINTR);
  if (n < 0) {
    return SocketFailure("recv", errno);
  }

  std::vector<uint8_t> payload(buffer_.begin(), buffer_.begin() + n);
  spdlog::debug("Received: {}", FormatBytes(payload));
  return payload;
}

void UdpClient::Close() {
  if (socket_.IsOpen()) {
    socket_.Close();
    spdlog::debug("Closed connection to {}", ToString(peer_));
  }
}

}  // namespace dutprobe
