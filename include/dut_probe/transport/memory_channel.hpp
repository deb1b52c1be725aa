#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "../common/byte_helpers.hpp"
#include "../common/error_code.hpp"
#include "../common/result.hpp"
#include "datagram_channel.hpp"

namespace dutprobe {

/**
 * @brief Memory-based channel implementation for testing
 *
 * Inbound datagrams (or errors) are scripted up front and handed out in order by Receive().
 * Once the script is exhausted Receive() reports kTimeout immediately, which is how a
 * silent device looks to the session. Everything sent is recorded.
 */
class MemoryChannel : public DatagramChannel {
 public:
  // DatagramChannel interface
  [[nodiscard]] Status Send(std::span<const uint8_t> payload) override {
    if (!open_) {
      return MakeError(ErrorCode::kSocketError, "Channel closed");
    }
    if (send_error_.has_value()) {
      return *send_error_;
    }
    sent_.emplace_back(payload.begin(), payload.end());
    return Status::Ok();
  }

  [[nodiscard]] Result<std::vector<uint8_t>> Receive([[maybe_unused]] uint32_t timeout_ms) override {
    if (!open_) {
      return MakeError(ErrorCode::kSocketError, "Channel closed");
    }
    if (inbound_.empty()) {
      return MakeError(ErrorCode::kTimeout, "No datagram received");
    }
    Result<std::vector<uint8_t>> next = std::move(inbound_.front());
    inbound_.pop_front();
    ++receive_count_;
    return next;
  }

  void Close() override { open_ = false; }

  [[nodiscard]] bool IsOpen() const override { return open_; }

  // MemoryChannel-specific methods
  /**
   * @brief Queue a datagram that Receive() will return
   */
  void PushInbound(std::string_view payload) { inbound_.emplace_back(ToBytes(payload)); }

  void PushInbound(std::span<const uint8_t> payload) {
    inbound_.emplace_back(std::vector<uint8_t>(payload.begin(), payload.end()));
  }

  /**
   * @brief Queue an error that Receive() will return in place of a datagram
   */
  void PushInboundError(ErrorCode code) { inbound_.emplace_back(MakeError(code, std::string(ToString(code)))); }

  /**
   * @brief Make every following Send() fail with the given code
   */
  void FailSends(ErrorCode code) { send_error_ = MakeError(code, std::string(ToString(code))); }

  [[nodiscard]] std::vector<std::vector<uint8_t>> const &GetSentData() const { return sent_; }

  [[nodiscard]] size_t PendingInbound() const { return inbound_.size(); }

  [[nodiscard]] size_t ReceiveCount() const { return receive_count_; }

 private:
  std::deque<Result<std::vector<uint8_t>>> inbound_{};
  std::vector<std::vector<uint8_t>> sent_{};
  std::optional<Error> send_error_{};
  size_t receive_count_{0};
  bool open_{true};
};

}  // namespace dutprobe
