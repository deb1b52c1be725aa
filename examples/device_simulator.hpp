/**
 * @file device_simulator.hpp
 * @brief In-process DUT simulator speaking the ID/TEST/STATUS protocol over UDP
 *
 * Answers the discovery probe and runs timed tests, streaming STATUS telemetry to the
 * operator that started them. Used by the end-to-end tests (bound to loopback on an
 * ephemeral port) and by the runnable dut_simulator example (bound to the multicast port).
 *
 * Usage:
 *   DeviceSimulator device({"M001", "SN0123456"});
 *   if (device.Open("127.0.0.1", 0)) {
 *     device.Start();
 *     ...  // talk to device.GetEndpoint()
 *     device.Stop();
 *   }
 */

#pragma once

#include "dut_probe/common/byte_helpers.hpp"
#include "dut_probe/common/error_code.hpp"
#include "dut_probe/common/network_options.hpp"
#include "dut_probe/common/result.hpp"
#include "dut_probe/protocol/device_message.hpp"
#include "dut_probe/protocol/message_codec.hpp"
#include "dut_probe/protocol/wire_names.hpp"
#include "dut_probe/transport/udp_socket.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <algorithm>
#include <atomic>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace dutprobe {

/**
 * @brief Model and serial a simulated device reports in its ID reply
 */
struct SimulatorIdentity {
  std::string model{"M001"};
  std::string serial{"SN0123456"};
};

class DeviceSimulator {
 public:
  using Identity = SimulatorIdentity;

  explicit DeviceSimulator(Identity identity = {})
      : identity_(std::move(identity)) {}

  ~DeviceSimulator() { Stop(); }

  DeviceSimulator(const DeviceSimulator &) = delete;
  DeviceSimulator &operator=(const DeviceSimulator &) = delete;

  /**
   * @brief Bind the device socket
   * @param bind_address Local address, e.g. "127.0.0.1" or "0.0.0.0"
   * @param port Local port, 0 for an ephemeral one (see GetEndpoint())
   */
  [[nodiscard]] Status Open(std::string const &bind_address, uint16_t port) {
    auto address = ResolveEndpoint({bind_address, port});
    if (!address.has_value()) {
      return std::move(address).error();
    }
    auto opened = UdpSocket::Open(address->GetFamily());
    if (!opened.has_value()) {
      return std::move(opened).error();
    }
    socket_ = std::move(opened).value();

    int reuse = 1;
    if (::setsockopt(socket_.GetFd(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) != 0) {
      return MakeError(ErrorCode::kSocketError, "setsockopt(SO_REUSEADDR) failed: " + ErrnoMessage(errno));
    }
    auto bound = socket_.Bind(*address);
    if (!bound.ok()) {
      return bound;
    }
    auto local = socket_.GetLocalEndpoint();
    if (!local.has_value()) {
      return std::move(local).error();
    }
    endpoint_ = *local;
    return Status::Ok();
  }

  /**
   * @brief Subscribe to an IPv4 multicast group so probes sent to it arrive here
   */
  [[nodiscard]] Status JoinGroup(std::string const &group) {
    ip_mreq request{};
    if (::inet_pton(AF_INET, group.c_str(), &request.imr_multiaddr) != 1) {
      return MakeError(ErrorCode::kInvalidEndpoint, "Not an IPv4 multicast group: " + group);
    }
    request.imr_interface.s_addr = htonl(INADDR_ANY);
    if (::setsockopt(socket_.GetFd(), IPPROTO_IP, IP_ADD_MEMBERSHIP, &request, sizeof(request)) != 0) {
      return MakeError(ErrorCode::kSocketError, "setsockopt(IP_ADD_MEMBERSHIP) failed: " + ErrnoMessage(errno));
    }
    return Status::Ok();
  }

  /**
   * @brief Reply to "ID;" with this raw text instead of the identity; empty optional = stay silent
   */
  void SetIdReply(std::optional<std::string> reply) {
    std::lock_guard lock(mutex_);
    id_reply_override_ = std::move(reply);
    id_reply_overridden_ = true;
  }

  /**
   * @brief Answer TEST;CMD=START with exactly these datagrams, sent back to back
   *
   * Replaces the generated ack/telemetry/idle stream. An empty script makes the device
   * accept the command and then go silent.
   */
  void SetTestScript(std::vector<std::string> replies) {
    std::lock_guard lock(mutex_);
    test_script_ = std::move(replies);
  }

  void Start() {
    if (running_.exchange(true)) {
      return;
    }
    worker_ = std::thread([this] { Run(); });
  }

  void Stop() {
    running_ = false;
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  /**
   * @brief Run the receive loop on the calling thread until Stop() is called elsewhere
   */
  void RunForeground() {
    running_ = true;
    Run();
  }

  [[nodiscard]] Endpoint const &GetEndpoint() const noexcept { return endpoint_; }

  /**
   * @brief Every message the device has received, in order, as text
   */
  [[nodiscard]] std::vector<std::string> GetReceived() const {
    std::lock_guard lock(mutex_);
    return received_;
  }

 private:
  static constexpr uint32_t kPollIntervalMs = 20;

  struct ActiveTest {
    SocketAddress operator_address{};
    std::chrono::steady_clock::time_point started{};
    std::chrono::steady_clock::time_point next_report{};
    std::chrono::milliseconds duration{0};
    std::chrono::milliseconds rate{0};
  };

  void Run() {
    std::vector<uint8_t> buffer(kMaxDatagramSize);
    while (running_) {
      auto readable = socket_.WaitReadable(PollTimeoutMs());
      if (!readable.has_value()) {
        spdlog::error("Simulator stopped: {}", readable.error().message);
        return;
      }
      if (*readable) {
        SocketAddress sender;
        sender.length = sizeof(sender.storage);
        ssize_t n = ::recvfrom(socket_.GetFd(), buffer.data(), buffer.size(), 0, sender.Get(), &sender.length);
        if (n >= 0) {
          Handle(std::span<const uint8_t>(buffer.data(), static_cast<size_t>(n)), sender);
        }
      }
      Report();
    }
  }

  [[nodiscard]] uint32_t PollTimeoutMs() const {
    if (!test_.has_value()) {
      return kPollIntervalMs;
    }
    auto until_next = std::chrono::duration_cast<std::chrono::milliseconds>(test_->next_report -
                                                                           std::chrono::steady_clock::now());
    return static_cast<uint32_t>(std::clamp<int64_t>(until_next.count(), 0, kPollIntervalMs));
  }

  void Handle(std::span<const uint8_t> payload, SocketAddress const &sender) {
    auto message = MessageCodec::Decode(payload);
    {
      std::lock_guard lock(mutex_);
      received_.emplace_back(reinterpret_cast<const char *>(payload.data()), payload.size());
    }
    if (!message.has_value()) {
      spdlog::warn("Simulator ignoring {}", message.error().message);
      return;
    }

    if (message->GetName() == wire::kId) {
      ReplyToId(sender);
    } else if (message->GetName() == wire::kTest && message->HasValue(wire::kCmd, wire::kStart)) {
      StartTest(*message, sender);
    } else if (message->GetName() == wire::kTest && message->HasValue(wire::kCmd, wire::kStop)) {
      StopTest(sender);
    }
  }

  void ReplyToId(SocketAddress const &sender) {
    std::optional<std::string> reply;
    {
      std::lock_guard lock(mutex_);
      if (id_reply_overridden_) {
        reply = id_reply_override_;
      } else {
        DeviceMessage id{std::string(wire::kId)};
        id.Set(wire::kModel, identity_.model);
        id.Set(wire::kSerial, identity_.serial);
        reply = MessageCodec::EncodeToString(id);
      }
    }
    if (reply.has_value()) {
      SendTo(*reply, sender);
    }
  }

  void StartTest(DeviceMessage const &command, SocketAddress const &sender) {
    std::optional<std::vector<std::string>> script;
    {
      std::lock_guard lock(mutex_);
      script = test_script_;
    }
    if (script.has_value()) {
      for (auto const &reply : *script) {
        SendTo(reply, sender);
      }
      return;
    }

    auto now = std::chrono::steady_clock::now();
    ActiveTest test;
    test.operator_address = sender;
    test.started = now;
    test.duration = std::chrono::seconds(ReadUnsigned(command, wire::kDuration, 2));
    test.rate = std::chrono::milliseconds(std::max<uint32_t>(1, ReadUnsigned(command, wire::kRate, 100)));
    test.next_report = now + test.rate;
    test_ = test;
    SendTo("TEST;RESULT=STARTED;", sender);
  }

  void StopTest(SocketAddress const &sender) {
    SendTo("TEST;RESULT=STOPPED;", sender);
    if (test_.has_value()) {
      SendTo("STATUS;STATE=IDLE;", test_->operator_address);
      test_.reset();
    }
  }

  void Report() {
    if (!test_.has_value()) {
      return;
    }
    auto now = std::chrono::steady_clock::now();
    while (test_.has_value() && now >= test_->next_report) {
      auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(test_->next_report - test_->started);
      if (elapsed > test_->duration) {
        SendTo("STATUS;STATE=IDLE;", test_->operator_address);
        test_.reset();
        return;
      }
      double t = static_cast<double>(elapsed.count()) / 1000.0;
      DeviceMessage status{std::string(wire::kStatus)};
      status.Set(wire::kTime, std::to_string(elapsed.count()));
      status.Set(wire::kMillivolts, FormatReading(4448.9 + 25.0 * std::sin(t)));
      status.Set(wire::kMilliamps, FormatReading(-11.1 + 2.5 * std::cos(t)));
      SendTo(MessageCodec::EncodeToString(status), test_->operator_address);
      test_->next_report += test_->rate;
    }
  }

  void SendTo(std::string_view text, SocketAddress const &to) {
    auto bytes = AsBytes(text);
    if (::sendto(socket_.GetFd(), bytes.data(), bytes.size(), 0, to.Get(), to.length) < 0) {
      spdlog::warn("Simulator send failed: {}", ErrnoMessage(errno));
    }
  }

  [[nodiscard]] static uint32_t ReadUnsigned(DeviceMessage const &message, std::string_view key, uint32_t fallback) {
    auto text = message.Find(key);
    uint32_t value = fallback;
    if (text.has_value()) {
      std::from_chars(text->data(), text->data() + text->size(), value);
    }
    return value;
  }

  [[nodiscard]] static std::string FormatReading(double value) {
    char text[32];
    int n = std::snprintf(text, sizeof(text), "%.1f", value);
    return std::string(text, n > 0 ? static_cast<size_t>(n) : 0);
  }

  Identity identity_;
  UdpSocket socket_{};
  Endpoint endpoint_{};
  std::atomic<bool> running_{false};
  std::thread worker_{};
  std::optional<ActiveTest> test_{};

  mutable std::mutex mutex_;
  std::vector<std::string> received_{};
  std::optional<std::string> id_reply_override_{};
  bool id_reply_overridden_{false};
  std::optional<std::vector<std::string>> test_script_{};
};

}  // namespace dutprobe
