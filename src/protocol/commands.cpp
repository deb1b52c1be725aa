#include "protocol/commands.hpp"
#include <cstdint>
#include <string>
#include "protocol/device_message.hpp"
#include "protocol/wire_names.hpp"

namespace dutprobe {

DeviceMessage MakeDiscoveryProbe() {
  return DeviceMessage{std::string(wire::kId)};
}

DeviceMessage MakeStartTest(uint32_t duration_s, uint32_t rate_ms) {
  DeviceMessage message{std::string(wire::kTest)};
  message.Set(wire::kCmd, wire::kStart);
  message.Set(wire::kDuration, std::to_string(duration_s));
  message.Set(wire::kRate, std::to_string(rate_ms));
  return message;
}

DeviceMessage MakeStopTest() {
  DeviceMessage message{std::string(wire::kTest)};
  message.Set(wire::kCmd, wire::kStop);
  return message;
}

}  // namespace dutprobe
