#include "protocol/message_kind.hpp"
#include <string_view>
#include "protocol/device_message.hpp"
#include "protocol/wire_names.hpp"

namespace dutprobe {

MessageKind Classify(DeviceMessage const &message) {
  std::string_view name = message.GetName();
  if (name == wire::kId) {
    return MessageKind::kDiscoveryResponse;
  }
  if (name == wire::kTest) {
    return MessageKind::kTestAck;
  }
  if (name == wire::kStatus) {
    if (message.HasValue(wire::kState, wire::kIdle)) {
      return MessageKind::kTestComplete;
    }
    return MessageKind::kStatusSample;
  }
  return MessageKind::kUnrecognized;
}

bool IsTestStarted(DeviceMessage const &message) {
  return message.GetName() == wire::kTest && message.HasValue(wire::kResult, wire::kStarted);
}

std::string_view ToString(MessageKind kind) {
  switch (kind) {
    case MessageKind::kDiscoveryResponse:
      return "discovery response";
    case MessageKind::kTestAck:
      return "test acknowledgement";
    case MessageKind::kStatusSample:
      return "status sample";
    case MessageKind::kTestComplete:
      return "test complete";
    case MessageKind::kUnrecognized:
      return "unrecognized";
  }
  return "unknown";
}

}  // namespace dutprobe
