#pragma once

#include <cstdint>
#include <string_view>
#include "device_message.hpp"

namespace dutprobe {

/**
 * @brief Protocol role of a decoded message
 *
 * Assigned once, right after decoding, so consumers switch on the kind instead of
 * probing fields themselves.
 */
enum class MessageKind : uint8_t {
  kDiscoveryResponse,  // ID;MODEL=...;SERIAL=...;
  kTestAck,            // TEST;RESULT=...;
  kStatusSample,       // STATUS;TIME=...;MV=...;MA=...;
  kTestComplete,       // STATUS;STATE=IDLE;
  kUnrecognized
};

[[nodiscard]] MessageKind Classify(DeviceMessage const &message);

/**
 * @brief True for the device's "test started" acknowledgement (TEST;RESULT=STARTED;)
 */
[[nodiscard]] bool IsTestStarted(DeviceMessage const &message);

[[nodiscard]] std::string_view ToString(MessageKind kind);

}  // namespace dutprobe
