#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "../common/result.hpp"
#include "device_message.hpp"

namespace dutprobe {

/**
 * @brief Semicolon-delimited text codec for device messages
 *
 * Wire grammar: MessageName ( ';' Key '=' Value )* ';'
 * - Payload is ISO-8859-1 text, so every byte maps to exactly one character
 * - The first segment is the message name, every later non-empty segment is one key=value pair
 * - Encoding terminates every segment (the last included) with ';'
 */
class MessageCodec {
 public:
  static constexpr char kSegmentDelimiter = ';';
  static constexpr char kKeyValueDelimiter = '=';

  /**
   * @brief Decode a datagram payload into a message
   * @param raw Payload bytes as received
   * @return Decoded message, or kParseError (with raw bytes attached) when the name is empty
   *         or a field segment does not contain exactly one '='
   */
  [[nodiscard]] static Result<DeviceMessage> Decode(std::span<const uint8_t> raw);

  /**
   * @brief Encode a message as "name;key1=value1;key2=value2;"
   *
   * Fields are written in their stored order, which makes this the left inverse of Decode.
   */
  [[nodiscard]] static std::vector<uint8_t> Encode(DeviceMessage const &message);

  /**
   * @brief Same as Encode, as text
   */
  [[nodiscard]] static std::string EncodeToString(DeviceMessage const &message);
};

}  // namespace dutprobe
