#include "protocol/message_codec.hpp"
#include <algorithm>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "common/byte_helpers.hpp"
#include "common/error_code.hpp"
#include "common/result.hpp"
#include "protocol/device_message.hpp"

namespace dutprobe {

namespace {

Error MakeParseError(std::string message, std::span<const uint8_t> raw) {
  Error error = MakeError(ErrorCode::kParseError, std::move(message));
  error.raw.assign(raw.begin(), raw.end());
  return error;
}

}  // namespace

Result<DeviceMessage> MessageCodec::Decode(std::span<const uint8_t> raw) {
  // ISO-8859-1: byte value == code unit
  std::string_view text(reinterpret_cast<const char *>(raw.data()), raw.size());

  size_t name_end = text.find(kSegmentDelimiter);
  std::string_view name = text.substr(0, name_end);
  DeviceMessage message{std::string(name)};

  size_t pos = (name_end == std::string_view::npos) ? text.size() : name_end + 1;
  while (pos < text.size()) {
    size_t end = text.find(kSegmentDelimiter, pos);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view segment = text.substr(pos, end - pos);
    pos = end + 1;

    if (segment.empty()) {
      continue;
    }
    if (std::count(segment.begin(), segment.end(), kKeyValueDelimiter) != 1) {
      return MakeParseError("Could not parse " + std::string(segment) + " from " + FormatBytes(raw), raw);
    }
    size_t equals = segment.find(kKeyValueDelimiter);
    message.Set(segment.substr(0, equals), segment.substr(equals + 1));
  }

  if (name.empty()) {
    return MakeParseError("Empty message", raw);
  }

  return message;
}

std::string MessageCodec::EncodeToString(DeviceMessage const &message) {
  std::string text = message.GetName();
  text += kSegmentDelimiter;
  for (auto const &[key, value] : message.GetFields()) {
    text += key;
    text += kKeyValueDelimiter;
    text += value;
    text += kSegmentDelimiter;
  }
  return text;
}

std::vector<uint8_t> MessageCodec::Encode(DeviceMessage const &message) {
  return ToBytes(EncodeToString(message));
}

}  // namespace dutprobe
