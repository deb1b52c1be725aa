#include "protocol/status_sample.hpp"
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include "common/error_code.hpp"
#include "common/result.hpp"
#include "protocol/device_message.hpp"
#include "protocol/wire_names.hpp"

namespace dutprobe {

namespace {

constexpr double kMillisecondsPerSecond = 1000.0;

std::optional<double> ParseDouble(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  // from_chars rejects an explicit plus sign
  if (text.size() > 1 && text.front() == '+' && text[1] != '-' && text[1] != '+') {
    text.remove_prefix(1);
  }
  if (text.empty()) {
    return {};
  }

  double value = 0.0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || end != text.data() + text.size()) {
    return {};
  }
  return value;
}

Result<double> ReadNumber(DeviceMessage const &message, std::string_view key) {
  auto text = message.Find(key);
  if (!text.has_value()) {
    Error error = MakeError(ErrorCode::kMissingField, "Status data missing: '" + std::string(key) + "' not found");
    error.field = std::string(key);
    return error;
  }
  auto value = ParseDouble(*text);
  if (!value.has_value()) {
    Error error = MakeError(ErrorCode::kInvalidField,
                            "Invalid status data: could not convert string to float: '" + std::string(*text) + "'");
    error.field = std::string(key);
    return error;
  }
  return *value;
}

}  // namespace

Result<StatusSample> StatusSample::FromMessage(DeviceMessage const &message) {
  if (message.GetName() != wire::kStatus) {
    return MakeError(ErrorCode::kUnexpectedMessage,
                     "Expected a message of type 'STATUS', got '" + message.GetName() + "'");
  }

  auto milliamps = ReadNumber(message, wire::kMilliamps);
  if (!milliamps.has_value()) {
    return std::move(milliamps).error();
  }
  auto millivolts = ReadNumber(message, wire::kMillivolts);
  if (!millivolts.has_value()) {
    return std::move(millivolts).error();
  }
  auto time_ms = ReadNumber(message, wire::kTime);
  if (!time_ms.has_value()) {
    return std::move(time_ms).error();
  }

  return StatusSample{*milliamps, *millivolts, *time_ms / kMillisecondsPerSecond};
}

}  // namespace dutprobe
