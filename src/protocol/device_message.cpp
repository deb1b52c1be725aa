#include "protocol/device_message.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <string_view>

namespace dutprobe {

std::optional<std::string_view> DeviceMessage::Find(std::string_view key) const {
  auto it = std::find_if(fields_.begin(), fields_.end(), [key](Field const &field) { return field.first == key; });
  if (it == fields_.end()) {
    return {};
  }
  return std::string_view(it->second);
}

bool DeviceMessage::HasValue(std::string_view key, std::string_view expected) const {
  auto value = Find(key);
  return value.has_value() && *value == expected;
}

void DeviceMessage::Set(std::string_view key, std::string_view value) {
  auto it = std::find_if(fields_.begin(), fields_.end(), [key](Field const &field) { return field.first == key; });
  if (it != fields_.end()) {
    it->second = std::string(value);
    return;
  }
  fields_.emplace_back(std::string(key), std::string(value));
}

}  // namespace dutprobe
