#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dutprobe {

static constexpr uint8_t kFirstPrintable = 0x20;
static constexpr uint8_t kLastPrintable = 0x7E;

/**
 * @brief View the characters of a string as raw bytes (no copy)
 */
[[nodiscard]] inline std::span<const uint8_t> AsBytes(std::string_view text) {
  return {reinterpret_cast<const uint8_t *>(text.data()), text.size()};
}

[[nodiscard]] inline std::vector<uint8_t> ToBytes(std::string_view text) {
  auto bytes = AsBytes(text);
  return {bytes.begin(), bytes.end()};
}

/**
 * @brief Render bytes as a quoted literal for diagnostics, e.g. b'ID;MODEL=M001;'
 *
 * Printable ASCII is kept as-is; quote and backslash are escaped; everything else is \xNN.
 */
[[nodiscard]] inline std::string FormatBytes(std::span<const uint8_t> bytes) {
  static constexpr char kHexChars[] = "0123456789abcdef";
  std::string result = "b'";
  result.reserve(bytes.size() + 3);
  for (uint8_t b : bytes) {
    if (b == '\'' || b == '\\') {
      result += '\\';
      result += static_cast<char>(b);
    } else if (b == '\n') {
      result += "\\n";
    } else if (b == '\r') {
      result += "\\r";
    } else if (b == '\t') {
      result += "\\t";
    } else if (b >= kFirstPrintable && b <= kLastPrintable) {
      result += static_cast<char>(b);
    } else {
      result += "\\x";
      result += kHexChars[(b >> 4) & 0x0F];
      result += kHexChars[b & 0x0F];
    }
  }
  result += '\'';
  return result;
}

}  // namespace dutprobe
