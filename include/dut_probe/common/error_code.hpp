#pragma once

#include <cstdint>
#include <string_view>

namespace dutprobe {

enum class ErrorCode : uint8_t {
  kNone = 0,
  kParseError,
  kMissingField,
  kInvalidField,
  kUnexpectedMessage,
  kTimeout,
  kConnectionRefused,
  kSocketError,
  kInvalidEndpoint
};

[[nodiscard]] constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return "none";
    case ErrorCode::kParseError:
      return "parse error";
    case ErrorCode::kMissingField:
      return "missing field";
    case ErrorCode::kInvalidField:
      return "invalid field";
    case ErrorCode::kUnexpectedMessage:
      return "unexpected message";
    case ErrorCode::kTimeout:
      return "timeout";
    case ErrorCode::kConnectionRefused:
      return "connection refused";
    case ErrorCode::kSocketError:
      return "socket error";
    case ErrorCode::kInvalidEndpoint:
      return "invalid endpoint";
  }
  return "unknown";
}

}  // namespace dutprobe
