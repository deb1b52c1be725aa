#include "common/network_options.hpp"
#include <charconv>
#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>
#include "common/error_code.hpp"
#include "common/result.hpp"

namespace dutprobe {

Result<Endpoint> ParseEndpoint(std::string_view text) {
  size_t colon = text.rfind(':');
  if (colon == std::string_view::npos) {
    return MakeError(ErrorCode::kInvalidEndpoint, "Port number missing. Use colon to separate.");
  }

  std::string_view address = text.substr(0, colon);
  std::string_view port_text = text.substr(colon + 1);

  unsigned int port = 0;
  auto [end, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
  if (port_text.empty() || ec != std::errc{} || end != port_text.data() + port_text.size() || port > UINT16_MAX) {
    return MakeError(ErrorCode::kInvalidEndpoint,
                     "Invalid port number. Expected integer, given '" + std::string(port_text) + "'");
  }

  return Endpoint{std::string(address), static_cast<uint16_t>(port)};
}

std::string ToString(Endpoint const &endpoint) {
  return endpoint.address + ":" + std::to_string(endpoint.port);
}

Result<uint32_t> ParseTimeoutMs(std::string_view seconds) {
  double value = 0.0;
  auto [end, ec] = std::from_chars(seconds.data(), seconds.data() + seconds.size(), value);
  double milliseconds = std::floor(value * 1000.0);
  if (seconds.empty() || ec != std::errc{} || end != seconds.data() + seconds.size() || !std::isfinite(value) ||
      value < 0.0 || milliseconds > static_cast<double>(UINT32_MAX)) {
    Error error = MakeError(ErrorCode::kInvalidField,
                            "Invalid timeout. Expected seconds, given '" + std::string(seconds) + "'");
    error.field = "timeout";
    return error;
  }
  return static_cast<uint32_t>(milliseconds);
}

}  // namespace dutprobe
