#include "session/telemetry_summary.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <optional>
#include <span>
#include <string>
#include "protocol/status_sample.hpp"

namespace dutprobe {

namespace {

template <typename Projection>
Aggregate Aggregated(std::span<const StatusSample> samples, Projection value_of) {
  Aggregate result{0.0, value_of(samples.front()), value_of(samples.front())};
  double sum = 0.0;
  for (auto const &sample : samples) {
    double value = value_of(sample);
    sum += value;
    result.max = std::max(result.max, value);
    result.min = std::min(result.min, value);
  }
  result.mean = sum / static_cast<double>(samples.size());
  return result;
}

}  // namespace

std::optional<TelemetrySummary> Summarize(std::span<const StatusSample> samples) {
  if (samples.empty()) {
    return {};
  }

  TelemetrySummary summary;
  summary.count = samples.size();
  summary.milliamps = Aggregated(samples, [](StatusSample const &s) { return s.milliamps; });
  summary.millivolts = Aggregated(samples, [](StatusSample const &s) { return s.millivolts; });
  return summary;
}

std::string FormatQuantity(double value, int decimals) {
  std::string digits = fmt::format("{:.{}f}", std::fabs(value), decimals);
  size_t integer_end = digits.find('.');
  if (integer_end == std::string::npos) {
    integer_end = digits.size();
  }
  for (size_t pos = integer_end; pos > 3; pos -= 3) {
    digits.insert(pos - 3, 1, ',');
  }
  if (std::signbit(value)) {
    digits.insert(digits.begin(), '-');
  }
  return digits;
}

}  // namespace dutprobe
