#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include "../protocol/status_sample.hpp"

namespace dutprobe {

struct Aggregate {
  double mean{0.0};
  double max{0.0};
  double min{0.0};
};

/**
 * @brief Current and voltage statistics over a finished test
 */
struct TelemetrySummary {
  size_t count{0};
  Aggregate milliamps{};
  Aggregate millivolts{};
};

/**
 * @return Summary, or empty if there are no samples
 */
[[nodiscard]] std::optional<TelemetrySummary> Summarize(std::span<const StatusSample> samples);

/**
 * @brief Fixed-point text with comma thousands separators, e.g. 4448.9 -> "4,448.90"
 */
[[nodiscard]] std::string FormatQuantity(double value, int decimals = 2);

}  // namespace dutprobe
