#pragma once

#include "../common/result.hpp"
#include "device_message.hpp"

namespace dutprobe {

/**
 * @brief One telemetry report from a running test
 */
struct StatusSample {
  double milliamps{0.0};
  double millivolts{0.0};
  double elapsed_seconds{0.0};  // TIME field (ms) / 1000

  /**
   * @brief Extract telemetry from a STATUS message, e.g. "STATUS;TIME=300;MV=4448.9;MA=-11.1;"
   * @return Sample, or kUnexpectedMessage (not STATUS), kMissingField, kInvalidField (not a number)
   */
  [[nodiscard]] static Result<StatusSample> FromMessage(DeviceMessage const &message);

  friend bool operator==(StatusSample const &, StatusSample const &) = default;
};

}  // namespace dutprobe
