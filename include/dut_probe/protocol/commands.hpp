#pragma once

#include <cstdint>
#include "device_message.hpp"

namespace dutprobe {

/** ID; */
[[nodiscard]] DeviceMessage MakeDiscoveryProbe();

/**
 * @brief TEST;CMD=START;DURATION=<duration_s>;RATE=<rate_ms>;
 * @param duration_s Seconds to run the test for
 * @param rate_ms Milliseconds between status reports
 */
[[nodiscard]] DeviceMessage MakeStartTest(uint32_t duration_s, uint32_t rate_ms);

/** TEST;CMD=STOP; */
[[nodiscard]] DeviceMessage MakeStopTest();

}  // namespace dutprobe
