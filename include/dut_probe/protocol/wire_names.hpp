#pragma once

#include <string_view>

namespace dutprobe::wire {

// Message names
inline constexpr std::string_view kId = "ID";
inline constexpr std::string_view kTest = "TEST";
inline constexpr std::string_view kStatus = "STATUS";

// ID response
inline constexpr std::string_view kModel = "MODEL";
inline constexpr std::string_view kSerial = "SERIAL";

// TEST command / acknowledgement
inline constexpr std::string_view kCmd = "CMD";
inline constexpr std::string_view kDuration = "DURATION";
inline constexpr std::string_view kRate = "RATE";
inline constexpr std::string_view kResult = "RESULT";
inline constexpr std::string_view kStart = "START";
inline constexpr std::string_view kStop = "STOP";
inline constexpr std::string_view kStarted = "STARTED";
inline constexpr std::string_view kStopped = "STOPPED";

// STATUS telemetry
inline constexpr std::string_view kTime = "TIME";
inline constexpr std::string_view kMillivolts = "MV";
inline constexpr std::string_view kMilliamps = "MA";
inline constexpr std::string_view kState = "STATE";
inline constexpr std::string_view kIdle = "IDLE";

}  // namespace dutprobe::wire
