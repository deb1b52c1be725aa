#pragma once

namespace dutprobe {

/**
 * @brief Install the console log pattern ("LEVEL   message") on the default spdlog logger
 * @param verbose Log at debug level (every datagram sent/received) instead of info
 */
void ConfigureLogging(bool verbose);

}  // namespace dutprobe
