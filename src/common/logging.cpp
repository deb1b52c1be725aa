#include "common/logging.hpp"
#include <spdlog/spdlog.h>

namespace dutprobe {

void ConfigureLogging(bool verbose) {
  spdlog::set_pattern("%-7l %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

}  // namespace dutprobe
