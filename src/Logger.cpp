#include "service-supervisor/Logger.hpp"

namespace svcsup {

// DLL-safe singleton implementation
SupervisorLogger &SupervisorLogger::instance() {
  static SupervisorLogger logger;
  return logger;
}

spdlog::level::level_enum parse_log_level(const std::string &level) {
  if (level == "debug")
    return spdlog::level::debug;
  if (level == "warn")
    return spdlog::level::warn;
  if (level == "error")
    return spdlog::level::err;
  if (level == "trace")
    return spdlog::level::trace;
  return spdlog::level::info;
}

} // namespace svcsup
