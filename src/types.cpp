#include "service-supervisor/types.hpp"
#include <fmt/format.h>

#ifndef _WIN32
#include <csignal>
#endif

namespace svcsup {

bool ExitStatus::is_clean() const {
#ifdef _WIN32
  // taskkill /F and TerminateProcess leave exit code 1
  return exit_code == 0 || exit_code == 1;
#else
  if (signaled()) {
    return term_signal == SIGTERM || term_signal == SIGKILL;
  }
  return exit_code == 0;
#endif
}

std::string ExitStatus::describe() const {
  if (signaled()) {
    return fmt::format("signal {}", term_signal);
  }
  return fmt::format("exit code {}", exit_code);
}

} // namespace svcsup
