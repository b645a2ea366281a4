#pragma once
#include "service-supervisor/export.h"
#include <string>

namespace svcsup {
namespace process {

struct CommandResult {
  bool launched = false; // false if the shell could not be started at all
  int exit_code = -1;
  std::string output; // stdout (stderr is discarded)
};

/// Run a shell command synchronously and capture its standard output
SERVICE_SUPERVISOR_API CommandResult run_command(const std::string &command);

} // namespace process
} // namespace svcsup
