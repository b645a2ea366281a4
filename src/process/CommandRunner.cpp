#include "service-supervisor/process/CommandRunner.hpp"
#include "service-supervisor/Logger.hpp"
#include <cstdio>

#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace svcsup {
namespace process {

CommandResult run_command(const std::string &command) {
  CommandResult result;

#ifdef _WIN32
  std::string full = command + " 2>NUL";
  FILE *pipe = _popen(full.c_str(), "r");
#else
  std::string full = command + " 2>/dev/null";
  FILE *pipe = popen(full.c_str(), "r");
#endif
  if (!pipe) {
    LOG_ERROR("COMMAND", "RUN", "Failed to start command: {}", command);
    return result;
  }
  result.launched = true;

  char buffer[256];
  while (fgets(buffer, sizeof(buffer), pipe)) {
    result.output += buffer;
  }

#ifdef _WIN32
  result.exit_code = _pclose(pipe);
#else
  int status = pclose(pipe);
  if (status == -1) {
    result.exit_code = -1;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else {
    result.exit_code = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
  }
#endif

  LOG_DEBUG("COMMAND", "RUN", "'{}' exited with {}", command,
            result.exit_code);
  return result;
}

} // namespace process
} // namespace svcsup
