#pragma once
#include "service-supervisor/export.h"
#include "service-supervisor/process/PlatformTypes.hpp"
#include "service-supervisor/types.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace svcsup {
namespace process {

/// Finds and force-kills processes by name or by the TCP port they listen on.
/// Both operations are idempotent: nothing to kill is a success.
class SERVICE_SUPERVISOR_API ProcessReaper {
public:
  virtual ~ProcessReaper() = default;

  virtual CleanupOutcome kill_by_port(uint16_t port) = 0;
  virtual CleanupOutcome kill_by_name(const std::string &name) = 0;
};

/// Listeners found on a port. `listener_found` with no pids means the owner
/// could not be resolved (typically another user's process).
struct PortOwners {
  bool listener_found = false;
  std::vector<ProcessId> pids;
};

/// OS-tool based reaper for the build platform:
///  - Linux:   /proc/net/tcp{,6} and /proc/<pid>/{fd,comm,cmdline}, SIGKILL
///  - macOS:   lsof / pgrep, SIGKILL
///  - Windows: netstat -ano / tasklist, taskkill /F /T
/// Never targets the calling process.
class SERVICE_SUPERVISOR_API PlatformProcessReaper : public ProcessReaper {
public:
  CleanupOutcome kill_by_port(uint16_t port) override;
  CleanupOutcome kill_by_name(const std::string &name) override;

  PortOwners find_port_owners(uint16_t port) const;
  std::vector<ProcessId> pids_by_name(const std::string &name) const;

private:
  bool force_kill(ProcessId pid, std::string &error) const;
};

SERVICE_SUPERVISOR_API std::unique_ptr<ProcessReaper> make_platform_reaper();

/// PID of the calling process
SERVICE_SUPERVISOR_API ProcessId current_process_id();

} // namespace process
} // namespace svcsup
