#pragma once
#include "service-supervisor/BoundedRetry.hpp"
#include "service-supervisor/export.h"
#include "service-supervisor/process/ProcessReaper.hpp"
#include "service-supervisor/process/ServiceHandle.hpp"
#include <string>

namespace svcsup {

/// Bounded stop sequence: graceful signal, then forceful signals, then a
/// by-name reap as the last resort.
class SERVICE_SUPERVISOR_API TerminationEscalator {
public:
  /// `policy.max_attempts` signals are sent, each followed by a wait of up to
  /// `policy.interval` for the process to exit.
  TerminationEscalator(process::ProcessReaper &reaper,
                       std::string process_name, RetryPolicy policy);

  /// Returns false if `handle` is absent or has no valid pid. Throws
  /// TerminationIncomplete if no signal could be delivered and the final reap
  /// failed too. Otherwise reports success, even when the final reap could
  /// not confirm the process is gone.
  bool stop(process::ServiceHandle *handle);

  const RetryPolicy &policy() const { return policy_; }

private:
  process::ProcessReaper &reaper_;
  std::string process_name_;
  RetryPolicy policy_;
};

} // namespace svcsup
