#include "service-supervisor/supervisor/TerminationEscalator.hpp"
#include "service-supervisor/Errors.hpp"
#include "service-supervisor/Logger.hpp"

namespace svcsup {

TerminationEscalator::TerminationEscalator(process::ProcessReaper &reaper,
                                           std::string process_name,
                                           RetryPolicy policy)
    : reaper_(reaper), process_name_(std::move(process_name)),
      policy_(policy) {}

bool TerminationEscalator::stop(process::ServiceHandle *handle) {
  if (!handle) {
    LOG_WARN("ESCALATOR", "STOP", "No service handle to stop");
    return false;
  }
  const auto pid = handle->pid();
  if (pid <= 0) {
    LOG_ERROR("ESCALATOR", "STOP", "Invalid PID={}", pid);
    return false;
  }

  if (!handle->is_alive()) {
    LOG_INFO("ESCALATOR", "STOP", "PID={} already exited", pid);
    return true;
  }

  bool delivered = false;
  // The wait for exit is the pacing; no extra sleep between attempts
  RetryPolicy signal_policy{policy_.max_attempts, std::chrono::milliseconds(0)};
  auto outcome = retry_bounded(signal_policy, [&](int attempt) {
    bool sent;
    if (attempt == 1) {
      LOG_INFO("ESCALATOR", "TERM", "Requesting graceful exit of PID={}", pid);
      sent = handle->send_graceful();
    } else {
      LOG_WARN("ESCALATOR", "KILL",
               "PID={} still alive, forcing termination (attempt {}/{})", pid,
               attempt, policy_.max_attempts);
      sent = handle->send_forceful();
    }
    delivered = delivered || sent;
    return handle->wait_for_exit(policy_.interval);
  });

  if (outcome == RetryOutcome::Succeeded) {
    LOG_INFO("ESCALATOR", "STOP", "PID={} terminated", pid);
    return true;
  }

  LOG_WARN("ESCALATOR", "REAP",
           "PID={} survived {} attempt(s), reaping by name '{}'", pid,
           policy_.max_attempts, process_name_);
  auto reaped = reaper_.kill_by_name(process_name_);
  if (reaped.succeeded) {
    handle->wait_for_exit(policy_.interval);
  }

  if (!delivered && !reaped.succeeded) {
    LOG_ERROR("ESCALATOR", "STOP", "Could not terminate PID={}: {}", pid,
              reaped.detail);
    throw TerminationIncomplete("could not signal PID " + std::to_string(pid) +
                                " and by-name reap failed: " + reaped.detail);
  }

  // Best effort: the reap ran, so report success even if unconfirmed
  if (handle->is_alive()) {
    LOG_WARN("ESCALATOR", "STOP",
             "PID={} may still be running after escalation ({})", pid,
             reaped.detail);
  }
  return true;
}

} // namespace svcsup
