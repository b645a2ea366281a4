#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace svcsup {

enum class ServiceState { Idle, Starting, Running, Stopping, Stopped, Failed };

inline const char *to_string(ServiceState state) {
  switch (state) {
  case ServiceState::Idle:
    return "Idle";
  case ServiceState::Starting:
    return "Starting";
  case ServiceState::Running:
    return "Running";
  case ServiceState::Stopping:
    return "Stopping";
  case ServiceState::Stopped:
    return "Stopped";
  case ServiceState::Failed:
    return "Failed";
  }
  return "Unknown";
}

/// Result of a reap attempt. "Nothing to kill" is a success.
struct CleanupOutcome {
  bool succeeded = false;
  std::string detail;

  static CleanupOutcome ok(std::string detail) {
    return CleanupOutcome{true, std::move(detail)};
  }
  static CleanupOutcome failed(std::string detail) {
    return CleanupOutcome{false, std::move(detail)};
  }
};

enum class PortStatus { Free, InUse, AccessDenied, Error };

inline const char *to_string(PortStatus status) {
  switch (status) {
  case PortStatus::Free:
    return "free";
  case PortStatus::InUse:
    return "in-use";
  case PortStatus::AccessDenied:
    return "access-denied";
  case PortStatus::Error:
    return "error";
  }
  return "unknown";
}

/// How a supervised process ended
struct ExitStatus {
  int exit_code = -1;  // -1 when terminated by a signal
  int term_signal = 0; // 0 when exited normally (always 0 on Windows)

  bool signaled() const { return term_signal != 0; }

  /// Exit code 0, or termination by one of the signals the supervisor sends
  bool is_clean() const;

  std::string describe() const;
};

enum class OutputStream { Stdout, Stderr };

inline const char *to_string(OutputStream stream) {
  return stream == OutputStream::Stdout ? "stdout" : "stderr";
}

/// Published to Supervisor subscribers from the dispatcher thread
struct SupervisorEvent {
  enum class Kind { StateChanged, Ready, OutputWarning, Exited };

  Kind kind = Kind::StateChanged;
  ServiceState from = ServiceState::Idle;
  ServiceState to = ServiceState::Idle;
  uint16_t port = 0;
  std::string line;
  ExitStatus exit;
  bool anomalous = false;
};

/// Snapshot of the supervised backend for callers
struct SupervisorInfo {
  ServiceState state = ServiceState::Idle;
  uint16_t port = 0;
  bool running = false;
  bool ready = false;
  std::optional<long> pid;
};

} // namespace svcsup
