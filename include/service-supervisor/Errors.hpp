#pragma once

#include <stdexcept>
#include <string>

namespace svcsup {

enum class ErrorKind {
  LaunchError,
  PortConflictUnresolved,
  ReadinessTimeout,
  TerminationIncomplete,
  ProbeError,
  ConfigError,
  Cancelled
};

inline const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::LaunchError:
    return "LaunchError";
  case ErrorKind::PortConflictUnresolved:
    return "PortConflictUnresolved";
  case ErrorKind::ReadinessTimeout:
    return "ReadinessTimeout";
  case ErrorKind::TerminationIncomplete:
    return "TerminationIncomplete";
  case ErrorKind::ProbeError:
    return "ProbeError";
  case ErrorKind::ConfigError:
    return "ConfigError";
  case ErrorKind::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

class SupervisorError : public std::runtime_error {
public:
  SupervisorError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

/// Executable missing, or the OS refused to create the process
class LaunchError : public SupervisorError {
public:
  explicit LaunchError(const std::string &message)
      : SupervisorError(ErrorKind::LaunchError, message) {}
};

/// Port still bound after reaping and the increment budget is spent
class PortConflictUnresolved : public SupervisorError {
public:
  explicit PortConflictUnresolved(const std::string &message)
      : SupervisorError(ErrorKind::PortConflictUnresolved, message) {}
};

/// Spawned, but never signaled readiness. The process may still be alive.
class ReadinessTimeout : public SupervisorError {
public:
  explicit ReadinessTimeout(const std::string &message)
      : SupervisorError(ErrorKind::ReadinessTimeout, message) {}
};

/// OS termination primitives could not be invoked at all
class TerminationIncomplete : public SupervisorError {
public:
  explicit TerminationIncomplete(const std::string &message)
      : SupervisorError(ErrorKind::TerminationIncomplete, message) {}
};

class ProbeError : public SupervisorError {
public:
  explicit ProbeError(const std::string &message)
      : SupervisorError(ErrorKind::ProbeError, message) {}
};

class ConfigError : public SupervisorError {
public:
  explicit ConfigError(const std::string &message)
      : SupervisorError(ErrorKind::ConfigError, message) {}
};

} // namespace svcsup
