#pragma once
#include "service-supervisor/export.h"
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace svcsup {

struct ServiceSection {
  std::string executable;   // absolute or working-dir relative path
  std::string process_name; // target of by-name reaping
  std::string mode = "client";
  std::string readiness_marker = "Backend server is ready";
  std::string health_path = "/health";
  std::map<std::string, std::string> env; // extra environment
};

struct PortSection {
  uint16_t default_port = 23450;
  int max_attempts = 10;
  std::chrono::milliseconds release_wait{100};
  int release_checks = 5;
};

struct ReadinessSection {
  int attempts = 120;
  std::chrono::milliseconds interval{1000};
  std::chrono::milliseconds probe_timeout{2000};
};

struct TerminationSection {
  int attempts = 3;
  std::chrono::milliseconds wait{500};
};

struct LoggingSection {
  std::string file = "service_supervisor.log";
  std::string level = "info";
};

struct SERVICE_SUPERVISOR_API SupervisorConfig {
  ServiceSection service;
  PortSection ports;
  ReadinessSection readiness;
  TerminationSection termination;
  std::chrono::milliseconds restart_delay{1000};
  LoggingSection logging;

  /// Load from a YAML file. Missing keys keep their defaults.
  /// Throws ConfigError on unreadable/malformed files or invalid values.
  static SupervisorConfig load_file(const std::string &path);

  /// Same as load_file but from YAML text
  static SupervisorConfig from_yaml(const std::string &yaml_text);

  /// Throws ConfigError describing the first invalid value
  void validate() const;
};

/// Executable name used for by-name reaping when none is configured
SERVICE_SUPERVISOR_API std::string
default_process_name(const std::string &executable);

/// Packaged-vs-development path policy: first candidate that exists on disk,
/// or an empty string if none does
SERVICE_SUPERVISOR_API std::string
resolve_executable(const std::vector<std::string> &candidates);

} // namespace svcsup
