#pragma once
#include "service-supervisor/export.h"
#include "service-supervisor/process/ServiceHandle.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace svcsup {
namespace process {

/// Environment variable pinning the service's output encoding
inline constexpr const char *kEncodingEnvVar = "PYTHONIOENCODING";
/// Environment variable carrying the invocation mode
inline constexpr const char *kModeEnvVar = "ENV";

struct LaunchSpec {
  std::string executable; // resolved by the caller's path policy
  std::string mode = "client";
  std::map<std::string, std::string> env; // added on top of the inherited env
};

/// Spawns the service as `<exe> --port <N> --env <mode>` with piped output
class SERVICE_SUPERVISOR_API ServiceLauncher {
public:
  explicit ServiceLauncher(LaunchSpec spec);

  /// Throws LaunchError if the executable is missing or the OS refuses to
  /// create the process
  std::unique_ptr<ServiceHandle>
  spawn(uint16_t port,
        const std::map<std::string, std::string> &extra_env = {}) const;

  const LaunchSpec &spec() const { return spec_; }

  /// argv including argv[0]
  std::vector<std::string> build_arguments(uint16_t port) const;

  /// Variables set on top of the inherited environment, later entries win:
  /// encoding, mode, configured env, extra_env
  std::map<std::string, std::string>
  build_environment(const std::map<std::string, std::string> &extra_env) const;

private:
  void check_executable() const;
  std::unique_ptr<ServiceHandle>
  spawn_impl(uint16_t port, const std::vector<std::string> &args,
             const std::map<std::string, std::string> &env) const;

  LaunchSpec spec_;
};

} // namespace process
} // namespace svcsup
