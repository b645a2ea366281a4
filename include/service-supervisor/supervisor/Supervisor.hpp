#pragma once
#include "service-supervisor/BoundedRetry.hpp"
#include "service-supervisor/Errors.hpp"
#include "service-supervisor/SupervisorConfig.hpp"
#include "service-supervisor/export.h"
#include "service-supervisor/process/ProcessReaper.hpp"
#include "service-supervisor/process/ServiceHandle.hpp"
#include "service-supervisor/process/ServiceLauncher.hpp"
#include "service-supervisor/supervisor/EventChannel.hpp"
#include "service-supervisor/supervisor/ReadinessMonitor.hpp"
#include "service-supervisor/supervisor/TerminationEscalator.hpp"
#include "service-supervisor/types.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace svcsup {

struct LastError {
  ErrorKind kind;
  std::string message;
};

/// Owns the lifecycle of one local backend instance.
///
/// Control operations (start, stop, restart, the cleanups) are serialized by
/// one mutex. State queries take only a short state lock and never wait
/// behind a start in progress. Output lines, process exit and probe results
/// flow through an event channel into a single dispatcher thread, the only
/// place that notifies subscribers.
class SERVICE_SUPERVISOR_API Supervisor {
public:
  using Listener = std::function<void(const SupervisorEvent &)>;

  explicit Supervisor(SupervisorConfig config,
                      std::unique_ptr<process::ProcessReaper> reaper =
                          process::make_platform_reaper());
  ~Supervisor();

  Supervisor(const Supervisor &) = delete;
  Supervisor &operator=(const Supervisor &) = delete;

  /// Resolve a port, spawn and wait for readiness. A no-op returning the
  /// current state while Starting or Running. Throws PortConflictUnresolved,
  /// LaunchError or ReadinessTimeout (state Failed). Returns Failed without
  /// throwing when the wait was cut short by request_shutdown().
  ServiceState start(std::optional<uint16_t> preferred_port = std::nullopt);

  /// Terminate the instance through the escalation sequence. Returns true
  /// when there is nothing left to stop.
  bool stop();

  /// stop(), wait the restart delay, start(), as one control operation
  ServiceState restart(std::optional<uint16_t> preferred_port = std::nullopt);

  /// Cached readiness, or one health poll whose success is cached
  bool is_ready(std::chrono::milliseconds timeout);

  /// True only while a handle exists and the process is alive. Moves a
  /// Running supervisor to Stopped when the process is found gone.
  bool is_running();

  uint16_t current_port() const;
  ServiceState state() const;
  SupervisorInfo info();
  std::optional<ExitStatus> last_exit() const;
  std::optional<LastError> last_error() const;

  /// By-name reap of instances left behind by earlier runs. Refused while
  /// this supervisor holds a live instance.
  CleanupOutcome cleanup_stale_previous_instances();

  /// Free the configured port if something holds it. Never spawns.
  CleanupOutcome cleanup_service_port();

  int subscribe(Listener listener);
  void unsubscribe(int id);

  /// Abort an in-progress readiness wait; later starts are refused
  void request_shutdown();

  const SupervisorConfig &config() const { return config_; }

private:
  struct InstanceEvent {
    enum class Kind { LineReceived, ProcessExited, ProbeResult, StateChanged };
    Kind kind = Kind::LineReceived;
    process::ProcessId pid = 0;
    OutputLine line;
    ExitStatus exit;
    bool ready = false;
    ServiceState from = ServiceState::Idle;
    ServiceState to = ServiceState::Idle;
  };

  ServiceState start_locked(std::optional<uint16_t> preferred_port);
  ServiceState launch_locked(uint16_t base);
  /// Reap whatever a failed start spawned, then settle in Failed
  void abandon_start(const std::string &reason);
  bool stop_locked();

  std::optional<uint16_t> resolve_port(uint16_t base);
  bool free_port(uint16_t port);
  bool wait_port_released(uint16_t port);

  void attach_instance(std::unique_ptr<process::ServiceHandle> handle,
                       uint16_t port);
  void release_instance();
  bool has_instance() const;

  void transition(ServiceState to);
  void transition_locked(ServiceState to);
  void record_error(ErrorKind kind, const std::string &message);
  void mark_ready(process::ProcessId pid);

  void dispatch_loop();
  void handle_event(const InstanceEvent &event);
  void on_ready(process::ProcessId pid);
  void on_exit(process::ProcessId pid, const ExitStatus &status);
  void publish(const SupervisorEvent &event);

  SupervisorConfig config_;
  std::unique_ptr<process::ProcessReaper> reaper_;
  process::ServiceLauncher launcher_;
  std::string reap_name_; // by-name reap target
  TerminationEscalator escalator_;
  CancellationToken shutdown_;

  EventChannel<InstanceEvent> events_;

  std::mutex control_mutex_;
  mutable std::mutex state_mutex_;
  ServiceState state_ = ServiceState::Idle;
  uint16_t port_;
  bool ready_ = false;
  process::ProcessId current_pid_ = 0;
  std::unique_ptr<process::ServiceHandle> handle_;
  std::unique_ptr<ReadinessMonitor> monitor_; // destroyed before handle_
  std::optional<ExitStatus> last_exit_;
  std::optional<LastError> last_error_;

  std::mutex listeners_mutex_;
  std::map<int, Listener> listeners_;
  int next_listener_id_ = 1;

  process::ProcessId announced_pid_ = 0; // dispatcher thread only
  std::thread dispatcher_;
};

} // namespace svcsup
