#pragma once
#include "service-supervisor/export.h"
#include "service-supervisor/process/PlatformTypes.hpp"
#include "service-supervisor/types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace svcsup {
namespace process {

/// Exclusive reference to one spawned service process and its output pipes.
/// Closing (destruction) stops the exit watcher and releases all OS handles.
class SERVICE_SUPERVISOR_API ServiceHandle {
public:
  ServiceHandle(ProcessId pid, ProcessHandle handle, PipeHandle stdout_pipe,
                PipeHandle stderr_pipe, std::string executable, uint16_t port);
  ~ServiceHandle();

  ServiceHandle(const ServiceHandle &) = delete;
  ServiceHandle &operator=(const ServiceHandle &) = delete;

  ProcessId pid() const { return pid_; }
  uint16_t port() const { return port_; }
  const std::string &executable() const { return executable_; }
  std::chrono::system_clock::time_point launched_at() const {
    return launched_at_;
  }

  PipeHandle stdout_pipe() const { return stdout_pipe_; }
  PipeHandle stderr_pipe() const { return stderr_pipe_; }

  /// Start a background watcher that invokes `on_exit` once when the process
  /// ends. Has no effect if already watching. If the handle is closed after
  /// the process ended but before the watcher noticed, the callback fires
  /// from the destructor instead, so an observed exit is never lost.
  void watch_exit(std::function<void(ProcessId, const ExitStatus &)> on_exit);

  /// Lightweight existence check. Reaps the process if it has ended.
  bool is_alive();

  bool has_exited() const;
  std::optional<ExitStatus> exit_status() const;

  /// Returns true as soon as the process has ended, false on timeout
  bool wait_for_exit(std::chrono::milliseconds timeout);

  /// "Ask nicely": SIGTERM, or taskkill without /F on Windows.
  /// Returns false only if the OS refused to deliver it.
  bool send_graceful();

  /// "Kill now": SIGKILL, or TerminateProcess + taskkill /F /T on Windows
  bool send_forceful();

private:
  bool poll_exit();
  void watch_loop();
  void report_exit();
  void stop_watcher();
  void close_pipes();

  ProcessId pid_;
  ProcessHandle handle_;
  PipeHandle stdout_pipe_;
  PipeHandle stderr_pipe_;
  std::string executable_;
  uint16_t port_;
  std::chrono::system_clock::time_point launched_at_;

  mutable std::mutex mutex_;
  std::optional<ExitStatus> exit_status_;

  std::function<void(ProcessId, const ExitStatus &)> on_exit_;
  std::atomic<bool> watching_{false};
  std::atomic<bool> exit_reported_{false};
  std::mutex watch_mutex_;
  std::condition_variable watch_cv_;
  bool watch_stop_ = false;
  std::thread watch_thread_;
};

} // namespace process
} // namespace svcsup
