#include "service-supervisor/process/ServiceHandle.hpp"
#include "service-supervisor/Logger.hpp"
#include "service-supervisor/process/CommandRunner.hpp"

#ifndef _WIN32
#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace svcsup {
namespace process {

namespace {
constexpr auto kWatchInterval = std::chrono::milliseconds(50);
constexpr auto kExitPollInterval = std::chrono::milliseconds(20);
} // namespace

ServiceHandle::ServiceHandle(ProcessId pid, ProcessHandle handle,
                             PipeHandle stdout_pipe, PipeHandle stderr_pipe,
                             std::string executable, uint16_t port)
    : pid_(pid), handle_(handle), stdout_pipe_(stdout_pipe),
      stderr_pipe_(stderr_pipe), executable_(std::move(executable)),
      port_(port), launched_at_(std::chrono::system_clock::now()) {}

ServiceHandle::~ServiceHandle() {
  stop_watcher();
  // Collect the exit status if the process is already gone (avoids zombies)
  if (poll_exit() && watching_) {
    report_exit();
  }
  close_pipes();
#ifdef _WIN32
  if (handle_ != InvalidProcessHandle) {
    CloseHandle(handle_);
    handle_ = InvalidProcessHandle;
  }
#endif
  LOG_DEBUG("HANDLE", "CLOSE", "Released handle for PID={}", pid_);
}

void ServiceHandle::close_pipes() {
#ifdef _WIN32
  if (stdout_pipe_ != invalid_pipe())
    CloseHandle(stdout_pipe_);
  if (stderr_pipe_ != invalid_pipe())
    CloseHandle(stderr_pipe_);
#else
  if (stdout_pipe_ >= 0)
    close(stdout_pipe_);
  if (stderr_pipe_ >= 0)
    close(stderr_pipe_);
#endif
  stdout_pipe_ = invalid_pipe();
  stderr_pipe_ = invalid_pipe();
}

bool ServiceHandle::has_exited() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return exit_status_.has_value();
}

std::optional<ExitStatus> ServiceHandle::exit_status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return exit_status_;
}

bool ServiceHandle::is_alive() { return !poll_exit(); }

bool ServiceHandle::wait_for_exit(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!poll_exit()) {
    if (std::chrono::steady_clock::now() >= deadline)
      return false;
    std::this_thread::sleep_for(kExitPollInterval);
  }
  return true;
}

void ServiceHandle::watch_exit(
    std::function<void(ProcessId, const ExitStatus &)> on_exit) {
  if (watching_.exchange(true))
    return;

  on_exit_ = std::move(on_exit);
  {
    std::lock_guard<std::mutex> lk(watch_mutex_);
    watch_stop_ = false;
  }
  watch_thread_ = std::thread([this]() { watch_loop(); });
}

void ServiceHandle::stop_watcher() {
  {
    std::lock_guard<std::mutex> lk(watch_mutex_);
    watch_stop_ = true;
  }
  watch_cv_.notify_all();
  if (watch_thread_.joinable()) {
    watch_thread_.join();
  }
}

void ServiceHandle::watch_loop() {
  for (;;) {
    if (poll_exit()) {
      report_exit();
      return;
    }

    std::unique_lock<std::mutex> lk(watch_mutex_);
    if (watch_cv_.wait_for(lk, kWatchInterval, [this] { return watch_stop_; }))
      return;
  }
}

void ServiceHandle::report_exit() {
  if (exit_reported_.exchange(true))
    return;
  auto status = exit_status();
  if (!status)
    return;
  LOG_INFO("HANDLE", "EXIT", "Service PID={} exited ({})", pid_,
           status->describe());
  if (on_exit_) {
    on_exit_(pid_, *status);
  }
}

// Platform-specific implementations

#ifdef _WIN32

bool ServiceHandle::poll_exit() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (exit_status_)
    return true;
  if (handle_ == InvalidProcessHandle)
    return false;

  if (WaitForSingleObject(handle_, 0) != WAIT_OBJECT_0)
    return false;

  DWORD code = 0;
  if (!GetExitCodeProcess(handle_, &code))
    code = static_cast<DWORD>(-1);

  ExitStatus status;
  status.exit_code = static_cast<int>(code);
  exit_status_ = status;
  return true;
}

bool ServiceHandle::send_graceful() {
  if (has_exited())
    return true;
  // Windows has no SIGTERM for console-less children; taskkill without /F
  // posts WM_CLOSE to the process tree.
  auto result =
      run_command("taskkill /PID " + std::to_string(pid_) + " /T");
  if (!result.launched) {
    LOG_ERROR("HANDLE", "TERM", "Could not run taskkill for PID={}", pid_);
    return false;
  }
  return true;
}

bool ServiceHandle::send_forceful() {
  if (has_exited())
    return true;
  bool terminated = TerminateProcess(handle_, 1) != 0;
  if (!terminated) {
    LOG_WARN("HANDLE", "KILL", "TerminateProcess failed for PID={}: {}", pid_,
             GetLastError());
  }
  auto result =
      run_command("taskkill /F /PID " + std::to_string(pid_) + " /T");
  return terminated || result.launched;
}

#else // POSIX

bool ServiceHandle::poll_exit() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (exit_status_)
    return true;
  if (pid_ <= 0)
    return false;

  int status = 0;
  pid_t result = waitpid(pid_, &status, WNOHANG);
  if (result == 0)
    return false; // still running

  ExitStatus es;
  if (result == pid_) {
    if (WIFEXITED(status)) {
      es.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      es.term_signal = WTERMSIG(status);
    }
  } else if (errno == ECHILD) {
    // Not our child any more (already reaped elsewhere)
    if (kill(pid_, 0) == 0 || errno == EPERM)
      return false;
  } else {
    return false;
  }

  exit_status_ = es;
  return true;
}

bool ServiceHandle::send_graceful() {
  if (has_exited())
    return true;
  if (kill(pid_, SIGTERM) == 0 || errno == ESRCH)
    return true;
  LOG_ERROR("HANDLE", "TERM", "SIGTERM to PID={} failed: {}", pid_,
            strerror(errno));
  return false;
}

bool ServiceHandle::send_forceful() {
  if (has_exited())
    return true;
  if (kill(pid_, SIGKILL) == 0 || errno == ESRCH)
    return true;
  LOG_ERROR("HANDLE", "KILL", "SIGKILL to PID={} failed: {}", pid_,
            strerror(errno));
  return false;
}

#endif

} // namespace process
} // namespace svcsup
