#include "service-supervisor/supervisor/Supervisor.hpp"
#include "service-supervisor/Logger.hpp"
#include "service-supervisor/probe/PortProbe.hpp"
#include <algorithm>

namespace svcsup {

namespace {

process::LaunchSpec make_launch_spec(const SupervisorConfig &config) {
  process::LaunchSpec spec;
  spec.executable = config.service.executable;
  spec.mode = config.service.mode;
  spec.env = config.service.env;
  return spec;
}

std::string reap_target(const SupervisorConfig &config) {
  if (!config.service.process_name.empty())
    return config.service.process_name;
  if (config.service.executable.empty())
    return "";
  return default_process_name(config.service.executable);
}

} // namespace

Supervisor::Supervisor(SupervisorConfig config,
                       std::unique_ptr<process::ProcessReaper> reaper)
    : config_(std::move(config)), reaper_(std::move(reaper)),
      launcher_(make_launch_spec(config_)), reap_name_(reap_target(config_)),
      escalator_(*reaper_, reap_name_,
                 RetryPolicy{config_.termination.attempts,
                             config_.termination.wait}),
      port_(config_.ports.default_port) {
  dispatcher_ = std::thread([this]() { dispatch_loop(); });
  LOG_DEBUG("SUPERVISOR", "INIT", "Supervisor for {} (default port {})",
            config_.service.executable, config_.ports.default_port);
}

Supervisor::~Supervisor() {
  shutdown_.cancel();
  {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (has_instance()) {
      LOG_INFO("SUPERVISOR", "SHUTDOWN", "Stopping service before exit");
      try {
        stop_locked();
      } catch (const std::exception &e) {
        LOG_ERROR("SUPERVISOR", "SHUTDOWN", "Stop during shutdown failed: {}",
                  e.what());
      }
    }
  }
  events_.close();
  if (dispatcher_.joinable()) {
    dispatcher_.join();
  }
}

// Control operations

ServiceState Supervisor::start(std::optional<uint16_t> preferred_port) {
  std::lock_guard<std::mutex> lock(control_mutex_);
  return start_locked(preferred_port);
}

bool Supervisor::stop() {
  std::lock_guard<std::mutex> lock(control_mutex_);
  return stop_locked();
}

ServiceState Supervisor::restart(std::optional<uint16_t> preferred_port) {
  std::lock_guard<std::mutex> lock(control_mutex_);
  LOG_INFO("SUPERVISOR", "RESTART", "Restarting service");

  if (!stop_locked()) {
    LOG_ERROR("SUPERVISOR", "RESTART",
              "Previous instance could not be stopped; not restarting");
    return state();
  }

  if (shutdown_.wait_for(config_.restart_delay)) {
    record_error(ErrorKind::Cancelled, "restart interrupted by shutdown");
    return state();
  }
  return start_locked(preferred_port);
}

ServiceState Supervisor::start_locked(std::optional<uint16_t> preferred_port) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == ServiceState::Running || state_ == ServiceState::Starting) {
      LOG_DEBUG("SUPERVISOR", "START", "Already {}, nothing to do",
                to_string(state_));
      return state_;
    }
  }

  if (shutdown_.is_cancelled()) {
    LOG_WARN("SUPERVISOR", "START", "Shutdown requested, not starting");
    record_error(ErrorKind::Cancelled, "shutdown requested");
    return state();
  }

  // A Failed start may have left a live process behind
  if (has_instance()) {
    LOG_INFO("SUPERVISOR", "START", "Reaping retained instance first");
    if (!stop_locked()) {
      throw TerminationIncomplete("retained instance could not be stopped");
    }
  }

  transition(ServiceState::Starting);

  try {
    return launch_locked(preferred_port.value_or(config_.ports.default_port));
  } catch (const SupervisorError &) {
    throw;
  } catch (const std::exception &e) {
    abandon_start(e.what());
    throw;
  }
}

ServiceState Supervisor::launch_locked(uint16_t base) {
  std::optional<uint16_t> port = resolve_port(base);
  if (!port) {
    if (shutdown_.is_cancelled()) {
      record_error(ErrorKind::Cancelled, "port resolution interrupted");
      transition(ServiceState::Failed);
      return ServiceState::Failed;
    }
    std::string msg = "no free port in " + std::to_string(base) + ".." +
                      std::to_string(base + config_.ports.max_attempts - 1);
    LOG_ERROR("SUPERVISOR", "PORT", "{}", msg);
    record_error(ErrorKind::PortConflictUnresolved, msg);
    transition(ServiceState::Failed);
    throw PortConflictUnresolved(msg);
  }

  std::unique_ptr<process::ServiceHandle> spawned;
  try {
    spawned = launcher_.spawn(*port);
  } catch (const LaunchError &e) {
    LOG_ERROR("SUPERVISOR", "START", "Launch failed: {}", e.what());
    record_error(ErrorKind::LaunchError, e.what());
    transition(ServiceState::Failed);
    throw;
  }

  // The handle stays valid: only control operations release it, and the
  // dispatcher only detaches it from a Running supervisor.
  process::ServiceHandle *handle = spawned.get();
  ReadinessMonitor *monitor = nullptr;
  attach_instance(std::move(spawned), *port);
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    monitor = monitor_.get();
  }
  const auto pid = handle->pid();

  LOG_INFO("SUPERVISOR", "READY_WAIT",
           "Waiting for PID={} on port {} ({} x {}ms)", pid, *port,
           config_.readiness.attempts, config_.readiness.interval.count());

  bool exited_early = false;
  RetryPolicy policy{config_.readiness.attempts, config_.readiness.interval};
  auto outcome = retry_bounded(
      policy,
      [&](int attempt) {
        if (monitor->marker_seen()) {
          mark_ready(pid);
          return true;
        }
        if (!handle->is_alive()) {
          exited_early = true;
          return true;
        }
        if (ReadinessMonitor::poll_health(*port,
                                          config_.readiness.probe_timeout,
                                          config_.service.health_path)) {
          mark_ready(pid);
          return true;
        }
        LOG_TRACE("SUPERVISOR", "READY_WAIT", "Not ready yet (attempt {}/{})",
                  attempt, config_.readiness.attempts);
        return false;
      },
      &shutdown_);

  if (exited_early) {
    auto status = handle->exit_status();
    std::string msg = "service exited before becoming ready (" +
                      (status ? status->describe() : std::string("unknown")) +
                      ")";
    LOG_ERROR("SUPERVISOR", "START", "{}", msg);
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      last_exit_ = status;
    }
    release_instance();
    record_error(ErrorKind::LaunchError, msg);
    transition(ServiceState::Failed);
    throw LaunchError(msg);
  }

  switch (outcome) {
  case RetryOutcome::Succeeded:
    transition(ServiceState::Running);
    LOG_INFO("SUPERVISOR", "START", "Service PID={} is ready on port {}", pid,
             *port);
    return ServiceState::Running;

  case RetryOutcome::Cancelled:
    LOG_WARN("SUPERVISOR", "START",
             "Readiness wait cancelled; PID={} retained for stop", pid);
    record_error(ErrorKind::Cancelled, "readiness wait cancelled");
    transition(ServiceState::Failed);
    return ServiceState::Failed;

  case RetryOutcome::Exhausted:
    break;
  }

  std::string msg = "service on port " + std::to_string(*port) +
                    " not ready after " +
                    std::to_string(config_.readiness.attempts) + " attempts";
  LOG_ERROR("SUPERVISOR", "START", "{}", msg);
  record_error(ErrorKind::ReadinessTimeout, msg);
  transition(ServiceState::Failed);
  throw ReadinessTimeout(msg);
}

void Supervisor::abandon_start(const std::string &reason) {
  LOG_ERROR("SUPERVISOR", "START", "Start aborted: {}", reason);
  process::ServiceHandle *handle = nullptr;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    handle = handle_.get();
  }

  if (handle) {
    bool stopped = false;
    try {
      stopped = escalator_.stop(handle);
    } catch (const TerminationIncomplete &e) {
      LOG_ERROR("SUPERVISOR", "START", "{}", e.what());
    }
    if (stopped) {
      release_instance();
    } else {
      // Kept so a later stop or start can retry the reap
      auto by_name = reaper_->kill_by_name(reap_name_);
      LOG_WARN("SUPERVISOR", "START", "By-name reap: {}", by_name.detail);
    }
  }

  record_error(ErrorKind::LaunchError, reason);
  transition(ServiceState::Failed);
}

bool Supervisor::stop_locked() {
  process::ServiceHandle *handle = nullptr;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!handle_) {
      if (state_ != ServiceState::Idle && state_ != ServiceState::Stopped) {
        transition_locked(ServiceState::Stopped);
      }
      LOG_DEBUG("SUPERVISOR", "STOP", "No running instance");
      return true;
    }
    transition_locked(ServiceState::Stopping);
    handle = handle_.get();
  }

  LOG_INFO("SUPERVISOR", "STOP", "Stopping service PID={}", handle->pid());

  bool stopped = false;
  try {
    stopped = escalator_.stop(handle);
  } catch (const TerminationIncomplete &e) {
    LOG_ERROR("SUPERVISOR", "STOP", "{}", e.what());
    record_error(ErrorKind::TerminationIncomplete, e.what());
    transition(ServiceState::Failed);
    return false;
  }

  if (!stopped) {
    record_error(ErrorKind::TerminationIncomplete,
                 "service handle could not be signalled");
    transition(ServiceState::Failed);
    return false;
  }

  if (auto status = handle->exit_status()) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_exit_ = status;
  }
  release_instance();
  transition(ServiceState::Stopped);
  LOG_INFO("SUPERVISOR", "STOP", "Service stopped");
  return true;
}

// Port resolution

std::optional<uint16_t> Supervisor::resolve_port(uint16_t base) {
  const int budget = std::min(config_.ports.max_attempts, 65535 - base + 1);
  std::optional<uint16_t> chosen;

  retry_bounded(
      RetryPolicy{budget, std::chrono::milliseconds(0)},
      [&](int attempt) {
        auto candidate = static_cast<uint16_t>(base + attempt - 1);
        // Only the preferred port is reaped; neighbours are merely skipped
        const bool available = candidate == base
                                   ? free_port(candidate)
                                   : !probe::is_port_bound(candidate);
        if (available) {
          chosen = candidate;
          return true;
        }
        LOG_WARN("SUPERVISOR", "PORT", "Port {} unavailable, trying next",
                 candidate);
        return false;
      },
      &shutdown_);

  if (chosen && *chosen != base) {
    LOG_INFO("SUPERVISOR", "PORT", "Using port {} instead of {}", *chosen,
             base);
  }
  return chosen;
}

bool Supervisor::free_port(uint16_t port) {
  if (!probe::is_port_bound(port))
    return true;

  LOG_INFO("SUPERVISOR", "PORT", "Port {} in use, reaping its owner", port);
  auto by_port = reaper_->kill_by_port(port);
  LOG_DEBUG("SUPERVISOR", "PORT", "By-port reap: {}", by_port.detail);
  if (by_port.succeeded && wait_port_released(port))
    return true;

  auto by_name = reaper_->kill_by_name(reap_name_);
  LOG_DEBUG("SUPERVISOR", "PORT", "By-name reap: {}", by_name.detail);
  return wait_port_released(port);
}

bool Supervisor::wait_port_released(uint16_t port) {
  RetryPolicy policy{config_.ports.release_checks, config_.ports.release_wait};
  auto outcome = retry_bounded(
      policy, [&](int) { return !probe::is_port_bound(port); }, &shutdown_);
  return outcome == RetryOutcome::Succeeded;
}

// Instance bookkeeping

void Supervisor::attach_instance(
    std::unique_ptr<process::ServiceHandle> handle, uint16_t port) {
  const auto pid = handle->pid();
  process::ServiceHandle &owned = *handle;
  ReadinessMonitor *monitor = nullptr;
  {
    // Owned before any reader starts, so a failed attach can still reap it
    std::lock_guard<std::mutex> lock(state_mutex_);
    handle_ = std::move(handle);
    monitor_ =
        std::make_unique<ReadinessMonitor>(config_.service.readiness_marker);
    monitor = monitor_.get();
    port_ = port;
    ready_ = false;
    current_pid_ = pid;
  }

  monitor->attach(owned, [this, pid](const OutputLine &line) {
    InstanceEvent event;
    event.kind = InstanceEvent::Kind::LineReceived;
    event.pid = pid;
    event.line = line;
    events_.push(std::move(event));
  });
  owned.watch_exit([this](process::ProcessId exited_pid,
                          const ExitStatus &status) {
    InstanceEvent event;
    event.kind = InstanceEvent::Kind::ProcessExited;
    event.pid = exited_pid;
    event.exit = status;
    events_.push(std::move(event));
  });
}

void Supervisor::release_instance() {
  std::unique_ptr<ReadinessMonitor> monitor;
  std::unique_ptr<process::ServiceHandle> handle;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    monitor = std::move(monitor_);
    handle = std::move(handle_);
    ready_ = false;
    current_pid_ = 0;
  }
  // Readers must stop before the handle closes their pipes
  monitor.reset();
  handle.reset();
}

bool Supervisor::has_instance() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return handle_ != nullptr;
}

void Supervisor::transition(ServiceState to) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  transition_locked(to);
}

void Supervisor::transition_locked(ServiceState to) {
  if (state_ == to)
    return;
  InstanceEvent event;
  event.kind = InstanceEvent::Kind::StateChanged;
  event.from = state_;
  event.to = to;
  LOG_INFO("SUPERVISOR", "STATE", "{} -> {}", to_string(state_), to_string(to));
  state_ = to;
  events_.push(std::move(event));
}

void Supervisor::record_error(ErrorKind kind, const std::string &message) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  last_error_ = LastError{kind, message};
}

void Supervisor::mark_ready(process::ProcessId pid) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (pid != current_pid_)
      return;
    ready_ = true;
  }
  InstanceEvent event;
  event.kind = InstanceEvent::Kind::ProbeResult;
  event.pid = pid;
  event.ready = true;
  events_.push(std::move(event));
}

// Queries

bool Supervisor::is_ready(std::chrono::milliseconds timeout) {
  uint16_t port = 0;
  process::ProcessId pid = 0;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (ready_)
      return true;
    if (!handle_)
      return false;
    port = port_;
    pid = current_pid_;
  }

  if (!ReadinessMonitor::poll_health(port, timeout,
                                     config_.service.health_path))
    return false;
  mark_ready(pid);
  return true;
}

bool Supervisor::is_running() {
  std::unique_ptr<ReadinessMonitor> monitor;
  std::unique_ptr<process::ServiceHandle> handle;
  bool alive = false;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!handle_)
      return false;
    alive = handle_->is_alive();
    if (!alive && state_ == ServiceState::Running) {
      LOG_WARN("SUPERVISOR", "CHECK", "Service PID={} is gone", current_pid_);
      monitor = std::move(monitor_);
      handle = std::move(handle_);
      ready_ = false;
      current_pid_ = 0;
      transition_locked(ServiceState::Stopped);
    }
  }
  monitor.reset();
  handle.reset();
  return alive;
}

uint16_t Supervisor::current_port() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return port_;
}

ServiceState Supervisor::state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

SupervisorInfo Supervisor::info() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  SupervisorInfo info;
  info.state = state_;
  info.port = port_;
  info.ready = ready_;
  if (handle_) {
    info.running = handle_->is_alive();
    info.pid = static_cast<long>(handle_->pid());
  }
  return info;
}

std::optional<ExitStatus> Supervisor::last_exit() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return last_exit_;
}

std::optional<LastError> Supervisor::last_error() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return last_error_;
}

// Cleanup

CleanupOutcome Supervisor::cleanup_stale_previous_instances() {
  std::lock_guard<std::mutex> lock(control_mutex_);
  if (has_instance()) {
    return CleanupOutcome::failed(
        "refusing to reap by name while an instance is supervised");
  }

  LOG_INFO("SUPERVISOR", "CLEANUP", "Reaping stale '{}' processes",
           reap_name_);
  auto outcome = reaper_->kill_by_name(reap_name_);
  if (outcome.succeeded) {
    LOG_INFO("SUPERVISOR", "CLEANUP", "{}", outcome.detail);
  } else {
    LOG_WARN("SUPERVISOR", "CLEANUP", "Stale cleanup incomplete: {}",
             outcome.detail);
  }
  return outcome;
}

CleanupOutcome Supervisor::cleanup_service_port() {
  std::lock_guard<std::mutex> lock(control_mutex_);
  const uint16_t port = config_.ports.default_port;
  {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    if (handle_ && port_ == port) {
      return CleanupOutcome::failed("port " + std::to_string(port) +
                                    " belongs to the supervised instance");
    }
  }

  auto status = probe::probe_port(port);
  if (status == PortStatus::Free) {
    LOG_INFO("SUPERVISOR", "CLEANUP", "Port {} is free", port);
    return CleanupOutcome::ok("port " + std::to_string(port) + " is free");
  }

  LOG_INFO("SUPERVISOR", "CLEANUP", "Port {} is {}, cleaning up", port,
           to_string(status));
  if (free_port(port)) {
    LOG_INFO("SUPERVISOR", "CLEANUP", "Port {} released", port);
    return CleanupOutcome::ok("port " + std::to_string(port) + " released");
  }

  LOG_WARN("SUPERVISOR", "CLEANUP", "Port {} is still in use", port);
  return CleanupOutcome::failed("port " + std::to_string(port) +
                                " is still in use");
}

// Subscribers

int Supervisor::subscribe(Listener listener) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  int id = next_listener_id_++;
  listeners_[id] = std::move(listener);
  return id;
}

void Supervisor::unsubscribe(int id) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  listeners_.erase(id);
}

void Supervisor::request_shutdown() {
  LOG_INFO("SUPERVISOR", "SHUTDOWN", "Shutdown requested");
  shutdown_.cancel();
}

// Dispatcher

void Supervisor::dispatch_loop() {
  InstanceEvent event;
  while (events_.pop(event)) {
    handle_event(event);
  }
}

void Supervisor::handle_event(const InstanceEvent &event) {
  switch (event.kind) {
  case InstanceEvent::Kind::LineReceived: {
    const auto &line = event.line;
    if (line.cls == LineClass::Info) {
      LOG_INFO("BACKEND", to_string(line.stream), "{}", line.text);
    } else {
      LOG_ERROR("BACKEND", to_string(line.stream), "{}", line.text);
      SupervisorEvent warning;
      warning.kind = SupervisorEvent::Kind::OutputWarning;
      warning.line = line.text;
      publish(warning);
    }
    if (line.marker)
      on_ready(event.pid);
    break;
  }

  case InstanceEvent::Kind::ProbeResult:
    if (event.ready)
      on_ready(event.pid);
    break;

  case InstanceEvent::Kind::ProcessExited:
    on_exit(event.pid, event.exit);
    break;

  case InstanceEvent::Kind::StateChanged: {
    SupervisorEvent changed;
    changed.kind = SupervisorEvent::Kind::StateChanged;
    changed.from = event.from;
    changed.to = event.to;
    publish(changed);
    break;
  }
  }
}

void Supervisor::on_ready(process::ProcessId pid) {
  uint16_t port = 0;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (pid != current_pid_)
      return; // stale instance
    ready_ = true;
    port = port_;
  }
  if (announced_pid_ == pid)
    return;
  announced_pid_ = pid;

  LOG_INFO("SUPERVISOR", "READY", "Backend ready on port {}", port);
  SupervisorEvent ready;
  ready.kind = SupervisorEvent::Kind::Ready;
  ready.port = port;
  publish(ready);
}

void Supervisor::on_exit(process::ProcessId pid, const ExitStatus &status) {
  std::unique_ptr<ReadinessMonitor> monitor;
  std::unique_ptr<process::ServiceHandle> handle;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_exit_ = status;
    // Stop and Start own the handle while Stopping/Starting
    if (pid == current_pid_ && state_ == ServiceState::Running) {
      monitor = std::move(monitor_);
      handle = std::move(handle_);
      ready_ = false;
      current_pid_ = 0;
      transition_locked(ServiceState::Stopped);
    }
  }
  monitor.reset();
  handle.reset();

  bool anomalous = !status.is_clean();
  if (anomalous) {
    LOG_ERROR("SUPERVISOR", "EXIT", "Backend PID={} exited abnormally ({})",
              pid, status.describe());
  } else {
    LOG_INFO("SUPERVISOR", "EXIT", "Backend PID={} exited ({})", pid,
             status.describe());
  }

  SupervisorEvent exited;
  exited.kind = SupervisorEvent::Kind::Exited;
  exited.exit = status;
  exited.anomalous = anomalous;
  publish(exited);
}

void Supervisor::publish(const SupervisorEvent &event) {
  std::vector<Listener> listeners;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    for (const auto &[id, listener] : listeners_)
      listeners.push_back(listener);
  }
  for (const auto &listener : listeners) {
    try {
      listener(event);
    } catch (const std::exception &e) {
      LOG_ERROR("SUPERVISOR", "PUBLISH", "Subscriber threw: {}", e.what());
    }
  }
}

} // namespace svcsup
