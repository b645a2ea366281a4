#include "../test_utils/RecordingReaper.hpp"
#include "../test_utils/TestFixtures.hpp"
#include "../test_utils/TestPorts.hpp"
#include "service-supervisor/Errors.hpp"
#include "service-supervisor/probe/PortProbe.hpp"
#include "service-supervisor/process/ServiceLauncher.hpp"
#include "service-supervisor/supervisor/Supervisor.hpp"
#include <atomic>
#include <csignal>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>

using namespace svcsup;

namespace {

/// Thread-safe record of everything a Supervisor published
class EventLog {
public:
  void attach(Supervisor &supervisor) {
    supervisor.subscribe([this](const SupervisorEvent &event) {
      std::lock_guard<std::mutex> lock(mutex_);
      events_.push_back(event);
    });
  }

  int count(SupervisorEvent::Kind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    int n = 0;
    for (const auto &event : events_) {
      if (event.kind == kind)
        ++n;
    }
    return n;
  }

  int transitions_to(ServiceState state) const {
    std::lock_guard<std::mutex> lock(mutex_);
    int n = 0;
    for (const auto &event : events_) {
      if (event.kind == SupervisorEvent::Kind::StateChanged &&
          event.to == state)
        ++n;
    }
    return n;
  }

  std::vector<SupervisorEvent> of(SupervisorEvent::Kind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SupervisorEvent> out;
    for (const auto &event : events_) {
      if (event.kind == kind)
        out.push_back(event);
    }
    return out;
  }

private:
  mutable std::mutex mutex_;
  std::vector<SupervisorEvent> events_;
};

} // namespace

class SupervisorLifecycleTest : public test::SupervisorTest {
protected:
  void SetUp() override {
    test::SupervisorTest::SetUp();
    base_port_ = test::find_free_port_range(4, 36000);
    ASSERT_NE(base_port_, 0);
  }

  SupervisorConfig config() const { return test::fast_config(base_port_); }

  uint16_t base_port_ = 0;
};

TEST_F(SupervisorLifecycleTest, StartsOnDefaultPort) {
  Supervisor supervisor(config());
  EventLog log;
  log.attach(supervisor);

  EXPECT_EQ(supervisor.state(), ServiceState::Idle);
  EXPECT_EQ(supervisor.start(), ServiceState::Running);
  EXPECT_EQ(supervisor.state(), ServiceState::Running);
  EXPECT_EQ(supervisor.current_port(), base_port_);
  EXPECT_TRUE(supervisor.is_running());
  EXPECT_TRUE(supervisor.is_ready(std::chrono::seconds(2)));

  auto info = supervisor.info();
  EXPECT_TRUE(info.running);
  EXPECT_TRUE(info.ready);
  EXPECT_TRUE(info.pid.has_value());
  EXPECT_EQ(info.port, base_port_);

  EXPECT_TRUE(test::wait_until(
      [&]() { return log.count(SupervisorEvent::Kind::Ready) == 1; },
      std::chrono::seconds(2)));
  auto ready = log.of(SupervisorEvent::Kind::Ready);
  ASSERT_EQ(ready.size(), 1u);
  EXPECT_EQ(ready[0].port, base_port_);

  EXPECT_TRUE(supervisor.stop());
  EXPECT_EQ(supervisor.state(), ServiceState::Stopped);
  EXPECT_FALSE(supervisor.is_running());
  EXPECT_FALSE(probe::is_port_bound(base_port_));
}

TEST_F(SupervisorLifecycleTest, MovesToNextPortWhenOccupantCannotBeKilled) {
  test::PortHolder holder(base_port_);
  ASSERT_TRUE(holder.holding());

  Supervisor supervisor(config());
  EXPECT_EQ(supervisor.start(), ServiceState::Running);
  EXPECT_EQ(supervisor.current_port(), base_port_ + 1);
  EXPECT_TRUE(holder.holding());
  EXPECT_TRUE(supervisor.stop());
}

TEST_F(SupervisorLifecycleTest, ReapsPortOwnerBeforeMovingOn) {
  test::PortHolder holder(base_port_);
  ASSERT_TRUE(holder.holding());

  auto reaper = std::make_unique<test::RecordingReaper>();
  auto *recorded = reaper.get();
  Supervisor supervisor(config(), std::move(reaper));
  EXPECT_EQ(supervisor.start(), ServiceState::Running);

  // By-port first; the occupant survives, so by-name follows
  auto ports = recorded->port_requests();
  ASSERT_EQ(ports.size(), 1u);
  EXPECT_EQ(ports[0], base_port_);
  auto names = recorded->name_requests();
  ASSERT_EQ(names.size(), 1u);
  EXPECT_EQ(names[0], default_process_name(test::fake_backend_path()));
  EXPECT_EQ(supervisor.current_port(), base_port_ + 1);

  EXPECT_TRUE(supervisor.stop());
}

TEST_F(SupervisorLifecycleTest, OnlyPreferredPortIsReaped) {
  test::PortHolder first(base_port_);
  test::PortHolder second(static_cast<uint16_t>(base_port_ + 1));
  ASSERT_TRUE(first.holding());
  ASSERT_TRUE(second.holding());

  auto reaper = std::make_unique<test::RecordingReaper>();
  auto *recorded = reaper.get();
  Supervisor supervisor(config(), std::move(reaper));
  EXPECT_EQ(supervisor.start(), ServiceState::Running);

  // The neighbour's occupant is skipped, never killed
  auto ports = recorded->port_requests();
  ASSERT_EQ(ports.size(), 1u);
  EXPECT_EQ(ports[0], base_port_);
  EXPECT_EQ(recorded->name_requests().size(), 1u);
  EXPECT_EQ(supervisor.current_port(), base_port_ + 2);
  EXPECT_TRUE(second.holding());

  EXPECT_TRUE(supervisor.stop());
}

TEST_F(SupervisorLifecycleTest, UnexpectedStartErrorSettlesInFailed) {
  test::PortHolder holder(base_port_);
  ASSERT_TRUE(holder.holding());

  auto reaper = std::make_unique<test::RecordingReaper>();
  auto *recorded = reaper.get();
  recorded->set_port_failure("reaper unavailable");
  Supervisor supervisor(config(), std::move(reaper));
  EventLog log;
  log.attach(supervisor);

  EXPECT_THROW(supervisor.start(), std::runtime_error);
  EXPECT_EQ(supervisor.state(), ServiceState::Failed);
  ASSERT_TRUE(supervisor.last_error().has_value());
  EXPECT_EQ(supervisor.last_error()->kind, ErrorKind::LaunchError);
  EXPECT_EQ(supervisor.last_error()->message, "reaper unavailable");
  EXPECT_FALSE(supervisor.is_running());
  EXPECT_TRUE(test::wait_until(
      [&]() { return log.transitions_to(ServiceState::Failed) == 1; },
      std::chrono::seconds(2)));

  // Not stuck in Starting: the next start really launches
  holder.release();
  recorded->set_port_failure("");
  EXPECT_EQ(supervisor.start(), ServiceState::Running);
  EXPECT_EQ(supervisor.current_port(), base_port_);
  EXPECT_TRUE(supervisor.stop());
}

TEST_F(SupervisorLifecycleTest, PortConflictUnresolvedWhenRangeExhausted) {
  auto cfg = config();
  cfg.ports.max_attempts = 2;
  test::PortHolder first(base_port_);
  test::PortHolder second(static_cast<uint16_t>(base_port_ + 1));
  ASSERT_TRUE(first.holding());
  ASSERT_TRUE(second.holding());

  Supervisor supervisor(cfg, std::make_unique<test::RecordingReaper>());
  EXPECT_THROW(supervisor.start(), PortConflictUnresolved);
  EXPECT_EQ(supervisor.state(), ServiceState::Failed);
  ASSERT_TRUE(supervisor.last_error().has_value());
  EXPECT_EQ(supervisor.last_error()->kind, ErrorKind::PortConflictUnresolved);
  EXPECT_FALSE(supervisor.is_running());
}

TEST_F(SupervisorLifecycleTest, StopWithoutStartIsSuccess) {
  Supervisor supervisor(config());
  EXPECT_TRUE(supervisor.stop());
  EXPECT_EQ(supervisor.state(), ServiceState::Idle);
  EXPECT_FALSE(supervisor.is_running());
  EXPECT_FALSE(supervisor.is_ready(std::chrono::milliseconds(100)));
}

TEST_F(SupervisorLifecycleTest, StopStartCycle) {
  Supervisor supervisor(config());
  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(supervisor.start(), ServiceState::Running) << "cycle " << i;
    EXPECT_TRUE(supervisor.is_running());
    EXPECT_TRUE(supervisor.stop());
    EXPECT_FALSE(supervisor.is_running());
  }
  EXPECT_EQ(supervisor.current_port(), base_port_);
}

TEST_F(SupervisorLifecycleTest, StartWhileRunningIsNoOp) {
  Supervisor supervisor(config());
  EventLog log;
  log.attach(supervisor);

  ASSERT_EQ(supervisor.start(), ServiceState::Running);
  auto pid = supervisor.info().pid;
  EXPECT_EQ(supervisor.start(), ServiceState::Running);
  EXPECT_EQ(supervisor.info().pid, pid);
  EXPECT_EQ(log.transitions_to(ServiceState::Starting), 1);
  EXPECT_TRUE(supervisor.stop());
}

TEST_F(SupervisorLifecycleTest, ConcurrentStartsSpawnOnce) {
  auto cfg = config();
  cfg.service.env["FAKE_BACKEND_READY_DELAY_MS"] = "300";
  Supervisor supervisor(cfg);
  EventLog log;
  log.attach(supervisor);

  ServiceState a = ServiceState::Idle;
  ServiceState b = ServiceState::Idle;
  std::thread first([&]() { a = supervisor.start(); });
  std::thread second([&]() { b = supervisor.start(); });
  first.join();
  second.join();

  EXPECT_EQ(a, ServiceState::Running);
  EXPECT_EQ(b, ServiceState::Running);
  EXPECT_TRUE(test::wait_until(
      [&]() { return log.count(SupervisorEvent::Kind::Ready) >= 1; },
      std::chrono::seconds(2)));
  EXPECT_EQ(log.transitions_to(ServiceState::Starting), 1);
  EXPECT_EQ(log.count(SupervisorEvent::Kind::Ready), 1);
  EXPECT_TRUE(supervisor.stop());
}

TEST_F(SupervisorLifecycleTest, DelayedMarkerBecomesReady) {
  auto cfg = config();
  cfg.service.env["FAKE_BACKEND_READY_DELAY_MS"] = "1000";
  Supervisor supervisor(cfg);

  EXPECT_EQ(supervisor.start(), ServiceState::Running);
  EXPECT_TRUE(supervisor.is_ready(std::chrono::seconds(5)));
  EXPECT_TRUE(supervisor.stop());
}

TEST_F(SupervisorLifecycleTest, HealthProbeAloneEstablishesReadiness) {
  auto cfg = config();
  cfg.service.env["FAKE_BACKEND_HEALTH_ONLY"] = "1";
  Supervisor supervisor(cfg);
  EventLog log;
  log.attach(supervisor);

  EXPECT_EQ(supervisor.start(), ServiceState::Running);
  EXPECT_TRUE(supervisor.info().ready);
  EXPECT_TRUE(test::wait_until(
      [&]() { return log.count(SupervisorEvent::Kind::Ready) == 1; },
      std::chrono::seconds(2)));
  EXPECT_TRUE(supervisor.stop());
}

TEST_F(SupervisorLifecycleTest, UnterminatedMarkerEstablishesReadiness) {
  auto cfg = config();
  cfg.service.env["FAKE_BACKEND_MARKER_NO_NEWLINE"] = "1";
  // Health answers 404 here, so only the marker can signal readiness
  cfg.service.health_path = "/not-served";
  cfg.readiness.attempts = 20;
  Supervisor supervisor(cfg);
  EventLog log;
  log.attach(supervisor);

  EXPECT_EQ(supervisor.start(), ServiceState::Running);
  EXPECT_TRUE(supervisor.info().ready);
  EXPECT_TRUE(test::wait_until(
      [&]() { return log.count(SupervisorEvent::Kind::Ready) == 1; },
      std::chrono::seconds(2)));
  EXPECT_TRUE(supervisor.stop());
}

TEST_F(SupervisorLifecycleTest, SilentServiceTimesOutAndCanBeStopped) {
  auto cfg = config();
  cfg.service.env["FAKE_BACKEND_SILENT"] = "1";
  cfg.readiness.attempts = 5;
  cfg.readiness.interval = std::chrono::milliseconds(100);
  cfg.readiness.probe_timeout = std::chrono::milliseconds(100);
  Supervisor supervisor(cfg);

  EXPECT_THROW(supervisor.start(), ReadinessTimeout);
  EXPECT_EQ(supervisor.state(), ServiceState::Failed);
  ASSERT_TRUE(supervisor.last_error().has_value());
  EXPECT_EQ(supervisor.last_error()->kind, ErrorKind::ReadinessTimeout);

  // The unready process is retained so it can be stopped
  EXPECT_TRUE(supervisor.is_running());
  EXPECT_FALSE(supervisor.is_ready(std::chrono::milliseconds(100)));
  EXPECT_TRUE(supervisor.stop());
  EXPECT_EQ(supervisor.state(), ServiceState::Stopped);
  EXPECT_FALSE(supervisor.is_running());
}

TEST_F(SupervisorLifecycleTest, StopIsBoundedWhenGracefulSignalIgnored) {
  auto cfg = config();
  cfg.service.env["FAKE_BACKEND_IGNORE_TERM"] = "1";
  Supervisor supervisor(cfg);
  ASSERT_EQ(supervisor.start(), ServiceState::Running);

  auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(supervisor.stop());
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(supervisor.is_running());
  EXPECT_LT(elapsed, cfg.termination.wait * cfg.termination.attempts +
                         std::chrono::seconds(1));
  auto exit = supervisor.last_exit();
  ASSERT_TRUE(exit.has_value());
#ifndef _WIN32
  EXPECT_EQ(exit->term_signal, SIGKILL);
#endif
}

TEST_F(SupervisorLifecycleTest, UnsolicitedExitIsObserved) {
  auto cfg = config();
  cfg.service.env["FAKE_BACKEND_EXIT_AFTER_MS"] = "1000";
  cfg.service.env["FAKE_BACKEND_EXIT_CODE"] = "5";
  Supervisor supervisor(cfg);
  EventLog log;
  log.attach(supervisor);

  ASSERT_EQ(supervisor.start(), ServiceState::Running);
  EXPECT_TRUE(test::wait_until(
      [&]() { return supervisor.state() == ServiceState::Stopped; },
      std::chrono::seconds(5)));
  EXPECT_FALSE(supervisor.is_running());

  EXPECT_TRUE(test::wait_until(
      [&]() { return log.count(SupervisorEvent::Kind::Exited) == 1; },
      std::chrono::seconds(2)));
  auto exited = log.of(SupervisorEvent::Kind::Exited);
  ASSERT_EQ(exited.size(), 1u);
  EXPECT_TRUE(exited[0].anomalous);
  EXPECT_EQ(exited[0].exit.exit_code, 5);

  ASSERT_TRUE(supervisor.last_exit().has_value());
  EXPECT_EQ(supervisor.last_exit()->exit_code, 5);

  // A fresh start works after the crash
  EXPECT_EQ(supervisor.start(), ServiceState::Running);
  EXPECT_TRUE(supervisor.stop());
}

TEST_F(SupervisorLifecycleTest, RequestedStopIsNotAnomalous) {
  Supervisor supervisor(config());
  EventLog log;
  log.attach(supervisor);

  ASSERT_EQ(supervisor.start(), ServiceState::Running);
  EXPECT_TRUE(supervisor.stop());
  EXPECT_TRUE(test::wait_until(
      [&]() { return log.count(SupervisorEvent::Kind::Exited) == 1; },
      std::chrono::seconds(2)));
  EXPECT_FALSE(log.of(SupervisorEvent::Kind::Exited)[0].anomalous);
}

TEST_F(SupervisorLifecycleTest, EarlyExitIsLaunchError) {
  auto cfg = config();
  cfg.service.env["FAKE_BACKEND_SILENT"] = "1";
  cfg.service.env["FAKE_BACKEND_EXIT_AFTER_MS"] = "0";
  cfg.service.env["FAKE_BACKEND_EXIT_CODE"] = "7";
  Supervisor supervisor(cfg);

  EXPECT_THROW(supervisor.start(), LaunchError);
  EXPECT_EQ(supervisor.state(), ServiceState::Failed);
  EXPECT_FALSE(supervisor.is_running());
  ASSERT_TRUE(supervisor.last_exit().has_value());
  EXPECT_EQ(supervisor.last_exit()->exit_code, 7);
}

TEST_F(SupervisorLifecycleTest, MissingExecutableIsLaunchError) {
  auto cfg = config();
  cfg.service.executable = "/nonexistent/backend-server";
  Supervisor supervisor(cfg, std::make_unique<test::RecordingReaper>());

  EXPECT_THROW(supervisor.start(), LaunchError);
  EXPECT_EQ(supervisor.state(), ServiceState::Failed);
  ASSERT_TRUE(supervisor.last_error().has_value());
  EXPECT_EQ(supervisor.last_error()->kind, ErrorKind::LaunchError);
}

TEST_F(SupervisorLifecycleTest, ShutdownCancelsReadinessWait) {
  auto cfg = config();
  cfg.service.env["FAKE_BACKEND_SILENT"] = "1";
  cfg.readiness.attempts = 200;
  cfg.readiness.probe_timeout = std::chrono::milliseconds(100);
  Supervisor supervisor(cfg);

  std::thread canceller([&]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    supervisor.request_shutdown();
  });

  auto start = std::chrono::steady_clock::now();
  auto state = supervisor.start();
  auto elapsed = std::chrono::steady_clock::now() - start;
  canceller.join();

  EXPECT_EQ(state, ServiceState::Failed);
  EXPECT_LT(elapsed, std::chrono::seconds(3));
  ASSERT_TRUE(supervisor.last_error().has_value());
  EXPECT_EQ(supervisor.last_error()->kind, ErrorKind::Cancelled);

  EXPECT_TRUE(supervisor.stop());
  EXPECT_FALSE(supervisor.is_running());

  // Later starts are refused
  EXPECT_NE(supervisor.start(), ServiceState::Running);
  EXPECT_FALSE(supervisor.is_running());
}

TEST_F(SupervisorLifecycleTest, RestartReplacesInstance) {
  Supervisor supervisor(config());
  ASSERT_EQ(supervisor.start(), ServiceState::Running);
  auto first_pid = supervisor.info().pid;

  EXPECT_EQ(supervisor.restart(), ServiceState::Running);
  auto second_pid = supervisor.info().pid;
  ASSERT_TRUE(first_pid.has_value());
  ASSERT_TRUE(second_pid.has_value());
  EXPECT_NE(*first_pid, *second_pid);
  EXPECT_TRUE(supervisor.is_running());
  EXPECT_TRUE(supervisor.stop());
}

TEST_F(SupervisorLifecycleTest, CleanupServicePortOnFreePort) {
  auto reaper = std::make_unique<test::RecordingReaper>();
  auto *recorded = reaper.get();
  Supervisor supervisor(config(), std::move(reaper));

  auto outcome = supervisor.cleanup_service_port();
  EXPECT_TRUE(outcome.succeeded) << outcome.detail;
  EXPECT_TRUE(recorded->port_requests().empty());
  EXPECT_EQ(supervisor.state(), ServiceState::Idle);
}

TEST_F(SupervisorLifecycleTest, CleanupServicePortReapsOccupant) {
  auto cfg = config();

  // An instance left running by a supervisor that is now gone
  process::LaunchSpec spec;
  spec.executable = cfg.service.executable;
  auto orphan = process::ServiceLauncher(spec).spawn(base_port_);
  ASSERT_TRUE(test::wait_until(
      [&]() { return probe::is_port_bound(base_port_); },
      std::chrono::seconds(5)));

  Supervisor supervisor(cfg);
  auto outcome = supervisor.cleanup_service_port();
  EXPECT_TRUE(outcome.succeeded) << outcome.detail;
  EXPECT_FALSE(probe::is_port_bound(base_port_));
  EXPECT_TRUE(orphan->wait_for_exit(std::chrono::seconds(3)));
  EXPECT_EQ(supervisor.state(), ServiceState::Idle);
}

TEST_F(SupervisorLifecycleTest, CleanupRefusedWhileSupervising) {
  Supervisor supervisor(config());
  ASSERT_EQ(supervisor.start(), ServiceState::Running);

  EXPECT_FALSE(supervisor.cleanup_stale_previous_instances().succeeded);
  EXPECT_FALSE(supervisor.cleanup_service_port().succeeded);
  EXPECT_TRUE(supervisor.is_running());
  EXPECT_TRUE(supervisor.stop());
}

TEST_F(SupervisorLifecycleTest, StaleCleanupReapsByName) {
  auto reaper = std::make_unique<test::RecordingReaper>();
  auto *recorded = reaper.get();
  auto cfg = config();
  cfg.service.process_name = "backend-server";
  Supervisor supervisor(cfg, std::move(reaper));

  EXPECT_TRUE(supervisor.cleanup_stale_previous_instances().succeeded);
  auto names = recorded->name_requests();
  ASSERT_EQ(names.size(), 1u);
  EXPECT_EQ(names[0], "backend-server");

  recorded->set_name_outcome(CleanupOutcome::failed("access denied"));
  auto outcome = supervisor.cleanup_stale_previous_instances();
  EXPECT_FALSE(outcome.succeeded);
  EXPECT_EQ(outcome.detail, "access denied");
}

TEST_F(SupervisorLifecycleTest, StderrWarningsArePublished) {
  auto cfg = config();
  cfg.service.env["FAKE_BACKEND_STDERR"] = "WARNING: deprecated option";
  Supervisor supervisor(cfg);
  EventLog log;
  log.attach(supervisor);

  ASSERT_EQ(supervisor.start(), ServiceState::Running);
  EXPECT_TRUE(test::wait_until(
      [&]() { return log.count(SupervisorEvent::Kind::OutputWarning) >= 1; },
      std::chrono::seconds(2)));
  auto warnings = log.of(SupervisorEvent::Kind::OutputWarning);
  ASSERT_FALSE(warnings.empty());
  EXPECT_EQ(warnings[0].line, "WARNING: deprecated option");
  EXPECT_TRUE(supervisor.stop());
}

TEST_F(SupervisorLifecycleTest, UnsubscribedListenerIsNotCalled) {
  Supervisor supervisor(config());
  std::atomic<int> calls{0};
  int id = supervisor.subscribe([&](const SupervisorEvent &) { ++calls; });
  supervisor.unsubscribe(id);
  EventLog log;
  log.attach(supervisor);

  ASSERT_EQ(supervisor.start(), ServiceState::Running);
  EXPECT_TRUE(supervisor.stop());
  EXPECT_TRUE(test::wait_until(
      [&]() { return log.transitions_to(ServiceState::Stopped) == 1; },
      std::chrono::seconds(2)));
  EXPECT_EQ(calls.load(), 0);
}

TEST_F(SupervisorLifecycleTest, DestructorStopsService) {
  std::optional<long> pid;
  {
    Supervisor supervisor(config());
    ASSERT_EQ(supervisor.start(), ServiceState::Running);
    pid = supervisor.info().pid;
  }
  ASSERT_TRUE(pid.has_value());
  EXPECT_TRUE(test::wait_until(
      [&]() { return !probe::is_port_bound(base_port_); },
      std::chrono::seconds(2)));
}
