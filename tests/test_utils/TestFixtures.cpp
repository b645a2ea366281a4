#include "TestFixtures.hpp"
#include "service-supervisor/Logger.hpp"

#include <filesystem>
#include <thread>

namespace svcsup {
namespace test {

std::string fake_backend_path() {
#ifdef FAKE_BACKEND_PATH
  std::filesystem::path path(FAKE_BACKEND_PATH);
  if (std::filesystem::exists(path))
    return path.string();
#endif
#ifdef _WIN32
  return (std::filesystem::current_path() / "fake-backend.exe").string();
#else
  return (std::filesystem::current_path() / "fake-backend").string();
#endif
}

SupervisorConfig fast_config(uint16_t port) {
  SupervisorConfig config;
  config.service.executable = fake_backend_path();
  config.service.process_name = default_process_name(config.service.executable);
  config.ports.default_port = port;
  config.ports.max_attempts = 3;
  config.ports.release_checks = 3;
  config.ports.release_wait = std::chrono::milliseconds(50);
  config.readiness.attempts = 50;
  config.readiness.interval = std::chrono::milliseconds(100);
  config.readiness.probe_timeout = std::chrono::milliseconds(500);
  config.termination.attempts = 3;
  config.termination.wait = std::chrono::milliseconds(300);
  config.restart_delay = std::chrono::milliseconds(100);
  config.logging.file = "test_supervisor.log";
  return config;
}

bool wait_until(const std::function<bool()> &predicate,
                std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!predicate()) {
    if (std::chrono::steady_clock::now() >= deadline)
      return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return true;
}

void SupervisorTest::SetUp() {
  SupervisorLogger::instance().init("test_supervisor.log",
                                    spdlog::level::debug);
}

} // namespace test
} // namespace svcsup
