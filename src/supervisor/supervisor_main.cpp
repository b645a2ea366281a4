#include "service-supervisor/Logger.hpp"
#include "service-supervisor/SupervisorConfig.hpp"
#include "service-supervisor/probe/HealthProbe.hpp"
#include "service-supervisor/probe/PortProbe.hpp"
#include "service-supervisor/supervisor/Supervisor.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

using namespace svcsup;
using json = nlohmann::json;

static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int sig) {
  (void)sig;
  g_running = 0;
}

void print_usage() {
  std::cout << "Usage: supervisor-cli <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  run [options]                  Start the backend and "
               "supervise it until Ctrl-C\n";
  std::cout << "  cleanup [options]              Reap stale instances and "
               "free the service port\n";
  std::cout << "  probe-port <port>              Print 'free' or 'in-use'\n";
  std::cout << "  health <port> [--timeout ms] [--path p]\n";
  std::cout << "                                 Poll the liveness endpoint "
               "once\n";
  std::cout << "\nOptions:\n";
  std::cout << "  --config <file>      YAML supervisor configuration\n";
  std::cout << "  --exe <path>         Backend executable (overrides config)\n";
  std::cout << "  --port <N>           Preferred port (default: 23450)\n";
  std::cout << "  --name <name>        Process name to reap (cleanup)\n";
  std::cout << "  --log-level <level>  Log level (default: info)\n";
  std::cout << "\nExit codes:\n";
  std::cout << "  probe-port: 0 = free, 1 = in use\n";
  std::cout << "  health:     0 = ready, 1 = not ready\n";
}

struct CommonOptions {
  std::string config_path;
  std::string executable;
  std::string process_name;
  std::string log_level;
  std::string port;
};

CommonOptions parse_common(int argc, char **argv) {
  CommonOptions opts;
  for (int i = 0; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      opts.config_path = argv[++i];
    } else if (arg == "--exe" && i + 1 < argc) {
      opts.executable = argv[++i];
    } else if (arg == "--port" && i + 1 < argc) {
      opts.port = argv[++i];
    } else if (arg == "--name" && i + 1 < argc) {
      opts.process_name = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      opts.log_level = argv[++i];
    } else {
      throw std::runtime_error("Unknown option: " + arg);
    }
  }
  return opts;
}

uint16_t parse_port(const std::string &text) {
  int port = std::stoi(text);
  if (port < 1 || port > 65535) {
    throw std::runtime_error("Port out of range: " + text);
  }
  return static_cast<uint16_t>(port);
}

SupervisorConfig load_config(const CommonOptions &opts) {
  SupervisorConfig config;
  if (!opts.config_path.empty()) {
    config = SupervisorConfig::load_file(opts.config_path);
  }
  if (!opts.executable.empty()) {
    config.service.executable = opts.executable;
    if (opts.process_name.empty()) {
      config.service.process_name = default_process_name(opts.executable);
    }
  }
  if (!opts.process_name.empty()) {
    config.service.process_name = opts.process_name;
  }
  if (!opts.port.empty()) {
    config.ports.default_port = parse_port(opts.port);
  }
  if (!opts.log_level.empty()) {
    config.logging.level = opts.log_level;
  }
  config.validate();
  return config;
}

void init_logging(const SupervisorConfig &config) {
  SupervisorLogger::instance().init(config.logging.file,
                                    parse_log_level(config.logging.level));
}

json info_to_json(const SupervisorInfo &info) {
  json j;
  j["port"] = info.port;
  j["isRunning"] = info.running;
  j["ready"] = info.ready;
  j["state"] = to_string(info.state);
  if (info.pid) {
    j["pid"] = *info.pid;
  } else {
    j["pid"] = nullptr;
  }
  return j;
}

int cmd_run(int argc, char **argv);
int cmd_cleanup(int argc, char **argv);
int cmd_probe_port(int argc, char **argv);
int cmd_health(int argc, char **argv);

int main(int argc, char **argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];

  try {
    if (command == "run") {
      return cmd_run(argc - 2, argv + 2);
    } else if (command == "cleanup") {
      return cmd_cleanup(argc - 2, argv + 2);
    } else if (command == "probe-port") {
      return cmd_probe_port(argc - 2, argv + 2);
    } else if (command == "health") {
      return cmd_health(argc - 2, argv + 2);
    } else if (command == "--help" || command == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown command: " << command << "\n\n";
      print_usage();
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}

int cmd_run(int argc, char **argv) {
  auto config = load_config(parse_common(argc, argv));
  if (config.service.executable.empty()) {
    std::cerr << "Error: no backend executable (use --exe or --config)\n";
    return 1;
  }
  init_logging(config);

  LOG_INFO("MAIN", "RUN", "Supervising {}", config.service.executable);

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  Supervisor supervisor(config);
  supervisor.subscribe([](const SupervisorEvent &event) {
    if (event.kind == SupervisorEvent::Kind::Exited && event.anomalous) {
      std::cerr << "Backend exited abnormally (" << event.exit.describe()
                << ")\n";
    }
  });

  auto stale = supervisor.cleanup_stale_previous_instances();
  if (!stale.succeeded) {
    std::cerr << "Warning: stale cleanup incomplete: " << stale.detail << "\n";
  }
  auto port_cleanup = supervisor.cleanup_service_port();
  if (!port_cleanup.succeeded) {
    std::cerr << "Warning: " << port_cleanup.detail << "\n";
  }

  // Ctrl-C must also interrupt a readiness wait in progress
  std::atomic<bool> done{false};
  std::thread signal_watch([&]() {
    while (g_running && !done) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (!g_running) {
      supervisor.request_shutdown();
    }
  });

  ServiceState state;
  try {
    state = supervisor.start();
  } catch (const SupervisorError &e) {
    done = true;
    signal_watch.join();
    std::cerr << "Error: " << to_string(e.kind()) << ": " << e.what() << "\n";
    supervisor.stop();
    return 1;
  } catch (const std::exception &e) {
    done = true;
    signal_watch.join();
    std::cerr << "Error: " << e.what() << "\n";
    supervisor.stop();
    return 1;
  }
  if (state != ServiceState::Running) {
    done = true;
    signal_watch.join();
    std::cerr << "Error: backend did not start (state: " << to_string(state)
              << ")\n";
    supervisor.stop();
    return 1;
  }

  std::cout << info_to_json(supervisor.info()).dump(2) << std::endl;

  // Watch until interrupted or the backend goes away on its own
  while (g_running && supervisor.is_running()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  done = true;
  signal_watch.join();
  if (!g_running) {
    LOG_INFO("MAIN", "RUN", "Interrupted, stopping backend");
  }

  bool stopped = supervisor.stop();
  if (auto exit = supervisor.last_exit()) {
    std::cout << "Backend exited: " << exit->describe() << "\n";
  }
  SupervisorLogger::instance().shutdown();
  return stopped ? 0 : 1;
}

int cmd_cleanup(int argc, char **argv) {
  auto config = load_config(parse_common(argc, argv));
  init_logging(config);

  if (config.service.process_name.empty()) {
    std::cerr << "Error: no process name (use --name, --exe or --config)\n";
    return 1;
  }

  Supervisor supervisor(config);
  auto stale = supervisor.cleanup_stale_previous_instances();
  std::cout << "Stale instances: " << stale.detail << "\n";
  auto port = supervisor.cleanup_service_port();
  std::cout << "Service port: " << port.detail << "\n";

  return stale.succeeded && port.succeeded ? 0 : 1;
}

int cmd_probe_port(int argc, char **argv) {
  if (argc < 1) {
    std::cerr << "Usage: supervisor-cli probe-port <port>\n";
    return 1;
  }
  auto status = probe::probe_port(parse_port(argv[0]));
  std::cout << (status == PortStatus::Free ? "free" : "in-use") << "\n";
  return status == PortStatus::Free ? 0 : 1;
}

int cmd_health(int argc, char **argv) {
  if (argc < 1) {
    std::cerr << "Usage: supervisor-cli health <port> [--timeout ms] "
                 "[--path p]\n";
    return 1;
  }
  uint16_t port = parse_port(argv[0]);
  int timeout_ms = 2000;
  std::string path = "/health";

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--timeout" && i + 1 < argc) {
      timeout_ms = std::stoi(argv[++i]);
    } else if (arg == "--path" && i + 1 < argc) {
      path = argv[++i];
    }
  }

  int status = probe::http_get_status(port, path,
                                      std::chrono::milliseconds(timeout_ms));
  if (status == 200) {
    std::cout << "ready\n";
    return 0;
  }
  if (status < 0) {
    std::cout << "unreachable\n";
  } else {
    std::cout << "not ready (HTTP " << status << ")\n";
  }
  return 1;
}
