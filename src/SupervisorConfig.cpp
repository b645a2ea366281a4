#include "service-supervisor/SupervisorConfig.hpp"
#include "service-supervisor/Errors.hpp"
#include "service-supervisor/Logger.hpp"
#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace svcsup {

namespace {

std::chrono::milliseconds read_ms(const YAML::Node &node, const char *key,
                                  std::chrono::milliseconds fallback) {
  if (!node[key])
    return fallback;
  return std::chrono::milliseconds(node[key].as<int64_t>());
}

SupervisorConfig parse_root(const YAML::Node &root) {
  SupervisorConfig cfg;

  if (!root || root.IsNull())
    return cfg;
  if (!root.IsMap())
    throw ConfigError("configuration root must be a mapping");

  if (auto service = root["service"]) {
    cfg.service.executable =
        service["executable"].as<std::string>(cfg.service.executable);
    cfg.service.process_name =
        service["process_name"].as<std::string>(cfg.service.process_name);
    cfg.service.mode = service["mode"].as<std::string>(cfg.service.mode);
    cfg.service.readiness_marker = service["readiness_marker"].as<std::string>(
        cfg.service.readiness_marker);
    cfg.service.health_path =
        service["health_path"].as<std::string>(cfg.service.health_path);
    if (auto env = service["env"]) {
      for (const auto &kv : env) {
        cfg.service.env[kv.first.as<std::string>()] =
            kv.second.as<std::string>();
      }
    }
  }

  if (auto ports = root["ports"]) {
    int port = ports["default"].as<int>(cfg.ports.default_port);
    if (port < 1 || port > 65535)
      throw ConfigError("ports.default out of range: " + std::to_string(port));
    cfg.ports.default_port = static_cast<uint16_t>(port);
    cfg.ports.max_attempts =
        ports["max_attempts"].as<int>(cfg.ports.max_attempts);
    cfg.ports.release_wait =
        read_ms(ports, "release_wait_ms", cfg.ports.release_wait);
    cfg.ports.release_checks =
        ports["release_checks"].as<int>(cfg.ports.release_checks);
  }

  if (auto readiness = root["readiness"]) {
    cfg.readiness.attempts =
        readiness["attempts"].as<int>(cfg.readiness.attempts);
    cfg.readiness.interval =
        read_ms(readiness, "interval_ms", cfg.readiness.interval);
    cfg.readiness.probe_timeout =
        read_ms(readiness, "probe_timeout_ms", cfg.readiness.probe_timeout);
  }

  if (auto termination = root["termination"]) {
    cfg.termination.attempts =
        termination["attempts"].as<int>(cfg.termination.attempts);
    cfg.termination.wait =
        read_ms(termination, "wait_ms", cfg.termination.wait);
  }

  if (auto restart = root["restart"]) {
    cfg.restart_delay = read_ms(restart, "delay_ms", cfg.restart_delay);
  }

  if (auto logging = root["logging"]) {
    cfg.logging.file = logging["file"].as<std::string>(cfg.logging.file);
    cfg.logging.level = logging["level"].as<std::string>(cfg.logging.level);
  }

  if (cfg.service.process_name.empty() && !cfg.service.executable.empty()) {
    cfg.service.process_name = default_process_name(cfg.service.executable);
  }

  cfg.validate();
  return cfg;
}

} // namespace

SupervisorConfig SupervisorConfig::load_file(const std::string &path) {
  LOG_INFO("CONFIG", "LOAD", "Loading supervisor config from: {}", path);

  if (!std::filesystem::exists(path)) {
    throw ConfigError("config file not found: " + path);
  }

  try {
    return parse_root(YAML::LoadFile(path));
  } catch (const YAML::Exception &ex) {
    throw ConfigError("invalid config " + path + ": " + ex.what());
  }
}

SupervisorConfig SupervisorConfig::from_yaml(const std::string &yaml_text) {
  try {
    return parse_root(YAML::Load(yaml_text));
  } catch (const YAML::Exception &ex) {
    throw ConfigError(std::string("invalid config: ") + ex.what());
  }
}

void SupervisorConfig::validate() const {
  if (ports.max_attempts < 1)
    throw ConfigError("ports.max_attempts must be >= 1");
  if (static_cast<int>(ports.default_port) + ports.max_attempts - 1 > 65535)
    throw ConfigError("port range exceeds 65535");
  if (ports.release_checks < 1)
    throw ConfigError("ports.release_checks must be >= 1");
  if (readiness.attempts < 1)
    throw ConfigError("readiness.attempts must be >= 1");
  if (readiness.interval.count() < 0 || readiness.probe_timeout.count() <= 0)
    throw ConfigError("readiness intervals must be positive");
  if (termination.attempts < 1)
    throw ConfigError("termination.attempts must be >= 1");
  if (termination.wait.count() < 0)
    throw ConfigError("termination.wait_ms must be >= 0");
  if (service.health_path.empty() || service.health_path.front() != '/')
    throw ConfigError("service.health_path must start with '/'");
  if (service.readiness_marker.empty())
    throw ConfigError("service.readiness_marker must not be empty");
}

std::string default_process_name(const std::string &executable) {
  std::filesystem::path p(executable);
  std::string name = p.filename().string();
#ifdef _WIN32
  if (p.extension() == ".exe") {
    name = p.stem().string();
  }
#endif
  return name;
}

std::string resolve_executable(const std::vector<std::string> &candidates) {
  for (const auto &candidate : candidates) {
    std::error_code ec;
    if (!candidate.empty() && std::filesystem::is_regular_file(candidate, ec)) {
      return std::filesystem::absolute(candidate, ec).string();
    }
    LOG_DEBUG("CONFIG", "RESOLVE", "Executable candidate not found: {}",
              candidate);
  }
  return "";
}

} // namespace svcsup
