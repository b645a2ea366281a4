#include "service-supervisor/process/ProcessReaper.hpp"
#include "service-supervisor/Logger.hpp"
#include "service-supervisor/process/CommandRunner.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <csignal>
#include <cstring>
#include <unistd.h>
#endif

#ifdef __linux__
#include <filesystem>
#include <fstream>
#include <set>
#endif

namespace svcsup {
namespace process {

namespace {

bool parse_pid(const std::string &text, ProcessId &pid) {
  const char *begin = text.c_str();
  while (*begin && std::isspace(static_cast<unsigned char>(*begin)))
    ++begin;
  char *end = nullptr;
  long value = std::strtol(begin, &end, 10);
  if (end == begin || value <= 0)
    return false;
  pid = static_cast<ProcessId>(value);
  return true;
}

#if !defined(_WIN32) && !defined(__linux__)
// One pid per line, as printed by lsof -t and pgrep
std::vector<ProcessId> parse_pid_lines(const std::string &output) {
  std::vector<ProcessId> pids;
  std::istringstream iss(output);
  std::string line;
  while (std::getline(iss, line)) {
    ProcessId pid = 0;
    if (parse_pid(line, pid))
      pids.push_back(pid);
  }
  return pids;
}
#endif

void sort_unique(std::vector<ProcessId> &pids) {
  std::sort(pids.begin(), pids.end());
  pids.erase(std::unique(pids.begin(), pids.end()), pids.end());
}

std::string join_pids(const std::vector<ProcessId> &pids) {
  std::string out;
  for (auto pid : pids) {
    if (!out.empty())
      out += ",";
    out += std::to_string(pid);
  }
  return out;
}

#ifdef __linux__

bool is_numeric(const std::string &s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isdigit(c);
  });
}

// Socket inodes in LISTEN state on `port` from /proc/net/tcp or tcp6
void collect_listen_inodes(const char *table, uint16_t port,
                           std::set<std::string> &inodes) {
  std::ifstream file(table);
  if (!file.is_open())
    return;

  std::string line;
  std::getline(file, line); // header
  while (std::getline(file, line)) {
    std::istringstream iss(line);
    std::string slot, local, remote, state, queues, timer, retransmit, uid,
        timeout, inode;
    if (!(iss >> slot >> local >> remote >> state >> queues >> timer >>
          retransmit >> uid >> timeout >> inode))
      continue;
    if (state != "0A") // TCP_LISTEN
      continue;
    auto colon = local.rfind(':');
    if (colon == std::string::npos)
      continue;
    unsigned long local_port =
        std::strtoul(local.c_str() + colon + 1, nullptr, 16);
    if (local_port == port && inode != "0")
      inodes.insert(inode);
  }
}

// Calls visit(path, pid_string) for every /proc/<pid> directory
template <typename Visit> void for_each_process_dir(Visit &&visit) {
  std::error_code ec;
  std::filesystem::directory_iterator it("/proc", ec);
  for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    const std::string pid_str = it->path().filename().string();
    if (is_numeric(pid_str))
      visit(it->path(), pid_str);
  }
}

std::string read_first_line(const std::filesystem::path &path) {
  std::ifstream file(path);
  std::string line;
  if (file.is_open())
    std::getline(file, line);
  return line;
}

std::string argv0_basename(const std::filesystem::path &proc_dir) {
  std::ifstream file(proc_dir / "cmdline", std::ios::binary);
  if (!file.is_open())
    return "";
  std::string argv0;
  std::getline(file, argv0, '\0');
  return std::filesystem::path(argv0).filename().string();
}

#endif

} // namespace

ProcessId current_process_id() {
#ifdef _WIN32
  return GetCurrentProcessId();
#else
  return getpid();
#endif
}

std::unique_ptr<ProcessReaper> make_platform_reaper() {
  return std::make_unique<PlatformProcessReaper>();
}

CleanupOutcome PlatformProcessReaper::kill_by_port(uint16_t port) {
  auto owners = find_port_owners(port);
  if (!owners.listener_found) {
    LOG_DEBUG("REAPER", "KILL_PORT", "No listener on port {}", port);
    return CleanupOutcome::ok("no process listening on port " +
                              std::to_string(port));
  }
  if (owners.pids.empty()) {
    LOG_WARN("REAPER", "KILL_PORT",
             "Port {} has a listener whose owner could not be resolved", port);
    return CleanupOutcome::failed("owner of port " + std::to_string(port) +
                                  " could not be resolved");
  }

  const ProcessId self = current_process_id();
  std::vector<std::string> errors;
  for (auto pid : owners.pids) {
    if (pid == self) {
      LOG_WARN("REAPER", "KILL_PORT",
               "Port {} is held by this process; refusing to kill it", port);
      errors.push_back("port held by the calling process");
      continue;
    }
    LOG_INFO("REAPER", "KILL_PORT", "Killing PID={} listening on port {}",
             pid, port);
    std::string error;
    if (!force_kill(pid, error))
      errors.push_back("PID " + std::to_string(pid) + ": " + error);
  }

  if (!errors.empty()) {
    std::string detail = "port " + std::to_string(port) + ": ";
    for (size_t i = 0; i < errors.size(); ++i)
      detail += (i ? "; " : "") + errors[i];
    return CleanupOutcome::failed(detail);
  }
  return CleanupOutcome::ok("killed PID(s) " + join_pids(owners.pids) +
                            " on port " + std::to_string(port));
}

CleanupOutcome PlatformProcessReaper::kill_by_name(const std::string &name) {
  if (name.empty()) {
    return CleanupOutcome::ok("no process name configured");
  }

  auto pids = pids_by_name(name);
  const ProcessId self = current_process_id();
  pids.erase(std::remove(pids.begin(), pids.end(), self), pids.end());

  if (pids.empty()) {
    LOG_DEBUG("REAPER", "KILL_NAME", "No running process named '{}'", name);
    return CleanupOutcome::ok("no process named " + name);
  }

  LOG_INFO("REAPER", "KILL_NAME", "Killing {} process(es) named '{}': {}",
           pids.size(), name, join_pids(pids));

  std::string failures;
  for (auto pid : pids) {
    std::string error;
    if (!force_kill(pid, error)) {
      if (!failures.empty())
        failures += "; ";
      failures += "PID " + std::to_string(pid) + ": " + error;
    }
  }

  if (!failures.empty()) {
    LOG_WARN("REAPER", "KILL_NAME", "Some '{}' processes survived: {}", name,
             failures);
    return CleanupOutcome::failed(failures);
  }
  return CleanupOutcome::ok("killed " + name + " PID(s) " + join_pids(pids));
}

// Platform-specific implementations

#if defined(_WIN32)

PortOwners PlatformProcessReaper::find_port_owners(uint16_t port) const {
  PortOwners owners;
  auto result = run_command("netstat -ano -p TCP");
  if (!result.launched) {
    LOG_ERROR("REAPER", "FIND_PORT", "Could not run netstat");
    return owners;
  }

  const std::string suffix = ":" + std::to_string(port);
  std::istringstream iss(result.output);
  std::string line;
  while (std::getline(iss, line)) {
    std::istringstream fields(line);
    std::string proto, local, remote, state, pid_str;
    if (!(fields >> proto >> local >> remote >> state >> pid_str))
      continue;
    if (proto != "TCP" || state != "LISTENING")
      continue;
    if (local.size() < suffix.size() ||
        local.compare(local.size() - suffix.size(), suffix.size(), suffix) != 0)
      continue;
    owners.listener_found = true;
    ProcessId pid = 0;
    if (parse_pid(pid_str, pid))
      owners.pids.push_back(pid);
  }
  sort_unique(owners.pids);
  return owners;
}

std::vector<ProcessId>
PlatformProcessReaper::pids_by_name(const std::string &name) const {
  std::string image = name;
  if (image.size() < 4 || image.compare(image.size() - 4, 4, ".exe") != 0)
    image += ".exe";

  auto result = run_command("tasklist /FI \"IMAGENAME eq " + image +
                            "\" /NH /FO CSV");
  std::vector<ProcessId> pids;
  if (!result.launched) {
    LOG_ERROR("REAPER", "FIND_NAME", "Could not run tasklist");
    return pids;
  }

  // "image.exe","1234","Console","1","12,345 K"
  std::istringstream iss(result.output);
  std::string line;
  while (std::getline(iss, line)) {
    if (line.empty() || line[0] != '"')
      continue;
    auto first_end = line.find("\",\"");
    if (first_end == std::string::npos)
      continue;
    auto pid_end = line.find('"', first_end + 3);
    ProcessId pid = 0;
    if (parse_pid(line.substr(first_end + 3, pid_end - first_end - 3), pid))
      pids.push_back(pid);
  }
  sort_unique(pids);
  return pids;
}

bool PlatformProcessReaper::force_kill(ProcessId pid,
                                       std::string &error) const {
  auto result =
      run_command("taskkill /F /PID " + std::to_string(pid) + " /T");
  if (!result.launched) {
    error = "could not run taskkill";
    return false;
  }
  // 128: no such process
  if (result.exit_code == 0 || result.exit_code == 128)
    return true;
  error = "taskkill exited with " + std::to_string(result.exit_code);
  return false;
}

#else // POSIX

#if defined(__linux__)

PortOwners PlatformProcessReaper::find_port_owners(uint16_t port) const {
  PortOwners owners;
  std::set<std::string> inodes;
  collect_listen_inodes("/proc/net/tcp", port, inodes);
  collect_listen_inodes("/proc/net/tcp6", port, inodes);
  if (inodes.empty())
    return owners;
  owners.listener_found = true;

  for_each_process_dir([&](const std::filesystem::path &proc_dir,
                           const std::string &pid_str) {
    // Processes exit while we scan; errors just skip the entry
    std::error_code ec;
    std::filesystem::directory_iterator fd(proc_dir / "fd", ec);
    for (; !ec && fd != std::filesystem::directory_iterator();
         fd.increment(ec)) {
      std::error_code link_ec;
      auto target = std::filesystem::read_symlink(fd->path(), link_ec).string();
      // socket:[12345]
      if (link_ec || target.rfind("socket:[", 0) != 0)
        continue;
      auto inode = target.substr(8, target.size() - 9);
      if (inodes.count(inode)) {
        ProcessId pid = 0;
        if (parse_pid(pid_str, pid))
          owners.pids.push_back(pid);
        break;
      }
    }
  });

  sort_unique(owners.pids);
  return owners;
}

std::vector<ProcessId>
PlatformProcessReaper::pids_by_name(const std::string &name) const {
  std::vector<ProcessId> pids;
  // The kernel truncates comm to 15 characters
  const std::string comm_name = name.substr(0, 15);

  for_each_process_dir([&](const std::filesystem::path &proc_dir,
                           const std::string &pid_str) {
    bool match = read_first_line(proc_dir / "comm") == comm_name &&
                 (name.size() <= 15 || argv0_basename(proc_dir) == name);
    if (!match)
      match = argv0_basename(proc_dir) == name;

    ProcessId pid = 0;
    if (match && parse_pid(pid_str, pid))
      pids.push_back(pid);
  });

  sort_unique(pids);
  return pids;
}

#else // macOS and other POSIX

PortOwners PlatformProcessReaper::find_port_owners(uint16_t port) const {
  PortOwners owners;
  auto result = run_command("lsof -nP -iTCP:" + std::to_string(port) +
                            " -sTCP:LISTEN -t");
  if (!result.launched) {
    LOG_ERROR("REAPER", "FIND_PORT", "Could not run lsof");
    return owners;
  }
  owners.pids = parse_pid_lines(result.output);
  sort_unique(owners.pids);
  owners.listener_found = !owners.pids.empty();
  return owners;
}

std::vector<ProcessId>
PlatformProcessReaper::pids_by_name(const std::string &name) const {
  auto result = run_command("pgrep -x '" + name + "'");
  if (!result.launched) {
    LOG_ERROR("REAPER", "FIND_NAME", "Could not run pgrep");
    return {};
  }
  auto pids = parse_pid_lines(result.output);
  sort_unique(pids);
  return pids;
}

#endif

bool PlatformProcessReaper::force_kill(ProcessId pid,
                                       std::string &error) const {
  if (kill(pid, SIGKILL) == 0 || errno == ESRCH)
    return true;
  error = strerror(errno);
  return false;
}

#endif

} // namespace process
} // namespace svcsup
