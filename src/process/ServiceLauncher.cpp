#include "service-supervisor/process/ServiceLauncher.hpp"
#include "service-supervisor/Errors.hpp"
#include "service-supervisor/Logger.hpp"
#include <filesystem>
#include <sstream>

#ifdef _WIN32
#include <processthreadsapi.h>
#else
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <spawn.h>
#include <unistd.h>
extern char **environ;
#endif

namespace svcsup {
namespace process {

ServiceLauncher::ServiceLauncher(LaunchSpec spec) : spec_(std::move(spec)) {}

std::vector<std::string> ServiceLauncher::build_arguments(uint16_t port) const {
  return {spec_.executable, "--port", std::to_string(port), "--env",
          spec_.mode};
}

std::map<std::string, std::string> ServiceLauncher::build_environment(
    const std::map<std::string, std::string> &extra_env) const {
  std::map<std::string, std::string> env;
  env[kEncodingEnvVar] = "utf-8";
  env[kModeEnvVar] = spec_.mode;
  for (const auto &[key, value] : spec_.env) {
    env[key] = value;
  }
  for (const auto &[key, value] : extra_env) {
    env[key] = value;
  }
  return env;
}

void ServiceLauncher::check_executable() const {
  std::error_code ec;
  if (spec_.executable.empty()) {
    throw LaunchError("no service executable configured");
  }
  if (!std::filesystem::is_regular_file(spec_.executable, ec)) {
    throw LaunchError("service executable not found: " + spec_.executable);
  }
#ifndef _WIN32
  if (access(spec_.executable.c_str(), X_OK) != 0) {
    throw LaunchError("service executable is not executable: " +
                      spec_.executable);
  }
#endif
}

std::unique_ptr<ServiceHandle> ServiceLauncher::spawn(
    uint16_t port, const std::map<std::string, std::string> &extra_env) const {
  check_executable();

  auto args = build_arguments(port);
  auto env = build_environment(extra_env);

  LOG_INFO("LAUNCH", "SPAWN", "Starting service: {} on port {} (mode={})",
           spec_.executable, port, spec_.mode);

  auto handle = spawn_impl(port, args, env);

  LOG_INFO("LAUNCH", "SPAWN", "Service spawned: PID={}", handle->pid());
  return handle;
}

// Platform-specific implementations

#ifdef _WIN32

namespace {

std::string quote_argument(const std::string &arg) {
  if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos)
    return arg;
  std::string quoted = "\"";
  size_t backslashes = 0;
  for (char c : arg) {
    if (c == '\\') {
      ++backslashes;
    } else if (c == '"') {
      quoted.append(backslashes * 2 + 1, '\\');
      quoted.push_back('"');
      backslashes = 0;
      continue;
    } else {
      backslashes = 0;
    }
    quoted.push_back(c);
  }
  quoted.append(backslashes * 2, '\\');
  quoted.push_back('"');
  return quoted;
}

// Inherited environment with overrides, as a double-NUL-terminated block
std::string build_environment_block(
    const std::map<std::string, std::string> &overrides) {
  std::map<std::string, std::string> merged;
  LPCH strings = GetEnvironmentStringsA();
  if (strings) {
    for (LPCH p = strings; *p; p += std::strlen(p) + 1) {
      std::string entry(p);
      auto eq = entry.find('=', 1); // entries like "=C:=C:\" start with '='
      if (eq == std::string::npos)
        continue;
      merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    FreeEnvironmentStringsA(strings);
  }
  for (const auto &[key, value] : overrides) {
    merged[key] = value;
  }

  std::string block;
  for (const auto &[key, value] : merged) {
    block += key + "=" + value;
    block.push_back('\0');
  }
  block.push_back('\0');
  return block;
}

} // namespace

std::unique_ptr<ServiceHandle> ServiceLauncher::spawn_impl(
    uint16_t port, const std::vector<std::string> &args,
    const std::map<std::string, std::string> &env) const {
  SECURITY_ATTRIBUTES sa{sizeof(SECURITY_ATTRIBUTES), nullptr, TRUE};

  HANDLE out_read = nullptr, out_write = nullptr;
  HANDLE err_read = nullptr, err_write = nullptr;
  if (!CreatePipe(&out_read, &out_write, &sa, 0) ||
      !CreatePipe(&err_read, &err_write, &sa, 0)) {
    DWORD err = GetLastError();
    if (out_read)
      CloseHandle(out_read);
    if (out_write)
      CloseHandle(out_write);
    throw LaunchError("CreatePipe failed: " + std::to_string(err));
  }
  // Parent-side ends must not leak into the child
  SetHandleInformation(out_read, HANDLE_FLAG_INHERIT, 0);
  SetHandleInformation(err_read, HANDLE_FLAG_INHERIT, 0);

  HANDLE null_in = CreateFileA("NUL", GENERIC_READ, FILE_SHARE_READ, &sa,
                               OPEN_EXISTING, 0, nullptr);

  std::ostringstream cmdline;
  for (size_t i = 0; i < args.size(); ++i) {
    if (i > 0)
      cmdline << " ";
    cmdline << quote_argument(args[i]);
  }
  std::string cmdline_str = cmdline.str();
  std::string env_block = build_environment_block(env);

  STARTUPINFOA si = {};
  si.cb = sizeof(si);
  si.dwFlags = STARTF_USESTDHANDLES;
  si.hStdInput = null_in;
  si.hStdOutput = out_write;
  si.hStdError = err_write;
  PROCESS_INFORMATION pi = {};

  BOOL created = CreateProcessA(
      nullptr, const_cast<char *>(cmdline_str.c_str()), nullptr, nullptr,
      TRUE, CREATE_NO_WINDOW, const_cast<char *>(env_block.c_str()), nullptr,
      &si, &pi);
  DWORD create_error = GetLastError();

  CloseHandle(out_write);
  CloseHandle(err_write);
  if (null_in != INVALID_HANDLE_VALUE)
    CloseHandle(null_in);

  if (!created) {
    CloseHandle(out_read);
    CloseHandle(err_read);
    LOG_ERROR("LAUNCH", "SPAWN", "CreateProcess failed: {}", create_error);
    throw LaunchError("CreateProcess failed for " + spec_.executable + ": " +
                      std::to_string(create_error));
  }

  CloseHandle(pi.hThread); // Don't need thread handle

  return std::make_unique<ServiceHandle>(pi.dwProcessId, pi.hProcess,
                                         out_read, err_read, spec_.executable,
                                         port);
}

#else // POSIX

namespace {

bool make_pipe(int fds[2]) {
#ifdef __linux__
  return pipe2(fds, O_CLOEXEC) == 0;
#else
  if (pipe(fds) != 0)
    return false;
  fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  fcntl(fds[1], F_SETFD, FD_CLOEXEC);
  return true;
#endif
}

// Inherited environment with overrides applied
std::vector<std::string>
build_environment_strings(const std::map<std::string, std::string> &overrides) {
  std::vector<std::string> entries;
  for (char **e = environ; e && *e; ++e) {
    std::string entry(*e);
    auto eq = entry.find('=');
    std::string key = entry.substr(0, eq);
    if (overrides.count(key))
      continue;
    entries.push_back(std::move(entry));
  }
  for (const auto &[key, value] : overrides) {
    entries.push_back(key + "=" + value);
  }
  return entries;
}

} // namespace

std::unique_ptr<ServiceHandle> ServiceLauncher::spawn_impl(
    uint16_t port, const std::vector<std::string> &args,
    const std::map<std::string, std::string> &env) const {
  int out_pipe[2];
  int err_pipe[2];
  if (!make_pipe(out_pipe)) {
    throw LaunchError(std::string("pipe() failed: ") + strerror(errno));
  }
  if (!make_pipe(err_pipe)) {
    int err = errno;
    close(out_pipe[0]);
    close(out_pipe[1]);
    throw LaunchError(std::string("pipe() failed: ") + strerror(err));
  }

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null",
                                   O_RDONLY, 0);
  posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, err_pipe[1], STDERR_FILENO);

  // The child starts with a clean signal mask and default dispositions,
  // whatever the supervisor's threads have blocked or ignored.
  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  sigset_t empty_mask;
  sigemptyset(&empty_mask);
  posix_spawnattr_setsigmask(&attr, &empty_mask);
  sigset_t default_signals;
  sigemptyset(&default_signals);
  sigaddset(&default_signals, SIGPIPE);
  sigaddset(&default_signals, SIGTERM);
  sigaddset(&default_signals, SIGINT);
  posix_spawnattr_setsigdefault(&attr, &default_signals);
  posix_spawnattr_setflags(&attr,
                           POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);

  std::vector<char *> argv;
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  auto env_strings = build_environment_strings(env);
  std::vector<char *> envp;
  for (auto &entry : env_strings) {
    envp.push_back(const_cast<char *>(entry.c_str()));
  }
  envp.push_back(nullptr);

  pid_t pid = -1;
  int status =
      posix_spawn(&pid, argv[0], &actions, &attr, argv.data(), envp.data());

  posix_spawn_file_actions_destroy(&actions);
  posix_spawnattr_destroy(&attr);
  close(out_pipe[1]);
  close(err_pipe[1]);

  if (status != 0) {
    close(out_pipe[0]);
    close(err_pipe[0]);
    LOG_ERROR("LAUNCH", "SPAWN", "posix_spawn failed: {}", strerror(status));
    throw LaunchError("posix_spawn failed for " + spec_.executable + ": " +
                      strerror(status));
  }

  return std::make_unique<ServiceHandle>(pid, pid, out_pipe[0], err_pipe[0],
                                         spec_.executable, port);
}

#endif

} // namespace process
} // namespace svcsup
