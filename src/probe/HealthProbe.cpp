#include "service-supervisor/probe/HealthProbe.hpp"
#include "service-supervisor/Logger.hpp"
#include "service-supervisor/compat/WinSock.hpp"
#include <cstring>
#include <sstream>

namespace svcsup {
namespace probe {

namespace {

using Clock = std::chrono::steady_clock;

#ifdef MSG_NOSIGNAL
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0;
#endif

int remaining_ms(Clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - Clock::now());
  return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

bool set_non_blocking(socket_t fd) {
#ifdef _WIN32
  u_long mode = 1;
  return ioctlsocket(fd, FIONBIO, &mode) == 0;
#else
  int flags = fcntl(fd, F_GETFL, 0);
  return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
#endif
}

// Wait for `events` on fd until the deadline. Returns false on timeout/error.
bool wait_socket(socket_t fd, short events, Clock::time_point deadline) {
  for (;;) {
    int wait_ms = remaining_ms(deadline);
    if (wait_ms <= 0)
      return false;
#ifdef _WIN32
    WSAPOLLFD pfd{};
    pfd.fd = fd;
    pfd.events = events;
    int rc = WSAPoll(&pfd, 1, wait_ms);
#else
    struct pollfd pfd {};
    pfd.fd = fd;
    pfd.events = events;
    int rc = poll(&pfd, 1, wait_ms);
    if (rc < 0 && errno == EINTR)
      continue;
#endif
    if (rc <= 0)
      return false;
    return (pfd.revents & (events | POLLHUP)) != 0;
  }
}

bool connect_with_deadline(socket_t fd, uint16_t port,
                           Clock::time_point deadline) {
  struct sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = htons(port);

  if (connect(fd, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) ==
      0) {
    return true;
  }

  int err = net::last_socket_error();
#ifdef _WIN32
  if (err != WSAEWOULDBLOCK)
    return false;
#else
  if (err != EINPROGRESS)
    return false;
#endif

  if (!wait_socket(fd, POLLOUT, deadline))
    return false;

  int so_error = 0;
  socklen_t len = sizeof(so_error);
  if (getsockopt(fd, SOL_SOCKET, SO_ERROR,
                 reinterpret_cast<char *>(&so_error), &len) != 0) {
    return false;
  }
  return so_error == 0;
}

bool send_all(socket_t fd, const std::string &data,
              Clock::time_point deadline) {
  size_t sent = 0;
  while (sent < data.size()) {
    if (!wait_socket(fd, POLLOUT, deadline))
      return false;
    int w = static_cast<int>(send(fd, data.data() + sent,
                                  static_cast<int>(data.size() - sent),
                                  kSendFlags));
    if (w <= 0)
      return false;
    sent += static_cast<size_t>(w);
  }
  return true;
}

// Parses "HTTP/1.x <code> ..." from the first response line
int parse_status_line(const std::string &line) {
  std::istringstream ss(line);
  std::string proto;
  int code = -1;
  ss >> proto >> code;
  if (proto.rfind("HTTP/", 0) != 0 || ss.fail())
    return -1;
  return code;
}

} // namespace

int http_get_status(uint16_t port, const std::string &path,
                    std::chrono::milliseconds timeout) {
  if (!net::ensure_socket_runtime())
    return -1;

  auto deadline = Clock::now() + timeout;

  net::SocketGuard sock(socket(AF_INET, SOCK_STREAM, IPPROTO_TCP));
  if (!sock.valid() || !set_non_blocking(sock.get()))
    return -1;

  if (!connect_with_deadline(sock.get(), port, deadline)) {
    LOG_TRACE("HEALTH", "CONNECT", "Connect to 127.0.0.1:{} failed", port);
    return -1;
  }

  std::ostringstream req;
  req << "GET " << path << " HTTP/1.0\r\n";
  req << "Host: 127.0.0.1:" << port << "\r\n";
  req << "Connection: close\r\n";
  req << "\r\n";

  if (!send_all(sock.get(), req.str(), deadline))
    return -1;

  std::string response;
  char buffer[512];
  while (response.find("\r\n") == std::string::npos) {
    if (!wait_socket(sock.get(), POLLIN, deadline)) {
      LOG_TRACE("HEALTH", "READ", "Timed out waiting for response on port {}",
                port);
      return -1;
    }
    int n = static_cast<int>(recv(sock.get(), buffer, sizeof(buffer), 0));
    if (n <= 0)
      break;
    response.append(buffer, buffer + n);
    if (response.size() > 8192)
      break;
  }

  auto eol = response.find("\r\n");
  return parse_status_line(eol == std::string::npos ? response
                                                    : response.substr(0, eol));
}

bool poll_health(uint16_t port, std::chrono::milliseconds timeout,
                 const std::string &path) {
  int status = http_get_status(port, path, timeout);
  LOG_TRACE("HEALTH", "POLL", "GET {} on port {} -> {}", path, port, status);
  return status == 200;
}

} // namespace probe
} // namespace svcsup
