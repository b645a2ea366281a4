#include "service-supervisor/probe/PortProbe.hpp"
#include "service-supervisor/Logger.hpp"
#include "service-supervisor/compat/WinSock.hpp"
#include <cstring>

namespace svcsup {
namespace net {

bool ensure_socket_runtime() {
#ifdef _WIN32
  static const bool started = [] {
    WSADATA wsa_data;
    return WSAStartup(MAKEWORD(2, 2), &wsa_data) == 0;
  }();
  return started;
#else
  return true;
#endif
}

} // namespace net

namespace probe {

namespace {

bool is_addr_in_use(int err) {
#ifdef _WIN32
  return err == WSAEADDRINUSE;
#else
  return err == EADDRINUSE;
#endif
}

bool is_access_denied(int err) {
#ifdef _WIN32
  return err == WSAEACCES;
#else
  return err == EACCES || err == EPERM;
#endif
}

} // namespace

PortStatus probe_port(uint16_t port) {
  if (!net::ensure_socket_runtime()) {
    LOG_ERROR("PORT", "PROBE", "Socket runtime unavailable");
    return PortStatus::Error;
  }

  net::SocketGuard sock(socket(AF_INET, SOCK_STREAM, IPPROTO_TCP));
  if (!sock.valid()) {
    LOG_WARN("PORT", "PROBE", "Failed to create probe socket: {}",
             net::last_socket_error());
    return PortStatus::Error;
  }

#ifndef _WIN32
  // Ignore TIME_WAIT leftovers. A live listener still makes bind fail.
  // (On Windows SO_REUSEADDR would let the bind steal the port.)
  int opt = 1;
  setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
#endif

  struct sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = htons(port);

  if (bind(sock.get(), reinterpret_cast<struct sockaddr *>(&addr),
           sizeof(addr)) != 0) {
    int err = net::last_socket_error();
    if (is_addr_in_use(err)) {
      LOG_DEBUG("PORT", "PROBE", "Port {} is in use", port);
      return PortStatus::InUse;
    }
    if (is_access_denied(err)) {
      LOG_WARN("PORT", "PROBE", "Permission denied binding port {}", port);
      return PortStatus::AccessDenied;
    }
    LOG_WARN("PORT", "PROBE", "bind on port {} failed: {}", port, err);
    return PortStatus::Error;
  }

  if (listen(sock.get(), 1) != 0) {
    int err = net::last_socket_error();
    LOG_DEBUG("PORT", "PROBE", "listen on port {} failed: {}", port, err);
    return is_addr_in_use(err) ? PortStatus::InUse : PortStatus::Error;
  }

  LOG_TRACE("PORT", "PROBE", "Port {} is free", port);
  return PortStatus::Free;
}

bool is_port_bound(uint16_t port) {
  return probe_port(port) != PortStatus::Free;
}

} // namespace probe
} // namespace svcsup
