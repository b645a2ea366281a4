#pragma once

// Centralized socket compatibility header.
// Include this before <windows.h> in any translation unit that uses sockets
// to avoid the winsock.h vs winsock2.h conflict.

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif

#ifndef NOMINMAX
#define NOMINMAX
#endif

#include <winsock2.h>
#include <ws2tcpip.h>

#if defined(_MSC_VER)
#pragma comment(lib, "Ws2_32.lib")
#endif

using socklen_t = int;
using socket_t = SOCKET;
constexpr socket_t kInvalidSocket = INVALID_SOCKET;

#else

#include <arpa/inet.h>
#include <cerrno>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

using socket_t = int;
constexpr socket_t kInvalidSocket = -1;

#endif // _WIN32

namespace svcsup {
namespace net {

// Cross-platform close
inline void close_socket(socket_t fd) {
#ifdef _WIN32
  closesocket(fd);
#else
  close(fd);
#endif
}

inline int last_socket_error() {
#ifdef _WIN32
  return WSAGetLastError();
#else
  return errno;
#endif
}

/// Process-wide WinSock initialization; no-op elsewhere
bool ensure_socket_runtime();

/// Closes the wrapped socket on scope exit
class SocketGuard {
public:
  explicit SocketGuard(socket_t fd) : fd_(fd) {}
  ~SocketGuard() { reset(); }

  SocketGuard(const SocketGuard &) = delete;
  SocketGuard &operator=(const SocketGuard &) = delete;

  socket_t get() const { return fd_; }
  bool valid() const { return fd_ != kInvalidSocket; }

  void reset() {
    if (fd_ != kInvalidSocket) {
      close_socket(fd_);
      fd_ = kInvalidSocket;
    }
  }

private:
  socket_t fd_;
};

} // namespace net
} // namespace svcsup
