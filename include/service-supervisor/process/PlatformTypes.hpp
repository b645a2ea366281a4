#pragma once

// Platform-specific lightweight aliases for process ids, handles and pipes.
//
// On POSIX the pid doubles as the process "handle" and pipes are plain file
// descriptors. On Windows both are HANDLEs.

#if defined(_WIN32) || defined(_WIN64)
#include "service-supervisor/compat/WinSock.hpp"
#include <windows.h>
namespace svcsup {
namespace process {
using ProcessId = DWORD;
using ProcessHandle = HANDLE;
using PipeHandle = HANDLE;
constexpr ProcessHandle InvalidProcessHandle = nullptr;
inline PipeHandle invalid_pipe() { return INVALID_HANDLE_VALUE; }
} // namespace process
} // namespace svcsup
#else
#include <sys/types.h>
namespace svcsup {
namespace process {
using ProcessId = pid_t;
using ProcessHandle = pid_t;
using PipeHandle = int;
constexpr ProcessHandle InvalidProcessHandle = static_cast<ProcessHandle>(-1);
inline PipeHandle invalid_pipe() { return -1; }
} // namespace process
} // namespace svcsup
#endif
