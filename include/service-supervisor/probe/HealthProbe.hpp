#pragma once
#include "service-supervisor/export.h"
#include <chrono>
#include <cstdint>
#include <string>

namespace svcsup {
namespace probe {

/// GET http://127.0.0.1:<port><path>. Returns the HTTP status code, or -1 on
/// connection failure, timeout, or an unparsable response. The socket is
/// always closed before returning, so a timed-out request is abandoned, not
/// left pending.
SERVICE_SUPERVISOR_API int http_get_status(uint16_t port,
                                           const std::string &path,
                                           std::chrono::milliseconds timeout);

/// True only on HTTP 200 from the liveness endpoint
SERVICE_SUPERVISOR_API bool
poll_health(uint16_t port, std::chrono::milliseconds timeout,
            const std::string &path = "/health");

} // namespace probe
} // namespace svcsup
