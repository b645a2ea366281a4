#pragma once
#include "service-supervisor/export.h"
#include "service-supervisor/types.hpp"
#include <cstdint>

namespace svcsup {
namespace probe {

/// Detailed result of a throwaway bind on 127.0.0.1:port
SERVICE_SUPERVISOR_API PortStatus probe_port(uint16_t port);

/// True unless the port could be bound. Permission and socket errors count
/// as "in use".
SERVICE_SUPERVISOR_API bool is_port_bound(uint16_t port);

} // namespace probe
} // namespace svcsup
