#pragma once

#include "netsleuth/net/tcp_socket_ops.h"

namespace netsleuth::platform {

// Return the platform's default TCP socket operations implementation.
// The instance lives for the whole process.
netsleuth::net::ITcpSocketOps& default_tcp_socket_ops();

} // namespace netsleuth::platform
