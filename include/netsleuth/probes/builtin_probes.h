#pragma once

#include <memory>
#include <string>
#include <vector>

#include "netsleuth/config/engine_config.h"
#include "netsleuth/discovery/probe_registry.h"
#include "netsleuth/fs/filesystem.h"
#include "netsleuth/net/tcp_socket_ops.h"

namespace netsleuth::probes {

// Names of the built-in probes, in registration order.
std::vector<std::string> builtin_probe_names();

// Built-in probes switched off in `cfg`.
std::vector<std::string> disabled_builtin_probes(const config::EngineConfig& cfg);

// Register arp_table, oui_vendor, tcp_ports and http_fingerprint with the
// weights and timeouts from `cfg`. Disabled probes are still registered so
// they can be requested by name. `hostFs` resolves the neighbour table paths.
// Returns false if any registration was rejected.
bool register_builtin_probes(discovery::ProbeRegistry& registry,
                             const config::EngineConfig& cfg,
                             std::shared_ptr<fs::IFileSystem> hostFs,
                             net::ITcpSocketOps& sockets);

} // namespace netsleuth::probes
