#pragma once

#include <string>
#include <string_view>

#include "netsleuth/config/engine_config.h"
#include "netsleuth/discovery/probe.h"
#include "netsleuth/net/tcp_socket_ops.h"

namespace netsleuth::probes {

inline constexpr const char* kTcpPortsProbe = "tcp_ports";

// First line of a greeting, printable ASCII only, trimmed. Empty if nothing usable.
std::string clean_banner(std::string_view raw);

// Banner prober: nonblocking connects to every configured port of every
// in-scope host, then a short wait for a greeting. Output format "tcp":
//   port=<n> per open port, banner:<n>=<first line> where one was sent.
//
// `ops` must outlive every run of the returned probe.
discovery::Probe make_tcp_port_probe(const config::TcpProbeConfig& cfg,
                                     net::ITcpSocketOps& ops);

} // namespace netsleuth::probes
