#pragma once

#include <cstdint>
#include <string>

#include "netsleuth/config/engine_config.h"
#include "netsleuth/discovery/probe.h"

namespace netsleuth::probes {

inline constexpr const char* kHttpFingerprintProbe = "http_fingerprint";

// "https" for the usual TLS ports (443, 8443), "http" otherwise.
std::string scheme_for_port(std::uint16_t port);

// Fingerprint prober: GET http(s)://host:port/ for each configured port of each
// in-scope host over a libcurl multi handle. Output format "http":
//   url, scheme, port, status, header (one per response line), body (preview).
discovery::Probe make_http_fingerprint_probe(const config::HttpProbeConfig& cfg);

} // namespace netsleuth::probes
