#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "netsleuth/config/engine_config.h"
#include "netsleuth/discovery/probe.h"
#include "netsleuth/fs/filesystem.h"

namespace netsleuth::probes {

inline constexpr const char* kOuiVendorProbe = "oui_vendor";

// Vendor for the first three octets of `mac`, empty if unknown.
// Prefixes compare case-insensitively and accept ':' or '-' separators.
std::string lookup_oui_vendor(const std::vector<config::OuiEntry>& table, std::string_view mac);

// Hardware-vendor lookup over the neighbour table. Output format "oui".
discovery::Probe make_oui_vendor_probe(const config::OuiProbeConfig& cfg,
                                       std::shared_ptr<fs::IFileSystem> fs);

} // namespace netsleuth::probes
