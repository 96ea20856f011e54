#pragma once

#include <memory>

#include "netsleuth/config/engine_config.h"
#include "netsleuth/discovery/probe.h"
#include "netsleuth/fs/filesystem.h"

namespace netsleuth::probes {

inline constexpr const char* kArpTableProbe = "arp_table";

// Address-resolution scan: reports the hardware address of every in-scope
// neighbour the kernel has resolved. Output format "arp".
discovery::Probe make_arp_table_probe(const config::ArpProbeConfig& cfg,
                                      std::shared_ptr<fs::IFileSystem> fs);

} // namespace netsleuth::probes
