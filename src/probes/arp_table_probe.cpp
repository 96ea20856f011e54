#include "netsleuth/probes/arp_table_probe.h"

#include "netsleuth/core/logging.h"
#include "netsleuth/probes/neighbor_table.h"

namespace netsleuth::probes {

static constexpr const char* TAG = "arp";

discovery::Probe make_arp_table_probe(const config::ArpProbeConfig& cfg,
                                      std::shared_ptr<fs::IFileSystem> fs)
{
    discovery::Probe p;
    p.descriptor.name         = kArpTableProbe;
    p.descriptor.outputFormat = "arp";
    p.descriptor.kinds        = {discovery::AttributeKind::HardwareAddress};
    p.descriptor.trustWeight  = cfg.settings.trustWeight;
    p.descriptor.timeoutMs    = cfg.settings.timeoutMs;

    const std::string path = cfg.tablePath;
    p.run = [fs, path](const discovery::Scope& scope, discovery::ProbeContext& ctx) {
        const auto entries = read_neighbor_table(*fs, path);

        std::size_t hits = 0;
        for (const NeighborEntry& e : entries) {
            if (ctx.should_stop()) {
                return;
            }
            if (!scope.contains(e.address)) {
                continue;
            }
            ctx.emit(e.address, {{"hw_address", e.hwAddress}, {"interface", e.device}});
            ++hits;
        }

        NS_LOGD(TAG, "%zu of %zu neighbours in %s", hits, entries.size(), scope.to_string().c_str());
    };
    return p;
}

} // namespace netsleuth::probes
