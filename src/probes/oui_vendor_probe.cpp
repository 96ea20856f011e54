#include "netsleuth/probes/oui_vendor_probe.h"

#include "netsleuth/core/logging.h"
#include "netsleuth/discovery/normalizer.h"
#include "netsleuth/probes/neighbor_table.h"

namespace netsleuth::probes {

static constexpr const char* TAG = "oui";

std::string lookup_oui_vendor(const std::vector<config::OuiEntry>& table, std::string_view mac)
{
    const std::string canon = discovery::canonical_mac(mac);
    if (canon.empty()) {
        return {};
    }
    const std::string prefix = canon.substr(0, 8); // "aa:bb:cc"

    for (const auto& e : table) {
        // Pad to a full address so canonical_mac can normalise the prefix.
        const std::string p = discovery::canonical_mac(e.prefix + ":00:00:00");
        if (!p.empty() && p.compare(0, 8, prefix) == 0) {
            return e.vendor;
        }
    }
    return {};
}

discovery::Probe make_oui_vendor_probe(const config::OuiProbeConfig& cfg,
                                       std::shared_ptr<fs::IFileSystem> fs)
{
    discovery::Probe p;
    p.descriptor.name         = kOuiVendorProbe;
    p.descriptor.outputFormat = "oui";
    p.descriptor.kinds        = {discovery::AttributeKind::Manufacturer};
    p.descriptor.trustWeight  = cfg.settings.trustWeight;
    p.descriptor.timeoutMs    = cfg.settings.timeoutMs;

    const std::string path = cfg.tablePath;
    const std::vector<config::OuiEntry> vendors = cfg.vendors;
    p.run = [fs, path, vendors](const discovery::Scope& scope, discovery::ProbeContext& ctx) {
        for (const NeighborEntry& e : read_neighbor_table(*fs, path)) {
            if (ctx.should_stop()) {
                return;
            }
            if (!scope.contains(e.address)) {
                continue;
            }
            const std::string vendor = lookup_oui_vendor(vendors, e.hwAddress);
            if (vendor.empty()) {
                NS_LOGV(TAG, "%s: unknown OUI %s", e.address.c_str(), e.hwAddress.c_str());
                continue;
            }
            ctx.emit(e.address, {{"vendor", vendor}, {"hw_address", e.hwAddress}});
        }
    };
    return p;
}

} // namespace netsleuth::probes
