#include "netsleuth/probes/builtin_probes.h"

#include "netsleuth/core/logging.h"
#include "netsleuth/probes/arp_table_probe.h"
#include "netsleuth/probes/http_fingerprint_probe.h"
#include "netsleuth/probes/oui_vendor_probe.h"
#include "netsleuth/probes/tcp_port_probe.h"

namespace netsleuth::probes {

static constexpr const char* TAG = "probes";

std::vector<std::string> builtin_probe_names()
{
    return {kArpTableProbe, kOuiVendorProbe, kTcpPortsProbe, kHttpFingerprintProbe};
}

std::vector<std::string> disabled_builtin_probes(const config::EngineConfig& cfg)
{
    std::vector<std::string> out;
    if (!cfg.arp.settings.enabled)  out.emplace_back(kArpTableProbe);
    if (!cfg.oui.settings.enabled)  out.emplace_back(kOuiVendorProbe);
    if (!cfg.tcp.settings.enabled)  out.emplace_back(kTcpPortsProbe);
    if (!cfg.http.settings.enabled) out.emplace_back(kHttpFingerprintProbe);
    return out;
}

bool register_builtin_probes(discovery::ProbeRegistry& registry,
                             const config::EngineConfig& cfg,
                             std::shared_ptr<fs::IFileSystem> hostFs,
                             net::ITcpSocketOps& sockets)
{
    bool ok = true;

    auto add = [&](discovery::Probe p) {
        const std::string name = p.descriptor.name;
        if (!registry.register_probe(std::move(p))) {
            NS_LOGE(TAG, "Failed to register probe '%s'", name.c_str());
            ok = false;
        }
    };

    if (hostFs) {
        add(make_arp_table_probe(cfg.arp, hostFs));
        add(make_oui_vendor_probe(cfg.oui, hostFs));
    } else {
        NS_LOGW(TAG, "No host filesystem; neighbour-table probes not registered");
        ok = false;
    }
    add(make_tcp_port_probe(cfg.tcp, sockets));
    add(make_http_fingerprint_probe(cfg.http));

    return ok;
}

} // namespace netsleuth::probes
