#include "netsleuth/discovery/probe_registry.h"

#include "netsleuth/core/logging.h"

namespace netsleuth::discovery {

static constexpr const char* TAG = "probes";

bool ProbeRegistry::register_probe(Probe probe)
{
    const ProbeDescriptor& d = probe.descriptor;

    if (d.name.empty() || !probe.run) {
        return false;
    }
    if (!(d.trustWeight > 0.0) || d.trustWeight > 1.0) {
        NS_LOGW(TAG, "Probe '%s' rejected: trust weight %.3f outside (0, 1]",
                d.name.c_str(), d.trustWeight);
        return false;
    }
    if (d.timeoutMs == 0 || d.kinds.empty()) {
        NS_LOGW(TAG, "Probe '%s' rejected: zero timeout or no attribute kinds", d.name.c_str());
        return false;
    }

    auto it = _probes.find(d.name);
    if (it != _probes.end()) {
        // already registered
        return false;
    }

    NS_LOGD(TAG, "Registered probe '%s' (format=%s, weight=%.2f, timeout=%ums)",
            d.name.c_str(), d.outputFormat.c_str(), d.trustWeight,
            static_cast<unsigned>(d.timeoutMs));

    std::string key = d.name;
    _probes.emplace(std::move(key), std::move(probe));
    return true;
}

const Probe* ProbeRegistry::find(std::string_view name) const
{
    auto it = _probes.find(name);
    if (it == _probes.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> ProbeRegistry::names() const
{
    std::vector<std::string> out;
    out.reserve(_probes.size());
    for (const auto& kv : _probes) {
        out.push_back(kv.first);
    }
    return out;
}

} // namespace netsleuth::discovery
