#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "netsleuth/discovery/probe.h"

namespace netsleuth::discovery {

// Name-keyed registry of probes.
class ProbeRegistry {
public:
    ProbeRegistry() = default;

    ProbeRegistry(const ProbeRegistry&) = delete;
    ProbeRegistry& operator=(const ProbeRegistry&) = delete;

    // Returns false if the name is empty or already taken, `run` is empty, the
    // trust weight is outside (0, 1], the timeout is zero or no kinds are declared.
    bool register_probe(Probe probe);

    // Returns nullptr if no probe has that name.
    const Probe* find(std::string_view name) const;

    // Registered names, sorted.
    std::vector<std::string> names() const;

    std::size_t size() const noexcept { return _probes.size(); }

private:
    std::map<std::string, Probe, std::less<>> _probes;
};

} // namespace netsleuth::discovery
