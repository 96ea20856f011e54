#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

#include "netsleuth/discovery/probe.h"

namespace netsleuth::tests {

// Emits fixed attribute fields (format "attributes") for one address.
inline discovery::Probe static_probe(const std::string& name, double weight,
                                     const std::string& address,
                                     discovery::RawFields fields,
                                     std::set<discovery::AttributeKind> kinds = {
                                         discovery::AttributeKind::Manufacturer,
                                         discovery::AttributeKind::DeviceClass})
{
    discovery::Probe p;
    p.descriptor.name         = name;
    p.descriptor.outputFormat = "attributes";
    p.descriptor.kinds        = std::move(kinds);
    p.descriptor.trustWeight  = weight;
    p.descriptor.timeoutMs    = 5000;
    p.run = [address, fields](const discovery::Scope&, discovery::ProbeContext& ctx) {
        ctx.emit(address, fields);
    };
    return p;
}

// Emits once, then sleeps past any sane deadline without checking cancellation.
inline discovery::Probe stuck_probe(const std::string& name, const std::string& address,
                                    std::chrono::milliseconds sleep = std::chrono::milliseconds(1500))
{
    discovery::Probe p;
    p.descriptor.name         = name;
    p.descriptor.outputFormat = "attributes";
    p.descriptor.kinds        = {discovery::AttributeKind::Manufacturer};
    p.descriptor.trustWeight  = 0.5;
    p.descriptor.timeoutMs    = 5000;
    p.run = [address, sleep](const discovery::Scope&, discovery::ProbeContext& ctx) {
        ctx.emit(address, {{"manufacturer", "EarlyBird"}});
        std::this_thread::sleep_for(sleep);
        ctx.emit(address, {{"manufacturer", "TooLate"}});
    };
    return p;
}

inline discovery::Probe throwing_probe(const std::string& name)
{
    discovery::Probe p;
    p.descriptor.name         = name;
    p.descriptor.outputFormat = "attributes";
    p.descriptor.kinds        = {discovery::AttributeKind::Manufacturer};
    p.descriptor.trustWeight  = 0.5;
    p.descriptor.timeoutMs    = 5000;
    p.run = [](const discovery::Scope&, discovery::ProbeContext&) {
        throw std::runtime_error("network unreachable");
    };
    return p;
}

} // namespace netsleuth::tests
