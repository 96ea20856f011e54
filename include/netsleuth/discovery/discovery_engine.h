#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "netsleuth/config/engine_config.h"
#include "netsleuth/discovery/device_registry.h"
#include "netsleuth/discovery/normalizer.h"
#include "netsleuth/discovery/probe_registry.h"
#include "netsleuth/discovery/probe_runner.h"

namespace netsleuth::discovery {

struct DiscoveryRequest {
    std::string              scope;
    std::vector<std::string> probes;   // empty = every registered probe not disabled
    std::uint32_t            perProbeTimeoutMs{0};
    std::uint32_t            overallTimeoutMs{0};
};

enum class DiscoveryStatus : std::uint8_t {
    Ok = 0,
    InvalidArgs,
};

struct DiscoveryReport {
    DiscoveryStatus status{DiscoveryStatus::Ok};

    // Why the request was rejected. Empty on Ok.
    std::string message;

    // Profiles that received evidence in this run, ranked.
    std::vector<ProfilePtr> profiles;

    std::vector<ProbeFailure> failures;
    std::vector<std::string>  completed;

    std::size_t evidenceCount{0};
    std::size_t dropped{0};
    bool        overallTimedOut{false};

    static DiscoveryReport ok() {
        DiscoveryReport r;
        r.status = DiscoveryStatus::Ok;
        return r;
    }

    static DiscoveryReport invalid_args(std::string m) {
        DiscoveryReport r;
        r.status = DiscoveryStatus::InvalidArgs;
        r.message = std::move(m);
        return r;
    }
};

/**
 * Composition root: probe registry, normalizer, runner and device registry for
 * one configuration.
 *
 * Probes and extra output formats must be registered before the first
 * discover() call. discover() itself may run concurrently from several
 * threads; the device registry serializes the merges.
 */
class DiscoveryEngine {
public:
    explicit DiscoveryEngine(config::EngineConfig cfg);

    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    ProbeRegistry& probes() noexcept { return _probes; }
    Normalizer& normalizer() noexcept { return _normalizer; }

    DeviceRegistry& registry() noexcept { return _registry; }
    const DeviceRegistry& registry() const noexcept { return _registry; }

    const config::EngineConfig& engine_config() const noexcept { return _cfg; }

    // Request populated from the `discovery` config section.
    DiscoveryRequest default_request() const;

    // Registered probes minus those disabled in config, sorted.
    std::vector<std::string> default_probes() const;

    // Runs every requested probe, folds the evidence into the registry as one
    // batch and reports what happened. Configuration errors are returned as
    // InvalidArgs before any probe is launched; probe failures are reported,
    // never thrown.
    DiscoveryReport discover(const DiscoveryRequest& request);

private:
    const config::EngineConfig _cfg;
    std::set<std::string>      _disabled;

    ProbeRegistry  _probes;
    Normalizer     _normalizer;
    ProbeRunner    _runner;
    DeviceRegistry _registry;
};

} // namespace netsleuth::discovery
