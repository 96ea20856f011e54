#include "netsleuth/discovery/discovery_engine.h"

#include "netsleuth/core/logging.h"
#include "netsleuth/probes/builtin_probes.h"

namespace netsleuth::discovery {

static constexpr const char* TAG = "engine";

DiscoveryEngine::DiscoveryEngine(config::EngineConfig cfg)
    : _cfg(std::move(cfg))
    , _normalizer(create_default_normalizer(_cfg.tables))
    , _runner(_probes, _normalizer)
    , _registry(Correlator(_cfg.importance))
{
    for (auto& name : probes::disabled_builtin_probes(_cfg)) {
        _disabled.insert(std::move(name));
    }
}

DiscoveryRequest DiscoveryEngine::default_request() const
{
    DiscoveryRequest req;
    req.scope             = _cfg.discovery.scope;
    req.perProbeTimeoutMs = _cfg.discovery.perProbeTimeoutMs;
    req.overallTimeoutMs  = _cfg.discovery.overallTimeoutMs;
    return req;
}

std::vector<std::string> DiscoveryEngine::default_probes() const
{
    std::vector<std::string> out;
    for (auto& name : _probes.names()) {
        if (!_disabled.count(name)) {
            out.push_back(std::move(name));
        }
    }
    return out;
}

DiscoveryReport DiscoveryEngine::discover(const DiscoveryRequest& request)
{
    Scope scope;
    if (!Scope::parse(request.scope, scope)) {
        NS_LOGW(TAG, "Rejected scope '%s'", request.scope.c_str());
        return DiscoveryReport::invalid_args("invalid scope '" + request.scope + "'");
    }

    const std::vector<std::string> enabled =
        request.probes.empty() ? default_probes() : request.probes;
    if (enabled.empty()) {
        return DiscoveryReport::invalid_args("no probes enabled");
    }

    std::string error;
    auto stream = _runner.discover(scope, enabled,
                                   request.perProbeTimeoutMs, request.overallTimeoutMs,
                                   &error);
    if (!stream) {
        NS_LOGW(TAG, "Rejected discovery request: %s", error.c_str());
        return DiscoveryReport::invalid_args(error);
    }

    NS_LOGI(TAG, "Discovering %s with %zu probe(s)", scope.to_string().c_str(), enabled.size());

    DiscoveryReport report = DiscoveryReport::ok();
    std::vector<EvidenceRecord> batch;

    DiscoveryItem item;
    while (stream->next(item)) {
        if (item.kind == DiscoveryItem::Kind::Evidence) {
            batch.push_back(std::move(item.evidence));
        } else {
            NS_LOGW(TAG, "Probe '%s' %s: %s",
                    item.failure.probe.c_str(),
                    to_string(item.failure.reason),
                    item.failure.detail.c_str());
        }
    }

    report.failures        = stream->failures();
    report.completed       = stream->completed();
    report.dropped         = stream->dropped();
    report.overallTimedOut = stream->overall_timed_out();
    report.evidenceCount   = batch.size();

    _registry.upsert(batch);

    std::set<std::string> touched;
    for (const auto& rec : batch) {
        touched.insert(rec.address);
    }
    for (const auto& address : touched) {
        if (ProfilePtr p = _registry.get(address)) {
            report.profiles.push_back(std::move(p));
        }
    }
    rank_profiles(report.profiles);

    NS_LOGI(TAG, "Run finished: %zu evidence record(s), %zu device(s), %zu failure(s)",
            report.evidenceCount, report.profiles.size(), report.failures.size());

    return report;
}

} // namespace netsleuth::discovery
