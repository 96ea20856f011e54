#include "netsleuth/discovery/correlator.h"

#include "netsleuth/core/logging.h"

#include <algorithm>
#include <cmath>

namespace netsleuth::discovery {

static constexpr const char* TAG = "correlate";

// Aggregated weights are sums of configured doubles; treat values closer than
// this as equal so the tie-break policy decides instead of rounding noise.
static constexpr double kWeightEpsilon = 1e-9;

namespace {

struct ProbeContribution {
    double        weight{0.0};
    std::uint64_t latestMs{0};
};

struct ValueTally {
    // Sorted by probe name so the weight sum is order-independent.
    std::map<std::string, ProbeContribution> probes;
    double        aggregated{0.0};
    std::uint64_t latestMs{0};
};

// true if `a` should be chosen over `b`.
bool outranks(const std::string& aValue, const ValueTally& a,
              const std::string& bValue, const ValueTally& b)
{
    if (std::fabs(a.aggregated - b.aggregated) > kWeightEpsilon) {
        return a.aggregated > b.aggregated;
    }
    if (a.probes.size() != b.probes.size()) {
        return a.probes.size() > b.probes.size();
    }
    if (a.latestMs != b.latestMs) {
        return a.latestMs > b.latestMs;
    }
    return aValue < bValue;
}

} // namespace

Correlator::Correlator(ImportanceTable importance)
    : _importance(std::move(importance))
{
}

bool Correlator::assess(const CandidateLog& log, AttributeAssessment& out)
{
    if (log.empty()) {
        return false;
    }

    std::map<std::string, ValueTally> tallies;
    for (const Candidate& c : log) {
        ValueTally& t = tallies[c.value];
        ProbeContribution& pc = t.probes[c.probe];
        // A probe counts once per value, at the highest weight it reported it with.
        pc.weight   = std::max(pc.weight, c.trustWeight);
        pc.latestMs = std::max(pc.latestMs, c.observedAtMs);
        t.latestMs  = std::max(t.latestMs, c.observedAtMs);
    }

    double total = 0.0;
    for (auto& kv : tallies) {
        ValueTally& t = kv.second;
        t.aggregated = 0.0;
        for (const auto& p : t.probes) {
            t.aggregated += p.second.weight;
        }
        total += t.aggregated;
    }

    auto best = tallies.begin();
    for (auto it = std::next(tallies.begin()); it != tallies.end(); ++it) {
        if (outranks(it->first, it->second, best->first, best->second)) {
            best = it;
        }
    }

    out.chosenValue      = best->first;
    out.aggregatedWeight = best->second.aggregated;
    out.confidence       = total > 0.0 ? best->second.aggregated / total : 0.0;
    out.sources.clear();
    for (const auto& kv : best->second.probes) {
        out.sources.insert(kv.first);
    }
    return true;
}

void Correlator::rescore(DeviceProfile& profile) const
{
    profile.attributes.clear();

    double weighted = 0.0;
    double weights  = 0.0;
    bool   seen     = false;
    std::uint64_t first = 0;
    std::uint64_t last  = 0;

    for (const auto& [kind, log] : profile.candidates) {
        AttributeAssessment a;
        if (!assess(log, a)) {
            continue;
        }

        const double w = importance_of(_importance, kind);
        weighted += w * a.confidence;
        weights  += w;
        profile.attributes.emplace(kind, std::move(a));

        for (const Candidate& c : log) {
            if (!seen || c.observedAtMs < first) first = c.observedAtMs;
            if (!seen || c.observedAtMs > last)  last  = c.observedAtMs;
            seen = true;
        }
    }

    const double overall = weights > 0.0 ? weighted / weights : 0.0;
    profile.overallConfidence = std::clamp(overall, 0.0, 1.0);
    profile.firstSeenMs = first;
    profile.lastSeenMs  = last;
}

void Correlator::fold(DeviceProfile& profile, const std::vector<const EvidenceRecord*>& records) const
{
    for (const EvidenceRecord* rec : records) {
        if (!rec || rec->address != profile.address) {
            continue;
        }
        for (const auto& [kind, value] : rec->attributes) {
            if (value.empty()) {
                continue;
            }
            Candidate c;
            c.value        = value;
            c.probe        = rec->probe;
            c.trustWeight  = rec->trustWeight;
            c.observedAtMs = rec->observedAtMs;
            profile.candidates[kind].insert(std::move(c));
        }
    }
    rescore(profile);
}

ProfileMap Correlator::merge(const ProfileMap& existing,
                             const std::vector<EvidenceRecord>& records) const
{
    // Step 1: identity resolution by address.
    std::map<std::string, std::vector<const EvidenceRecord*>> byAddress;
    for (const EvidenceRecord& rec : records) {
        if (rec.address.empty() || rec.attributes.empty() || !(rec.trustWeight > 0.0)) {
            continue;
        }
        byAddress[rec.address].push_back(&rec);
    }

    ProfileMap out;
    for (const auto& [address, recs] : byAddress) {
        DeviceProfile profile;
        auto it = existing.find(address);
        if (it != existing.end()) {
            profile = it->second;
        } else {
            profile.address = address;
        }

        fold(profile, recs);

        if (profile.attributes.empty()) {
            continue;
        }

        NS_LOGV(TAG, "%s: %zu attribute(s), overall %.3f",
                address.c_str(), profile.attributes.size(), profile.overallConfidence);
        out.emplace(address, std::move(profile));
    }
    return out;
}

} // namespace netsleuth::discovery
