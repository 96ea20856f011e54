#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <tuple>

#include "netsleuth/discovery/attribute.h"

namespace netsleuth::discovery {

// One observed value for one attribute, as reported by one probe at one time.
struct Candidate {
    std::string   value;
    std::string   probe;
    double        trustWeight{0.0};
    std::uint64_t observedAtMs{0};

    bool operator<(const Candidate& o) const
    {
        return std::tie(value, probe, observedAtMs, trustWeight)
             < std::tie(o.value, o.probe, o.observedAtMs, o.trustWeight);
    }
    bool operator==(const Candidate& o) const
    {
        return value == o.value && probe == o.probe
            && observedAtMs == o.observedAtMs && trustWeight == o.trustWeight;
    }
};

// Retained candidate history for one attribute. Duplicates collapse, so replaying
// the same evidence leaves it unchanged.
using CandidateLog = std::set<Candidate>;

// Resolved view of one attribute.
struct AttributeAssessment {
    std::string           chosenValue;
    double                confidence{0.0};       // in (0, 1]
    double                aggregatedWeight{0.0}; // of chosenValue
    std::set<std::string> sources;               // probes backing chosenValue; never empty
};

struct DeviceProfile {
    std::string address;

    std::map<AttributeKind, AttributeAssessment> attributes;

    // Full history, including candidates that lost. Kept for audit and for
    // re-scoring when new evidence arrives.
    std::map<AttributeKind, CandidateLog> candidates;

    double        overallConfidence{0.0}; // in [0, 1]
    std::uint64_t firstSeenMs{0};
    std::uint64_t lastSeenMs{0};

    // Time since the last corroborating evidence. Exposed, not enforced.
    std::uint64_t age_ms(std::uint64_t nowMs) const noexcept
    {
        return nowMs > lastSeenMs ? nowMs - lastSeenMs : 0;
    }

    // Chosen value for `kind`, or empty.
    const std::string& value_of(AttributeKind kind) const
    {
        static const std::string empty;
        auto it = attributes.find(kind);
        return it == attributes.end() ? empty : it->second.chosenValue;
    }
};

using ProfilePtr = std::shared_ptr<const DeviceProfile>;

} // namespace netsleuth::discovery
