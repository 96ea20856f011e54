#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "netsleuth/discovery/attribute.h"

namespace netsleuth::discovery {

// Native key/value output of a probe, in the order the probe produced it.
// Keys may repeat (e.g. one "port" entry per open port).
using RawFields = std::vector<std::pair<std::string, std::string>>;

// One probe's native output for one address, stamped by the runner with the
// probe's identity and trust weight.
struct RawObservation {
    std::string   probe;
    std::string   format;        // output shape, selects the normalizer mapping
    std::string   address;
    RawFields     fields;
    std::uint64_t observedAtMs{0};
    double        trustWeight{0.0};
};

// One probe's observations for one address at one point in time, in the common
// vocabulary. Immutable once created.
struct EvidenceRecord {
    std::string                          address;
    std::string                          probe;
    std::map<AttributeKind, std::string> attributes;
    std::uint64_t                        observedAtMs{0};
    double                               trustWeight{0.0};
};

enum class FailureReason : std::uint8_t {
    Timeout = 0,
    Error,
};

const char* to_string(FailureReason reason) noexcept;

// Emitted instead of evidence when a probe times out or throws.
struct ProbeFailure {
    std::string   probe;
    FailureReason reason{FailureReason::Error};
    std::string   detail;
};

} // namespace netsleuth::discovery
