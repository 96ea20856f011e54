#pragma once

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "netsleuth/discovery/attribute.h"
#include "netsleuth/discovery/evidence.h"

namespace netsleuth::discovery {

// Keyword signature for HTTP fingerprinting. Keywords are matched
// case-insensitively against the concatenated response headers / body preview.
struct HttpSignature {
    std::string              name;          // e.g. "philips_hue"
    std::vector<std::string> headerKeywords;
    std::vector<std::string> bodyKeywords;
    std::string              manufacturer;
    std::string              deviceClass;

    // Body keyword -> more specific device class, first match wins.
    std::vector<std::pair<std::string, std::string>> classRefinements;
};

// Advertised service type -> what it says about the device.
struct ServiceMapping {
    std::string serviceType;   // "_hue._tcp"
    std::string manufacturer;  // may be empty
    std::string deviceClass;   // may be empty
    std::string protocol;      // may be empty
};

// Open port -> protocol / device class. Earlier rules take precedence.
struct PortRule {
    int         port{0};
    std::string protocol;
    std::string deviceClass;   // may be empty
};

struct NormalizerTables {
    std::vector<HttpSignature>  httpSignatures;
    std::vector<ServiceMapping> services;
    std::vector<PortRule>       portRules;
};

NormalizerTables default_normalizer_tables();

// Converts probe-native output into evidence in the common vocabulary.
// Each output format has a dedicated mapper; unmappable output yields nullopt
// and is dropped (absence of evidence is not an error).
class Normalizer {
public:
    using Attributes = std::map<AttributeKind, std::string>;
    using Mapper     = std::function<void(const RawObservation& raw, Attributes& out)>;

    Normalizer() = default;

    // Returns false if the format name is empty or already registered.
    bool register_format(std::string format, Mapper mapper);

    bool has_format(std::string_view format) const;

    std::optional<EvidenceRecord> normalize(const RawObservation& raw) const;

    // As above, but attributes outside `allowed` (the probe's declared kinds)
    // are discarded.
    std::optional<EvidenceRecord> normalize(const RawObservation& raw,
                                            const std::set<AttributeKind>& allowed) const;

private:
    std::optional<EvidenceRecord> normalize_impl(const RawObservation& raw,
                                                 const std::set<AttributeKind>* allowed) const;

    std::unordered_map<std::string, Mapper> _mappers;
};

// Normalizer with the built-in formats registered:
// "arp", "oui", "tcp", "http", "mdns", "ssdp", "attributes".
Normalizer create_default_normalizer(const NormalizerTables& tables);

// ---- value canonicalisation (shared with probes and tests) ----

// Trim and collapse internal whitespace runs to one space.
std::string canonical_text(std::string_view v);

// "AA-BB-CC-00-11-22" / "aabb.cc00.1122" -> "aa:bb:cc:00:11:22". Empty if invalid.
std::string canonical_mac(std::string_view v);

// Sorted, de-duplicated, comma-separated port list ("22,80,443"). Invalid entries dropped.
std::string canonical_port_list(const std::vector<std::string>& ports);

} // namespace netsleuth::discovery
