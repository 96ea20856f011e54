#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "netsleuth/discovery/attribute.h"
#include "netsleuth/discovery/iot_hints.h"
#include "netsleuth/discovery/normalizer.h"

namespace netsleuth::config {

struct DiscoveryConfig {
    std::string   scope{"192.168.1.0/24"};
    std::uint32_t perProbeTimeoutMs{10000};
    std::uint32_t overallTimeoutMs{30000};
    double        minConfidence{0.0};   // report filter
    std::string   stateDir{"./netsleuth-data"};
    std::string   registryFile{"registry.yaml"};
};

// Common knobs every built-in probe has.
struct ProbeSettings {
    bool          enabled{true};
    double        trustWeight{0.5};
    std::uint32_t timeoutMs{5000};
};

struct ArpProbeConfig {
    ProbeSettings settings{true, 0.9, 2000};
    std::string   tablePath{"/proc/net/arp"};
};

struct OuiEntry {
    std::string prefix;   // "28:6D:97"
    std::string vendor;
};

struct OuiProbeConfig {
    ProbeSettings         settings{true, 0.5, 2000};
    std::string           tablePath{"/proc/net/arp"};
    std::vector<OuiEntry> vendors{
        {"28:6D:97", "Samsung SmartThings"},
        {"00:17:88", "Philips"},
        {"18:B4:30", "Google Nest"},
        {"64:16:66", "Google Nest"},
        {"00:0E:58", "Sonos"},
        {"5C:AA:FD", "Sonos"},
        {"B8:27:EB", "Raspberry Pi Foundation"},
        {"DC:A6:32", "Raspberry Pi Trading"},
        {"24:0A:C4", "Espressif"},
    };
};

struct TcpProbeConfig {
    ProbeSettings              settings{true, 0.6, 20000};
    std::vector<std::uint16_t> ports{22, 23, 80, 443, 502, 554, 631, 1883, 8080, 8443, 8883, 9100};
    std::uint32_t              connectTimeoutMs{400};
    std::uint32_t              bannerWaitMs{250};
};

struct HttpProbeConfig {
    ProbeSettings              settings{true, 0.8, 20000};
    std::vector<std::uint16_t> ports{80, 8080, 443, 8443};
    std::uint32_t              requestTimeoutMs{3000};
    std::uint32_t              maxConcurrent{32};
    std::uint32_t              bodyPreviewBytes{500};
};

// Unified config for one engine instance. Static for the engine's lifetime.
struct EngineConfig {
    DiscoveryConfig discovery;

    ArpProbeConfig  arp;
    OuiProbeConfig  oui;
    TcpProbeConfig  tcp;
    HttpProbeConfig http;

    discovery::ImportanceTable  importance{discovery::default_importance()};
    discovery::NormalizerTables tables{discovery::default_normalizer_tables()};
    discovery::IotHints         iot;
};

// Abstract storage interface.
class EngineConfigStore {
public:
    virtual ~EngineConfigStore() = default;

    virtual EngineConfig load() = 0;
    virtual void         save(const EngineConfig& cfg) = 0;
};

} // namespace netsleuth::config
