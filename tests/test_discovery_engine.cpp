#include "doctest.h"

#include "fake_probes.h"

#include "netsleuth/config/engine_config.h"
#include "netsleuth/discovery/discovery_engine.h"
#include "netsleuth/discovery/iot_hints.h"

using namespace netsleuth;
using discovery::AttributeKind;
using discovery::DiscoveryEngine;
using discovery::DiscoveryRequest;
using discovery::DiscoveryStatus;
using netsleuth::tests::static_probe;
using netsleuth::tests::stuck_probe;
using netsleuth::tests::throwing_probe;

namespace {

DiscoveryRequest request(const std::string& scope, std::vector<std::string> probes = {})
{
    DiscoveryRequest r;
    r.scope = scope;
    r.probes = std::move(probes);
    r.perProbeTimeoutMs = 300;
    r.overallTimeoutMs = 2000;
    return r;
}

void register_acme_probes(DiscoveryEngine& engine)
{
    REQUIRE(engine.probes().register_probe(
        static_probe("p1", 0.6, "192.168.1.20", {{"manufacturer", "Acme"}})));
    REQUIRE(engine.probes().register_probe(
        static_probe("p2", 0.4, "192.168.1.20", {{"manufacturer", "Acme"}})));
    REQUIRE(engine.probes().register_probe(
        static_probe("p3", 0.5, "192.168.1.20", {{"manufacturer", "Zenith"}})));
}

} // namespace

TEST_CASE("DiscoveryEngine: configuration errors are rejected up front")
{
    DiscoveryEngine engine(config::EngineConfig{});
    register_acme_probes(engine);

    auto r = engine.discover(request("192.168.1.0/8"));
    CHECK(r.status == DiscoveryStatus::InvalidArgs);
    CHECK(r.message.find("scope") != std::string::npos);

    r = engine.discover(request("192.168.1.0/24", {"p1", "nope"}));
    CHECK(r.status == DiscoveryStatus::InvalidArgs);
    CHECK(r.message.find("nope") != std::string::npos);

    auto zero = request("192.168.1.0/24");
    zero.overallTimeoutMs = 0;
    CHECK(engine.discover(zero).status == DiscoveryStatus::InvalidArgs);

    CHECK(engine.registry().size() == 0);

    DiscoveryEngine empty(config::EngineConfig{});
    r = empty.discover(request("192.168.1.0/24"));
    CHECK(r.status == DiscoveryStatus::InvalidArgs);
    CHECK(r.message == "no probes enabled");
}

TEST_CASE("DiscoveryEngine: corroborated evidence becomes a scored profile")
{
    DiscoveryEngine engine(config::EngineConfig{});
    register_acme_probes(engine);

    const auto r = engine.discover(request("192.168.1.0/24"));
    REQUIRE(r.status == DiscoveryStatus::Ok);
    CHECK(r.failures.empty());
    CHECK(r.completed.size() == 3);
    CHECK(r.evidenceCount == 3);

    REQUIRE(r.profiles.size() == 1);
    const auto& p = *r.profiles[0];
    CHECK(p.address == "192.168.1.20");
    CHECK(p.value_of(AttributeKind::Manufacturer) == "Acme");
    CHECK(p.attributes.at(AttributeKind::Manufacturer).confidence == doctest::Approx(0.667).epsilon(0.001));

    CHECK(engine.registry().get("192.168.1.20") == r.profiles[0]);
    CHECK(engine.registry().get("192.168.1.21") == nullptr);
}

TEST_CASE("DiscoveryEngine: failed probes are reported alongside the rest")
{
    DiscoveryEngine engine(config::EngineConfig{});
    register_acme_probes(engine);
    REQUIRE(engine.probes().register_probe(stuck_probe("slow", "192.168.1.99")));
    REQUIRE(engine.probes().register_probe(throwing_probe("broken")));

    const auto r = engine.discover(request("192.168.1.0/24"));
    REQUIRE(r.status == DiscoveryStatus::Ok);
    REQUIRE(r.failures.size() == 2);

    bool sawTimeout = false;
    bool sawError = false;
    for (const auto& f : r.failures) {
        sawTimeout = sawTimeout || (f.probe == "slow" && f.reason == discovery::FailureReason::Timeout);
        sawError   = sawError || (f.probe == "broken" && f.reason == discovery::FailureReason::Error);
    }
    CHECK(sawTimeout);
    CHECK(sawError);

    CHECK(engine.registry().get("192.168.1.20") != nullptr);
    // Emitted before the timeout, so it counts.
    CHECK(engine.registry().get("192.168.1.99") != nullptr);
}

TEST_CASE("DiscoveryEngine: disabled built-ins are skipped by default but can be named")
{
    config::EngineConfig cfg;
    cfg.tcp.settings.enabled = false;
    DiscoveryEngine engine(cfg);

    REQUIRE(engine.probes().register_probe(
        static_probe("tcp_ports", 0.6, "192.168.1.20", {{"device-class", "plc"}})));
    REQUIRE(engine.probes().register_probe(
        static_probe("custom", 0.5, "192.168.1.20", {{"manufacturer", "Acme"}})));

    CHECK(engine.default_probes() == std::vector<std::string>{"custom"});

    auto r = engine.discover(request("192.168.1.20"));
    REQUIRE(r.status == DiscoveryStatus::Ok);
    CHECK(r.completed == std::vector<std::string>{"custom"});

    r = engine.discover(request("192.168.1.20", {"tcp_ports"}));
    REQUIRE(r.status == DiscoveryStatus::Ok);
    CHECK(engine.registry().get("192.168.1.20")->value_of(AttributeKind::DeviceClass) == "plc");
}

TEST_CASE("DiscoveryEngine: default request comes from config")
{
    config::EngineConfig cfg;
    cfg.discovery.scope = "10.1.0.0/16";
    cfg.discovery.perProbeTimeoutMs = 1234;
    DiscoveryEngine engine(cfg);

    const auto req = engine.default_request();
    CHECK(req.scope == "10.1.0.0/16");
    CHECK(req.perProbeTimeoutMs == 1234);
    CHECK(req.probes.empty());
}

TEST_CASE("is_likely_iot_device: keywords or confidence")
{
    discovery::IotHints hints;
    hints.minConfidence = 0.95;

    discovery::DeviceProfile p;
    p.address = "10.0.0.1";
    p.overallConfidence = 0.5;
    CHECK_FALSE(discovery::is_likely_iot_device(p, hints));

    p.attributes[AttributeKind::Manufacturer].chosenValue = "Philips Lighting";
    CHECK(discovery::is_likely_iot_device(p, hints));

    p.attributes.clear();
    p.attributes[AttributeKind::ProtocolCapability].chosenValue = "MQTT";
    CHECK(discovery::is_likely_iot_device(p, hints));

    p.attributes.clear();
    p.attributes[AttributeKind::DeviceClass].chosenValue = "Thermostat";
    CHECK(discovery::is_likely_iot_device(p, hints));

    p.attributes.clear();
    p.overallConfidence = 0.96;
    CHECK(discovery::is_likely_iot_device(p, hints));
}
