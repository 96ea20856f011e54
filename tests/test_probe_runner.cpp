#include "doctest.h"

#include "fake_probes.h"

#include "netsleuth/discovery/normalizer.h"
#include "netsleuth/discovery/probe_registry.h"
#include "netsleuth/discovery/probe_runner.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace netsleuth::discovery;
using netsleuth::tests::static_probe;
using netsleuth::tests::stuck_probe;
using netsleuth::tests::throwing_probe;

namespace {

struct Drained {
    std::vector<EvidenceRecord> evidence;
    std::vector<ProbeFailure>   failures;
};

Drained drain(DiscoveryStream& stream)
{
    Drained d;
    DiscoveryItem item;
    while (stream.next(item)) {
        if (item.kind == DiscoveryItem::Kind::Evidence) {
            d.evidence.push_back(item.evidence);
        } else {
            d.failures.push_back(item.failure);
        }
    }
    return d;
}

Scope scope_of(const char* text)
{
    Scope s;
    REQUIRE(Scope::parse(text, s));
    return s;
}

} // namespace

TEST_CASE("ProbeRegistry: validates registrations")
{
    ProbeRegistry reg;
    CHECK(reg.register_probe(static_probe("a", 0.5, "10.0.0.1", {})));
    CHECK_FALSE(reg.register_probe(static_probe("a", 0.5, "10.0.0.1", {})));
    CHECK_FALSE(reg.register_probe(static_probe("", 0.5, "10.0.0.1", {})));
    CHECK_FALSE(reg.register_probe(static_probe("zero", 0.0, "10.0.0.1", {})));
    CHECK_FALSE(reg.register_probe(static_probe("heavy", 1.5, "10.0.0.1", {})));
    CHECK_FALSE(reg.register_probe(static_probe("blind", 0.5, "10.0.0.1", {}, {})));

    auto noRun = static_probe("norun", 0.5, "10.0.0.1", {});
    noRun.run = nullptr;
    CHECK_FALSE(reg.register_probe(noRun));

    CHECK(reg.size() == 1);
    REQUIRE(reg.find("a") != nullptr);
    CHECK(reg.find("a")->descriptor.trustWeight == 0.5);
    CHECK(reg.find("b") == nullptr);
}

TEST_CASE("ProbeRunner: rejects bad requests before launching anything")
{
    ProbeRegistry reg;
    bool launched = false;
    auto p = static_probe("ok", 0.5, "10.0.0.1", {{"manufacturer", "Acme"}});
    p.run = [&launched](const Scope&, ProbeContext&) { launched = true; };
    REQUIRE(reg.register_probe(p));

    const Normalizer n = create_default_normalizer(default_normalizer_tables());
    ProbeRunner runner(reg, n);
    const Scope s = scope_of("10.0.0.1");

    std::string err;
    CHECK(runner.discover(s, {"ok", "missing"}, 1000, 1000, &err) == nullptr);
    CHECK(err.find("missing") != std::string::npos);
    CHECK(runner.discover(s, {}, 1000, 1000, &err) == nullptr);
    CHECK(runner.discover(s, {"ok"}, 0, 1000, &err) == nullptr);
    CHECK(runner.discover(s, {"ok"}, 1000, 0, &err) == nullptr);
    CHECK_FALSE(launched);
}

TEST_CASE("ProbeRunner: every probe's evidence arrives, stamped with its identity")
{
    ProbeRegistry reg;
    REQUIRE(reg.register_probe(static_probe("p1", 0.6, "10.0.0.5", {{"manufacturer", "Acme"}})));
    REQUIRE(reg.register_probe(static_probe("p2", 0.4, "10.0.0.5", {{"device-class", "sensor"}})));
    REQUIRE(reg.register_probe(static_probe("silent", 0.4, "10.0.0.5", {})));

    const Normalizer n = create_default_normalizer(default_normalizer_tables());
    ProbeRunner runner(reg, n);

    auto stream = runner.discover(scope_of("10.0.0.0/24"), {"p1", "p2", "silent"}, 2000, 5000);
    REQUIRE(stream);
    const Drained d = drain(*stream);

    CHECK(d.failures.empty());
    REQUIRE(d.evidence.size() == 2);
    for (const auto& e : d.evidence) {
        CHECK(e.address == "10.0.0.5");
        CHECK(e.observedAtMs > 0);
        if (e.probe == "p1") {
            CHECK(e.trustWeight == 0.6);
            CHECK(e.attributes.at(AttributeKind::Manufacturer) == "Acme");
        } else {
            CHECK(e.probe == "p2");
            CHECK(e.attributes.at(AttributeKind::DeviceClass) == "sensor");
        }
    }
    CHECK(stream->completed().size() == 3);
    CHECK(stream->dropped() == 1);
    CHECK_FALSE(stream->overall_timed_out());

    DiscoveryItem item;
    CHECK_FALSE(stream->next(item));
}

TEST_CASE("ProbeRunner: a slow probe becomes a timeout marker, others still report")
{
    ProbeRegistry reg;
    REQUIRE(reg.register_probe(static_probe("fast", 0.6, "10.0.0.5", {{"manufacturer", "Acme"}})));
    REQUIRE(reg.register_probe(stuck_probe("slow", "10.0.0.6")));

    const Normalizer n = create_default_normalizer(default_normalizer_tables());
    ProbeRunner runner(reg, n);

    const auto started = std::chrono::steady_clock::now();
    auto stream = runner.discover(scope_of("10.0.0.0/24"), {"fast", "slow"}, 200, 5000);
    REQUIRE(stream);
    const Drained d = drain(*stream);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    CHECK(elapsed < std::chrono::milliseconds(1200));

    REQUIRE(d.failures.size() == 1);
    CHECK(d.failures[0].probe == "slow");
    CHECK(d.failures[0].reason == FailureReason::Timeout);

    // Evidence emitted before the deadline is kept; the late emit is not.
    bool early = false;
    bool late = false;
    for (const auto& e : d.evidence) {
        const auto& v = e.attributes.begin()->second;
        early = early || v == "EarlyBird";
        late  = late || v == "TooLate";
    }
    CHECK(early);
    CHECK_FALSE(late);
    CHECK(stream->completed() == std::vector<std::string>{"fast"});
}

TEST_CASE("ProbeRunner: the overall timeout abandons everything still running")
{
    ProbeRegistry reg;
    REQUIRE(reg.register_probe(stuck_probe("a", "10.0.0.6")));
    REQUIRE(reg.register_probe(stuck_probe("b", "10.0.0.7")));

    const Normalizer n = create_default_normalizer(default_normalizer_tables());
    ProbeRunner runner(reg, n);

    auto stream = runner.discover(scope_of("10.0.0.0/24"), {"a", "b"}, 5000, 150);
    REQUIRE(stream);
    const Drained d = drain(*stream);

    CHECK(stream->overall_timed_out());
    REQUIRE(d.failures.size() == 2);
    for (const auto& f : d.failures) {
        CHECK(f.reason == FailureReason::Timeout);
        CHECK(f.detail == "overall timeout");
    }
}

TEST_CASE("ProbeRunner: a throwing probe becomes an error marker")
{
    ProbeRegistry reg;
    REQUIRE(reg.register_probe(throwing_probe("broken")));
    REQUIRE(reg.register_probe(static_probe("ok", 0.5, "10.0.0.5", {{"manufacturer", "Acme"}})));

    const Normalizer n = create_default_normalizer(default_normalizer_tables());
    ProbeRunner runner(reg, n);

    auto stream = runner.discover(scope_of("10.0.0.5"), {"broken", "ok"}, 1000, 2000);
    REQUIRE(stream);
    const Drained d = drain(*stream);

    REQUIRE(d.failures.size() == 1);
    CHECK(d.failures[0].probe == "broken");
    CHECK(d.failures[0].reason == FailureReason::Error);
    CHECK(d.failures[0].detail == "network unreachable");
    CHECK(d.evidence.size() == 1);
    CHECK(std::string(to_string(FailureReason::Error)) != std::string(to_string(FailureReason::Timeout)));
}

TEST_CASE("ProbeRunner: probe timeout is the smaller of request and descriptor budget")
{
    ProbeRegistry reg;
    auto p = stuck_probe("tight", "10.0.0.6");
    p.descriptor.timeoutMs = 100;
    REQUIRE(reg.register_probe(p));

    const Normalizer n = create_default_normalizer(default_normalizer_tables());
    ProbeRunner runner(reg, n);

    auto stream = runner.discover(scope_of("10.0.0.6"), {"tight"}, 5000, 5000);
    REQUIRE(stream);
    const Drained d = drain(*stream);
    REQUIRE(d.failures.size() == 1);
    CHECK(d.failures[0].detail == "exceeded 100ms");
}

TEST_CASE("ProbeRunner: cooperative probes see cancellation after abandonment")
{
    ProbeRegistry reg;
    auto observed = std::make_shared<std::atomic<bool>>(false);

    Probe p;
    p.descriptor.name         = "polite";
    p.descriptor.outputFormat = "attributes";
    p.descriptor.kinds        = {AttributeKind::Manufacturer};
    p.descriptor.trustWeight  = 0.5;
    p.descriptor.timeoutMs    = 100;
    p.run = [observed](const Scope&, ProbeContext& ctx) {
        while (!ctx.should_stop()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        observed->store(true);
    };
    REQUIRE(reg.register_probe(p));

    const Normalizer n = create_default_normalizer(default_normalizer_tables());
    ProbeRunner runner(reg, n);

    auto stream = runner.discover(scope_of("10.0.0.6"), {"polite"}, 5000, 5000);
    REQUIRE(stream);
    drain(*stream);

    for (int i = 0; i < 100 && !observed->load(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    CHECK(observed->load());
}
