#include "doctest.h"

#include "evidence_helpers.h"
#include "fake_fs.h"

#include "netsleuth/discovery/device_registry.h"
#include "netsleuth/discovery/registry_store.h"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using netsleuth::discovery::AttributeKind;
using netsleuth::discovery::DeviceRegistry;
using netsleuth::discovery::EvidenceRecord;
using netsleuth::discovery::ProfilePtr;
using netsleuth::discovery::RegistryStore;
using netsleuth::discovery::YamlRegistryStore;
using netsleuth::tests::MemoryFileSystem;
using netsleuth::tests::evidence;

namespace {

class ThrowingStore : public RegistryStore {
public:
    std::vector<EvidenceRecord> load() override { throw std::runtime_error("disk on fire"); }
    void save(const std::map<std::string, ProfilePtr>&) override { throw std::runtime_error("disk on fire"); }
};

} // namespace

TEST_CASE("DeviceRegistry: upsert creates, updates and skips no-op batches")
{
    DeviceRegistry reg;
    CHECK(reg.size() == 0);
    CHECK(reg.get("10.0.0.1") == nullptr);

    auto touched = reg.upsert({
        evidence("10.0.0.1", "p1", 0.6, 100, AttributeKind::Manufacturer, "Acme"),
        evidence("10.0.0.2", "p1", 0.6, 100, AttributeKind::Manufacturer, "Zenith"),
    });
    CHECK(touched == std::vector<std::string>{"10.0.0.1", "10.0.0.2"});
    CHECK(reg.size() == 2);

    ProfilePtr before = reg.get("10.0.0.1");
    REQUIRE(before);

    // Replaying identical evidence changes nothing.
    touched = reg.upsert({evidence("10.0.0.1", "p1", 0.6, 100, AttributeKind::Manufacturer, "Acme")});
    CHECK(touched.empty());
    CHECK(reg.get("10.0.0.1") == before);

    touched = reg.upsert({evidence("10.0.0.1", "p2", 0.5, 200, AttributeKind::Manufacturer, "Acme")});
    CHECK(touched == std::vector<std::string>{"10.0.0.1"});

    // Readers holding the old snapshot keep seeing it.
    CHECK(before->lastSeenMs == 100);
    CHECK(reg.get("10.0.0.1")->lastSeenMs == 200);
    CHECK(reg.get("10.0.0.1")->attributes.at(AttributeKind::Manufacturer).sources.size() == 2);
}

TEST_CASE("DeviceRegistry: list filters and ranks")
{
    DeviceRegistry reg;
    reg.upsert({
        evidence("10.0.0.10", "p1", 0.5, 1, AttributeKind::Manufacturer, "A"),
        evidence("10.0.0.10", "p2", 0.5, 1, AttributeKind::Manufacturer, "B"),
        evidence("10.0.0.9",  "p1", 0.5, 1, AttributeKind::Manufacturer, "A"),
        evidence("10.0.0.2",  "p1", 0.5, 1, AttributeKind::Manufacturer, "A"),
    });

    auto all = reg.list();
    REQUIRE(all.size() == 3);
    CHECK(all[0]->address == "10.0.0.2");
    CHECK(all[1]->address == "10.0.0.9");
    CHECK(all[2]->address == "10.0.0.10");

    auto confident = reg.list(0.9);
    REQUIRE(confident.size() == 2);
    CHECK(confident[0]->overallConfidence == 1.0);
}

TEST_CASE("DeviceRegistry: staleness is reported, not enforced")
{
    DeviceRegistry reg;
    reg.upsert({
        evidence("10.0.0.1", "p", 0.5, 1000, AttributeKind::DeviceClass, "printer"),
        evidence("10.0.0.2", "p", 0.5, 5000, AttributeKind::DeviceClass, "camera"),
    });

    auto stale = reg.list_seen_before(2000);
    REQUIRE(stale.size() == 1);
    CHECK(stale[0]->address == "10.0.0.1");
    CHECK(reg.size() == 2);
}

TEST_CASE("DeviceRegistry: concurrent upserts never lose evidence")
{
    DeviceRegistry reg;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;

    std::vector<std::thread> writers;
    for (int t = 0; t < kThreads; ++t) {
        writers.emplace_back([&reg, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                reg.upsert({evidence("10.0.0.1", "probe" + std::to_string(t), 0.5,
                                     static_cast<std::uint64_t>(i),
                                     AttributeKind::OpenServicePort, std::to_string(1000 + i))});
            }
        });
    }

    std::atomic<bool> stop{false};
    std::thread reader([&]() {
        while (!stop.load()) {
            if (auto p = reg.get("10.0.0.1")) {
                // A published profile is always fully scored.
                CHECK(p->attributes.count(AttributeKind::OpenServicePort) == 1);
            }
        }
    });

    for (auto& w : writers) w.join();
    stop = true;
    reader.join();

    auto p = reg.get("10.0.0.1");
    REQUIRE(p);
    CHECK(p->candidates.at(AttributeKind::OpenServicePort).size() ==
          static_cast<std::size_t>(kThreads * kPerThread));
}

TEST_CASE("Registry store: persist and restore reproduce the profiles")
{
    MemoryFileSystem fs("mem");
    YamlRegistryStore store(&fs, "registry.yaml");

    DeviceRegistry first;
    first.upsert({
        evidence("192.168.1.20", "p1", 0.6, 1000, AttributeKind::Manufacturer, "Acme"),
        evidence("192.168.1.20", "p2", 0.4, 2000, AttributeKind::Manufacturer, "Acme"),
        evidence("192.168.1.20", "p3", 0.5, 3000, AttributeKind::Manufacturer, "Zenith"),
        evidence("192.168.1.21", "p1", 0.6, 1500, AttributeKind::DeviceClass, "Printer: \"lab\""),
    });
    CHECK(first.persist(store));
    CHECK(fs.exists("registry.yaml"));
    CHECK_FALSE(fs.exists("registry.yaml.tmp"));

    DeviceRegistry second;
    CHECK(second.restore(store) == 2);

    for (const auto& [address, p] : first.snapshot()) {
        auto q = second.get(address);
        REQUIRE(q);
        CHECK(q->overallConfidence == p->overallConfidence);
        CHECK(q->firstSeenMs == p->firstSeenMs);
        CHECK(q->lastSeenMs == p->lastSeenMs);
        CHECK(q->candidates == p->candidates);
    }
    CHECK(second.get("192.168.1.21")->value_of(AttributeKind::DeviceClass) == "Printer: \"lab\"");
}

TEST_CASE("Registry store: missing, empty and malformed files restore nothing")
{
    MemoryFileSystem fs("mem");
    YamlRegistryStore store(&fs, "registry.yaml");
    DeviceRegistry reg;

    CHECK(reg.restore(store) == 0);

    fs.add_file("registry.yaml", "");
    CHECK(reg.restore(store) == 0);

    fs.add_file("registry.yaml", "devices: [ {address: 10.0.0.1, candidates: [");
    CHECK(reg.restore(store) == 0);

    fs.add_file("registry.yaml", "version: 99\ndevices: []\n");
    CHECK(reg.restore(store) == 0);

    CHECK(reg.size() == 0);
}

TEST_CASE("Registry store: failures are reported, not thrown")
{
    DeviceRegistry reg;
    reg.upsert({evidence("10.0.0.1", "p", 0.5, 1, AttributeKind::Manufacturer, "A")});

    ThrowingStore broken;
    CHECK(reg.restore(broken) == 0);
    CHECK_FALSE(reg.persist(broken));

    MemoryFileSystem fs("mem");
    fs.failRename = true;
    YamlRegistryStore store(&fs, "registry.yaml");
    CHECK_FALSE(reg.persist(store));
    CHECK_FALSE(fs.exists("registry.yaml.tmp"));

    MemoryFileSystem full("mem");
    full.add_file("registry.yaml", "version: 1\ndevices: []\n");
    full.failWrite = true;
    YamlRegistryStore shortStore(&full, "registry.yaml");
    CHECK_FALSE(reg.persist(shortStore));
    CHECK_FALSE(full.exists("registry.yaml.tmp"));
    CHECK(full.read_file("registry.yaml") == "version: 1\ndevices: []\n");
}
