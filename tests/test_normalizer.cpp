#include "doctest.h"

#include "netsleuth/discovery/attribute.h"
#include "netsleuth/discovery/normalizer.h"

using namespace netsleuth::discovery;

namespace {

RawObservation raw(const std::string& format, RawFields fields)
{
    RawObservation r;
    r.probe        = "test_probe";
    r.format       = format;
    r.address      = "192.168.1.50";
    r.fields       = std::move(fields);
    r.observedAtMs = 42;
    r.trustWeight  = 0.7;
    return r;
}

} // namespace

TEST_CASE("Attribute names round-trip and accept underscore aliases")
{
    for (AttributeKind k : kAllAttributeKinds) {
        auto parsed = parse_attribute_kind(to_string(k));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == k);
    }
    CHECK(parse_attribute_kind("device_type") == AttributeKind::DeviceClass);
    CHECK(parse_attribute_kind("mac") == AttributeKind::HardwareAddress);
    CHECK_FALSE(parse_attribute_kind("colour").has_value());

    const auto imp = default_importance();
    CHECK(importance_of(imp, AttributeKind::DeviceClass) > importance_of(imp, AttributeKind::OpenServicePort));
    CHECK(importance_of(imp, AttributeKind::Manufacturer) > importance_of(imp, AttributeKind::OpenServicePort));
    CHECK(importance_of(ImportanceTable{}, AttributeKind::Manufacturer) == 1.0);
}

TEST_CASE("Value canonicalisation")
{
    CHECK(canonical_text("  Philips   Hue \t Bridge ") == "Philips Hue Bridge");
    CHECK(canonical_text("") == "");

    CHECK(canonical_mac("AA-BB-CC-00-11-22") == "aa:bb:cc:00:11:22");
    CHECK(canonical_mac("aabb.cc00.1122") == "aa:bb:cc:00:11:22");
    CHECK(canonical_mac("aa:bb:cc") == "");
    CHECK(canonical_mac("zz:bb:cc:00:11:22") == "");

    CHECK(canonical_port_list({"443", "80", "22", "80", "bogus", "70000"}) == "22,80,443");
}

TEST_CASE("Normalizer: evidence carries probe identity, weight and time")
{
    const Normalizer n = create_default_normalizer(default_normalizer_tables());

    auto rec = n.normalize(raw("arp", {{"hw_address", "28-6D-97-01-02-03"}}));
    REQUIRE(rec.has_value());
    CHECK(rec->address == "192.168.1.50");
    CHECK(rec->probe == "test_probe");
    CHECK(rec->trustWeight == 0.7);
    CHECK(rec->observedAtMs == 42);
    CHECK(rec->attributes.at(AttributeKind::HardwareAddress) == "28:6d:97:01:02:03");
}

TEST_CASE("Normalizer: unmappable output is dropped")
{
    const Normalizer n = create_default_normalizer(default_normalizer_tables());

    CHECK_FALSE(n.normalize(raw("arp", {{"hw_address", "00:00:00:00:00:00"}})).has_value());
    CHECK_FALSE(n.normalize(raw("tcp", {})).has_value());
    CHECK_FALSE(n.normalize(raw("no-such-format", {{"vendor", "Acme"}})).has_value());
    CHECK_FALSE(n.normalize(raw("http", {{"scheme", "ftp"}})).has_value());
}

TEST_CASE("Normalizer: tcp ports map to protocol and device class by rule order")
{
    const Normalizer n = create_default_normalizer(default_normalizer_tables());

    auto rec = n.normalize(raw("tcp", {{"port", "80"}, {"port", "502"}, {"port", "22"}}));
    REQUIRE(rec.has_value());
    CHECK(rec->attributes.at(AttributeKind::OpenServicePort) == "22,80,502");
    CHECK(rec->attributes.at(AttributeKind::ProtocolCapability) == "modbus-tcp");
    CHECK(rec->attributes.at(AttributeKind::DeviceClass) == "modbus_device");

    auto ssh = n.normalize(raw("tcp", {{"port", "2222"}, {"banner:2222", "SSH-2.0-dropbear"}}));
    REQUIRE(ssh.has_value());
    CHECK(ssh->attributes.at(AttributeKind::ProtocolCapability) == "ssh");
    CHECK(ssh->attributes.count(AttributeKind::DeviceClass) == 0);
}

TEST_CASE("Normalizer: http signatures identify vendor and refine class")
{
    const Normalizer n = create_default_normalizer(default_normalizer_tables());

    auto hue = n.normalize(raw("http", {
        {"scheme", "http"},
        {"header", "Server: nginx"},
        {"body", "<html><title>Philips hue bridge</title></html>"},
    }));
    REQUIRE(hue.has_value());
    CHECK(hue->attributes.at(AttributeKind::Manufacturer) == "Philips");
    CHECK(hue->attributes.at(AttributeKind::DeviceClass) == "hue_bridge");
    CHECK(hue->attributes.at(AttributeKind::ProtocolCapability) == "http");

    auto washer = n.normalize(raw("http", {
        {"scheme", "https"},
        {"header", "X-Powered-By: SmartThings"},
        {"body", "Laundry status: washing"},
    }));
    REQUIRE(washer.has_value());
    CHECK(washer->attributes.at(AttributeKind::Manufacturer) == "Samsung SmartThings");
    CHECK(washer->attributes.at(AttributeKind::DeviceClass) == "washing_machine");

    auto plain = n.normalize(raw("http", {{"scheme", "http"}, {"body", "It works!"}}));
    REQUIRE(plain.has_value());
    CHECK(plain->attributes.size() == 1);
}

TEST_CASE("Normalizer: mdns and ssdp shapes")
{
    const Normalizer n = create_default_normalizer(default_normalizer_tables());

    auto mdns = n.normalize(raw("mdns", {
        {"service_type", "_hue._tcp.local."},
        {"txt:md", "BSB002"},
        {"port", "443"},
    }));
    REQUIRE(mdns.has_value());
    CHECK(mdns->attributes.at(AttributeKind::Manufacturer) == "Philips");
    CHECK(mdns->attributes.at(AttributeKind::ProtocolCapability) == "hue");
    CHECK(mdns->attributes.at(AttributeKind::ModelIdentifier) == "BSB002");
    CHECK(mdns->attributes.at(AttributeKind::OpenServicePort) == "443");

    auto ssdp = n.normalize(raw("ssdp", {
        {"manufacturer", "Sonos, Inc."},
        {"model_name", "Sonos One"},
        {"device_type", "urn:schemas-upnp-org:device:ZonePlayer:1"},
    }));
    REQUIRE(ssdp.has_value());
    CHECK(ssdp->attributes.at(AttributeKind::Manufacturer) == "Sonos, Inc.");
    CHECK(ssdp->attributes.at(AttributeKind::DeviceClass) == "ZonePlayer");
    CHECK(ssdp->attributes.at(AttributeKind::ProtocolCapability) == "upnp");
}

TEST_CASE("Normalizer: undeclared kinds are filtered out")
{
    const Normalizer n = create_default_normalizer(default_normalizer_tables());

    auto r = raw("attributes", {{"manufacturer", "Acme"}, {"device-class", "sensor"}});
    auto rec = n.normalize(r, {AttributeKind::Manufacturer});
    REQUIRE(rec.has_value());
    CHECK(rec->attributes.size() == 1);
    CHECK(rec->attributes.count(AttributeKind::Manufacturer) == 1);

    CHECK_FALSE(n.normalize(r, {AttributeKind::HardwareAddress}).has_value());
}

TEST_CASE("Normalizer: formats register once")
{
    Normalizer n;
    auto mapper = [](const RawObservation&, Normalizer::Attributes& out) {
        out[AttributeKind::DeviceClass] = "thing";
    };
    CHECK(n.register_format("custom", mapper));
    CHECK_FALSE(n.register_format("custom", mapper));
    CHECK_FALSE(n.register_format("", mapper));
    CHECK(n.has_format("custom"));
    CHECK(n.normalize(raw("custom", {})).has_value());
}
