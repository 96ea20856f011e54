#include "netsleuth/discovery/normalizer.h"

#include "netsleuth/core/logging.h"

#include <algorithm>
#include <cctype>
#include <set>

namespace netsleuth::discovery {

static constexpr const char* TAG = "normalize";

// ---------- tiny helpers ----------

static std::string to_lower(std::string_view v)
{
    std::string out(v);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

static bool contains_ci(const std::string& haystackLower, const std::string& needle)
{
    if (needle.empty()) return false;
    return haystackLower.find(to_lower(needle)) != std::string::npos;
}

static std::string field(const RawObservation& raw, std::string_view key)
{
    for (const auto& kv : raw.fields) {
        if (kv.first == key) return kv.second;
    }
    return {};
}

static std::vector<std::string> fields(const RawObservation& raw, std::string_view key)
{
    std::vector<std::string> out;
    for (const auto& kv : raw.fields) {
        if (kv.first == key) out.push_back(kv.second);
    }
    return out;
}

static bool starts_with(std::string_view s, std::string_view p)
{
    return s.size() >= p.size() && s.substr(0, p.size()) == p;
}

static void put(Normalizer::Attributes& out, AttributeKind kind, std::string value)
{
    if (!value.empty()) {
        out[kind] = std::move(value);
    }
}

static int parse_port(std::string_view v)
{
    v = v.substr(0, v.find_last_not_of(" \t") + 1);
    if (v.empty() || v.size() > 5) return 0;
    int n = 0;
    for (char c : v) {
        if (c < '0' || c > '9') return 0;
        n = n * 10 + (c - '0');
    }
    return (n >= 1 && n <= 65535) ? n : 0;
}

// ---------- canonical forms ----------

std::string canonical_text(std::string_view v)
{
    std::string out;
    out.reserve(v.size());
    bool pendingSpace = false;
    for (char ch : v) {
        const auto c = static_cast<unsigned char>(ch);
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(ch);
    }
    return out;
}

std::string canonical_mac(std::string_view v)
{
    std::string hex;
    for (char ch : v) {
        const auto c = static_cast<unsigned char>(ch);
        if (std::isxdigit(c)) {
            hex.push_back(static_cast<char>(std::tolower(c)));
        } else if (ch != ':' && ch != '-' && ch != '.') {
            return {};
        }
    }
    if (hex.size() != 12) return {};

    std::string out;
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        if (i) out.push_back(':');
        out.append(hex, i, 2);
    }
    return out;
}

std::string canonical_port_list(const std::vector<std::string>& ports)
{
    std::set<int> uniq;
    for (const auto& p : ports) {
        if (int n = parse_port(p)) uniq.insert(n);
    }
    std::string out;
    for (int n : uniq) {
        if (!out.empty()) out.push_back(',');
        out += std::to_string(n);
    }
    return out;
}

// ---------- default tables ----------

NormalizerTables default_normalizer_tables()
{
    NormalizerTables t;

    t.httpSignatures = {
        {"smartthings", {"smartthings", "samsung"}, {"smartthings", "hub"},
         "Samsung SmartThings", "smartthings_device",
         {{"washing", "washing_machine"}, {"laundry", "washing_machine"},
          {"thermostat", "thermostat"}}},
        {"philips_hue", {"philips", "hue"}, {"philips", "hue", "bridge"},
         "Philips", "hue_bridge", {}},
        {"sonos", {"sonos"}, {}, "Sonos", "smart_speaker", {}},
        {"nest", {"nest", "google"}, {}, "Google Nest", "nest_device",
         {{"thermostat", "thermostat"}}},
    };

    t.services = {
        {"_smartthings._tcp",     "Samsung SmartThings", "SmartThings Hub",   "smartthings"},
        {"_hue._tcp",             "Philips",             "Hue Bridge",        "hue"},
        {"_hap._tcp",             "",                    "homekit_accessory", "hap"},
        {"_matter._tcp",          "",                    "",                  "matter"},
        {"_googlecast._tcp",      "Google",              "cast_device",       "googlecast"},
        {"_airplay._tcp",         "Apple",               "airplay_receiver",  "airplay"},
        {"_ipp._tcp",             "",                    "printer",           "ipp"},
        {"_sonos._tcp",           "Sonos",               "smart_speaker",     "sonos"},
        {"_spotify-connect._tcp", "",                    "speaker",           "spotify-connect"},
        {"_http._tcp",            "",                    "",                  "http"},
    };

    t.portRules = {
        {502,  "modbus-tcp", "modbus_device"},
        {1883, "mqtt",       "mqtt_device"},
        {8883, "mqtt",       "mqtt_device"},
        {443,  "https",      "web_device"},
        {8443, "https",      "web_device"},
        {80,   "http",       "web_device"},
        {8080, "http",       "web_device"},
        {554,  "rtsp",       "camera"},
        {631,  "ipp",        "printer"},
        {9100, "jetdirect",  "printer"},
        {22,   "ssh",        ""},
        {23,   "telnet",     ""},
    };

    return t;
}

// ---------- format mappers ----------

static void map_arp(const RawObservation& raw, Normalizer::Attributes& out)
{
    const std::string mac = canonical_mac(field(raw, "hw_address"));
    if (mac.empty() || mac == "00:00:00:00:00:00") {
        return;
    }
    put(out, AttributeKind::HardwareAddress, mac);
}

static void map_oui(const RawObservation& raw, Normalizer::Attributes& out)
{
    put(out, AttributeKind::Manufacturer, canonical_text(field(raw, "vendor")));
}

static void map_tcp(const NormalizerTables& tables, const RawObservation& raw, Normalizer::Attributes& out)
{
    const std::vector<std::string> portTexts = fields(raw, "port");
    std::set<int> open;
    for (const auto& p : portTexts) {
        if (int n = parse_port(p)) open.insert(n);
    }
    if (open.empty()) {
        return;
    }

    put(out, AttributeKind::OpenServicePort, canonical_port_list(portTexts));

    std::string protocol;
    std::string deviceClass;
    for (const PortRule& r : tables.portRules) {
        if (!open.count(r.port)) continue;
        if (protocol.empty()) protocol = r.protocol;
        if (deviceClass.empty()) deviceClass = r.deviceClass;
    }

    if (protocol.empty()) {
        // "banner:<port>" greeting lines
        for (const auto& kv : raw.fields) {
            if (starts_with(kv.first, "banner:") && starts_with(kv.second, "SSH-")) {
                protocol = "ssh";
                break;
            }
        }
    }

    put(out, AttributeKind::ProtocolCapability, protocol);
    put(out, AttributeKind::DeviceClass, deviceClass);
}

static void map_http(const NormalizerTables& tables, const RawObservation& raw, Normalizer::Attributes& out)
{
    const std::string scheme = to_lower(field(raw, "scheme"));
    if (scheme != "http" && scheme != "https") {
        return;
    }

    std::string headers;
    for (const auto& h : fields(raw, "header")) {
        headers += to_lower(h);
        headers.push_back('\n');
    }
    const std::string body = to_lower(field(raw, "body"));

    put(out, AttributeKind::ProtocolCapability, scheme);

    for (const HttpSignature& sig : tables.httpSignatures) {
        bool hit = false;
        for (const auto& k : sig.headerKeywords) {
            if (contains_ci(headers, k)) { hit = true; break; }
        }
        if (!hit) {
            for (const auto& k : sig.bodyKeywords) {
                if (contains_ci(body, k)) { hit = true; break; }
            }
        }
        if (!hit) continue;

        std::string deviceClass = sig.deviceClass;
        for (const auto& [keyword, refined] : sig.classRefinements) {
            if (contains_ci(body, keyword)) {
                deviceClass = refined;
                break;
            }
        }

        put(out, AttributeKind::Manufacturer, canonical_text(sig.manufacturer));
        put(out, AttributeKind::DeviceClass, canonical_text(deviceClass));
        NS_LOGD(TAG, "%s: http signature '%s' matched", raw.address.c_str(), sig.name.c_str());
        break;
    }
}

static void map_mdns(const NormalizerTables& tables, const RawObservation& raw, Normalizer::Attributes& out)
{
    const std::string type = to_lower(field(raw, "service_type"));
    if (type.empty()) {
        return;
    }

    for (const ServiceMapping& m : tables.services) {
        if (!starts_with(type, to_lower(m.serviceType))) continue;
        put(out, AttributeKind::Manufacturer, canonical_text(m.manufacturer));
        put(out, AttributeKind::DeviceClass, canonical_text(m.deviceClass));
        put(out, AttributeKind::ProtocolCapability, m.protocol);
        break;
    }

    // TXT records override the table where present.
    put(out, AttributeKind::DeviceClass, canonical_text(field(raw, "txt:deviceType")));
    put(out, AttributeKind::ModelIdentifier, canonical_text(field(raw, "txt:md")));

    const std::string port = field(raw, "port");
    if (!port.empty()) {
        put(out, AttributeKind::OpenServicePort, canonical_port_list({port}));
    }
}

static void map_ssdp(const RawObservation& raw, Normalizer::Attributes& out)
{
    const std::string manufacturer = canonical_text(field(raw, "manufacturer"));
    const std::string model        = canonical_text(field(raw, "model_name"));
    const std::string urn          = field(raw, "device_type");

    // urn:schemas-upnp-org:device:MediaRenderer:1 -> MediaRenderer
    std::string deviceClass;
    const std::string marker = ":device:";
    const std::size_t pos = urn.find(marker);
    if (pos != std::string::npos) {
        const std::string rest = urn.substr(pos + marker.size());
        deviceClass = canonical_text(rest.substr(0, rest.find(':')));
    }

    if (manufacturer.empty() && model.empty() && deviceClass.empty()) {
        return;
    }

    put(out, AttributeKind::Manufacturer, manufacturer);
    put(out, AttributeKind::ModelIdentifier, model);
    put(out, AttributeKind::DeviceClass, deviceClass);
    put(out, AttributeKind::ProtocolCapability, "upnp");
}

static void map_attributes(const RawObservation& raw, Normalizer::Attributes& out)
{
    std::vector<std::string> ports;
    for (const auto& [key, value] : raw.fields) {
        auto kind = parse_attribute_kind(key);
        if (!kind) continue;

        switch (*kind) {
        case AttributeKind::OpenServicePort:
            ports.push_back(value);
            break;
        case AttributeKind::HardwareAddress:
            put(out, *kind, canonical_mac(value));
            break;
        default:
            put(out, *kind, canonical_text(value));
            break;
        }
    }
    if (!ports.empty()) {
        put(out, AttributeKind::OpenServicePort, canonical_port_list(ports));
    }
}

// ---------- Normalizer ----------

bool Normalizer::register_format(std::string format, Mapper mapper)
{
    if (format.empty() || !mapper) {
        return false;
    }
    return _mappers.emplace(std::move(format), std::move(mapper)).second;
}

bool Normalizer::has_format(std::string_view format) const
{
    return _mappers.find(std::string(format)) != _mappers.end();
}

std::optional<EvidenceRecord> Normalizer::normalize(const RawObservation& raw) const
{
    return normalize_impl(raw, nullptr);
}

std::optional<EvidenceRecord> Normalizer::normalize(const RawObservation& raw,
                                                    const std::set<AttributeKind>& allowed) const
{
    return normalize_impl(raw, &allowed);
}

std::optional<EvidenceRecord> Normalizer::normalize_impl(const RawObservation& raw,
                                                         const std::set<AttributeKind>* allowed) const
{
    if (raw.address.empty() || raw.probe.empty()) {
        return std::nullopt;
    }

    auto it = _mappers.find(raw.format);
    if (it == _mappers.end()) {
        NS_LOGD(TAG, "No mapping for format '%s' (probe '%s')", raw.format.c_str(), raw.probe.c_str());
        return std::nullopt;
    }

    Attributes attrs;
    it->second(raw, attrs);

    if (allowed) {
        for (auto a = attrs.begin(); a != attrs.end();) {
            if (allowed->count(a->first) == 0) {
                NS_LOGD(TAG, "Probe '%s' produced undeclared attribute '%.*s'; dropped",
                        raw.probe.c_str(),
                        static_cast<int>(to_string(a->first).size()), to_string(a->first).data());
                a = attrs.erase(a);
            } else {
                ++a;
            }
        }
    }

    if (attrs.empty()) {
        return std::nullopt;
    }

    EvidenceRecord rec;
    rec.address      = raw.address;
    rec.probe        = raw.probe;
    rec.attributes   = std::move(attrs);
    rec.observedAtMs = raw.observedAtMs;
    rec.trustWeight  = raw.trustWeight;
    return rec;
}

Normalizer create_default_normalizer(const NormalizerTables& tables)
{
    Normalizer n;
    n.register_format("arp", map_arp);
    n.register_format("oui", map_oui);
    n.register_format("tcp", [tables](const RawObservation& raw, Normalizer::Attributes& out) {
        map_tcp(tables, raw, out);
    });
    n.register_format("http", [tables](const RawObservation& raw, Normalizer::Attributes& out) {
        map_http(tables, raw, out);
    });
    n.register_format("mdns", [tables](const RawObservation& raw, Normalizer::Attributes& out) {
        map_mdns(tables, raw, out);
    });
    n.register_format("ssdp", map_ssdp);
    n.register_format("attributes", map_attributes);
    return n;
}

} // namespace netsleuth::discovery
