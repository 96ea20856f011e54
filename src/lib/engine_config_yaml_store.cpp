#include "netsleuth/config/engine_config_yaml_store.h"
#include "netsleuth/core/logging.h"

#include <stdexcept>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace netsleuth::config {

static constexpr const char* TAG = "config";

// ---------- tiny helpers ----------

template<typename T>
static T get_or(const YAML::Node& obj, const char* key, T def)
{
    auto n = obj[key];
    return n ? n.as<T>() : def;
}

template<typename T>
static std::vector<T> get_list_or(const YAML::Node& obj, const char* key, std::vector<T> def)
{
    auto n = obj[key];
    if (!n || !n.IsSequence()) {
        return def;
    }
    std::vector<T> out;
    for (const auto& item : n) {
        out.push_back(item.as<T>());
    }
    return out;
}

static void emit_list(YAML::Emitter& out, const char* key, const std::vector<std::string>& v)
{
    out << YAML::Key << key << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (const auto& s : v) out << s;
    out << YAML::EndSeq;
}

static void emit_ports(YAML::Emitter& out, const std::vector<std::uint16_t>& v)
{
    out << YAML::Key << "ports" << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (auto p : v) out << static_cast<unsigned>(p);
    out << YAML::EndSeq;
}

// ---------- from_yaml helpers ----------

static void from_yaml(const YAML::Node& node, DiscoveryConfig& out)
{
    out.scope             = get_or<std::string>(node, "scope", out.scope);
    out.perProbeTimeoutMs = get_or<std::uint32_t>(node, "per_probe_timeout_ms", out.perProbeTimeoutMs);
    out.overallTimeoutMs  = get_or<std::uint32_t>(node, "overall_timeout_ms", out.overallTimeoutMs);
    out.minConfidence     = get_or<double>(node, "min_confidence", out.minConfidence);
    out.stateDir          = get_or<std::string>(node, "state_dir", out.stateDir);
    out.registryFile      = get_or<std::string>(node, "registry_file", out.registryFile);
}

static void from_yaml(const YAML::Node& node, ProbeSettings& out)
{
    out.enabled     = get_or<bool>(node, "enabled", out.enabled);
    out.trustWeight = get_or<double>(node, "trust_weight", out.trustWeight);
    out.timeoutMs   = get_or<std::uint32_t>(node, "timeout_ms", out.timeoutMs);
}

static void from_yaml(const YAML::Node& node, ArpProbeConfig& out)
{
    from_yaml(node, out.settings);
    out.tablePath = get_or<std::string>(node, "table_path", out.tablePath);
}

static void from_yaml(const YAML::Node& node, OuiProbeConfig& out)
{
    from_yaml(node, out.settings);
    out.tablePath = get_or<std::string>(node, "table_path", out.tablePath);
}

static void from_yaml(const YAML::Node& node, TcpProbeConfig& out)
{
    from_yaml(node, out.settings);
    out.ports            = get_list_or<std::uint16_t>(node, "ports", out.ports);
    out.connectTimeoutMs = get_or<std::uint32_t>(node, "connect_timeout_ms", out.connectTimeoutMs);
    out.bannerWaitMs     = get_or<std::uint32_t>(node, "banner_wait_ms", out.bannerWaitMs);
}

static void from_yaml(const YAML::Node& node, HttpProbeConfig& out)
{
    from_yaml(node, out.settings);
    out.ports            = get_list_or<std::uint16_t>(node, "ports", out.ports);
    out.requestTimeoutMs = get_or<std::uint32_t>(node, "request_timeout_ms", out.requestTimeoutMs);
    out.maxConcurrent    = get_or<std::uint32_t>(node, "max_concurrent", out.maxConcurrent);
    out.bodyPreviewBytes = get_or<std::uint32_t>(node, "body_preview_bytes", out.bodyPreviewBytes);
}

static void from_yaml(const YAML::Node& node, discovery::HttpSignature& out)
{
    out.name           = get_or<std::string>(node, "name", "");
    out.headerKeywords = get_list_or<std::string>(node, "header_keywords", {});
    out.bodyKeywords   = get_list_or<std::string>(node, "body_keywords", {});
    out.manufacturer   = get_or<std::string>(node, "manufacturer", "");
    out.deviceClass    = get_or<std::string>(node, "device_class", "");

    out.classRefinements.clear();
    if (auto refs = node["class_refinements"]; refs && refs.IsSequence()) {
        for (const auto& r : refs) {
            out.classRefinements.emplace_back(get_or<std::string>(r, "keyword", ""),
                                              get_or<std::string>(r, "device_class", ""));
        }
    }
}

static void from_yaml(const YAML::Node& node, discovery::IotHints& out)
{
    out.manufacturerKeywords = get_list_or<std::string>(node, "manufacturer_keywords", out.manufacturerKeywords);
    out.protocolKeywords     = get_list_or<std::string>(node, "protocol_keywords", out.protocolKeywords);
    out.deviceClassKeywords  = get_list_or<std::string>(node, "device_class_keywords", out.deviceClassKeywords);
    out.minConfidence        = get_or<double>(node, "min_confidence", out.minConfidence);
}

// Top-level EngineConfig mapper. Absent sections keep their defaults.
static void from_yaml(const YAML::Node& root, EngineConfig& cfg)
{
    if (auto n = root["discovery"]) {
        from_yaml(n, cfg.discovery);
    }

    if (auto probes = root["probes"]) {
        if (auto n = probes["arp_table"])        from_yaml(n, cfg.arp);
        if (auto n = probes["oui_vendor"])       from_yaml(n, cfg.oui);
        if (auto n = probes["tcp_ports"])        from_yaml(n, cfg.tcp);
        if (auto n = probes["http_fingerprint"]) from_yaml(n, cfg.http);
    }

    if (auto imp = root["importance"]; imp && imp.IsMap()) {
        for (const auto& kv : imp) {
            const auto name = kv.first.as<std::string>();
            auto kind = discovery::parse_attribute_kind(name);
            const double w = kv.second.as<double>();
            if (!kind || !(w > 0.0)) {
                NS_LOGW(TAG, "Ignoring importance entry '%s'", name.c_str());
                continue;
            }
            cfg.importance[*kind] = w;
        }
    }

    if (auto oui = root["oui"]; oui && oui.IsSequence()) {
        cfg.oui.vendors.clear();
        for (const auto& on : oui) {
            OuiEntry e;
            e.prefix = get_or<std::string>(on, "prefix", "");
            e.vendor = get_or<std::string>(on, "vendor", "");
            if (!e.prefix.empty() && !e.vendor.empty()) {
                cfg.oui.vendors.push_back(std::move(e));
            }
        }
    }

    if (auto sigs = root["http_signatures"]; sigs && sigs.IsSequence()) {
        cfg.tables.httpSignatures.clear();
        for (const auto& sn : sigs) {
            discovery::HttpSignature sig;
            from_yaml(sn, sig);
            cfg.tables.httpSignatures.push_back(std::move(sig));
        }
    }

    if (auto n = root["iot_hints"]) {
        from_yaml(n, cfg.iot);
    }
}

// ---------- to_yaml helpers ----------

static void to_yaml(YAML::Emitter& out, const ProbeSettings& s)
{
    out << YAML::Key << "enabled"      << YAML::Value << s.enabled;
    out << YAML::Key << "trust_weight" << YAML::Value << s.trustWeight;
    out << YAML::Key << "timeout_ms"   << YAML::Value << s.timeoutMs;
}

static void to_yaml(YAML::Emitter& out, const EngineConfig& cfg)
{
    out << YAML::BeginMap;

    // discovery:
    out << YAML::Key << "discovery" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "scope"                << YAML::Value << cfg.discovery.scope;
    out << YAML::Key << "per_probe_timeout_ms" << YAML::Value << cfg.discovery.perProbeTimeoutMs;
    out << YAML::Key << "overall_timeout_ms"   << YAML::Value << cfg.discovery.overallTimeoutMs;
    out << YAML::Key << "min_confidence"       << YAML::Value << cfg.discovery.minConfidence;
    out << YAML::Key << "state_dir"            << YAML::Value << cfg.discovery.stateDir;
    out << YAML::Key << "registry_file"        << YAML::Value << cfg.discovery.registryFile;
    out << YAML::EndMap;

    // probes:
    out << YAML::Key << "probes" << YAML::Value << YAML::BeginMap;

    out << YAML::Key << "arp_table" << YAML::Value << YAML::BeginMap;
    to_yaml(out, cfg.arp.settings);
    out << YAML::Key << "table_path" << YAML::Value << cfg.arp.tablePath;
    out << YAML::EndMap;

    out << YAML::Key << "oui_vendor" << YAML::Value << YAML::BeginMap;
    to_yaml(out, cfg.oui.settings);
    out << YAML::Key << "table_path" << YAML::Value << cfg.oui.tablePath;
    out << YAML::EndMap;

    out << YAML::Key << "tcp_ports" << YAML::Value << YAML::BeginMap;
    to_yaml(out, cfg.tcp.settings);
    emit_ports(out, cfg.tcp.ports);
    out << YAML::Key << "connect_timeout_ms" << YAML::Value << cfg.tcp.connectTimeoutMs;
    out << YAML::Key << "banner_wait_ms"     << YAML::Value << cfg.tcp.bannerWaitMs;
    out << YAML::EndMap;

    out << YAML::Key << "http_fingerprint" << YAML::Value << YAML::BeginMap;
    to_yaml(out, cfg.http.settings);
    emit_ports(out, cfg.http.ports);
    out << YAML::Key << "request_timeout_ms" << YAML::Value << cfg.http.requestTimeoutMs;
    out << YAML::Key << "max_concurrent"     << YAML::Value << cfg.http.maxConcurrent;
    out << YAML::Key << "body_preview_bytes" << YAML::Value << cfg.http.bodyPreviewBytes;
    out << YAML::EndMap;

    out << YAML::EndMap; // probes

    // importance:
    out << YAML::Key << "importance" << YAML::Value << YAML::BeginMap;
    for (const auto& [kind, w] : cfg.importance) {
        out << YAML::Key << std::string(discovery::to_string(kind)) << YAML::Value << w;
    }
    out << YAML::EndMap;

    // oui:
    out << YAML::Key << "oui" << YAML::Value << YAML::BeginSeq;
    for (const auto& e : cfg.oui.vendors) {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "prefix" << YAML::Value << e.prefix;
        out << YAML::Key << "vendor" << YAML::Value << e.vendor;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    // http_signatures:
    out << YAML::Key << "http_signatures" << YAML::Value << YAML::BeginSeq;
    for (const auto& sig : cfg.tables.httpSignatures) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << sig.name;
        emit_list(out, "header_keywords", sig.headerKeywords);
        emit_list(out, "body_keywords", sig.bodyKeywords);
        out << YAML::Key << "manufacturer" << YAML::Value << sig.manufacturer;
        out << YAML::Key << "device_class" << YAML::Value << sig.deviceClass;
        out << YAML::Key << "class_refinements" << YAML::Value << YAML::BeginSeq;
        for (const auto& [keyword, cls] : sig.classRefinements) {
            out << YAML::Flow << YAML::BeginMap;
            out << YAML::Key << "keyword"      << YAML::Value << keyword;
            out << YAML::Key << "device_class" << YAML::Value << cls;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    // iot_hints:
    out << YAML::Key << "iot_hints" << YAML::Value << YAML::BeginMap;
    emit_list(out, "manufacturer_keywords", cfg.iot.manufacturerKeywords);
    emit_list(out, "protocol_keywords", cfg.iot.protocolKeywords);
    emit_list(out, "device_class_keywords", cfg.iot.deviceClassKeywords);
    out << YAML::Key << "min_confidence" << YAML::Value << cfg.iot.minConfidence;
    out << YAML::EndMap;

    out << YAML::EndMap; // root
}

// ---------- YamlEngineConfigStore ----------

YamlEngineConfigStore::YamlEngineConfigStore(fs::IFileSystem* fs, std::string relativePath)
    : _fs(fs)
    , _relPath(std::move(relativePath))
{
}

EngineConfig YamlEngineConfigStore::parse(const std::string& yamlText)
{
    EngineConfig cfg{};
    if (yamlText.empty()) {
        return cfg;
    }
    YAML::Node root = YAML::Load(yamlText);
    from_yaml(root, cfg);
    return cfg;
}

std::string YamlEngineConfigStore::emit(const EngineConfig& cfg)
{
    YAML::Emitter out;
    to_yaml(out, cfg);
    return out.c_str();
}

EngineConfig YamlEngineConfigStore::load()
{
    if (!_fs) {
        return EngineConfig{};
    }

    if (_fs->exists(_relPath)) {
        try {
            auto file = _fs->open(_relPath, "rb");
            if (!file) {
                throw std::runtime_error("open for read failed");
            }
            EngineConfig cfg = parse(fs::read_all(*file));
            NS_LOGI(TAG, "Loaded config from '%s' on '%s'",
                    _relPath.c_str(), _fs->name().c_str());
            return cfg;
        } catch (const std::exception& ex) {
            NS_LOGE(TAG, "Failed to load config '%s' on '%s': %s; using defaults",
                    _relPath.c_str(), _fs->name().c_str(), ex.what());
            return EngineConfig{};
        }
    }

    // Nothing found: write defaults so the file exists for next run.
    NS_LOGW(TAG, "Config '%s' not found; writing defaults", _relPath.c_str());

    EngineConfig cfg{};
    try {
        save(cfg);
    } catch (const std::exception& ex) {
        NS_LOGE(TAG, "Failed to write default config '%s': %s", _relPath.c_str(), ex.what());
    }
    return cfg;
}

void YamlEngineConfigStore::save(const EngineConfig& cfg)
{
    if (!_fs) {
        return;
    }

    auto file = _fs->open(_relPath, "wb");
    if (!file) {
        throw std::runtime_error("open for write failed");
    }
    fs::write_all(*file, emit(cfg));

    NS_LOGI(TAG, "Saved config to '%s' on '%s'", _relPath.c_str(), _fs->name().c_str());
}

} // namespace netsleuth::config
